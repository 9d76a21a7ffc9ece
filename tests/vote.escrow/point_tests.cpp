#include <vote.escrow/vote.escrow.point.hpp>

#include <boost/test/unit_test.hpp>

using namespace shibdao;

BOOST_AUTO_TEST_SUITE(point_tests)

BOOST_AUTO_TEST_CASE(line_for_full_lock)
{
    const int64_t amount = 1000 * 100'000'000LL;
    const uint64_t now   = 1'700'000'000;

    auto p = line_for(amount, now + MAXTIME, now);
    BOOST_CHECK_EQUAL(p.slope, amount / (int64_t)MAXTIME);
    BOOST_CHECK_EQUAL(p.bias, p.slope * (int64_t)MAXTIME);
    BOOST_CHECK_LE(p.bias, amount);
    BOOST_CHECK_LT(amount - p.bias, (int64_t)MAXTIME);
    BOOST_CHECK_EQUAL(p.ts, now);
}

BOOST_AUTO_TEST_CASE(line_for_truncates_slope)
{
    const uint64_t now = 1'000;
    auto p = line_for(3 * (int64_t)MAXTIME + 5, now + 10, now);
    BOOST_CHECK_EQUAL(p.slope, 3);
    BOOST_CHECK_EQUAL(p.bias, 30);

    // less than one unit per second of MAXTIME gives no voting power at all
    auto dust = line_for((int64_t)MAXTIME - 1, now + MAXTIME, now);
    BOOST_CHECK_EQUAL(dust.slope, 0);
    BOOST_CHECK_EQUAL(dust.bias, 0);
}

BOOST_AUTO_TEST_CASE(line_for_without_active_lock)
{
    const uint64_t now = 5'000;
    BOOST_CHECK_EQUAL(line_for(1'000'000'000'000, now, now).bias, 0);
    BOOST_CHECK_EQUAL(line_for(1'000'000'000'000, now - 1, now).slope, 0);
    BOOST_CHECK_EQUAL(line_for(0, now + WEEK, now).bias, 0);
    BOOST_CHECK_EQUAL(line_for(-5, now + WEEK, now).slope, 0);
}

BOOST_AUTO_TEST_CASE(decay_clamps_at_zero)
{
    point_t p { 100, 10, 1'000, 7 };

    auto half = decay(p, 1'005);
    BOOST_CHECK_EQUAL(half.bias, 50);
    BOOST_CHECK_EQUAL(half.slope, 10);
    BOOST_CHECK_EQUAL(half.ts, 1'005u);
    BOOST_CHECK_EQUAL(half.blk, 7u);

    BOOST_CHECK_EQUAL(decay(p, 1'010).bias, 0);
    BOOST_CHECK_EQUAL(decay(p, 9'999).bias, 0);

    point_t negative { -4, -3, 0, 0 };
    auto fixed = decay(negative, 0);
    BOOST_CHECK_EQUAL(fixed.bias, 0);
    BOOST_CHECK_EQUAL(fixed.slope, 0);
}

BOOST_AUTO_TEST_CASE(decay_never_moves_backwards)
{
    point_t p { 100, 10, 1'000, 0 };
    BOOST_CHECK_EQUAL(decay(p, 990).bias, 100);
    BOOST_CHECK_EQUAL(decay(p, 0).bias, 100);
    BOOST_CHECK_EQUAL(decay(p, 1'000).bias, 100);
}

BOOST_AUTO_TEST_CASE(weeks_round_down)
{
    BOOST_CHECK_EQUAL(floor_week(0), 0u);
    BOOST_CHECK_EQUAL(floor_week(WEEK - 1), 0u);
    BOOST_CHECK_EQUAL(floor_week(WEEK), WEEK);
    BOOST_CHECK_EQUAL(floor_week(3 * WEEK + 86'400), 3 * WEEK);
}

BOOST_AUTO_TEST_SUITE_END()
