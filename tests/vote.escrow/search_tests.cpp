#include <vote.escrow/vote.escrow.search.hpp>

#include <boost/test/unit_test.hpp>

#include <vector>

using namespace shibdao;

BOOST_AUTO_TEST_SUITE(search_tests)

BOOST_AUTO_TEST_CASE(greatest_index_at_or_before_block)
{
    const std::vector<uint64_t> blocks { 10, 20, 20, 30, 40 };
    auto blk_of = [&](const uint64_t& i) { return blocks[i]; };
    const uint64_t max_index = blocks.size() - 1;

    BOOST_CHECK_EQUAL(bisect_history(25, max_index, blk_of), 2u);
    BOOST_CHECK_EQUAL(bisect_history(20, max_index, blk_of), 2u);
    BOOST_CHECK_EQUAL(bisect_history(30, max_index, blk_of), 3u);
    BOOST_CHECK_EQUAL(bisect_history(40, max_index, blk_of), 4u);
    BOOST_CHECK_EQUAL(bisect_history(1'000, max_index, blk_of), 4u);
    BOOST_CHECK_EQUAL(bisect_history(10, max_index, blk_of), 0u);
}

BOOST_AUTO_TEST_CASE(block_before_history_gives_zero)
{
    const std::vector<uint64_t> blocks { 10, 20, 30 };
    auto blk_of = [&](const uint64_t& i) { return blocks[i]; };

    BOOST_CHECK_EQUAL(bisect_history(5, 2, blk_of), 0u);
    BOOST_CHECK_EQUAL(bisect_history(5, 0, blk_of), 0u);
}

BOOST_AUTO_TEST_CASE(rounds_are_bounded)
{
    uint32_t calls = 0;
    auto blk_of = [&](const uint64_t& i) { calls++; return i * 2; };

    const uint64_t max_index = uint64_t(1) << 62;
    BOOST_CHECK_EQUAL(bisect_history(24'691, max_index, blk_of), 12'345u);
    BOOST_CHECK_LE(calls, MAX_BISECT_ROUNDS);
}

BOOST_AUTO_TEST_SUITE_END()
