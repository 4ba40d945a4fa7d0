#include <iostream>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>
#include "../src/RangePlanner.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        // 1) empty range plans nothing
        auto empty = plan_chunks(42, 42, 10);
        ASSERT_TRUE(empty.empty());
        RangePlanner emptyPlanner(0, 0, 1);
        ASSERT_TRUE(!emptyPlanner.hasNext());

        // 2) exact multiple: only full chunks
        auto exact = plan_chunks(0, 10000000, 5000000);
        ASSERT_TRUE(exact.size() == 2);
        ASSERT_TRUE(exact[0].offsetStart == 0 && exact[0].offsetEnd == 5000000);
        ASSERT_TRUE(exact[1].offsetStart == 5000000 && exact[1].offsetEnd == 10000000);
        ASSERT_TRUE(format_content_range(exact[0], 10000000) == "bytes 0-5000000/10000000");
        ASSERT_TRUE(format_content_range(exact[1], 10000000) == "bytes 5000000-10000000/10000000");

        // 3) remainder: one short chunk, last
        auto partial = plan_chunks(100, 250, 100);
        ASSERT_TRUE(partial.size() == 2);
        ASSERT_TRUE(partial[0].offsetStart == 100 && partial[0].length() == 100);
        ASSERT_TRUE(partial[1].offsetStart == 200 && partial[1].offsetEnd == 250);
        ASSERT_TRUE(partial[1].length() == 50);
        ASSERT_TRUE(format_content_range(partial[0], 250) == "bytes 100-200/250");
        ASSERT_TRUE(format_content_range(partial[1], 250) == "bytes 200-250/250");

        // 4) chunk larger than the range: a single chunk
        auto single = plan_chunks(0, 10, 1000);
        ASSERT_TRUE(single.size() == 1);
        ASSERT_TRUE(format_content_range(single[0], 10) == "bytes 0-10/10");

        // 5) huge chunk size near the top of the u64 range does not wrap
        const uint64_t top = std::numeric_limits<uint64_t>::max();
        ASSERT_TRUE(next_chunk_end(top - 10, top, top) == top);
        ASSERT_TRUE(next_chunk_end(5, 100, std::numeric_limits<uint64_t>::max()) == 100);
        ASSERT_TRUE(next_chunk_end(100, 100, 7) == 100);
        ASSERT_TRUE(next_chunk_end(0, 100, 7) == 7);

        // 6) the planner is lazy and restartable by rebuilding it
        RangePlanner planner(3, 20, 5);
        ASSERT_TRUE(planner.cursor() == 3);
        auto first = planner.next();
        ASSERT_TRUE(first.offsetStart == 3 && first.offsetEnd == 8);
        ASSERT_TRUE(planner.cursor() == 8);
        RangePlanner again(3, 20, 5);
        ASSERT_TRUE(again.next().offsetEnd == first.offsetEnd);
        std::vector<ChunkBounds> rest;
        while (planner.hasNext()) rest.push_back(planner.next());
        ASSERT_TRUE(rest.size() == 3);
        ASSERT_TRUE(rest.back().offsetEnd == 20 && rest.back().length() == 2);

        // 7) exhausted planner refuses to go further, zero chunk size is rejected
        bool threw = false;
        try {
            planner.next();
        } catch (const std::out_of_range&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
        threw = false;
        try {
            RangePlanner bad(0, 10, 0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All range planner tests passed" << std::endl;
    return 0;
}
