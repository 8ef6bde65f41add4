#include <catch2/catch.hpp>

#include <numeric>
#include <labelforge/workload.hpp>

#define TEST_TAG "[workload]"

static std::vector<int> iota_list(int n) {
    std::vector<int> v((size_t(n)));
    std::iota(v.begin(), v.end(), 0);
    return v;
}

TEST_CASE("Shards concatenate back to the input", TEST_TAG) {
    for (int n : {0, 1, 2, 5, 7, 10, 19}) {
        for (int m : {1, 2, 3, 4, 8, 25}) {
            auto items = iota_list(n);
            auto shards = lf::partition_list(items, m);
            REQUIRE(shards.size() == size_t(m));

            const size_t cap = (size_t(n) + size_t(m) - 1) / size_t(m);
            std::vector<int> joined;
            for (auto& s : shards) {
                CHECK(s.size() <= cap);
                joined.insert(joined.end(), s.begin(), s.end());
            }
            CHECK(joined == items);
        }
    }
}

TEST_CASE("Chunk size is ceil(N/M) and the tail may be short or empty", TEST_TAG) {
    SECTION("10 items over 4 workers") {
        auto shards = lf::partition_list(iota_list(10), 4);
        CHECK(shards[0] == std::vector<int>{0, 1, 2});
        CHECK(shards[1] == std::vector<int>{3, 4, 5});
        CHECK(shards[2] == std::vector<int>{6, 7, 8});
        CHECK(shards[3] == std::vector<int>{9});
    }
    SECTION("fewer items than workers") {
        auto shards = lf::partition_list(iota_list(2), 4);
        CHECK(shards[0] == std::vector<int>{0});
        CHECK(shards[1] == std::vector<int>{1});
        CHECK(shards[2].empty());
        CHECK(shards[3].empty());
    }
    SECTION("single worker gets everything") {
        auto shards = lf::partition_list(iota_list(5), 1);
        CHECK(shards[0] == iota_list(5));
    }
}

TEST_CASE("Partitioning is deterministic", TEST_TAG) {
    std::vector<std::string> names = {"a.png", "b.png", "c.png", "d.png", "e.png"};
    CHECK(lf::partition_list(names, 3) == lf::partition_list(names, 3));
}

TEST_CASE("Worker count below one is rejected", TEST_TAG) {
    CHECK_THROWS_AS(lf::partition_list(iota_list(3), 0), std::invalid_argument);
    CHECK_THROWS_AS(lf::partition_list(iota_list(3), -2), std::invalid_argument);
}
