// tableau_scene ZPath and ZOrderCounter tests

#include <catch2/catch.hpp>
#include <tableau_engine/scene/zpath.hpp>

#include <algorithm>
#include <thread>
#include <vector>

using namespace tableau_scene;

// =============================================================================
// ZPath Tests
// =============================================================================

TEST_CASE("ZPath basics", "[scene][zpath]") {
    SECTION("empty path") {
        ZPath path;
        REQUIRE(path.empty());
        REQUIRE(path.depth() == 0);
        REQUIRE(path.local_z_order() == 0);
        REQUIRE(path.to_string() == "[]");
    }

    SECTION("depth and local z-order") {
        ZPath path{5, 0, 3};
        REQUIRE(path.depth() == 3);
        REQUIRE(path.local_z_order() == 3);
        REQUIRE(path[0] == 5);
        REQUIRE(path.to_string() == "[5, 0, 3]");
    }

    SECTION("from_parent") {
        ZPath parent{5};
        REQUIRE(ZPath::from_parent(&parent, 2) == ZPath{5, 2});
        REQUIRE(ZPath::from_parent(nullptr, 7) == ZPath{7});
    }

    SECTION("parent and with_local") {
        ZPath path{1, 2, 3};
        REQUIRE(path.parent().has_value());
        REQUIRE(*path.parent() == ZPath{1, 2});
        REQUIRE_FALSE(ZPath{1}.parent().has_value());
        REQUIRE(path.with_local(9) == ZPath{1, 2, 9});
        REQUIRE(ZPath{}.with_local(4) == ZPath{4});
    }
}

TEST_CASE("ZPath prefix", "[scene][zpath]") {
    ZPath a{1, 2};
    ZPath b{1, 2, 0};
    ZPath c{1, 3};

    REQUIRE(a.is_prefix_of(b));
    REQUIRE(a.is_prefix_of(a));
    REQUIRE_FALSE(b.is_prefix_of(a));
    REQUIRE_FALSE(a.is_prefix_of(c));
    REQUIRE(ZPath{}.is_prefix_of(c));
}

TEST_CASE("ZPath ordering", "[scene][zpath]") {
    SECTION("lexicographic") {
        REQUIRE(ZPath{0, 5}.less(ZPath{1}));
        REQUIRE(ZPath{1, 0}.less(ZPath{1, 1}));
        REQUIRE_FALSE(ZPath{2}.less(ZPath{1, 9}));
    }

    SECTION("prefix sorts before its extension") {
        REQUIRE(ZPath{1}.less(ZPath{1, 0}));
        REQUIRE(ZPath{1, 0}.less(ZPath{1, 0, -1}));
        REQUIRE_FALSE(ZPath{1, 0}.less(ZPath{1}));
    }

    SECTION("equal paths are never less") {
        REQUIRE_FALSE(ZPath{3, 4}.less(ZPath{3, 4}));
        REQUIRE(ZPath{3, 4}.compare(ZPath{3, 4}) == 0);
    }

    SECTION("negative locals sort first") {
        REQUIRE(ZPath{1, -1}.less(ZPath{1, 0}));
    }

    SECTION("sorting yields pre-order") {
        std::vector<ZPath> paths{{1, 1}, {0}, {1}, {1, 0, 2}, {0, 3}, {1, 0}};
        std::sort(paths.begin(), paths.end());

        std::vector<ZPath> expected{{0}, {0, 3}, {1}, {1, 0}, {1, 0, 2}, {1, 1}};
        REQUIRE(paths == expected);
    }
}

// =============================================================================
// ZOrderCounter Tests
// =============================================================================

TEST_CASE("ZOrderCounter scopes", "[scene][zpath]") {
    ZOrderCounter counter;

    REQUIRE(counter.current(1) == 0);
    REQUIRE(counter.get_next(1) == 0);
    REQUIRE(counter.get_next(1) == 1);
    REQUIRE(counter.get_next(2) == 0);
    REQUIRE(counter.current(1) == 2);
    REQUIRE(counter.scope_count() == 2);

    SECTION("reset one scope") {
        counter.reset(1);
        REQUIRE(counter.get_next(1) == 0);
        REQUIRE(counter.current(2) == 1);
    }

    SECTION("reset all") {
        counter.reset_all();
        REQUIRE(counter.scope_count() == 0);
        REQUIRE(counter.get_next(2) == 0);
    }
}

TEST_CASE("ZOrderCounter concurrent allocation", "[scene][zpath]") {
    ZOrderCounter counter;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::vector<int>> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&counter, &results, t] {
            for (int i = 0; i < kPerThread; ++i) {
                results[t].push_back(counter.get_next(kRootScope));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<int> all;
    for (const auto& r : results) {
        all.insert(all.end(), r.begin(), r.end());
    }
    std::sort(all.begin(), all.end());
    REQUIRE(std::adjacent_find(all.begin(), all.end()) == all.end());
    REQUIRE(all.front() == 0);
    REQUIRE(all.back() == kThreads * kPerThread - 1);
}
