#include <catch2/catch_test_macros.hpp>
#include "simulation/random_stream.hpp"
#include "simulation/trial_pool.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace allocation::simulation;

TEST_CASE("TrialPool runs every trial exactly once", "[TrialPool]") {
    const size_t count = 1000;
    std::vector<std::atomic<int>> hits(count);

    TrialPool pool(4, 16);
    auto report = pool.run(count, [&](size_t i) { hits[i].fetch_add(1); });

    REQUIRE(report.completed_count == count);
    REQUIRE_FALSE(report.budget_expired);
    for (size_t i = 0; i < count; ++i) {
        REQUIRE(hits[i].load() == 1);
        REQUIRE(report.completed[i] == 1);
    }
}

TEST_CASE("TrialPool stops on the time budget", "[TrialPool]") {
    // Each trial sleeps, so the budget expires long before the last one
    TrialPool pool(2, 4);
    auto report = pool.run(
        1000,
        [](size_t) { std::this_thread::sleep_for(std::chrono::milliseconds(2)); },
        std::chrono::milliseconds(30));

    REQUIRE(report.budget_expired);
    REQUIRE(report.completed_count > 0);
    REQUIRE(report.completed_count < 1000);
}

TEST_CASE("TrialPool propagates task exceptions", "[TrialPool]") {
    TrialPool pool(3);
    REQUIRE_THROWS_AS(
        pool.run(500, [](size_t i) {
            if (i == 123) {
                throw std::runtime_error("trial failed");
            }
        }),
        std::runtime_error);
}

TEST_CASE("TrialPool validates its arguments", "[TrialPool]") {
    REQUIRE_THROWS_AS(TrialPool(-1), std::invalid_argument);
    REQUIRE_THROWS_AS(TrialPool(1, 0), std::invalid_argument);
    REQUIRE(TrialPool(0).get_num_threads() >= 1);

    auto report = TrialPool(2).run(0, [](size_t) {});
    REQUIRE(report.completed_count == 0);
}

TEST_CASE("Trial streams depend only on seed and index", "[RandomStream]") {
    TrialRandomStream a(42, 7);
    TrialRandomStream b(42, 7);
    TrialRandomStream c(42, 8);

    const double first = a.uniform();
    REQUIRE(first == b.uniform());
    REQUIRE(first != c.uniform());

    for (int i = 0; i < 1000; ++i) {
        const double u = a.uniform();
        REQUIRE(u >= 0.0);
        REQUIRE(u < 1.0);
    }

    REQUIRE(splitmix64(1) != splitmix64(2));
}

TEST_CASE("Nearby run seeds do not share trial streams", "[RandomStream]") {
    // (seed, index) pairs whose XOR coincides must still differ
    TrialRandomStream a(0, 1);
    TrialRandomStream b(1, 0);
    REQUIRE(a.uniform() != b.uniform());

    TrialRandomStream c(42, 1);
    TrialRandomStream d(43, 0);
    REQUIRE(c.uniform() != d.uniform());
}
