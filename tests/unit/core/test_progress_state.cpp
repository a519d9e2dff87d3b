#include "fake_clock.hpp"
#include "progressbar/core/error_codes.hpp"
#include "progressbar/core/progress_state.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <limits>

using namespace progressbar;
using namespace std::chrono_literals;
using Catch::Approx;

TEST_CASE("Percent is the floor of completed over total", "[state][percent]")
{
    testing::FakeClock clock;

    struct Case
    {
        int64_t total;
        uint64_t completed;
        int64_t expected;
    };
    const Case cases[] = {{100, 29, 29}, {3, 1, 33}, {3, 2, 66}, {7, 7, 100}, {1000, 1, 0}};

    for (const auto& c : cases)
    {
        core::ProgressState state(c.total, clock.now);
        REQUIRE(state.advance(c.completed, clock.now));
        CHECK(state.percent() == c.expected);
    }
}

TEST_CASE("Throughput and ETA follow elapsed time", "[state][eta]")
{
    testing::FakeClock clock;
    core::ProgressState state(10, clock.now);

    clock.advance(4000ms);
    REQUIRE(state.advance(2, clock.now));

    CHECK(state.elapsedSeconds() == Approx(4.0));
    CHECK(state.throughput() == Approx(0.5));
    // 2 s per unit, 8 units left
    CHECK(state.etaSeconds() == Approx(16.0));
}

TEST_CASE("Zero elapsed time and zero completed units yield zero metrics", "[state][eta]")
{
    testing::FakeClock clock;
    core::ProgressState state(10, clock.now);

    REQUIRE(state.advance(0, clock.now));
    CHECK(state.throughput() == 0.0);
    CHECK(state.etaSeconds() == 0.0);

    REQUIRE(state.advance(3, clock.now));
    CHECK(state.throughput() == 0.0);
    CHECK(state.percent() == 30);
}

TEST_CASE("Zero total counts one error per advance and keeps metrics", "[state][degenerate]")
{
    testing::FakeClock clock;
    core::ProgressState state(0, clock.now);

    for (int i = 1; i <= 4; ++i)
    {
        clock.advance(10ms);
        CHECK_FALSE(state.advance(1, clock.now));
        CHECK(state.errors() == i);
    }
    CHECK(state.completed() == 4);
    CHECK(state.percent() == 0);
    CHECK(state.throughput() == 0.0);
}

TEST_CASE("Unknown total behaves like a degenerate total", "[state][degenerate]")
{
    testing::FakeClock clock;
    core::ProgressState state(-1, clock.now);

    CHECK(state.isUnknownTotal());
    CHECK_FALSE(state.advance(5, clock.now));
    CHECK(state.errors() == 1);
    CHECK(state.completed() == 5);

    state.forceComplete();
    CHECK(state.completed() == 5);
}

TEST_CASE("Negative totals other than the sentinel are rejected", "[state][error]")
{
    testing::FakeClock clock;

    try
    {
        core::ProgressState state(-5, clock.now);
        FAIL("expected ProgressError");
    }
    catch (const core::ProgressError& e)
    {
        CHECK(e.code() == core::ProgressErrorCode::INVALID_TOTAL_KIND);
        CHECK(e.context().details.at("total") == "-5");
    }
}

TEST_CASE("Overshooting increments are not clamped", "[state][percent]")
{
    testing::FakeClock clock;
    core::ProgressState state(10, clock.now);

    REQUIRE(state.advance(15, clock.now));
    CHECK(state.percent() == 150);
    CHECK(state.hasReachedTotal());
    CHECK(state.etaSeconds() <= 0.0);
}

TEST_CASE("Raw value assignment leaves metrics stale", "[state][value]")
{
    testing::FakeClock clock;
    core::ProgressState state(10, clock.now);

    state.setCompleted(7);
    CHECK(state.completed() == 7);
    CHECK(state.percent() == 0);

    REQUIRE(state.advance(1, clock.now));
    CHECK(state.percent() == 80);
}

TEST_CASE("Restart and finish measure the execution time", "[state][timing]")
{
    testing::FakeClock clock;
    core::ProgressState state(10, clock.now);

    clock.advance(5000ms);
    state.restart(clock.now);
    clock.advance(1250ms);
    state.finish(clock.now);

    REQUIRE(state.endTime().has_value());
    CHECK(state.executionSeconds() == Approx(1.25));
}

TEST_CASE("Percent stays exact for totals near the int64 range", "[state][percent]")
{
    testing::FakeClock clock;
    core::ProgressState state(1000000000000000000, clock.now);

    REQUIRE(state.advance(500000000000000000, clock.now));
    CHECK(state.percent() == 50);

    REQUIRE(state.advance(499999999999999999, clock.now));
    CHECK(state.percent() == 99);

    REQUIRE(state.advance(1, clock.now));
    CHECK(state.percent() == 100);
    CHECK(state.hasReachedTotal());
}

TEST_CASE("Oversized increments saturate instead of wrapping", "[state][percent]")
{
    testing::FakeClock clock;
    core::ProgressState state(10, clock.now);

    REQUIRE(state.advance(std::numeric_limits<uint64_t>::max(), clock.now));
    CHECK(state.completed() == std::numeric_limits<int64_t>::max());
    CHECK(state.percent() > 100);

    REQUIRE(state.advance(1, clock.now));
    CHECK(state.completed() == std::numeric_limits<int64_t>::max());
}
