#include "fake_clock.hpp"
#include "progressbar/core/iteration_adapter.hpp"
#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace progressbar;
using testing::countOccurrences;

namespace
{
core::BarOptions quietOptions()
{
    core::BarOptions options;
    options.print_on_exit = false;
    return options;
}
} // namespace

TEST_CASE("A sequence sets the total and is drained one increment per item", "[iteration]")
{
    testing::FakeClock clock;
    std::ostringstream out;
    core::SequenceProgress<std::string> progress({"a", "b", "c", "d", "e"}, quietOptions(), out,
                                                 clock.source());

    REQUIRE(progress.bar().size() == 5);

    auto adapter = progress.iterate();
    std::vector<std::string> seen;
    for (int pull = 1; pull <= 5; ++pull)
    {
        auto item = adapter.next();
        REQUIRE(item.has_value());
        seen.push_back(*item);
        CHECK(progress.bar().value() == pull);
    }

    CHECK(seen == std::vector<std::string>{"a", "b", "c", "d", "e"});
    CHECK_FALSE(adapter.hasNext());
    CHECK_FALSE(adapter.next().has_value());
    CHECK(progress.bar().value() == 5);
    CHECK(progress.bar().isComplete());
    CHECK(countOccurrences(out.str(), "] 100%") == 1);
}

TEST_CASE("Range-for pulls through the same adapter", "[iteration]")
{
    testing::FakeClock clock;
    std::ostringstream out;
    core::SequenceProgress<int> progress({3, 1, 4}, quietOptions(), out, clock.source());

    auto adapter = progress.iterate();
    std::vector<int> seen;
    for (const auto& value : adapter)
        seen.push_back(value);

    CHECK(seen == std::vector<int>{3, 1, 4});
    CHECK(adapter.position() == 3);
    CHECK(progress.bar().value() == 3);
}

TEST_CASE("An empty sequence is exhausted immediately", "[iteration]")
{
    testing::FakeClock clock;
    std::ostringstream out;
    core::SequenceProgress<int> progress({}, quietOptions(), out, clock.source());

    auto adapter = progress.iterate();
    CHECK_FALSE(adapter.hasNext());
    CHECK_FALSE(adapter.next().has_value());
    CHECK(adapter.begin() == adapter.end());
    CHECK(progress.bar().errors() == 0);
    CHECK(progress.bar().value() == 0);
}

TEST_CASE("Exhausted adapters stay exhausted; a fresh one starts over", "[iteration]")
{
    testing::FakeClock clock;
    std::ostringstream out;
    core::SequenceProgress<int> progress({1, 2}, quietOptions(), out, clock.source());

    auto first = progress.iterate();
    while (first.next())
    {
    }
    CHECK_FALSE(first.next().has_value());
    CHECK(first.position() == 2);

    auto second = progress.iterate();
    CHECK(second.position() == 0);
    CHECK(second.next() == 1);
    CHECK(progress.bar().value() == 3);
}
