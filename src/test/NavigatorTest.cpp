#include "Navigator.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace std::literals;

namespace {

const auto t0 = from_epoch_millis(1'700'000'000'000);
constexpr auto path_delay = 1000ms;
constexpr auto loop_delay = 2000ms;

// East along a corridor from room 1.
Route corridor(size_t steps) {
    Route route;
    for (size_t i = 0; i < steps; ++i)
        route.push_back(RouteStep{Direction::East, static_cast<RoomId>(i + 2)});
    return route;
}

}

TEST_CASE("Guided navigation") {
    Navigator navigator(path_delay, loop_delay);
    const std::string aria = "Aria";

    // Takes the one step due for Aria at the given time, and reports it as done.
    auto take_step = [&](Time now) {
        const auto due = navigator.due(now);
        REQUIRE(due.size() == 1);
        CHECK(due.front().identity == aria);
        return navigator.completed(aria, due.front().generation, due.front().step.room, now);
    };

    SECTION("should refuse an empty route") {
        CHECK_THROWS_AS(navigator.start(aria, "nowhere", Route{}, RouteMode::Path, t0), std::invalid_argument);
        CHECK(navigator.active_count() == 0);
    }
    SECTION("should wait for each step to come due") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        CHECK(navigator.due(t0).empty());
        CHECK(navigator.due(t0 + 999ms).empty());
        const auto due = navigator.due(t0 + path_delay);
        REQUIRE(due.size() == 1);
        CHECK(due.front().step == RouteStep{Direction::East, 2});
        CHECK(due.front().step_number == 1);
        CHECK(due.front().total == 3);
        SECTION("and hand each step out only once") { CHECK(navigator.due(t0 + 5s).empty()); }
    }
    SECTION("should finish a path after its last step") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        auto progress = take_step(t0 + 1s);
        CHECK(progress.outcome == StepOutcome::Continuing);
        CHECK(progress.remaining == 2);
        CHECK(!progress.laps);
        CHECK(take_step(t0 + 2s).outcome == StepOutcome::Continuing);
        progress = take_step(t0 + 3s);
        CHECK(progress.outcome == StepOutcome::Completed);
        CHECK(progress.route_name == "Lake");
        CHECK(!navigator.state_of(aria));
        CHECK(navigator.due(t0 + 10s).empty());
    }
    SECTION("should go round a loop forever, counting laps") {
        navigator.start(aria, "Patrol", corridor(2), RouteMode::Loop, t0);
        CHECK(navigator.state_of(aria)->laps == 0u);
        CHECK(navigator.due(t0 + path_delay).empty());
        auto now = t0;
        for (uint32_t lap = 1; lap <= 3; ++lap) {
            now += loop_delay;
            CHECK(take_step(now).outcome == StepOutcome::Continuing);
            now += loop_delay;
            const auto progress = take_step(now);
            CHECK(progress.outcome == StepOutcome::LapCompleted);
            CHECK(progress.laps == lap);
            CHECK(navigator.state_of(aria)->next_step == 0);
        }
        CHECK(navigator.state_of(aria)->status == NavigationStatus::Running);
    }
    SECTION("should pause and resume in place") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        take_step(t0 + 1s);
        CHECK(navigator.pause(aria, 2) == PauseResult::Paused);
        CHECK(navigator.state_of(aria)->status == NavigationStatus::Paused);
        CHECK(navigator.due(t0 + 10s).empty());
        CHECK(navigator.resume(aria, 2, t0 + 10s) == ResumeResult::Resumed);
        const auto state = navigator.state_of(aria);
        CHECK(state->status == NavigationStatus::Running);
        CHECK(state->remaining() == 2);
        CHECK(navigator.due(t0 + 10s).empty());
        CHECK(take_step(t0 + 11s).outcome == StepOutcome::Continuing);
    }
    SECTION("should cancel on a second stop") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        CHECK(navigator.pause(aria, 1) == PauseResult::Paused);
        CHECK(navigator.pause(aria, 1) == PauseResult::Cancelled);
        CHECK(!navigator.state_of(aria));
        CHECK(navigator.pause(aria, 1) == PauseResult::NothingToPause);
    }
    SECTION("should refuse to resume somewhere else") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        CHECK(navigator.pause(aria, 1) == PauseResult::Paused);
        CHECK(navigator.resume(aria, 7, t0 + 1s) == ResumeResult::Stale);
        CHECK(!navigator.state_of(aria));
        CHECK(navigator.resume(aria, 1, t0 + 1s) == ResumeResult::NothingPaused);
    }
    SECTION("should only resume a paused route") {
        CHECK(navigator.resume(aria, 1, t0) == ResumeResult::NothingPaused);
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        CHECK(navigator.resume(aria, 1, t0) == ResumeResult::NothingPaused);
    }
    SECTION("should keep a move already under way when paused") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        const auto due = navigator.due(t0 + 1s);
        REQUIRE(due.size() == 1);
        CHECK(navigator.pause(aria, 1) == PauseResult::Paused);
        CHECK(navigator.completed(aria, due.front().generation, 2, t0 + 1s).outcome == StepOutcome::Continuing);
        CHECK(navigator.state_of(aria)->paused_in == 2u);
        CHECK(navigator.resume(aria, 2, t0 + 2s) == ResumeResult::Resumed);
    }
    SECTION("manual moves") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        SECTION("should cancel a running route") {
            CHECK(navigator.interrupt(aria));
            CHECK(!navigator.state_of(aria));
            CHECK(!navigator.interrupt(aria));
        }
        SECTION("should leave a paused route to go stale") {
            CHECK(navigator.pause(aria, 1) == PauseResult::Paused);
            CHECK(!navigator.interrupt(aria));
            CHECK(navigator.resume(aria, 2, t0 + 1s) == ResumeResult::Stale);
        }
    }
    SECTION("should ignore reports about a replaced route") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        const auto due = navigator.due(t0 + 1s);
        REQUIRE(due.size() == 1);
        navigator.start(aria, "Hill", corridor(2), RouteMode::Path, t0 + 1s);
        CHECK(navigator.completed(aria, due.front().generation, 2, t0 + 1s).outcome == StepOutcome::Superseded);
        navigator.failed(aria, due.front().generation);
        const auto state = navigator.state_of(aria);
        REQUIRE(state);
        CHECK(state->name == "Hill");
        CHECK(state->next_step == 0);
    }
    SECTION("should drop a route whose step failed") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        const auto due = navigator.due(t0 + 1s);
        REQUIRE(due.size() == 1);
        navigator.failed(aria, due.front().generation);
        CHECK(!navigator.state_of(aria));
    }
    SECTION("should walk to the start of a route first") {
        Route approach{{Direction::West, 1}};
        navigator.start_via(aria, std::move(approach), "Patrol", corridor(2), RouteMode::Loop, t0);
        CHECK(navigator.state_of(aria)->mode == RouteMode::Path);
        const auto progress = take_step(t0 + 1s);
        CHECK(progress.outcome == StepOutcome::FollowOnStarted);
        CHECK(progress.route_name == "Patrol");
        CHECK(progress.remaining == 2);
        const auto state = navigator.state_of(aria);
        CHECK(state->mode == RouteMode::Loop);
        CHECK(state->laps == 0u);
        CHECK(take_step(t0 + 3s).outcome == StepOutcome::Continuing);
    }
    SECTION("should start straight away with no approach") {
        navigator.start_via(aria, Route{}, "Patrol", corridor(2), RouteMode::Loop, t0);
        CHECK(navigator.state_of(aria)->mode == RouteMode::Loop);
    }
    SECTION("should track players independently") {
        navigator.start(aria, "Lake", corridor(3), RouteMode::Path, t0);
        navigator.start("Bram", "Patrol", corridor(2), RouteMode::Loop, t0);
        CHECK(navigator.active_count() == 2);
        CHECK(navigator.due(t0 + 1s).size() == 1);
        CHECK(navigator.due(t0 + 2s).size() == 1);
        navigator.remove("Bram");
        CHECK(navigator.active_count() == 1);
    }
}
