/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Pathfinding.hpp"
#include "common/Time.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class RouteMode { Path, Loop };
enum class NavigationStatus { Running, Paused, Stopped };

// A route queued to start as soon as the current one completes, used to walk to a saved route's origin first.
struct FollowOnRoute {
    std::string name;
    Route steps;
    RouteMode mode;
};

// One player's guided route in progress.
struct ExecutionState {
    std::string name;
    Route steps;
    RouteMode mode{RouteMode::Path};
    NavigationStatus status{NavigationStatus::Running};
    size_t next_step{};
    // Only loops count laps.
    std::optional<uint32_t> laps;
    std::optional<RoomId> paused_in;
    Time next_due{};
    uint64_t generation{};
    bool in_flight{};
    std::optional<FollowOnRoute> follow_on;

    [[nodiscard]] size_t remaining() const noexcept { return steps.size() - next_step; }
};

// A step whose time has come, to be executed through the normal movement path.
struct DueStep {
    std::string identity;
    uint64_t generation;
    RouteStep step;
    size_t step_number;
    size_t total;
};

enum class PauseResult { Paused, Cancelled, NothingToPause };
enum class ResumeResult { Resumed, Stale, NothingPaused };
enum class StepOutcome { Continuing, LapCompleted, Completed, FollowOnStarted, Superseded };

struct StepProgress {
    StepOutcome outcome;
    std::string route_name;
    size_t remaining{};
    std::optional<uint32_t> laps;
};

// Owns every player's guided route. Nothing here moves a player: the game asks which steps are due, performs each
// move exactly as it would a manual one, and reports back. Stopping therefore only ever takes effect between
// steps.
class Navigator {
    Millis path_step_delay_;
    Millis loop_step_delay_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExecutionState> states_;
    uint64_t next_generation_{1};

    [[nodiscard]] Millis delay_for(RouteMode mode) const noexcept {
        return mode == RouteMode::Loop ? loop_step_delay_ : path_step_delay_;
    }
    ExecutionState make_state(std::string name, Route steps, RouteMode mode, Time now);

public:
    Navigator(Millis path_step_delay, Millis loop_step_delay)
        : path_step_delay_(path_step_delay), loop_step_delay_(loop_step_delay) {}

    // Replaces any route the player already had. Throws std::invalid_argument for an empty route.
    void start(const std::string &identity, std::string name, Route steps, RouteMode mode, Time now);
    // Walks the approach first, then starts the route. An empty approach starts the route straight away.
    void start_via(const std::string &identity, Route approach, std::string name, Route steps, RouteMode mode,
                   Time now);

    // Pauses a running route in the given room; a second stop cancels it outright.
    PauseResult pause(const std::string &identity, RoomId room);
    // Only resumes if the player is still in the room where they paused. A stale route is discarded.
    ResumeResult resume(const std::string &identity, RoomId room, Time now);
    // A manual move. Returns true if it cancelled a running route. A paused route is kept, and goes stale on resume.
    bool interrupt(const std::string &identity);
    void remove(const std::string &identity);

    [[nodiscard]] std::vector<DueStep> due(Time now);
    StepProgress completed(const std::string &identity, uint64_t generation, RoomId arrived_in, Time now);
    void failed(const std::string &identity, uint64_t generation);

    [[nodiscard]] std::optional<ExecutionState> state_of(const std::string &identity) const;
    [[nodiscard]] size_t active_count() const;
};
