/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "Navigator.hpp"

#include <stdexcept>

ExecutionState Navigator::make_state(std::string name, Route steps, RouteMode mode, Time now) {
    if (steps.empty())
        throw std::invalid_argument("Cannot follow an empty route");
    ExecutionState state;
    state.name = std::move(name);
    state.steps = std::move(steps);
    state.mode = mode;
    if (mode == RouteMode::Loop)
        state.laps = 0;
    state.next_due = now + delay_for(mode);
    state.generation = next_generation_++;
    return state;
}

void Navigator::start(const std::string &identity, std::string name, Route steps, RouteMode mode, Time now) {
    std::lock_guard lock(mutex_);
    states_.insert_or_assign(identity, make_state(std::move(name), std::move(steps), mode, now));
}

void Navigator::start_via(const std::string &identity, Route approach, std::string name, Route steps,
                          RouteMode mode, Time now) {
    if (approach.empty()) {
        start(identity, std::move(name), std::move(steps), mode, now);
        return;
    }
    if (steps.empty())
        throw std::invalid_argument("Cannot follow an empty route");
    std::lock_guard lock(mutex_);
    auto state = make_state(name, std::move(approach), RouteMode::Path, now);
    state.follow_on = FollowOnRoute{std::move(name), std::move(steps), mode};
    states_.insert_or_assign(identity, std::move(state));
}

PauseResult Navigator::pause(const std::string &identity, RoomId room) {
    std::lock_guard lock(mutex_);
    auto it = states_.find(identity);
    if (it == states_.end())
        return PauseResult::NothingToPause;
    auto &state = it->second;
    if (state.status == NavigationStatus::Paused) {
        states_.erase(it);
        return PauseResult::Cancelled;
    }
    state.status = NavigationStatus::Paused;
    state.paused_in = room;
    return PauseResult::Paused;
}

ResumeResult Navigator::resume(const std::string &identity, RoomId room, Time now) {
    std::lock_guard lock(mutex_);
    auto it = states_.find(identity);
    if (it == states_.end() || it->second.status != NavigationStatus::Paused)
        return ResumeResult::NothingPaused;
    auto &state = it->second;
    if (state.paused_in != room) {
        states_.erase(it);
        return ResumeResult::Stale;
    }
    state.status = NavigationStatus::Running;
    state.paused_in.reset();
    state.next_due = now + delay_for(state.mode);
    return ResumeResult::Resumed;
}

bool Navigator::interrupt(const std::string &identity) {
    std::lock_guard lock(mutex_);
    auto it = states_.find(identity);
    if (it == states_.end() || it->second.status != NavigationStatus::Running)
        return false;
    states_.erase(it);
    return true;
}

void Navigator::remove(const std::string &identity) {
    std::lock_guard lock(mutex_);
    states_.erase(identity);
}

std::vector<DueStep> Navigator::due(Time now) {
    std::lock_guard lock(mutex_);
    std::vector<DueStep> result;
    for (auto &[identity, state] : states_) {
        if (state.status != NavigationStatus::Running || state.in_flight || now < state.next_due)
            continue;
        state.in_flight = true;
        result.push_back(
            DueStep{identity, state.generation, state.steps[state.next_step], state.next_step + 1, state.steps.size()});
    }
    return result;
}

StepProgress Navigator::completed(const std::string &identity, uint64_t generation, RoomId arrived_in, Time now) {
    std::lock_guard lock(mutex_);
    auto it = states_.find(identity);
    if (it == states_.end() || it->second.generation != generation)
        return StepProgress{StepOutcome::Superseded, {}, 0, {}};

    auto &state = it->second;
    state.in_flight = false;
    ++state.next_step;
    state.next_due = now + delay_for(state.mode);
    // A stop issued while the move was under way keeps the move, and the route pauses where it landed.
    if (state.status == NavigationStatus::Paused)
        state.paused_in = arrived_in;

    if (state.next_step < state.steps.size())
        return StepProgress{StepOutcome::Continuing, state.name, state.remaining(), state.laps};

    if (state.mode == RouteMode::Loop) {
        state.next_step = 0;
        state.laps = state.laps.value_or(0) + 1;
        return StepProgress{StepOutcome::LapCompleted, state.name, state.remaining(), state.laps};
    }

    if (state.follow_on) {
        auto follow_on = std::move(*state.follow_on);
        const auto was_paused = state.status == NavigationStatus::Paused;
        auto next = make_state(follow_on.name, std::move(follow_on.steps), follow_on.mode, now);
        if (was_paused) {
            next.status = NavigationStatus::Paused;
            next.paused_in = arrived_in;
        }
        const auto remaining = next.remaining();
        const auto laps = next.laps;
        it->second = std::move(next);
        return StepProgress{StepOutcome::FollowOnStarted, follow_on.name, remaining, laps};
    }

    auto name = std::move(state.name);
    states_.erase(it);
    return StepProgress{StepOutcome::Completed, std::move(name), 0, {}};
}

void Navigator::failed(const std::string &identity, uint64_t generation) {
    std::lock_guard lock(mutex_);
    if (auto it = states_.find(identity); it != states_.end() && it->second.generation == generation)
        states_.erase(it);
}

std::optional<ExecutionState> Navigator::state_of(const std::string &identity) const {
    std::lock_guard lock(mutex_);
    if (auto it = states_.find(identity); it != states_.end())
        return it->second;
    return {};
}

size_t Navigator::active_count() const {
    std::lock_guard lock(mutex_);
    return states_.size();
}
