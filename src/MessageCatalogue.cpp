/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "MessageCatalogue.hpp"

#include <stdexcept>
#include <utility>

using namespace std::literals;

namespace {

constexpr std::pair<std::string_view, std::string_view> default_templates[] = {
    {"movement_wall_collision"sv, "Ouch! You walked into the wall to the {direction}."sv},
    {"movement_vertical"sv, "Up/Down movement not yet implemented"sv},
    {"movement_invalid"sv, "Invalid direction"sv},
    {"player_left_to"sv, "{name} left to the {direction}."sv},
    {"player_arrives_from"sv, "{name} arrives from the {direction}."sv},
    {"player_entered_world"sv, "{name} has entered the world."sv},
    {"player_left_world"sv, "{name} has left the world."sv},
    {"player_not_found"sv, "Player not found"sv},
    {"player_already_connected"sv, "Player already connected"sv},
    {"room_also_here"sv, "Also here: {entities}"sv},
    {"room_no_one_here"sv, "No one else is here."sv},
    {"room_obvious_exits"sv, "Obvious exits: {directions}"sv},
    {"room_on_ground"sv, "On the ground: {items}"sv},
    {"look_not_here"sv, "You don't see \"{target}\" here."sv},
    {"look_which"sv, "Which did you mean: {choices}?"sv},
    {"harvest_begin"sv, "You begin harvesting the {npc}."sv},
    {"harvest_item_produced"sv, "{npc} pulses {quantity} {item} for harvest."sv},
    {"harvest_ended"sv, "The harvest has ended and this {npc} must recharge before it can be harvested again."sv},
    {"harvest_interrupted"sv, "Your harvesting has been interrupted."sv},
    {"harvest_cooldown"sv, "This creature is not currently capable of harvest."sv},
    {"harvest_already_self"sv, "You are already harvesting the {npc}."sv},
    {"harvest_already_other"sv, "Someone is already harvesting the {npc}."sv},
    {"harvest_not_harvestable"sv, "You can't harvest the {npc}."sv},
    {"route_computed"sv, "Route to {room}: {steps} ({count} steps)."sv},
    {"route_here"sv, "You are already there."sv},
    {"route_unreachable"sv, "No route to that room."sv},
    {"route_started"sv, "Following a route to {room} ({count} steps)."sv},
    {"route_run_started"sv, "Following {route} ({count} steps)."sv},
    {"route_approach"sv, "Heading to the start of {route}."sv},
    {"route_origin_reached"sv, "Reached the start of {route}."sv},
    {"route_origin_unreachable"sv, "You can't find a way to the start of {route}."sv},
    {"route_invalid_steps"sv, "Route {route} has invalid step data."sv},
    {"route_unknown"sv, "There is no route called {route}."sv},
    {"route_step"sv, "Route step {step}/{total}: {direction}."sv},
    {"route_complete"sv, "Route complete!"sv},
    {"route_lap"sv, "Loop {route}: lap {laps} complete."sv},
    {"route_blocked"sv, "Auto-navigation stopped: {direction} path blocked."sv},
    {"route_off_course"sv, "Auto-navigation stopped: the {direction} path no longer leads the same way."sv},
    {"route_paused"sv, "Guided route paused."sv},
    {"route_cancelled"sv, "Guided route stopped."sv},
    {"route_resumed"sv, "Guided route resumed."sv},
    {"route_stale"sv, "You have moved since the route was paused; start it again."sv},
    {"route_interrupted"sv, "Guided route interrupted."sv},
    {"route_nothing_paused"sv, "You have no paused route."sv},
    {"route_nothing_running"sv, "You are not following a route."sv},
};

}

MessageCatalogue::MessageCatalogue() : log_(logger_for("Messages")) {}

std::string_view MessageCatalogue::default_template(std::string_view key) {
    for (const auto &[name, text] : default_templates)
        if (name == key)
            return text;
    throw std::invalid_argument(fmt::format("No message called {}", key));
}

void MessageCatalogue::set_template(std::string_view key, std::string text) {
    // Validates the key.
    (void)default_template(key);
    overrides_.insert_or_assign(std::string(key), std::move(text));
}

std::string_view MessageCatalogue::template_for(std::string_view key) const {
    if (auto it = overrides_.find(key); it != overrides_.end())
        return it->second;
    return default_template(key);
}
