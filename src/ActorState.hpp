/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// The free-form state of a placed NPC. Behaviours own the meaning of most keys; the cycle counter and the harvest
// session keys are shared by convention.
class ActorState {
public:
    using Value = std::variant<bool, int64_t, std::string>;

    static constexpr std::string_view Cycles = "cycles";
    static constexpr std::string_view HarvestActive = "harvest_active";
    static constexpr std::string_view HarvestStartTime = "harvest_start_time";
    static constexpr std::string_view HarvestingPlayer = "harvesting_player";
    static constexpr std::string_view CooldownUntil = "cooldown_until";

    ActorState() = default;
    ActorState(std::initializer_list<std::pair<const std::string, Value>> values) : values_(values) {}

    [[nodiscard]] bool has(std::string_view key) const { return values_.find(key) != values_.end(); }
    [[nodiscard]] std::optional<bool> get_bool(std::string_view key) const;
    [[nodiscard]] std::optional<int64_t> get_int(std::string_view key) const;
    [[nodiscard]] std::optional<std::string> get_string(std::string_view key) const;

    void set(std::string_view key, Value value);
    void erase(std::string_view key);

    // Zero until the first cycle has run.
    [[nodiscard]] int64_t cycles() const { return get_int(Cycles).value_or(0); }
    void cycles(int64_t cycles) { set(Cycles, cycles); }

    [[nodiscard]] bool harvest_active() const { return get_bool(HarvestActive).value_or(false); }

    [[nodiscard]] const std::map<std::string, Value, std::less<>> &values() const noexcept { return values_; }
    // Renders as key=value pairs, for logging.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ActorState &) const = default;

private:
    std::map<std::string, Value, std::less<>> values_;
};
