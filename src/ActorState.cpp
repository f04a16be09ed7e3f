/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "ActorState.hpp"

#include <fmt/format.h>

namespace {

template <typename T>
std::optional<T> value_as(const std::map<std::string, ActorState::Value, std::less<>> &values, std::string_view key) {
    auto it = values.find(key);
    if (it == values.end())
        return {};
    if (auto *value = std::get_if<T>(&it->second))
        return *value;
    return {};
}

}

std::optional<bool> ActorState::get_bool(std::string_view key) const { return value_as<bool>(values_, key); }

std::optional<int64_t> ActorState::get_int(std::string_view key) const { return value_as<int64_t>(values_, key); }

std::optional<std::string> ActorState::get_string(std::string_view key) const {
    return value_as<std::string>(values_, key);
}

void ActorState::set(std::string_view key, Value value) {
    if (auto it = values_.find(key); it != values_.end())
        it->second = std::move(value);
    else
        values_.emplace(std::string(key), std::move(value));
}

void ActorState::erase(std::string_view key) {
    if (auto it = values_.find(key); it != values_.end())
        values_.erase(it);
}

std::string ActorState::to_string() const {
    std::string result;
    for (const auto &[key, value] : values_) {
        if (!result.empty())
            result += ' ';
        std::visit([&, &key = key](const auto &v) { result += fmt::format("{}={}", key, v); }, value);
    }
    return result;
}
