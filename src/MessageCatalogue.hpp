/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "common/Logger.hpp"

#include <fmt/format.h>

#include <functional>
#include <map>
#include <string>
#include <string_view>

// Player-facing message templates, keyed by name. Templates use fmt named placeholders such as {npc}. Every key
// has a built-in default which the world file may override. Read-only once the world has loaded.
class MessageCatalogue {
    std::map<std::string, std::string, std::less<>> overrides_;
    mutable Logger log_;

    [[nodiscard]] std::string_view template_for(std::string_view key) const;

public:
    MessageCatalogue();

    // Throws std::invalid_argument for a key with no default.
    void set_template(std::string_view key, std::string text);
    [[nodiscard]] static std::string_view default_template(std::string_view key);

    // e.g. format("harvest_begin", fmt::arg("npc", name)). A broken override is logged and the default is used.
    template <typename... Args>
    [[nodiscard]] std::string format(std::string_view key, Args &&...args) const {
        const auto text = template_for(key);
        try {
            return fmt::format(fmt::runtime(text), args...);
        } catch (const fmt::format_error &e) {
            log_.warn("Bad template for message {} ('{}'): {}", key, text, e.what());
        }
        return fmt::format(fmt::runtime(default_template(key)), args...);
    }
};
