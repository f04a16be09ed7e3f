/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Actor.hpp"

#include <string_view>
#include <vector>

using ContainerId = uint32_t;

// Item containers; a room's ground is the container with the room's id.
struct Inventory {
    virtual ~Inventory() = default;

    // Throws std::invalid_argument for a non-positive quantity.
    virtual void add_item(ContainerId container, std::string_view item, int quantity) = 0;
    [[nodiscard]] virtual std::vector<ItemStack> items_in(ContainerId container) const = 0;
};
