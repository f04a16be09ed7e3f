/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Inventory.hpp"

#include <map>
#include <mutex>
#include <string>

// In-memory ground items, stacked by item name.
class GroundInventory : public Inventory {
    mutable std::mutex mutex_;
    std::map<ContainerId, std::map<std::string, int, std::less<>>> containers_;

public:
    void add_item(ContainerId container, std::string_view item, int quantity) override;
    [[nodiscard]] std::vector<ItemStack> items_in(ContainerId container) const override;
};
