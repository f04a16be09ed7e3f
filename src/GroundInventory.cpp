/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "GroundInventory.hpp"

#include <fmt/format.h>

#include <stdexcept>

void GroundInventory::add_item(ContainerId container, std::string_view item, int quantity) {
    if (quantity <= 0)
        throw std::invalid_argument(fmt::format("Cannot add {} of {}", quantity, item));
    std::lock_guard lock(mutex_);
    auto &stacks = containers_[container];
    if (auto it = stacks.find(item); it != stacks.end())
        it->second += quantity;
    else
        stacks.emplace(std::string(item), quantity);
}

std::vector<ItemStack> GroundInventory::items_in(ContainerId container) const {
    std::lock_guard lock(mutex_);
    std::vector<ItemStack> result;
    if (auto it = containers_.find(container); it != containers_.end())
        for (const auto &[name, quantity] : it->second)
            result.push_back(ItemStack{name, quantity});
    return result;
}
