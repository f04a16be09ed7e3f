#include "ChannelConnection.hpp"

bool ChannelConnection::send(const Event &event) {
    if (!open_.load())
        return false;
    std::lock_guard lock(mutex_);
    if (pending_.size() + event.text.size() + 2 > MaxPendingOutput) {
        pending_.clear();
        open_.store(false);
        return false;
    }
    pending_ += event.text;
    pending_ += "\n\r";
    return true;
}

std::string ChannelConnection::take_pending() {
    std::lock_guard lock(mutex_);
    std::string taken;
    taken.swap(pending_);
    return taken;
}

bool ChannelConnection::has_pending() const {
    std::lock_guard lock(mutex_);
    return !pending_.empty();
}
