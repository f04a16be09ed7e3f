/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "Event.hpp"

// The sending half of a client connection. Implementations must be safe to call from any thread and must never
// block: when a peer has gone or cannot keep up, send returns false and the caller moves on.
struct Connection {
    virtual ~Connection() = default;

    [[nodiscard]] virtual bool send(const Event &event) = 0;
    [[nodiscard]] virtual bool is_open() const = 0;
};
