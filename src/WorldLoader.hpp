/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#pragma once

#include "World.hpp"

#include <istream>
#include <stdexcept>
#include <string>

// A malformed world file. The message names the offending line.
class WorldFormatError : public std::runtime_error {
public:
    WorldFormatError(int line, const std::string &message);
    [[nodiscard]] int line() const noexcept { return line_; }

private:
    int line_;
};

// Reads a world description into the (empty) world. Records may appear in any order: maps and rooms are read first,
// then portals, NPCs, actors, players, routes and messages.
void load_world(World &world, std::istream &input);
// Throws std::runtime_error if the file can't be opened.
void load_world_file(World &world, const std::string &path);
