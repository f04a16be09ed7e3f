/*************************************************************************/
/*  Newhaven (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Newhaven Development Team                                   */
/*************************************************************************/
#include "WorldLoader.hpp"

#include "ArgParser.hpp"
#include "NpcBehaviour.hpp"
#include "common/Logger.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <map>
#include <vector>

using namespace std::literals;

WorldFormatError::WorldFormatError(int line, const std::string &message)
    : std::runtime_error(fmt::format("line {}: {}", line, message)), line_(line) {}

namespace {

struct Record {
    int line;
    std::string keyword;
    std::string arguments;
};

// Pulls typed fields out of one record, throwing WorldFormatError on anything unexpected.
class RecordReader {
    const Record &record_;
    ArgParser args_;

public:
    explicit RecordReader(const Record &record) : record_(record), args_(record.arguments) {}

    [[noreturn]] void fail(const std::string &message) const { throw WorldFormatError(record_.line, message); }

    [[nodiscard]] bool empty() const noexcept { return args_.empty(); }

    std::string text(std::string_view what) {
        if (args_.empty())
            fail(fmt::format("{} record is missing its {}", record_.keyword, what));
        return std::string(args_.shift());
    }

    int number(std::string_view what) {
        if (args_.empty())
            fail(fmt::format("{} record is missing its {}", record_.keyword, what));
        if (auto value = args_.try_shift_number())
            return *value;
        fail(fmt::format("{} record has a non-numeric {} '{}'", record_.keyword, what, args_.shift()));
    }

    uint32_t id(std::string_view what) {
        const auto value = number(what);
        if (value < 0)
            fail(fmt::format("{} record has a negative {}", record_.keyword, what));
        return static_cast<uint32_t>(value);
    }

    Millis millis(std::string_view what) {
        const auto value = number(what);
        if (value < 0)
            fail(fmt::format("{} record has a negative {}", record_.keyword, what));
        return Millis(value);
    }

    Direction direction() {
        const auto word = text("direction");
        if (auto dir = try_parse_direction(word))
            return *dir;
        fail(fmt::format("'{}' is not a direction", word));
    }

    void finish() const {
        if (!args_.empty())
            fail(fmt::format("unexpected '{}' at the end of the {} record", args_.remaining(), record_.keyword));
    }
};

constexpr std::array record_order = {"map"sv,   "room"sv,  "portal"sv, "npc"sv,   "output"sv,  "status"sv,
                                     "actor"sv, "player"sv, "route"sv, "message"sv, "start"sv};

class WorldBuilder {
    World &world_;
    std::map<NpcDefinitionId, NpcDefinition> definitions_;
    Logger log_;

public:
    explicit WorldBuilder(World &world) : world_(world), log_(logger_for("WorldLoader")) {}

    void apply(std::string_view keyword, const Record &record) {
        RecordReader reader(record);
        try {
            if (keyword == "map")
                add_map(reader);
            else if (keyword == "room")
                add_room(reader);
            else if (keyword == "portal")
                add_portal(reader);
            else if (keyword == "npc")
                add_npc(reader);
            else if (keyword == "output")
                add_output(reader);
            else if (keyword == "status")
                add_status(reader);
            else if (keyword == "actor")
                add_actor(reader);
            else if (keyword == "player")
                add_player(reader);
            else if (keyword == "route")
                add_route(reader);
            else if (keyword == "message")
                add_message(reader);
            else if (keyword == "start")
                set_start(reader);
        } catch (const WorldFormatError &) {
            throw;
        } catch (const std::exception &e) {
            // Topology and store rule violations, reported against the line that caused them.
            reader.fail(e.what());
        }
    }

    void add_map(RecordReader &reader) {
        Map map;
        map.id = reader.id("map id");
        map.name = reader.text("name");
        if (!reader.empty())
            map.description = reader.text("description");
        reader.finish();
        world_.topology.add_map(std::move(map));
    }

    void add_room(RecordReader &reader) {
        Room room;
        room.id = reader.id("room id");
        room.coord.map = reader.id("map id");
        room.coord.x = reader.number("x");
        room.coord.y = reader.number("y");
        room.type = reader.text("room type");
        room.name = reader.text("name");
        if (!reader.empty())
            room.description = reader.text("description");
        reader.finish();
        world_.topology.add_room(std::move(room));
    }

    void add_portal(RecordReader &reader) {
        const auto room = reader.id("room id");
        Portal portal;
        portal.direction = reader.direction();
        portal.target.map = reader.id("target map id");
        portal.target.x = reader.number("target x");
        portal.target.y = reader.number("target y");
        reader.finish();
        // A portal to a room that doesn't exist yet is allowed: moving through it is simply blocked.
        if (!world_.topology.map_by_id(portal.target.map))
            log_.warn("Portal from room {} leads to unknown map {}", room, portal.target.map);
        world_.topology.set_portal(room, portal);
    }

    void add_npc(RecordReader &reader) {
        NpcDefinition npc;
        npc.id = reader.id("npc id");
        npc.type = reader.text("type");
        npc.base_cycle_time = reader.millis("base cycle time");
        npc.harvestable_time = reader.millis("harvestable time");
        npc.cooldown_time = reader.millis("cooldown time");
        npc.name = reader.text("name");
        if (!reader.empty())
            npc.description = reader.text("description");
        reader.finish();
        if (!try_parse_npc_type(npc.type))
            log_.warn("NPC {} has unknown type '{}'; it will only count cycles", npc.name, npc.type);
        const auto id = npc.id;
        if (!definitions_.try_emplace(id, std::move(npc)).second)
            reader.fail(fmt::format("duplicate npc id {}", id));
    }

    NpcDefinition &definition(RecordReader &reader, NpcDefinitionId id) {
        auto it = definitions_.find(id);
        if (it == definitions_.end())
            reader.fail(fmt::format("unknown npc id {}", id));
        return it->second;
    }

    void add_output(RecordReader &reader) {
        auto &npc = definition(reader, reader.id("npc id"));
        auto item = reader.text("item");
        const auto quantity = reader.number("quantity");
        reader.finish();
        npc.output_items[std::move(item)] = quantity;
    }

    void add_status(RecordReader &reader) {
        auto &npc = definition(reader, reader.id("npc id"));
        const auto which = reader.text("status");
        auto text = reader.text("text");
        reader.finish();
        if (which == "idle")
            npc.status_texts.idle = std::move(text);
        else if (which == "ready")
            npc.status_texts.ready = std::move(text);
        else if (which == "harvesting")
            npc.status_texts.harvesting = std::move(text);
        else if (which == "cooldown")
            npc.status_texts.cooldown = std::move(text);
        else
            reader.fail(fmt::format("unknown status '{}'", which));
    }

    void add_actor(RecordReader &reader) {
        ActorRecord actor;
        actor.id = reader.id("actor id");
        actor.definition = definition(reader, reader.id("npc id"));
        actor.room = reader.id("room id");
        actor.slot = reader.number("slot");
        if (!reader.empty()) {
            const auto flag = reader.text("flag");
            if (flag != "inactive")
                reader.fail(fmt::format("unknown actor flag '{}'", flag));
            actor.active = false;
        }
        reader.finish();
        if (!world_.topology.room_by_id(actor.room))
            reader.fail(fmt::format("actor {} is placed in unknown room {}", actor.id, actor.room));
        world_.actors.add(std::move(actor));
    }

    void add_player(RecordReader &reader) {
        PlayerRecord player;
        player.name = reader.text("name");
        player.room = reader.id("room id");
        reader.finish();
        world_.players.add(std::move(player));
    }

    void add_route(RecordReader &reader) {
        SavedRoute route;
        route.name = reader.text("name");
        const auto mode = reader.text("mode");
        if (mode == "path")
            route.mode = RouteMode::Path;
        else if (mode == "loop")
            route.mode = RouteMode::Loop;
        else
            reader.fail(fmt::format("route mode must be path or loop, not '{}'", mode));
        route.origin = reader.id("origin room id");
        while (!reader.empty())
            route.directions.push_back(reader.direction());
        if (route.directions.empty())
            reader.fail(fmt::format("route {} has no steps", route.name));
        world_.routes.add(std::move(route));
    }

    void add_message(RecordReader &reader) {
        const auto key = reader.text("key");
        auto text = reader.text("template");
        reader.finish();
        world_.messages.set_template(key, std::move(text));
    }

    void set_start(RecordReader &reader) {
        const auto room = reader.id("room id");
        reader.finish();
        if (!world_.topology.room_by_id(room))
            reader.fail(fmt::format("start room {} does not exist", room));
        world_.start_room = room;
    }
};

}

void load_world(World &world, std::istream &input) {
    std::vector<Record> records;
    std::string line;
    for (int line_number = 1; std::getline(input, line); ++line_number) {
        const auto trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#')
            continue;
        ArgParser args(trimmed);
        auto keyword = lower_case(args.shift());
        if (std::find(record_order.begin(), record_order.end(), keyword) == record_order.end())
            throw WorldFormatError(line_number, fmt::format("unknown record type '{}'", keyword));
        records.push_back(Record{line_number, std::move(keyword), std::string(args.remaining())});
    }

    WorldBuilder builder(world);
    for (auto keyword : record_order)
        for (const auto &record : records)
            if (record.keyword == keyword)
                builder.apply(keyword, record);
}

void load_world_file(World &world, const std::string &path) {
    std::ifstream input(path);
    if (!input)
        throw std::runtime_error(fmt::format("Unable to open world file {}", path));
    load_world(world, input);
}
