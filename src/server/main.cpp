// The Newhaven server: loads the world, starts the NPC scheduler and serves clients until told to stop.

#include "Game.hpp"
#include "Navigator.hpp"
#include "NpcScheduler.hpp"
#include "PresenceRegistry.hpp"
#include "RoomBroadcaster.hpp"
#include "Server.hpp"
#include "World.hpp"
#include "WorldLoader.hpp"
#include "common/Configuration.hpp"
#include "common/Logger.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <csignal>

namespace {

volatile std::sig_atomic_t shutdown_requested = 0;

void request_shutdown(int) { shutdown_requested = 1; }

}

int Main(Logger &log, int argc, char *argv[]) {
    bool help = false;
    bool debug = false;
    int port = 0;
    auto cli = lyra::cli() | lyra::help(help).description("Newhaven multiplayer world server.")
               | lyra::opt(debug)["-d"]["--debug"]("enable debug logging")
               | lyra::opt(port, "port")["-p"]["--port"]("listen on this port instead of $NEWHAVEN_PORT");

    auto result = cli.parse({argc, argv});
    if (!result) {
        fmt::print("Error in command line: {}\n", result.errorMessage());
        return 1;
    } else if (help) {
        fmt::print("{}", fmt::streamed(cli));
        return 0;
    }

    if (debug) {
        log.info("Debug logging enabled");
        set_log_level(spdlog::level::debug);
    }

    Configuration config;
    if (port > 0)
        config.override_port(static_cast<uint>(port));

    World world;
    load_world_file(world, config.world_file());
    log.info("Loaded {} rooms and {} saved routes from {}", world.topology.room_count(), world.routes.size(),
             config.world_file());

    PresenceRegistry presence(world.topology);
    RoomBroadcaster broadcaster(presence);
    NpcScheduler scheduler(world.actors, world.ground, presence, broadcaster, world.messages, config.tick_interval());
    Navigator navigator(config.step_delay(), config.loop_step_delay());
    Game game(world, presence, broadcaster, scheduler, navigator);
    Server server(game, static_cast<uint16_t>(config.port()), config.max_connections());

    // Dropped connections surface as write errors rather than signals.
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, request_shutdown);
    signal(SIGTERM, request_shutdown);

    if (!scheduler.start())
        log.warn("NPC scheduler was already running");
    while (!shutdown_requested)
        server.poll();

    log.info("Shutting down");
    scheduler.stop();
    return 0;
}

int main(int argc, char *argv[]) {
    auto log = logger_for("main");
    try {
        return Main(log, argc, argv);
    } catch (const std::exception &e) {
        log.error("{}", e.what());
        return 1;
    }
}
