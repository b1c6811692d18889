#include "collab/SessionManager.h"
#include "config/ServerConfig.h"
#include "networking/ConnectionLayer.h"
#include "networking/ConnectionRegistry.h"
#include "networking/WebSocketServer.h"
#include "presence/PresenceTracker.h"
#include "storage/FileSessionStore.h"
#include "util/Log.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using coedit::util::Log;

int main(int argc, char* argv[]) {
    using namespace coedit;

    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& a : args) {
        if (a == "--help" || a == "-h") {
            std::cout << config::usage();
            return 0;
        }
    }

    config::ServerConfig cfg;
    try {
        cfg = config::parse_command_line(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CoEdit] " << e.what() << "\n" << config::usage();
        return 2;
    }
    Log::set_level(Log::parse_level(cfg.log_level));

    boost::asio::io_context ioc;

    storage::FileSessionStore store(cfg.data_dir);
    presence::PresenceTracker presence(cfg.presence_options());

    std::unique_ptr<networking::WebSocketServer> server;
    try {
        server = std::make_unique<networking::WebSocketServer>(ioc, cfg.bind, cfg.port);
    } catch (const std::exception& e) {
        Log::error("CoEdit", "cannot listen on ", cfg.bind, ":", cfg.port, ": ", e.what());
        return 1;
    }

    // Snapshots are written off the socket threads, one at a time.
    boost::asio::io_context persistence;
    auto persistence_guard = boost::asio::make_work_guard(persistence);
    std::thread persistence_thread([&persistence] { persistence.run(); });

    networking::ConnectionRegistry registry(*server);
    collab::SessionManager sessions(store.collaborators(), registry, persistence, cfg.engine_options());
    networking::ConnectionLayer connections(registry, sessions, presence);

    server->set_on_connect([&](networking::ClientId id, const std::string& target) {
        connections.on_connect(id, target);
    });
    server->set_on_message([&](networking::ClientId id, const std::string& frame) {
        connections.on_message(id, frame);
    });
    server->set_on_disconnect([&](networking::ClientId id) { connections.on_disconnect(id); });

    server->start();
    presence.start(ioc);

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        Log::info("CoEdit", "shutting down...");
        presence.stop();
        connections.shutdown();
        server->stop();
    });

    Log::info("CoEdit", "WS server running on ", cfg.bind, ":", server->port(), " with ", cfg.threads,
              " thread(s), data in ", cfg.data_dir);

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < cfg.threads; ++i) workers.emplace_back([&ioc] { ioc.run(); });
    ioc.run();
    for (auto& t : workers) t.join();

    // Final snapshots go out before the persistence thread is released.
    sessions.shutdown();
    persistence_guard.reset();
    persistence_thread.join();

    if (sessions.persistence_failures() > 0) {
        Log::warn("CoEdit", sessions.persistence_failures(), " snapshot(s) could not be saved");
    }

    Log::info("CoEdit", "exit.");
    return 0;
}
