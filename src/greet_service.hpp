/*
 * File: src/greet_service.hpp
 * Project: Greet Service
 * Purpose: Process lifecycle: bind, serve on N threads, stop on SIGINT/SIGTERM
 * Notes:
 *  - Returns the process exit code: 0 after a signal, 1 if the bind fails
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "greet_config.hpp"
#include "greet_http.hpp"
#include "greet_log.hpp"
#include "greet_state.hpp"

// on_serving, when set, gets the bound port once the acceptor is listening.
inline int run_service(const ServiceConfig &cfg, const std::function<void(unsigned short)> &on_serving = {})
{
    ServiceState state;
    boost::asio::io_context ioc{cfg.threads};

    std::optional<HttpServer> server;
    try
    {
        server.emplace(ioc, cfg, state);
    }
    catch (const StartupError &e)
    {
        greet_log::error(e.what());
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const beast::error_code &ec, int sig)
                       {
        if (ec)
            return;
        greet_log::info("received signal " + std::to_string(sig) + ", shutting down");
        server->stop([&ioc]
                     { ioc.stop(); }); });

    const auto ep = server->local_endpoint();
    greet_log::info("Server running on port " + std::to_string(ep.port()) + " (" + ep.address().to_string() +
                    ", threads=" + std::to_string(cfg.threads) + ", state=" + phase_name(state.phase) + ")");
    if (on_serving)
        on_serving(ep.port());

    std::vector<std::thread> workers;
    workers.reserve(static_cast<std::size_t>(cfg.threads - 1));
    for (int i = 1; i < cfg.threads; ++i)
        workers.emplace_back([&ioc]
                             { ioc.run(); });
    ioc.run();
    for (auto &t : workers)
        t.join();

    auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
    greet_log::info("stopped after " + std::to_string(up) + "s");
    return 0;
}
