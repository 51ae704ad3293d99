/*
 * File: src/relay_main.cpp
 * Project: Display Relay
 * Purpose: Main server binary: HTTP upload/claim endpoints, WS relay, eviction sweep
 * Notes:
 *  - SIGINT/SIGTERM stop the sweep and the io_context
 * Last updated: 2026-10-18
 */

#include <filesystem>
#include <iostream>
#include <boost/asio.hpp>
#include "relay_config.hpp"
#include "relay_eviction.hpp"
#include "relay_http.hpp"
#include "relay_log.hpp"
#include "relay_state.hpp"
#include "relay_ws.hpp"

int main(int argc, char **argv)
{
    try
    {
        RelayState state{parse_args(argc, argv)};
        const RelayConfig &cfg = state.config;

        for (const auto &dir : {cfg.uploads_dir, cfg.sounds_dir})
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec)
                throw std::runtime_error("failed to create " + dir + ": " + ec.message());
        }

        auto http_bind = parse_endpoint(cfg.http_bind);
        auto ws_bind = parse_endpoint(cfg.ws_bind);

        boost::asio::io_context ioc{1};
        HttpServer http{ioc, {boost::asio::ip::make_address(http_bind.host), http_bind.port}, state};
        WsServer ws{ioc, {boost::asio::ip::make_address(ws_bind.host), ws_bind.port}, state};

        EvictionScheduler eviction{state.store, EvictionConfig{cfg.uploads_dir, cfg.sounds_dir, cfg.eviction_threshold, cfg.eviction_interval}};
        eviction.start();

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code &ec, int sig)
                           {
            if (ec)
                return;
            Log::info("main", "signal " + std::to_string(sig) + ", shutting down");
            eviction.stop();
            http.stop();
            ws.stop();
            ioc.stop(); });

        Log::info("main", "relay listening http=" + cfg.http_bind + " ws=" + cfg.ws_bind +
                              " uploads=" + cfg.uploads_dir + " sounds=" + cfg.sounds_dir);
        ioc.run();
        eviction.stop();
        return 0;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "relay_server: " << e.what() << "\n"
                  << "usage: relay_server [--http host:port] [--ws host:port] [--uploads dir] [--sounds dir]\n"
                  << "                    [--threshold seconds] [--interval ms] [--queue n]\n";
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "relay_server error: " << e.what() << "\n";
        return 1;
    }
}
