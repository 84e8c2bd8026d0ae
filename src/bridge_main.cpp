/*
 * File: src/bridge_main.cpp
 * Project: AGMO Sim Bridge
 * Purpose: Main bridge binary: sim link, environment, trainer, classification, console
 * Notes:
 *  - Console commands on stdin, one JSON reply per line on stdout
 *  - SIGINT/SIGTERM trigger the same shutdown as `quit`
 * Last updated: 2026-10-19
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include <boost/asio.hpp>

#include "bridge_checkpoint.hpp"
#include "bridge_classify.hpp"
#include "bridge_config.hpp"
#include "bridge_control.hpp"
#include "bridge_env.hpp"
#include "bridge_link.hpp"
#include "bridge_trainer.hpp"

// Waits up to `timeout` for a line on stdin. Returns false on timeout; sets `eof` at end of input.
static bool read_console_line(std::string &line, std::chrono::milliseconds timeout, bool &eof)
{
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc <= 0)
        return false;
    if (!std::getline(std::cin, line))
    {
        eof = true;
        return false;
    }
    return true;
}

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            std::cout << bridge_usage();
            return 0;
        }
    }

    BridgeConfig cfg;
    try
    {
        cfg = apply_cli_overrides(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "agmo_bridge: " << e.what() << "\n"
                  << bridge_usage();
        return 2;
    }
    set_log_level(parse_log_level(cfg.log_level));

    try
    {
        boost::asio::io_context ioc{cfg.io_threads};
        auto work = boost::asio::make_work_guard(ioc);

        auto sim_link = std::make_shared<StreamLink>(ioc, cfg.link);
        std::shared_ptr<StreamLink> classify_link = sim_link;
        if (!cfg.classify_link.url.empty())
            classify_link = std::make_shared<StreamLink>(ioc, cfg.classify_link);
        std::vector<std::shared_ptr<StreamLink>> links{sim_link};
        if (classify_link != sim_link)
            links.push_back(classify_link);

        ControlEnvironment env{cfg.env, sim_link.get()};
        env.attach(*sim_link);

        GreennessClassifier classifier{cfg.classifier};
        ClassificationBridge bridge{classifier, *classify_link};
        bridge.attach(*classify_link);
        classify_link->on_unknown([tag = classify_link->config().name](const InboundMessage &m)
                                  { log_warn(tag.c_str(), "ignoring message type '" + std::get<UnknownMsg>(m.payload).tag + "'"); });

        FileCheckpointStore store{cfg.checkpoint_dir};
        Trainer trainer{env, store, cfg.trainer};
        ControlSurface surface{trainer, store, [&]
                               {
                                   nlohmann::json arr = nlohmann::json::array();
                                   for (const auto &l : links)
                                   {
                                       auto j = link_status_json(l->status());
                                       j["name"] = l->config().name;
                                       arr.push_back(j);
                                   }
                                   return nlohmann::json{
                                       {"links", arr},
                                       {"environment", env.stats()},
                                       {"classification", bridge.stats()}};
                               }};

        std::atomic<bool> quit{false};
        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&quit](const boost::system::error_code &ec, int sig)
                           {
            if (ec)
                return;
            log_info("bridge", "signal " + std::to_string(sig) + " received, shutting down");
            quit = true; });

        std::vector<std::thread> io_threads;
        for (int i = 0; i < cfg.io_threads; ++i)
            io_threads.emplace_back([&ioc]
                                    { ioc.run(); });

        for (const auto &l : links)
            l->connect();
        log_info("bridge", "agmo_bridge up: sim=" + cfg.link.url + " checkpoints=" + cfg.checkpoint_dir +
                               " io_threads=" + std::to_string(cfg.io_threads));

        if (cfg.autostart)
        {
            try
            {
                std::cout << surface.start_training().to_line() << std::endl;
            }
            catch (const std::exception &e)
            {
                log_error("bridge", std::string("autostart failed: ") + e.what());
            }
        }

        bool console = cfg.console;
        while (!quit)
        {
            if (!console)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                continue;
            }
            std::string line;
            bool eof = false;
            if (!read_console_line(line, std::chrono::milliseconds(200), eof))
            {
                if (eof)
                {
                    log_info("bridge", "console closed; waiting for a signal");
                    console = false;
                }
                continue;
            }
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;
            if (line == "quit" || line == "exit")
                break;
            try
            {
                std::cout << surface.handle_command(line).to_line() << std::endl;
            }
            catch (const std::exception &e)
            {
                log_error("bridge", "command '" + line + "' failed: " + e.what());
            }
        }

        // shutdown: trainer, links, io
        trainer.shutdown();
        for (const auto &l : links)
            l->disconnect();
        signals.cancel();
        work.reset();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!ioc.stopped() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        if (!ioc.stopped())
        {
            log_warn("bridge", "io did not drain within 2s; forcing stop");
            ioc.stop();
        }
        for (auto &t : io_threads)
            t.join();
        log_info("bridge", "bye");
        return 0;
    }
    catch (const std::exception &e)
    {
        log_error("bridge", std::string("fatal: ") + e.what());
        return 1;
    }
}
