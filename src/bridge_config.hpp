/*
 * File: src/bridge_config.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Bridge configuration: JSON file plus --flag value overrides
 * Notes:
 *  - Unknown keys are ignored; wrong types throw naming the key
 *  - Durations are given in milliseconds
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "atomic_write.hpp"
#include "bridge_classify.hpp"
#include "bridge_env.hpp"
#include "bridge_link.hpp"
#include "bridge_trainer.hpp"
#include "common/log.hpp"

struct BridgeConfig
{
    LinkConfig link;
    // empty url: classification shares the simulation link
    LinkConfig classify_link = []
    {
        LinkConfig c;
        c.name = "classify";
        c.url.clear();
        return c;
    }();
    EnvConfig env;
    TrainerConfig trainer;
    ClassifierConfig classifier;
    std::string checkpoint_dir{"./checkpoints"};
    std::string log_level{"info"};
    int io_threads{2};
    bool console{true};
    bool autostart{false};
};

namespace config_detail
{
    template <typename T>
    void read_key(const nlohmann::json &obj, const std::string &section, const char *key, T &out)
    {
        auto it = obj.find(key);
        if (it == obj.end())
            return;
        // nlohmann converts -1 to a huge unsigned value without complaint
        if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>)
        {
            if (!it->is_number_unsigned())
                throw std::runtime_error("config " + section + key + ": expected a non-negative integer, got " + it->dump());
        }
        try
        {
            out = it->get<T>();
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("config " + section + key + ": " + e.what());
        }
    }

    inline void read_ms(const nlohmann::json &obj, const std::string &section, const char *key,
                        std::chrono::milliseconds &out)
    {
        long long ms = out.count();
        read_key(obj, section, key, ms);
        if (ms < 0)
            throw std::runtime_error("config " + section + key + ": must not be negative");
        out = std::chrono::milliseconds(ms);
    }

    inline const nlohmann::json *section(const nlohmann::json &root, const char *key)
    {
        auto it = root.find(key);
        if (it == root.end())
            return nullptr;
        if (!it->is_object())
            throw std::runtime_error(std::string("config ") + key + ": expected an object");
        return &*it;
    }

    inline void read_link(const nlohmann::json &j, const std::string &s, LinkConfig &c)
    {
        read_key(j, s, "url", c.url);
        read_ms(j, s, "backoff_ms", c.backoff);
        read_key(j, s, "max_attempts", c.max_attempts);
        read_ms(j, s, "connect_timeout_ms", c.connect_timeout);
        read_ms(j, s, "idle_timeout_ms", c.idle_timeout);
        read_key(j, s, "max_pending_sends", c.max_pending_sends);
    }
} // namespace config_detail

inline void validate_bridge_config(const BridgeConfig &c)
{
    auto fail = [](const std::string &what)
    { throw std::runtime_error("config " + what); };
    for (const LinkConfig *l : {&c.link, &c.classify_link})
    {
        if (l->max_attempts < 1)
            fail(l->name + ".max_attempts: must be at least 1");
        if (l->max_pending_sends < 1)
            fail(l->name + ".max_pending_sends: must be at least 1");
    }
    if (c.link.url.empty())
        fail("link.url: must not be empty");
    if (c.env.max_episode_steps < 1)
        fail("env.max_episode_steps: must be at least 1");
    if (c.env.discovery_radius < 0.0)
        fail("env.discovery_radius: must not be negative");
    if (c.trainer.total_steps < 1)
        fail("trainer.total_steps: must be at least 1");
    if (c.trainer.population < 2)
        fail("trainer.population: must be at least 2");
    if (!(c.trainer.noise_std > 0.0))
        fail("trainer.noise_std: must be positive");
    if (!valid_checkpoint_name(c.trainer.model_name))
        fail("trainer.model_name: only [A-Za-z0-9_.-] allowed");
    if (!(c.classifier.healthy_ratio > 0.0 && c.classifier.healthy_ratio < 1.0))
        fail("classifier.healthy_ratio: must be in (0, 1)");
    if (c.io_threads < 1)
        fail("io_threads: must be at least 1");
    try
    {
        parse_log_level(c.log_level);
    }
    catch (const std::invalid_argument &e)
    {
        fail(std::string("log_level: ") + e.what());
    }
}

inline void apply_bridge_json(BridgeConfig &c, const nlohmann::json &root)
{
    using namespace config_detail;
    if (!root.is_object())
        throw std::runtime_error("config: top level must be an object");

    if (auto *l = section(root, "link"))
        read_link(*l, "link.", c.link);
    if (auto *l = section(root, "classify_link"))
        read_link(*l, "classify_link.", c.classify_link);
    if (auto *e = section(root, "env"))
    {
        const std::string s = "env.";
        read_key(*e, s, "altitude_threshold", c.env.altitude_threshold);
        read_key(*e, s, "airborne_reward", c.env.airborne_reward);
        read_key(*e, s, "ground_penalty", c.env.ground_penalty);
        read_key(*e, s, "exploration_scale", c.env.exploration_scale);
        read_key(*e, s, "exploration_cap", c.env.exploration_cap);
        read_key(*e, s, "effort_scale", c.env.effort_scale);
        read_key(*e, s, "speed_threshold", c.env.speed_threshold);
        read_key(*e, s, "speed_penalty", c.env.speed_penalty);
        read_key(*e, s, "discovery_radius", c.env.discovery_radius);
        read_key(*e, s, "discovery_reward", c.env.discovery_reward);
        read_key(*e, s, "crash_altitude", c.env.crash_altitude);
        read_key(*e, s, "bounds", c.env.bounds);
        read_key(*e, s, "max_episode_steps", c.env.max_episode_steps);
    }
    if (auto *t = section(root, "trainer"))
    {
        const std::string s = "trainer.";
        read_key(*t, s, "model_name", c.trainer.model_name);
        read_key(*t, s, "total_steps", c.trainer.total_steps);
        read_key(*t, s, "save_every", c.trainer.save_every);
        read_key(*t, s, "log_interval", c.trainer.log_interval);
        read_ms(*t, s, "step_interval_ms", c.trainer.step_interval);
        read_ms(*t, s, "stop_timeout_ms", c.trainer.stop_timeout);
        read_key(*t, s, "population", c.trainer.population);
        read_key(*t, s, "noise_std", c.trainer.noise_std);
        read_key(*t, s, "learning_rate", c.trainer.learning_rate);
        read_key(*t, s, "reward_window", c.trainer.reward_window);
        read_key(*t, s, "seed", c.trainer.seed);
    }
    if (auto *k = section(root, "classifier"))
    {
        read_key(*k, "classifier.", "healthy_ratio", c.classifier.healthy_ratio);
        read_key(*k, "classifier.", "green_margin", c.classifier.green_margin);
    }
    read_key(root, "", "checkpoint_dir", c.checkpoint_dir);
    read_key(root, "", "log_level", c.log_level);
    read_key(root, "", "io_threads", c.io_threads);
    read_key(root, "", "console", c.console);
    read_key(root, "", "autostart", c.autostart);
}

inline BridgeConfig load_bridge_config(const std::string &path)
{
    std::string text;
    if (!read_file_all(path, text))
        throw std::runtime_error("cannot read config file: " + path);
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("config file is not valid JSON: " + path);
    BridgeConfig c;
    apply_bridge_json(c, j);
    validate_bridge_config(c);
    return c;
}

inline const char *bridge_usage()
{
    return "usage: agmo_bridge [--config file.json] [--sim ws://host:port/path] [--classify-ws url]\n"
           "                   [--checkpoints dir] [--steps N] [--log-level debug|info|warn|error]\n"
           "                   [--no-console] [--autostart]\n";
}

// --config is applied first, then every other flag overrides the file. Throws on a bad flag or value.
inline BridgeConfig apply_cli_overrides(int argc, char **argv)
{
    BridgeConfig c;
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            c = load_bridge_config(argv[i + 1]);
            break;
        }
    }
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::runtime_error("missing value for " + a);
            return argv[++i];
        };
        if (a == "--config")
            value();
        else if (a == "--sim")
            c.link.url = value();
        else if (a == "--classify-ws")
            c.classify_link.url = value();
        else if (a == "--checkpoints")
            c.checkpoint_dir = value();
        else if (a == "--steps")
        {
            const std::string v = value();
            try
            {
                std::size_t used = 0;
                const unsigned long long n = std::stoull(v, &used);
                if (used != v.size() || v.find('-') != std::string::npos)
                    throw std::invalid_argument(v);
                c.trainer.total_steps = n;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("--steps expects a positive integer, got '" + v + "'");
            }
        }
        else if (a == "--log-level")
            c.log_level = value();
        else if (a == "--no-console")
            c.console = false;
        else if (a == "--autostart")
            c.autostart = true;
        else
            throw std::runtime_error("unknown option: " + a);
    }
    validate_bridge_config(c);
    return c;
}
