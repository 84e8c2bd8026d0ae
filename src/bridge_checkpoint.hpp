/*
 * File: src/bridge_checkpoint.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Named model checkpoints (ModelState) and their on-disk store
 * Notes:
 *  - One JSON document per checkpoint: <dir>/<name>.json
 *  - Checkpoints written atomically via include/atomic_write.hpp
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "atomic_write.hpp"
#include "common/log.hpp"

struct ModelState
{
    std::string model_name;
    std::string algorithm{"es-linear"};
    std::size_t inputs{0};
    std::size_t outputs{0};
    std::vector<double> weights;
    std::uint64_t steps{0};
    std::string saved_at;
};

inline nlohmann::json model_state_to_json(const std::string &name, const ModelState &m)
{
    return nlohmann::json{
        {"name", name},
        {"model_name", m.model_name},
        {"algorithm", m.algorithm},
        {"inputs", m.inputs},
        {"outputs", m.outputs},
        {"weights", m.weights},
        {"steps", m.steps},
        {"saved_at", m.saved_at}};
}

inline ModelState model_state_from_json(const nlohmann::json &j)
{
    try
    {
        ModelState m;
        m.model_name = j.at("model_name").get<std::string>();
        m.algorithm = j.at("algorithm").get<std::string>();
        m.inputs = j.at("inputs").get<std::size_t>();
        m.outputs = j.at("outputs").get<std::size_t>();
        m.weights = j.at("weights").get<std::vector<double>>();
        m.steps = j.value("steps", std::uint64_t{0});
        m.saved_at = j.value("saved_at", std::string());
        return m;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(std::string("malformed checkpoint: ") + e.what());
    }
}

// Checkpoint names become file names, so they are restricted to [A-Za-z0-9_.-].
inline bool valid_checkpoint_name(const std::string &name)
{
    if (name.empty() || name.size() > 128 || name == "." || name == "..")
        return false;
    return std::all_of(name.begin(), name.end(), [](char c)
                       { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                                c == '_' || c == '-' || c == '.'; });
}

class CheckpointStore
{
public:
    virtual ~CheckpointStore() = default;
    // Both throw std::runtime_error (or std::invalid_argument for a bad name) on failure.
    virtual void save(const std::string &name, const ModelState &state) = 0;
    virtual ModelState load(const std::string &name) = 0;
    virtual std::vector<std::string> list() = 0;
};

class FileCheckpointStore : public CheckpointStore
{
    std::filesystem::path dir_;

public:
    explicit FileCheckpointStore(std::filesystem::path dir) : dir_(std::move(dir))
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
            throw std::runtime_error("failed to create checkpoint dir " + dir_.string() + ": " + ec.message());
    }

    const std::filesystem::path &dir() const { return dir_; }

    void save(const std::string &name, const ModelState &state) override
    {
        write_atomic(path_for(name), model_state_to_json(name, state).dump(2));
    }

    ModelState load(const std::string &name) override
    {
        std::string text;
        if (!read_file_all(path_for(name), text))
            throw std::runtime_error("checkpoint not found: " + name);
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            throw std::runtime_error("checkpoint is not valid JSON: " + name);
        return model_state_from_json(j);
    }

    std::vector<std::string> list() override
    {
        std::vector<std::string> names;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec))
        {
            const auto &p = it->path();
            if (p.extension() == ".json" && it->is_regular_file())
                names.push_back(p.stem().string());
        }
        if (ec)
            throw std::runtime_error("failed to list " + dir_.string() + ": " + ec.message());
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    std::filesystem::path path_for(const std::string &name) const
    {
        if (!valid_checkpoint_name(name))
            throw std::invalid_argument("invalid checkpoint name '" + name + "'");
        return dir_ / (name + ".json");
    }
};
