/*
 * File: src/bridge_control.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Operator control surface over the trainer and checkpoint store
 * Notes:
 *  - Every call answers with a status plus a JSON body
 *  - handle_command() is the console front end; one JSON reply per line
 * Last updated: 2026-10-19
 */

#pragma once
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge_checkpoint.hpp"
#include "bridge_trainer.hpp"
#include "common/log.hpp"

enum class SurfaceStatus
{
    Ok,
    AlreadyRunning,
    NotRunning,
    LoadFailed,
    SaveFailed,
    BadRequest
};

inline const char *surface_status_name(SurfaceStatus s)
{
    switch (s)
    {
    case SurfaceStatus::Ok:
        return "ok";
    case SurfaceStatus::AlreadyRunning:
        return "already_running";
    case SurfaceStatus::NotRunning:
        return "not_running";
    case SurfaceStatus::LoadFailed:
        return "load_failed";
    case SurfaceStatus::SaveFailed:
        return "save_failed";
    case SurfaceStatus::BadRequest:
        return "bad_request";
    }
    return "unknown";
}

inline SurfaceStatus to_surface_status(TrainerStatus s)
{
    switch (s)
    {
    case TrainerStatus::Ok:
        return SurfaceStatus::Ok;
    case TrainerStatus::AlreadyRunning:
        return SurfaceStatus::AlreadyRunning;
    case TrainerStatus::NotRunning:
        return SurfaceStatus::NotRunning;
    case TrainerStatus::LoadFailed:
        return SurfaceStatus::LoadFailed;
    }
    return SurfaceStatus::BadRequest;
}

struct SurfaceReply
{
    SurfaceStatus status{SurfaceStatus::Ok};
    nlohmann::json body = nlohmann::json::object();

    bool ok() const { return status == SurfaceStatus::Ok; }

    std::string to_line() const
    {
        nlohmann::json j = body;
        j["status"] = surface_status_name(status);
        return j.dump();
    }
};

class ControlSurface
{
    Trainer &trainer_;
    CheckpointStore &store_;
    std::function<nlohmann::json()> link_report_;

public:
    ControlSurface(Trainer &trainer, CheckpointStore &store,
                   std::function<nlohmann::json()> link_report = nullptr)
        : trainer_(trainer), store_(store), link_report_(std::move(link_report)) {}

    SurfaceReply get_status() const
    {
        const auto r = trainer_.metrics();
        return {SurfaceStatus::Ok, nlohmann::json{
                                       {"is_training", r.is_training},
                                       {"state", run_state_name(r.state)},
                                       {"total_timesteps", r.total_steps},
                                       {"current_timesteps", r.steps_completed},
                                       {"episodes", r.episodes},
                                       {"mean_reward", r.mean_reward},
                                       {"model_name", r.model_name}}};
    }

    SurfaceReply start_training()
    {
        const auto s = trainer_.start();
        if (s == TrainerStatus::Ok)
            return {SurfaceStatus::Ok, {{"message", "Training started successfully"}}};
        return {to_surface_status(s), {{"error", "Training already in progress"}}};
    }

    SurfaceReply stop_training()
    {
        const auto s = trainer_.stop();
        if (s == TrainerStatus::Ok)
            return {SurfaceStatus::Ok, {{"message", "Training stopped successfully"}}};
        return {to_surface_status(s), {{"error", "No training in progress"}}};
    }

    SurfaceReply load_model(const std::string &name)
    {
        std::string error;
        const auto s = trainer_.load_model(name, error);
        if (s == TrainerStatus::Ok)
            return {SurfaceStatus::Ok, {{"message", "Model " + name + " loaded successfully"}}};
        return {to_surface_status(s), {{"error", "Failed to load model: " + error}}};
    }

    SurfaceReply save_model(const std::string &name)
    {
        if (!name.empty() && !valid_checkpoint_name(name))
            return {SurfaceStatus::BadRequest, {{"error", "invalid model name '" + name + "'"}}};
        if (!trainer_.checkpoint(name))
            return {SurfaceStatus::SaveFailed, {{"error", "Failed to save model"}}};
        return {SurfaceStatus::Ok, {{"message", "Model saved"}, {"name", trainer_.metrics().last_checkpoint}}};
    }

    SurfaceReply get_metrics() const
    {
        const auto r = trainer_.metrics();
        return {SurfaceStatus::Ok, nlohmann::json{
                                       {"training_metrics", training_run_json(r, true)},
                                       {"model_info", {{"model_name", r.model_name},
                                                       {"algorithm", LinearPolicy::kAlgorithm},
                                                       {"inputs", kFeatureSize},
                                                       {"outputs", kActionSize}}}}};
    }

    SurfaceReply list_models()
    {
        try
        {
            return {SurfaceStatus::Ok, {{"models", store_.list()}}};
        }
        catch (const std::exception &e)
        {
            log_error("control", std::string("failed to list models: ") + e.what());
            return {SurfaceStatus::LoadFailed, {{"error", e.what()}}};
        }
    }

    SurfaceReply link_status() const
    {
        if (!link_report_)
            return {SurfaceStatus::Ok, {{"links", nlohmann::json::array()}}};
        return {SurfaceStatus::Ok, link_report_()};
    }

    // status | start | stop | metrics | load <name> | save [name] | models | link | help
    SurfaceReply handle_command(const std::string &line)
    {
        std::istringstream in(line);
        std::vector<std::string> words;
        for (std::string w; in >> w;)
            words.push_back(w);
        if (words.empty())
            return {SurfaceStatus::BadRequest, {{"error", "empty command"}}};

        const std::string &cmd = words[0];
        if (cmd == "status" && words.size() == 1)
            return get_status();
        if (cmd == "start" && words.size() == 1)
            return start_training();
        if (cmd == "stop" && words.size() == 1)
            return stop_training();
        if (cmd == "metrics" && words.size() == 1)
            return get_metrics();
        if (cmd == "load" && words.size() == 2)
            return load_model(words[1]);
        if (cmd == "save" && words.size() <= 2)
            return save_model(words.size() == 2 ? words[1] : std::string());
        if (cmd == "models" && words.size() == 1)
            return list_models();
        if (cmd == "link" && words.size() == 1)
            return link_status();
        if (cmd == "help")
            return {SurfaceStatus::Ok, {{"commands", {"status", "start", "stop", "metrics", "load <name>",
                                                      "save [name]", "models", "link", "quit"}}}};
        return {SurfaceStatus::BadRequest, {{"error", "unknown command: " + line}}};
    }
};
