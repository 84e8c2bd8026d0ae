/*
 * File: src/bridge_env.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Gym-style reset/step environment over the latest simulation state
 * Notes:
 *  - step() never waits for the observation caused by its own action
 *  - Observation cache is written by the link strand, read by the trainer
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <cmath>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/log.hpp"
#include "common/messages.hpp"
#include "common/observation.hpp"

struct EnvConfig
{
    double altitude_threshold{1.0};
    double airborne_reward{0.1};
    double ground_penalty{1.0};
    double exploration_scale{0.1};
    double exploration_cap{0.5};
    double effort_scale{0.01};
    double speed_threshold{5.0};
    double speed_penalty{0.1};
    double discovery_radius{2.0};
    double discovery_reward{1.0};
    double crash_altitude{0.5};
    double bounds{30.0};
    std::uint64_t max_episode_steps{1000};
};

struct StepInfo
{
    std::uint64_t episode_step{0};
    double total_reward{0.0};
    std::size_t entities_credited{0};
    double sim_reward{0.0};
    bool sim_done{false};
    bool reset_acknowledged{false};
};

struct StepResult
{
    std::shared_ptr<const Observation> observation;
    double reward{0.0};
    bool terminated{false};
    bool truncated{false};
    StepInfo info;
};

inline nlohmann::json step_info_json(const StepInfo &i)
{
    return nlohmann::json{
        {"episode_step", i.episode_step},
        {"total_reward", i.total_reward},
        {"plants_identified", i.entities_credited},
        {"sim_reward", i.sim_reward},
        {"sim_done", i.sim_done},
        {"reset_acknowledged", i.reset_acknowledged}};
}

// What the trainer drives. ControlEnvironment is the production implementation.
class GymEnvironment
{
public:
    virtual ~GymEnvironment() = default;
    virtual std::shared_ptr<const Observation> reset() = 0;
    virtual StepResult step(const Action &action) = 0;
    virtual std::string name() const = 0;
};

// Entities inside the discovery radius that have not been credited this episode.
inline std::vector<std::string> discoverable_entities(const Observation &obs, const EpisodeState &ep, const EnvConfig &cfg)
{
    std::vector<std::string> out;
    const Vec3 pos = obs.position();
    for (std::size_t i = 0; i < obs.entity_count; ++i)
    {
        const auto &id = obs.entity_ids[i];
        if (ep.credited_entities.count(id))
            continue;
        const float dx = obs.entity_positions[i][0] - pos[0];
        const float dz = obs.entity_positions[i][2] - pos[2];
        if (std::sqrt(dx * dx + dz * dz) <= cfg.discovery_radius)
            out.push_back(id);
    }
    return out;
}

// Pure function of (observation, action, episode state); no member state is touched.
inline double compute_reward(const Observation &obs, const Action &action, const EpisodeState &ep, const EnvConfig &cfg)
{
    double reward = 0.0;
    const Vec3 pos = obs.position();

    if (pos[1] > cfg.altitude_threshold)
        reward += cfg.airborne_reward;
    else
        reward -= cfg.ground_penalty;

    const Vec3 moved{pos[0] - ep.last_position[0], pos[1] - ep.last_position[1], pos[2] - ep.last_position[2]};
    reward += std::min(static_cast<double>(norm3(moved)) * cfg.exploration_scale, cfg.exploration_cap);

    if (norm3(obs.velocity()) > cfg.speed_threshold)
        reward -= cfg.speed_penalty;

    double effort = 0.0;
    for (float a : action)
        effort += std::fabs(a);
    reward -= effort * cfg.effort_scale;

    reward += static_cast<double>(discoverable_entities(obs, ep, cfg).size()) * cfg.discovery_reward;
    return reward;
}

inline bool is_terminated(const Observation &obs, const EnvConfig &cfg)
{
    const Vec3 pos = obs.position();
    if (pos[1] < cfg.crash_altitude)
        return true;
    return std::fabs(pos[0]) > cfg.bounds || std::fabs(pos[2]) > cfg.bounds;
}

class ControlEnvironment : public GymEnvironment
{
    EnvConfig cfg_;
    MessageSink *sink_;

    // Guards obs_ and episode_: apply_inbound runs on a link strand while step() runs on the trainer thread.
    mutable std::mutex mtx_;
    std::shared_ptr<const Observation> obs_ = std::make_shared<const Observation>();
    EpisodeState episode_;
    std::uint64_t inbound_applied_{0};
    std::uint64_t malformed_fields_{0};
    std::atomic<std::uint64_t> sends_failed_{0};

public:
    explicit ControlEnvironment(EnvConfig cfg = {}, MessageSink *sink = nullptr)
        : cfg_(cfg), sink_(sink) {}

    std::string name() const override { return "drone-farm"; }
    const EnvConfig &config() const { return cfg_; }

    // Routes the state-bearing message kinds from a link into apply_inbound.
    void attach(MessageSource &source)
    {
        auto handler = [this](const InboundMessage &m)
        { apply_inbound(m); };
        source.on(InboundKind::Observation, handler);
        source.on(InboundKind::TelemetryUpdate, handler);
        source.on(InboundKind::EntityUpdate, handler);
        source.on(InboundKind::Reward, handler);
        source.on(InboundKind::ResetAck, handler);
    }

    std::shared_ptr<const Observation> reset() override
    {
        std::shared_ptr<const Observation> obs;
        {
            std::scoped_lock lk(mtx_);
            episode_ = EpisodeState{};
            episode_.last_position = obs_->position();
            obs = obs_;
        }
        if (sink_ && !sink_->send(ResetRequestMsg{}))
            ++sends_failed_;
        log_debug("env", "episode reset");
        return obs;
    }

    StepResult step(const Action &action) override
    {
        const Action a = sanitize_action(action);
        if (sink_ && !sink_->send(ActionMsg{a}))
            ++sends_failed_;

        std::scoped_lock lk(mtx_);
        StepResult r;
        r.observation = obs_;
        ++episode_.step_count;

        const auto discovered = discoverable_entities(*obs_, episode_, cfg_);
        r.reward = compute_reward(*obs_, a, episode_, cfg_);
        episode_.total_reward += r.reward;
        episode_.last_position = obs_->position();
        episode_.credited_entities.insert(discovered.begin(), discovered.end());

        // terminal check first, so the two flags are never both set
        r.terminated = is_terminated(*obs_, cfg_);
        r.truncated = !r.terminated && episode_.step_count >= cfg_.max_episode_steps;

        r.info.episode_step = episode_.step_count;
        r.info.total_reward = episode_.total_reward;
        r.info.entities_credited = episode_.credited_entities.size();
        r.info.sim_reward = episode_.sim_reward;
        r.info.sim_done = episode_.sim_done;
        r.info.reset_acknowledged = episode_.reset_acknowledged;
        return r;
    }

    // Dispatcher entry point. Never throws; malformed fields keep their previous values.
    void apply_inbound(const InboundMessage &msg)
    {
        try
        {
            std::visit([this](const auto &m)
                       { apply(m); },
                       msg.payload);
        }
        catch (const std::exception &e)
        {
            log_error("env", std::string("failed to apply '") + kind_tag(msg.kind()) + "': " + e.what());
        }
    }

    std::shared_ptr<const Observation> observation() const
    {
        std::scoped_lock lk(mtx_);
        return obs_;
    }

    EpisodeState episode() const
    {
        std::scoped_lock lk(mtx_);
        return episode_;
    }

    nlohmann::json stats() const
    {
        std::scoped_lock lk(mtx_);
        return nlohmann::json{
            {"inbound_applied", inbound_applied_},
            {"malformed_fields", malformed_fields_},
            {"sends_failed", sends_failed_.load()},
            {"episode_step", episode_.step_count},
            {"episode_reward", episode_.total_reward},
            {"observation", observation_summary_json(*obs_)}};
    }

private:
    void note_malformed(const char *kind, const std::vector<std::string> &fields)
    {
        if (fields.empty())
            return;
        malformed_fields_ += fields.size();
        std::string list;
        for (const auto &f : fields)
            list += (list.empty() ? "" : ", ") + f;
        log_warn("env", std::string(kind) + ": kept previous values for malformed fields: " + list);
    }

    void apply(const ObservationMsg &m)
    {
        std::scoped_lock lk(mtx_);
        auto next = std::make_shared<Observation>(*obs_);
        if (m.position)
            next->set_position(*m.position);
        if (m.velocity)
            next->set_velocity(*m.velocity);
        if (m.rotation)
            next->set_rotation(*m.rotation);
        if (m.entities)
            assign_entities(*next, *m.entities);
        if (m.image)
            next->image = *m.image;
        note_malformed("observation", m.malformed);
        obs_ = std::move(next);
        ++inbound_applied_;
    }

    void apply(const TelemetryMsg &m)
    {
        std::scoped_lock lk(mtx_);
        auto next = std::make_shared<Observation>(*obs_);
        if (m.position)
            next->set_position(*m.position);
        if (m.velocity)
            next->set_velocity(*m.velocity);
        if (m.rotation)
            next->set_rotation(*m.rotation);
        note_malformed("drone_update", m.malformed);
        obs_ = std::move(next);
        ++inbound_applied_;
    }

    void apply(const EntityUpdateMsg &m)
    {
        std::scoped_lock lk(mtx_);
        note_malformed("plants_update", m.malformed);
        if (!m.entities)
            return;
        auto next = std::make_shared<Observation>(*obs_);
        assign_entities(*next, *m.entities);
        obs_ = std::move(next);
        ++inbound_applied_;
    }

    void apply(const RewardMsg &m)
    {
        std::scoped_lock lk(mtx_);
        episode_.sim_reward = m.reward;
        episode_.sim_done = m.done;
        log_debug("env", "simulation reward " + std::to_string(m.reward) + (m.done ? " (done)" : ""));
    }

    void apply(const ResetAckMsg &)
    {
        std::scoped_lock lk(mtx_);
        episode_.reset_acknowledged = true;
        log_info("env", "simulation acknowledged reset");
    }

    template <typename Other>
    void apply(const Other &)
    {
    }
};
