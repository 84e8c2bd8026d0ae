/*
 * File: src/bridge_trainer.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Background policy training against a GymEnvironment
 * Notes:
 *  - At most one training task; start/stop are serialised
 *  - Evolution strategies over LinearPolicy weights
 *  - Checkpoint failures never stop training
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge_checkpoint.hpp"
#include "bridge_env.hpp"
#include "bridge_policy.hpp"
#include "common/log.hpp"

enum class TrainerStatus
{
    Ok,
    AlreadyRunning,
    NotRunning,
    LoadFailed
};

inline const char *trainer_status_name(TrainerStatus s)
{
    switch (s)
    {
    case TrainerStatus::Ok:
        return "ok";
    case TrainerStatus::AlreadyRunning:
        return "already_running";
    case TrainerStatus::NotRunning:
        return "not_running";
    case TrainerStatus::LoadFailed:
        return "load_failed";
    }
    return "unknown";
}

enum class RunState
{
    Idle,
    Training,
    Completed,
    Stopped,
    Failed
};

inline const char *run_state_name(RunState s)
{
    switch (s)
    {
    case RunState::Idle:
        return "idle";
    case RunState::Training:
        return "training";
    case RunState::Completed:
        return "completed";
    case RunState::Stopped:
        return "stopped";
    case RunState::Failed:
        return "failed";
    }
    return "unknown";
}

struct TrainerConfig
{
    std::string model_name{"drone_agent"};
    std::uint64_t total_steps{1000000};
    std::uint64_t save_every{10000};
    std::uint64_t log_interval{100};
    std::chrono::milliseconds step_interval{50};
    std::chrono::milliseconds stop_timeout{5000};
    std::size_t population{8};
    double noise_std{0.1};
    double learning_rate{0.02};
    std::size_t reward_window{100};
    std::uint32_t seed{42};
};

struct TrainingRun
{
    RunState state{RunState::Idle};
    bool is_training{false};
    std::uint64_t total_steps{0};
    std::uint64_t steps_completed{0};
    std::uint64_t episodes{0};
    std::uint64_t generations{0};
    double mean_reward{0.0};
    double last_episode_reward{0.0};
    std::vector<double> episode_rewards;
    std::vector<std::uint64_t> episode_lengths;
    std::string last_error;
    std::string last_checkpoint;
    std::uint64_t checkpoint_failures{0};
    std::string model_name;
};

constexpr std::size_t kRunHistoryCap = 1000;

inline nlohmann::json training_run_json(const TrainingRun &r, bool with_history)
{
    nlohmann::json j{
        {"state", run_state_name(r.state)},
        {"is_training", r.is_training},
        {"total_timesteps", r.total_steps},
        {"current_timesteps", r.steps_completed},
        {"episodes", r.episodes},
        {"generations", r.generations},
        {"mean_reward", r.mean_reward},
        {"last_episode_reward", r.last_episode_reward},
        {"last_error", r.last_error},
        {"last_checkpoint", r.last_checkpoint},
        {"checkpoint_failures", r.checkpoint_failures},
        {"model_name", r.model_name}};
    if (with_history)
    {
        j["episode_rewards"] = r.episode_rewards;
        j["episode_lengths"] = r.episode_lengths;
    }
    return j;
}

class Trainer
{
    GymEnvironment &env_;
    CheckpointStore &store_;
    TrainerConfig cfg_;

    std::mutex lifecycle_mtx_;
    std::future<void> task_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_{false};

    std::mutex wait_mtx_;
    std::condition_variable wait_cv_;

    mutable std::mutex model_mtx_;
    LinearPolicy policy_;

    mutable std::mutex run_mtx_;
    TrainingRun run_;
    std::deque<double> window_;

    // only touched by the training task
    std::mt19937 rng_;

public:
    Trainer(GymEnvironment &env, CheckpointStore &store, TrainerConfig cfg = {})
        : env_(env), store_(store), cfg_(std::move(cfg)), rng_(cfg_.seed)
    {
        if (cfg_.population < 2)
            throw std::invalid_argument("trainer population must be at least 2");
        if (!(cfg_.noise_std > 0.0))
            throw std::invalid_argument("trainer noise_std must be positive");
        run_.model_name = cfg_.model_name;
        run_.total_steps = cfg_.total_steps;
    }

    ~Trainer() { shutdown(); }

    Trainer(const Trainer &) = delete;
    Trainer &operator=(const Trainer &) = delete;

    const TrainerConfig &config() const { return cfg_; }
    bool is_training() const { return running_; }

    TrainerStatus start()
    {
        std::scoped_lock lk(lifecycle_mtx_);
        if (running_)
        {
            log_warn("trainer", "training already in progress");
            return TrainerStatus::AlreadyRunning;
        }
        if (task_.valid())
        {
            // a task abandoned by a timed-out stop() may still be finishing its step
            if (task_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready)
            {
                log_warn("trainer", "previous training task has not exited yet");
                return TrainerStatus::AlreadyRunning;
            }
            task_.get();
        }

        {
            std::scoped_lock rl(run_mtx_);
            run_ = TrainingRun{};
            run_.state = RunState::Training;
            run_.model_name = cfg_.model_name;
            run_.total_steps = cfg_.total_steps;
            window_.clear();
        }
        cancel_ = false;
        running_ = true;
        try
        {
            task_ = std::async(std::launch::async, [this]
                               { run_loop(); });
        }
        catch (const std::system_error &e)
        {
            running_ = false;
            record_failure(std::string("failed to launch training task: ") + e.what());
            throw;
        }
        log_info("trainer", "training started: " + cfg_.model_name + ", " + std::to_string(cfg_.total_steps) + " steps");
        return TrainerStatus::Ok;
    }

    TrainerStatus stop()
    {
        std::scoped_lock lk(lifecycle_mtx_);
        if (!running_)
        {
            log_warn("trainer", "no training in progress");
            return TrainerStatus::NotRunning;
        }
        log_info("trainer", "stopping training");
        cancel_ = true;
        {
            std::scoped_lock wl(wait_mtx_);
        }
        wait_cv_.notify_all();

        if (task_.valid())
        {
            if (task_.wait_for(cfg_.stop_timeout) == std::future_status::ready)
                task_.get();
            else
                log_warn("trainer", "training task did not exit within " + std::to_string(cfg_.stop_timeout.count()) +
                                        " ms; continuing cleanup");
        }
        {
            std::scoped_lock rl(run_mtx_);
            // the task failed or completed while we waited; keep its outcome
            if (run_.state != RunState::Training)
            {
                log_warn("trainer", std::string("training already ended: ") + run_state_name(run_.state));
                return TrainerStatus::NotRunning;
            }
            running_ = false;
            run_.state = RunState::Stopped;
        }
        checkpoint("interrupted");
        log_info("trainer", "training stopped");
        return TrainerStatus::Ok;
    }

    // Pure inference; never touches the run bookkeeping.
    Action predict(const Observation &obs) const
    {
        const Features f = policy_features(obs);
        std::scoped_lock lk(model_mtx_);
        return policy_.act(f);
    }

    // Best effort: a failed save is logged and counted, and returns false.
    bool checkpoint(const std::string &name = std::string())
    {
        std::uint64_t steps;
        {
            std::scoped_lock rl(run_mtx_);
            steps = run_.steps_completed;
        }
        const std::string n = name.empty() ? cfg_.model_name + "_step_" + std::to_string(steps) : name;
        ModelState st;
        {
            std::scoped_lock lk(model_mtx_);
            st = policy_.state(cfg_.model_name);
        }
        st.steps = steps;
        st.saved_at = iso8601_now_ms();
        try
        {
            store_.save(n, st);
        }
        catch (const std::exception &e)
        {
            log_error("trainer", "failed to save checkpoint '" + n + "': " + e.what());
            std::scoped_lock rl(run_mtx_);
            ++run_.checkpoint_failures;
            return false;
        }
        {
            std::scoped_lock rl(run_mtx_);
            run_.last_checkpoint = n;
        }
        log_info("trainer", "model saved: " + n);
        return true;
    }

    TrainerStatus load_model(const std::string &name, std::string &error)
    {
        try
        {
            ModelState st = store_.load(name);
            std::scoped_lock lk(model_mtx_);
            policy_.load(st);
        }
        catch (const std::exception &e)
        {
            error = e.what();
            log_error("trainer", "failed to load model '" + name + "': " + error);
            return TrainerStatus::LoadFailed;
        }
        log_info("trainer", "model loaded: " + name);
        return TrainerStatus::Ok;
    }

    TrainingRun metrics() const
    {
        std::scoped_lock rl(run_mtx_);
        TrainingRun r = run_;
        r.is_training = running_;
        return r;
    }

    // Stops a live run, or waits out a stale task. Safe to call repeatedly.
    void shutdown()
    {
        if (running_)
        {
            stop();
            return;
        }
        std::scoped_lock lk(lifecycle_mtx_);
        if (task_.valid())
            task_.wait();
    }

private:
    std::uint64_t steps_completed() const
    {
        std::scoped_lock rl(run_mtx_);
        return run_.steps_completed;
    }

    bool out_of_budget() const { return cancel_ || steps_completed() >= cfg_.total_steps; }

    void run_loop()
    {
        try
        {
            std::normal_distribution<double> gauss(0.0, 1.0);
            while (!out_of_budget())
            {
                LinearPolicy base;
                {
                    std::scoped_lock lk(model_mtx_);
                    base = policy_;
                }
                std::vector<std::vector<double>> noise;
                std::vector<double> returns;
                for (std::size_t i = 0; i < cfg_.population; ++i)
                {
                    std::vector<double> eps(base.size());
                    for (auto &v : eps)
                        v = gauss(rng_);
                    auto ret = run_episode(base.perturbed(eps, cfg_.noise_std));
                    if (!ret)
                        break;
                    noise.push_back(std::move(eps));
                    returns.push_back(*ret);
                }
                if (returns.size() == cfg_.population)
                    update_policy(noise, returns);
            }

            if (cancel_)
                return;
            {
                std::scoped_lock rl(run_mtx_);
                run_.state = RunState::Completed;
                running_ = false;
            }
            log_info("trainer", "training completed after " + std::to_string(steps_completed()) + " steps");
            checkpoint(cfg_.model_name + "_final");
        }
        catch (const std::exception &e)
        {
            record_failure(e.what());
        }
    }

    // Returns the episode return, or nullopt when the run was cut short mid-episode.
    std::optional<double> run_episode(const LinearPolicy &policy)
    {
        auto obs = env_.reset();
        double total = 0.0;
        std::uint64_t length = 0;
        while (true)
        {
            if (out_of_budget())
                return std::nullopt;
            StepResult r = env_.step(policy.act(policy_features(*obs)));
            ++length;
            total += r.reward;
            obs = r.observation;
            on_step_completed();
            if (r.terminated || r.truncated)
            {
                record_episode(total, length);
                return total;
            }
            pace();
        }
    }

    void pace()
    {
        if (cfg_.step_interval.count() <= 0)
            return;
        std::unique_lock lk(wait_mtx_);
        wait_cv_.wait_for(lk, cfg_.step_interval, [this]
                          { return cancel_.load(); });
    }

    void on_step_completed()
    {
        std::uint64_t steps;
        std::uint64_t episodes;
        double mean;
        {
            std::scoped_lock rl(run_mtx_);
            steps = ++run_.steps_completed;
            episodes = run_.episodes;
            mean = run_.mean_reward;
        }
        if (cfg_.log_interval && steps % cfg_.log_interval == 0)
            log_info("trainer", "step " + std::to_string(steps) + "/" + std::to_string(cfg_.total_steps) +
                                    " episodes=" + std::to_string(episodes) + " mean_reward=" + std::to_string(mean));
        if (cfg_.save_every && steps % cfg_.save_every == 0)
            checkpoint("checkpoint_" + std::to_string(steps));
    }

    void record_episode(double total, std::uint64_t length)
    {
        std::scoped_lock rl(run_mtx_);
        ++run_.episodes;
        run_.last_episode_reward = total;
        window_.push_back(total);
        while (window_.size() > std::max<std::size_t>(cfg_.reward_window, 1))
            window_.pop_front();
        double sum = 0.0;
        for (double v : window_)
            sum += v;
        run_.mean_reward = sum / static_cast<double>(window_.size());

        run_.episode_rewards.push_back(total);
        run_.episode_lengths.push_back(length);
        if (run_.episode_rewards.size() > kRunHistoryCap)
        {
            run_.episode_rewards.erase(run_.episode_rewards.begin());
            run_.episode_lengths.erase(run_.episode_lengths.begin());
        }
    }

    // Standardised-return ES step on the central weights.
    void update_policy(const std::vector<std::vector<double>> &noise, const std::vector<double> &returns)
    {
        const double n = static_cast<double>(returns.size());
        double mean = 0.0;
        for (double r : returns)
            mean += r;
        mean /= n;
        double var = 0.0;
        for (double r : returns)
            var += (r - mean) * (r - mean);
        const double sd = std::sqrt(var / n);

        {
            std::scoped_lock rl(run_mtx_);
            ++run_.generations;
        }
        if (sd < 1e-8)
        {
            log_debug("trainer", "flat generation returns; weights unchanged");
            return;
        }

        std::vector<double> grad(noise.front().size(), 0.0);
        for (std::size_t i = 0; i < noise.size(); ++i)
        {
            const double a = (returns[i] - mean) / sd;
            for (std::size_t j = 0; j < grad.size(); ++j)
                grad[j] += a * noise[i][j];
        }
        for (auto &g : grad)
            g /= n * cfg_.noise_std;

        std::scoped_lock lk(model_mtx_);
        policy_.apply_update(grad, cfg_.learning_rate);
    }

    void record_failure(const std::string &what)
    {
        log_error("trainer", "training failed: " + what);
        std::scoped_lock rl(run_mtx_);
        run_.state = RunState::Failed;
        run_.last_error = what;
        running_ = false;
    }
};
