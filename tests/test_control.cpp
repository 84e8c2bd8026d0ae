/*
 * File: tests/test_control.cpp
 * Project: AGMO Sim Bridge
 * Purpose: ControlSurface replies and console command routing
 * Notes:
 *  - Runs a real Trainer over a ControlEnvironment with no link attached
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <chrono>
#include <nlohmann/json.hpp>

#include "bridge_control.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

namespace
{
    struct Rig
    {
        TempDir dir;
        FileCheckpointStore store{dir.path};
        ControlEnvironment env;
        Trainer trainer;
        ControlSurface surface;

        Rig() : trainer(env, store, config()), surface(trainer, store, &Rig::link_report) {}

        static nlohmann::json link_report()
        {
            nlohmann::json link{{"name", "sim"}, {"state", "live"}};
            return nlohmann::json{{"links", nlohmann::json::array({link})}};
        }

        static TrainerConfig config()
        {
            TrainerConfig c;
            c.model_name = "ctl";
            c.total_steps = 1000000;
            c.step_interval = 1ms;
            c.log_interval = 0;
            c.save_every = 0;
            c.stop_timeout = 2000ms;
            return c;
        }
    };
}

TEST_CASE("start and stop replies follow the trainer status")
{
    Rig rig;
    auto first = rig.surface.start_training();
    CHECK(first.status == SurfaceStatus::Ok);
    CHECK(first.body["message"] == "Training started successfully");

    auto again = rig.surface.start_training();
    CHECK(again.status == SurfaceStatus::AlreadyRunning);
    CHECK(again.body.contains("error"));

    CHECK(rig.surface.get_status().body["is_training"] == true);

    CHECK(rig.surface.stop_training().status == SurfaceStatus::Ok);
    auto idle = rig.surface.stop_training();
    CHECK(idle.status == SurfaceStatus::NotRunning);
    CHECK(idle.body["error"] == "No training in progress");
    CHECK(rig.surface.get_status().body["state"] == "stopped");
}

TEST_CASE("load_model reports failures with a reason")
{
    Rig rig;
    auto r = rig.surface.load_model("nothing_here");
    CHECK(r.status == SurfaceStatus::LoadFailed);
    CHECK(r.body["error"].get<std::string>().find("nothing_here") != std::string::npos);

    REQUIRE(rig.surface.save_model("snap").ok());
    CHECK(rig.surface.load_model("snap").ok());
}

TEST_CASE("models and metrics expose the store and the run")
{
    Rig rig;
    rig.surface.save_model("b_model");
    rig.surface.save_model("a_model");
    auto models = rig.surface.list_models();
    REQUIRE(models.ok());
    CHECK(models.body["models"] == nlohmann::json::array({"a_model", "b_model"}));

    auto metrics = rig.surface.get_metrics();
    CHECK(metrics.body["training_metrics"]["state"] == "idle");
    CHECK(metrics.body["training_metrics"].contains("episode_rewards"));
    CHECK(metrics.body["model_info"]["outputs"] == kActionSize);
}

TEST_CASE("save_model rejects unusable names")
{
    Rig rig;
    CHECK(rig.surface.save_model("../escape").status == SurfaceStatus::BadRequest);
    auto unnamed = rig.surface.save_model("");
    CHECK(unnamed.ok());
    CHECK(unnamed.body["name"] == "ctl_step_0");
}

TEST_CASE("console commands route to the surface")
{
    Rig rig;
    CHECK(rig.surface.handle_command("status").ok());
    CHECK(rig.surface.handle_command("  models ").ok());
    CHECK(rig.surface.handle_command("save named").body["name"] == "named");
    CHECK(rig.surface.handle_command("load named").ok());
    CHECK(rig.surface.handle_command("load").status == SurfaceStatus::BadRequest);
    CHECK(rig.surface.handle_command("fly away").status == SurfaceStatus::BadRequest);
    CHECK(rig.surface.handle_command("").status == SurfaceStatus::BadRequest);
    CHECK(rig.surface.handle_command("link").body["links"][0]["state"] == "live");

    auto line = nlohmann::json::parse(rig.surface.handle_command("stop").to_line());
    CHECK(line["status"] == "not_running");
}
