/*
 * File: tests/test_environment.cpp
 * Project: AGMO Sim Bridge
 * Purpose: ControlEnvironment reset/step, reward shaping and inbound application
 * Notes:
 *  - Inbound frames are delivered through FakeSource, outbound captured by RecordingSink
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <cmath>
#include <limits>

#include "bridge_env.hpp"
#include "test_support.hpp"

namespace
{
    Observation at(float x, float y, float z)
    {
        Observation o;
        o.set_position({x, y, z});
        return o;
    }

    EpisodeState episode_from(const Vec3 &last)
    {
        EpisodeState ep;
        ep.last_position = last;
        return ep;
    }
}

TEST_CASE("reset before any data returns the default observation")
{
    RecordingSink sink;
    ControlEnvironment env{{}, &sink};
    auto obs = env.reset();
    REQUIRE(obs);
    CHECK(obs->position() == Vec3{0, 5, 0});
    CHECK(obs->entity_count == 0);
    CHECK(obs->image.size() == kImageBytes);
    CHECK(sink.sent_of<ResetRequestMsg>().size() == 1);
}

TEST_CASE("reset starts exploration from the current position")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    REQUIRE(src.deliver(frame("observation", R"({"position":[10,5,10],"velocity":[0,0,0],"rotation":[0,0,0],"plants":[]})")));
    env.reset();
    auto still = env.step({0, 0, 0, 0});
    CHECK(still.reward == Catch::Approx(0.1));

    REQUIRE(src.deliver(frame("observation", R"({"position":[12,5,10],"velocity":[0,0,0],"rotation":[0,0,0],"plants":[]})")));
    auto moved = env.step({0, 0, 0, 0});
    CHECK(moved.reward == Catch::Approx(0.1 + 0.2));
}

TEST_CASE("first step after reset counts one step and is not terminal")
{
    RecordingSink sink;
    ControlEnvironment env{{}, &sink};
    env.reset();
    auto r = env.step({0, 0, 0, 0});
    CHECK(r.info.episode_step == 1);
    CHECK_FALSE(r.terminated);
    CHECK_FALSE(r.truncated);
    CHECK(sink.sent_of<ActionMsg>().size() == 1);
}

TEST_CASE("observation frames replace the cached state")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    REQUIRE(src.deliver(frame("observation", R"({"position":[1,2,3],"velocity":[0,0,0],"rotation":[0,0,0],"plants":[]})")));
    auto obs = env.observation();
    CHECK(obs->agent_state[0] == 1.0f);
    CHECK(obs->agent_state[1] == 2.0f);
    CHECK(obs->agent_state[2] == 3.0f);
}

TEST_CASE("malformed fields keep their previous values")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    src.deliver(frame("observation", R"({"position":[4,6,8],"velocity":[1,1,1]})"));
    src.deliver(frame("observation", R"({"position":"nope","velocity":[2,2,2]})"));
    auto obs = env.observation();
    CHECK(obs->position() == Vec3{4, 6, 8});
    CHECK(obs->velocity() == Vec3{2, 2, 2});
}

TEST_CASE("frames the link would drop leave the state untouched")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    src.deliver(frame("observation", R"({"position":[1,9,1]})"));
    CHECK_FALSE(src.deliver("{broken"));
    CHECK_FALSE(src.deliver(R"({"data":{}})"));
    CHECK(env.observation()->position() == Vec3{1, 9, 1});
}

TEST_CASE("drone_update is a partial update")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    src.deliver(frame("observation", R"({"position":[1,2,3],"velocity":[4,5,6],"rotation":[0,0,0]})"));
    src.deliver(frame("drone_update", R"({"position":[7,8,9]})"));
    auto obs = env.observation();
    CHECK(obs->position() == Vec3{7, 8, 9});
    CHECK(obs->velocity() == Vec3{4, 5, 6});
}

TEST_CASE("plants_update keeps at most twenty entities, zero padded")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    std::string plants = "[";
    for (int i = 0; i < 25; ++i)
        plants += std::string(i ? "," : "") + R"({"id":"p)" + std::to_string(i) + R"(","position":[1,0,1]})";
    plants += "]";
    src.deliver(frame("plants_update", R"({"plants":)" + plants + "}"));
    auto obs = env.observation();
    CHECK(obs->entity_count == kMaxEntities);
    CHECK(obs->entity_ids[19] == "p19");

    src.deliver(frame("plants_update", R"({"plants":[{"position":[2,0,2]}]})"));
    obs = env.observation();
    CHECK(obs->entity_count == 1);
    CHECK(obs->entity_ids[0] == "entity_0");
    CHECK(obs->entity_positions[1] == Vec3{0, 0, 0});
}

TEST_CASE("reward and reset acknowledgements surface in step info")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    env.reset();
    src.deliver(frame("reward", R"({"reward":2.5,"done":true})"));
    src.deliver(frame("reset", "{}"));
    auto r = env.step({0, 0, 0, 0});
    CHECK(r.info.sim_reward == 2.5);
    CHECK(r.info.sim_done);
    CHECK(r.info.reset_acknowledged);
    // informational only: the shaped reward ignores it
    CHECK(r.reward < 1.0);
}

TEST_CASE("termination on crash altitude and bounds")
{
    EnvConfig cfg;
    CHECK(is_terminated(at(0, 0.3f, 0), cfg));
    CHECK(is_terminated(at(35, 5, 0), cfg));
    CHECK(is_terminated(at(0, 5, -35), cfg));
    CHECK_FALSE(is_terminated(at(0, 5, 0), cfg));
    CHECK_FALSE(is_terminated(at(30, 5, 30), cfg));

    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    env.reset();
    src.deliver(frame("observation", R"({"position":[0,0.3,0]})"));
    auto r = env.step({0, 0, 0, 0});
    CHECK(r.terminated);
    CHECK_FALSE(r.truncated);
}

TEST_CASE("episodes truncate at the step ceiling")
{
    EnvConfig cfg;
    cfg.max_episode_steps = 3;
    ControlEnvironment env{cfg};
    env.reset();
    CHECK_FALSE(env.step({0, 0, 0, 0}).truncated);
    CHECK_FALSE(env.step({0, 0, 0, 0}).truncated);
    auto r = env.step({0, 0, 0, 0});
    CHECK(r.truncated);
    CHECK_FALSE(r.terminated);
}

TEST_CASE("terminal step at the ceiling is terminated, not truncated")
{
    EnvConfig cfg;
    cfg.max_episode_steps = 1;
    FakeSource src;
    ControlEnvironment env{cfg};
    env.attach(src);
    src.deliver(frame("observation", R"({"position":[0,0.1,0]})"));
    env.reset();
    auto r = env.step({0, 0, 0, 0});
    CHECK(r.terminated);
    CHECK_FALSE(r.truncated);
}

TEST_CASE("reward is deterministic for identical inputs")
{
    auto run = []
    {
        FakeSource src;
        ControlEnvironment env;
        env.attach(src);
        env.reset();
        src.deliver(frame("observation", R"({"position":[3,4,5],"velocity":[6,1,0],"plants":[{"id":"a","position":[3,0,5]}]})"));
        return env.step({0.3f, -0.7f, 0.1f, 1.0f}).reward;
    };
    const double a = run();
    const double b = run();
    CHECK(a == b);
}

TEST_CASE("reward components")
{
    EnvConfig cfg;
    const Action idle{0, 0, 0, 0};

    SECTION("airborne bonus and ground penalty")
    {
        CHECK(compute_reward(at(0, 5, 0), idle, episode_from({0, 5, 0}), cfg) == Catch::Approx(0.1));
        CHECK(compute_reward(at(0, 1, 0), idle, episode_from({0, 1, 0}), cfg) == Catch::Approx(-1.0));
    }
    SECTION("exploration is capped")
    {
        CHECK(compute_reward(at(2, 5, 0), idle, episode_from({0, 5, 0}), cfg) == Catch::Approx(0.1 + 0.2));
        CHECK(compute_reward(at(20, 5, 0), idle, episode_from({0, 5, 0}), cfg) == Catch::Approx(0.1 + 0.5));
    }
    SECTION("control effort and speed")
    {
        CHECK(compute_reward(at(0, 5, 0), {1, -1, 1, -1}, episode_from({0, 5, 0}), cfg) == Catch::Approx(0.1 - 0.04));
        Observation fast = at(0, 5, 0);
        fast.set_velocity({6, 0, 0});
        CHECK(compute_reward(fast, idle, episode_from({0, 5, 0}), cfg) == Catch::Approx(0.1 - 0.1));
    }
}

TEST_CASE("each entity is credited once per episode")
{
    FakeSource src;
    ControlEnvironment env;
    env.attach(src);
    src.deliver(frame("observation", R"({"position":[10,5,10],"plants":[{"id":"near","position":[11,0,10]},{"id":"far","position":[-10,0,-10]}]})"));
    env.reset();
    auto first = env.step({0, 0, 0, 0});
    CHECK(first.reward == Catch::Approx(0.1 + 1.0));
    CHECK(first.info.entities_credited == 1);
    auto second = env.step({0, 0, 0, 0});
    CHECK(second.reward == Catch::Approx(0.1));
    CHECK(second.info.entities_credited == 1);

    env.reset();
    CHECK(env.step({0, 0, 0, 0}).info.entities_credited == 1);
}

TEST_CASE("actions are sanitised before send and reward")
{
    RecordingSink sink;
    ControlEnvironment env{{}, &sink};
    env.reset();
    const float nan = std::numeric_limits<float>::quiet_NaN();
    auto r = env.step({nan, 3.0f, -7.0f, 0.5f});
    auto sent = sink.sent_of<ActionMsg>();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].action == Action{0.0f, 1.0f, -1.0f, 0.5f});
    CHECK(std::isfinite(r.reward));
    CHECK(r.reward == Catch::Approx(0.1 - 0.025));
}

TEST_CASE("step works with the link down")
{
    RecordingSink sink;
    sink.connected = false;
    ControlEnvironment env{{}, &sink};
    env.reset();
    auto r = env.step({0, 0, 0, 0});
    CHECK(r.info.episode_step == 1);
    CHECK(sink.sent().empty());
}
