/*
 * File: include/common/observation.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Fixed-shape observation, action and episode bookkeeping types
 * Notes:
 *  - Shapes are fixed; a default observation exists before any data arrives
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/beast/core/detail/base64.hpp>
#include <nlohmann/json.hpp>

constexpr std::size_t kImageHeight = 224;
constexpr std::size_t kImageWidth = 224;
constexpr std::size_t kImageChannels = 3;
constexpr std::size_t kImageBytes = kImageHeight * kImageWidth * kImageChannels;
constexpr std::size_t kMaxImageSide = 8192; // inbound frames larger than this are rejected before resampling
constexpr std::size_t kAgentStateSize = 9; // position(3) + velocity(3) + rotation(3)
constexpr std::size_t kMaxEntities = 20;
constexpr std::size_t kActionSize = 4; // thrust, pitch, roll, yaw

using Vec3 = std::array<float, 3>;
using Action = std::array<float, kActionSize>;

struct Observation
{
    std::vector<std::uint8_t> image = std::vector<std::uint8_t>(kImageBytes, 0);
    std::array<float, kAgentStateSize> agent_state{0, 5, 0, 0, 0, 0, 0, 0, 0};
    std::array<Vec3, kMaxEntities> entity_positions{};
    std::array<std::string, kMaxEntities> entity_ids{};
    std::size_t entity_count{0};

    Vec3 position() const { return {agent_state[0], agent_state[1], agent_state[2]}; }
    Vec3 velocity() const { return {agent_state[3], agent_state[4], agent_state[5]}; }
    Vec3 rotation() const { return {agent_state[6], agent_state[7], agent_state[8]}; }

    void set_position(const Vec3 &v) { set_slot(0, v); }
    void set_velocity(const Vec3 &v) { set_slot(3, v); }
    void set_rotation(const Vec3 &v) { set_slot(6, v); }

private:
    void set_slot(std::size_t off, const Vec3 &v)
    {
        for (std::size_t i = 0; i < 3; ++i)
            agent_state[off + i] = v[i];
    }
};

inline Observation default_observation() { return Observation{}; }

struct Entity
{
    std::string id;
    Vec3 position{0, 0, 0};
};

// Replaces the entity table; entries past kMaxEntities are dropped, the rest zero-padded.
inline void assign_entities(Observation &obs, const std::vector<Entity> &entities)
{
    obs.entity_positions.fill(Vec3{0, 0, 0});
    obs.entity_ids.fill(std::string());
    obs.entity_count = std::min(entities.size(), kMaxEntities);
    for (std::size_t i = 0; i < obs.entity_count; ++i)
    {
        obs.entity_positions[i] = entities[i].position;
        obs.entity_ids[i] = entities[i].id.empty() ? "entity_" + std::to_string(i) : entities[i].id;
    }
}

struct EpisodeState
{
    std::uint64_t step_count{0};
    double total_reward{0.0};
    std::set<std::string> credited_entities;
    Vec3 last_position{0, 5, 0};
    // Last values pushed by the simulation's own `reward` / `reset` messages.
    double sim_reward{0.0};
    bool sim_done{false};
    bool reset_acknowledged{false};
};

inline Action sanitize_action(Action a)
{
    for (auto &v : a)
    {
        if (!std::isfinite(v))
            v = 0.0f;
        v = std::max(-1.0f, std::min(1.0f, v));
    }
    return a;
}

inline float norm3(const Vec3 &v)
{
    return std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]);
}

// -------- image helpers --------

// Strict padded/unpadded base64 decode; throws on any character outside the alphabet.
inline std::vector<std::uint8_t> base64_decode(const std::string &in)
{
    namespace b64 = boost::beast::detail::base64;
    std::vector<std::uint8_t> out(b64::decoded_size(in.size()) + 3);
    auto [written, read] = b64::decode(out.data(), in.data(), in.size());
    auto tail = in.find_first_not_of('=', read);
    if (tail != std::string::npos || in.size() - read > 2)
        throw std::invalid_argument("invalid base64 at offset " + std::to_string(read));
    // a lone trailing character carries fewer than 8 bits
    if (read % 4 == 1)
        throw std::invalid_argument("truncated base64 (" + std::to_string(read) + " characters)");
    out.resize(written);
    return out;
}

inline std::string base64_encode(const std::vector<std::uint8_t> &in)
{
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(in.size()), '\0');
    out.resize(b64::encode(out.data(), in.data(), in.size()));
    return out;
}

// Raw interleaved RGB8 of (w x h) resampled nearest-neighbour into the fixed image shape.
// w == h == 0 means "already at the fixed shape".
inline std::vector<std::uint8_t> decode_rgb_image(const std::vector<std::uint8_t> &raw, std::size_t w, std::size_t h)
{
    if (w == 0 && h == 0)
    {
        if (raw.size() != kImageBytes)
            throw std::invalid_argument("image has " + std::to_string(raw.size()) + " bytes, expected " +
                                        std::to_string(kImageBytes));
        return raw;
    }
    if (w > kMaxImageSide || h > kMaxImageSide)
        throw std::invalid_argument("image dimensions " + std::to_string(w) + "x" + std::to_string(h) +
                                    " exceed " + std::to_string(kMaxImageSide));
    if (w == 0 || h == 0 || raw.size() != w * h * kImageChannels)
        throw std::invalid_argument("image dimensions " + std::to_string(w) + "x" + std::to_string(h) +
                                    " do not match " + std::to_string(raw.size()) + " bytes");
    std::vector<std::uint8_t> out(kImageBytes);
    for (std::size_t y = 0; y < kImageHeight; ++y)
    {
        const std::size_t sy = y * h / kImageHeight;
        for (std::size_t x = 0; x < kImageWidth; ++x)
        {
            const std::size_t sx = x * w / kImageWidth;
            const std::uint8_t *src = &raw[(sy * w + sx) * kImageChannels];
            std::uint8_t *dst = &out[(y * kImageWidth + x) * kImageChannels];
            dst[0] = src[0];
            dst[1] = src[1];
            dst[2] = src[2];
        }
    }
    return out;
}

inline nlohmann::json observation_summary_json(const Observation &obs)
{
    using nlohmann::json;
    json entities = json::array();
    for (std::size_t i = 0; i < obs.entity_count; ++i)
        entities.push_back(json{{"id", obs.entity_ids[i]}, {"position", obs.entity_positions[i]}});
    return json{
        {"position", obs.position()},
        {"velocity", obs.velocity()},
        {"rotation", obs.rotation()},
        {"entities", entities}};
}
