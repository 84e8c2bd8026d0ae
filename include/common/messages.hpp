/*
 * File: include/common/messages.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Typed inbound/outbound simulation messages and their JSON codec
 * Notes:
 *  - Wire format: {type, data, timestamp} JSON text frames
 *  - Unknown tags are carried through, never rejected
 * Last updated: 2026-10-19
 */

#pragma once
#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/log.hpp"
#include "common/observation.hpp"

// -------- inbound --------

struct ObservationMsg
{
    // Missing fields arrive default-filled; present-but-malformed fields are nullopt.
    std::optional<Vec3> position;
    std::optional<Vec3> velocity;
    std::optional<Vec3> rotation;
    std::optional<std::vector<Entity>> entities;
    std::optional<std::vector<std::uint8_t>> image;
    std::vector<std::string> malformed;
};

struct RewardMsg
{
    double reward{0.0};
    bool done{false};
};

struct ResetAckMsg
{
};

struct TelemetryMsg
{
    // Partial update: absent fields are nullopt and keep their cached value.
    std::optional<Vec3> position;
    std::optional<Vec3> velocity;
    std::optional<Vec3> rotation;
    std::vector<std::string> malformed;
};

struct EntityUpdateMsg
{
    std::optional<std::vector<Entity>> entities;
    std::vector<std::string> malformed;
};

struct ImageFrameMsg
{
    std::string image_b64;
    Vec3 position{0, 0, 0};
    std::vector<Entity> entities;
    std::string frame_id;
};

struct PingMsg
{
};

struct UnknownMsg
{
    std::string tag;
    nlohmann::json data;
};

enum class InboundKind
{
    Observation,
    Reward,
    ResetAck,
    TelemetryUpdate,
    EntityUpdate,
    ImageFrame,
    Ping,
    Unknown
};

using InboundPayload = std::variant<ObservationMsg, RewardMsg, ResetAckMsg, TelemetryMsg, EntityUpdateMsg,
                                    ImageFrameMsg, PingMsg, UnknownMsg>;

struct InboundMessage
{
    InboundPayload payload;
    double timestamp{0.0};

    // variant alternatives are declared in InboundKind order
    InboundKind kind() const { return static_cast<InboundKind>(payload.index()); }
};

inline const char *kind_tag(InboundKind k)
{
    switch (k)
    {
    case InboundKind::Observation:
        return "observation";
    case InboundKind::Reward:
        return "reward";
    case InboundKind::ResetAck:
        return "reset";
    case InboundKind::TelemetryUpdate:
        return "drone_update";
    case InboundKind::EntityUpdate:
        return "plants_update";
    case InboundKind::ImageFrame:
        return "camera_feed";
    case InboundKind::Ping:
        return "ping";
    case InboundKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

// -------- outbound --------

struct ActionMsg
{
    Action action{0, 0, 0, 0};
};

struct ResetRequestMsg
{
};

struct EntityClassification
{
    std::string entity_id;
    Vec3 position{0, 0, 0};
    std::string label;
    double confidence{0.0};
};

struct ClassificationResultMsg
{
    std::string label;
    double confidence{0.0};
    std::vector<EntityClassification> entries;
    std::string frame_id;
};

struct PongMsg
{
};

struct ErrorMsg
{
    std::string message;
};

using OutboundMessage = std::variant<ActionMsg, ResetRequestMsg, ClassificationResultMsg, PongMsg, ErrorMsg>;

inline const char *outbound_tag(const OutboundMessage &m)
{
    static const char *const tags[] = {"action", "reset", "plant_classification", "pong", "error"};
    return tags[m.index()];
}

// -------- codec --------

namespace wire_detail
{
    // Reads a 3-vector under `key`. Missing -> `fallback`; wrong shape -> nullopt + note.
    inline std::optional<Vec3> read_vec3(const nlohmann::json &data, const char *key,
                                         const std::optional<Vec3> &fallback,
                                         std::vector<std::string> &malformed)
    {
        auto it = data.find(key);
        if (it == data.end() || it->is_null())
            return fallback;
        if (!it->is_array() || it->size() != 3)
        {
            malformed.push_back(key);
            return std::nullopt;
        }
        Vec3 v{};
        for (std::size_t i = 0; i < 3; ++i)
        {
            const auto &e = (*it)[i];
            if (!e.is_number())
            {
                malformed.push_back(key);
                return std::nullopt;
            }
            v[i] = e.get<float>();
            if (!std::isfinite(v[i]))
            {
                malformed.push_back(key);
                return std::nullopt;
            }
        }
        return v;
    }

    inline std::string read_id(const nlohmann::json &j)
    {
        auto it = j.find("id");
        if (it == j.end())
            return {};
        if (it->is_string())
            return it->get<std::string>();
        if (it->is_number_integer())
            return std::to_string(it->get<long long>());
        return {};
    }

    inline std::optional<std::vector<Entity>> read_entities(const nlohmann::json &data,
                                                            const std::optional<std::vector<Entity>> &fallback,
                                                            std::vector<std::string> &malformed)
    {
        auto it = data.find("plants");
        if (it == data.end() || it->is_null())
            return fallback;
        if (!it->is_array())
        {
            malformed.push_back("plants");
            return std::nullopt;
        }
        std::vector<Entity> out;
        for (const auto &p : *it)
        {
            if (!p.is_object())
            {
                malformed.push_back("plants[]");
                continue;
            }
            std::vector<std::string> ignored;
            auto pos = read_vec3(p, "position", Vec3{0, 0, 0}, ignored);
            if (!pos)
            {
                malformed.push_back("plants[].position");
                continue;
            }
            out.push_back(Entity{read_id(p), *pos});
        }
        return out;
    }

    inline std::size_t read_dim(const nlohmann::json &data, const char *key)
    {
        auto it = data.find(key);
        if (it == data.end() || !it->is_number_unsigned())
            return 0;
        return it->get<std::size_t>();
    }

    inline std::optional<std::vector<std::uint8_t>> read_image(const nlohmann::json &data,
                                                               std::vector<std::string> &malformed)
    {
        auto it = data.find("image");
        if (it == data.end() || it->is_null())
            return std::vector<std::uint8_t>(kImageBytes, 0);
        if (!it->is_string())
        {
            malformed.push_back("image");
            return std::nullopt;
        }
        try
        {
            return decode_rgb_image(base64_decode(it->get<std::string>()),
                                    read_dim(data, "image_width"), read_dim(data, "image_height"));
        }
        catch (const std::exception &e)
        {
            malformed.push_back(std::string("image: ") + e.what());
            return std::nullopt;
        }
    }
} // namespace wire_detail

// Returns nullopt for frames that are not a {type, data?, timestamp?} object.
inline std::optional<InboundMessage> parse_inbound(const std::string &text, std::string *why = nullptr)
{
    using nlohmann::json;
    auto fail = [why](const std::string &reason) -> std::optional<InboundMessage>
    {
        if (why)
            *why = reason;
        return std::nullopt;
    };

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded())
        return fail("invalid json");
    if (!j.is_object())
        return fail("frame is not an object");
    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string())
        return fail("missing string 'type'");
    json data = json::object();
    if (auto d = j.find("data"); d != j.end() && !d->is_null())
    {
        if (!d->is_object())
            return fail("'data' is not an object");
        data = *d;
    }

    InboundMessage msg;
    if (auto ts = j.find("timestamp"); ts != j.end() && ts->is_number())
        msg.timestamp = ts->get<double>();

    const std::string type = type_it->get<std::string>();
    if (type == "observation")
    {
        ObservationMsg m;
        m.position = wire_detail::read_vec3(data, "position", Vec3{0, 5, 0}, m.malformed);
        m.velocity = wire_detail::read_vec3(data, "velocity", Vec3{0, 0, 0}, m.malformed);
        m.rotation = wire_detail::read_vec3(data, "rotation", Vec3{0, 0, 0}, m.malformed);
        m.entities = wire_detail::read_entities(data, std::vector<Entity>{}, m.malformed);
        m.image = wire_detail::read_image(data, m.malformed);
        msg.payload = std::move(m);
    }
    else if (type == "reward")
    {
        RewardMsg m;
        if (auto r = data.find("reward"); r != data.end() && r->is_number())
            m.reward = r->get<double>();
        if (auto d = data.find("done"); d != data.end() && d->is_boolean())
            m.done = d->get<bool>();
        msg.payload = m;
    }
    else if (type == "reset")
    {
        msg.payload = ResetAckMsg{};
    }
    else if (type == "drone_update")
    {
        TelemetryMsg m;
        m.position = wire_detail::read_vec3(data, "position", std::nullopt, m.malformed);
        m.velocity = wire_detail::read_vec3(data, "velocity", std::nullopt, m.malformed);
        m.rotation = wire_detail::read_vec3(data, "rotation", std::nullopt, m.malformed);
        msg.payload = std::move(m);
    }
    else if (type == "plants_update")
    {
        EntityUpdateMsg m;
        m.entities = wire_detail::read_entities(data, std::nullopt, m.malformed);
        msg.payload = std::move(m);
    }
    else if (type == "camera_feed")
    {
        ImageFrameMsg m;
        if (auto img = data.find("image"); img != data.end() && img->is_string())
            m.image_b64 = img->get<std::string>();
        std::vector<std::string> ignored;
        m.position = wire_detail::read_vec3(data, "position", Vec3{0, 0, 0}, ignored).value_or(Vec3{0, 0, 0});
        m.entities = wire_detail::read_entities(data, std::vector<Entity>{}, ignored).value_or(std::vector<Entity>{});
        if (auto fid = data.find("frame_id"); fid != data.end() && fid->is_string())
            m.frame_id = fid->get<std::string>();
        msg.payload = std::move(m);
    }
    else if (type == "ping")
    {
        msg.payload = PingMsg{};
    }
    else
    {
        msg.payload = UnknownMsg{type, data};
    }
    return msg;
}

inline nlohmann::json outbound_data(const OutboundMessage &m)
{
    using nlohmann::json;
    return std::visit(
        [](const auto &v) -> json
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, ActionMsg>)
            {
                return json{{"action", v.action}};
            }
            else if constexpr (std::is_same_v<T, ClassificationResultMsg>)
            {
                json plants = json::array();
                for (const auto &e : v.entries)
                    plants.push_back(json{
                        {"plantId", e.entity_id},
                        {"position", e.position},
                        {"prediction", e.label},
                        {"confidence", e.confidence}});
                json out{
                    {"overall_prediction", {{"label", v.label}, {"confidence", v.confidence}}},
                    {"plants", plants}};
                if (!v.frame_id.empty())
                    out["frame_id"] = v.frame_id;
                return out;
            }
            else if constexpr (std::is_same_v<T, ErrorMsg>)
            {
                return json{{"message", v.message}};
            }
            else
            {
                return json::object();
            }
        },
        m);
}

inline std::string serialize_outbound(const OutboundMessage &m, std::int64_t timestamp_ms = now_epoch_ms())
{
    nlohmann::json j{{"type", outbound_tag(m)}, {"data", outbound_data(m)}, {"timestamp", timestamp_ms}};
    return j.dump();
}

// -------- link seams --------

// Outbound side of a link. send() never blocks on the network and returns false when nothing was sent.
class MessageSink
{
public:
    virtual ~MessageSink() = default;
    virtual bool send(const OutboundMessage &m) = 0;
};

using InboundHandler = std::function<void(const InboundMessage &)>;

// Inbound side of a link: one handler per kind, invoked in arrival order, never concurrently.
class MessageSource
{
public:
    virtual ~MessageSource() = default;
    virtual void on(InboundKind kind, InboundHandler handler) = 0;
};
