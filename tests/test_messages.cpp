/*
 * File: tests/test_messages.cpp
 * Project: AGMO Sim Bridge
 * Purpose: Inbound parsing and outbound serialisation of wire messages
 * Notes:
 *  - Wire format: {type, data, timestamp} JSON text frames
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "common/messages.hpp"
#include "test_support.hpp"

using nlohmann::json;

TEST_CASE("every known tag maps to its kind")
{
    const std::pair<const char *, InboundKind> cases[] = {
        {"observation", InboundKind::Observation},
        {"reward", InboundKind::Reward},
        {"reset", InboundKind::ResetAck},
        {"drone_update", InboundKind::TelemetryUpdate},
        {"plants_update", InboundKind::EntityUpdate},
        {"camera_feed", InboundKind::ImageFrame},
        {"ping", InboundKind::Ping}};
    for (const auto &[tag, kind] : cases)
    {
        auto m = parse_inbound(frame(tag, "{}"));
        REQUIRE(m);
        CHECK(m->kind() == kind);
        CHECK(std::string(kind_tag(kind)) == tag);
    }
}

TEST_CASE("unknown tags are retained with their data")
{
    auto m = parse_inbound(frame("weather", R"({"wind":3})"));
    REQUIRE(m);
    REQUIRE(m->kind() == InboundKind::Unknown);
    const auto &u = std::get<UnknownMsg>(m->payload);
    CHECK(u.tag == "weather");
    CHECK(u.data["wind"] == 3);
}

TEST_CASE("frames without a usable envelope are rejected")
{
    std::string why;
    CHECK_FALSE(parse_inbound("not json", &why));
    CHECK(why == "invalid json");
    CHECK_FALSE(parse_inbound("[1,2,3]", &why));
    CHECK_FALSE(parse_inbound(R"({"data":{}})", &why));
    CHECK_FALSE(parse_inbound(R"({"type":5})", &why));
    CHECK_FALSE(parse_inbound(R"({"type":"observation","data":[1]})", &why));
    CHECK(why == "'data' is not an object");
}

TEST_CASE("observation defaults fill missing fields")
{
    auto m = parse_inbound(R"({"type":"observation"})");
    REQUIRE(m);
    const auto &o = std::get<ObservationMsg>(m->payload);
    REQUIRE(o.position);
    CHECK(*o.position == Vec3{0, 5, 0});
    CHECK(*o.velocity == Vec3{0, 0, 0});
    REQUIRE(o.entities);
    CHECK(o.entities->empty());
    REQUIRE(o.image);
    CHECK(o.image->size() == kImageBytes);
    CHECK(o.malformed.empty());
}

TEST_CASE("malformed observation fields are reported, not defaulted")
{
    auto m = parse_inbound(frame("observation", R"({"position":[1,2],"velocity":["a",0,0],"rotation":[0,0,1]})"));
    REQUIRE(m);
    const auto &o = std::get<ObservationMsg>(m->payload);
    CHECK_FALSE(o.position);
    CHECK_FALSE(o.velocity);
    REQUIRE(o.rotation);
    CHECK((*o.rotation)[2] == 1.0f);
    CHECK(o.malformed.size() == 2);
}

TEST_CASE("drone_update leaves absent fields empty")
{
    auto m = parse_inbound(frame("drone_update", R"({"velocity":[1,0,0]})"));
    REQUIRE(m);
    const auto &t = std::get<TelemetryMsg>(m->payload);
    CHECK_FALSE(t.position);
    REQUIRE(t.velocity);
    CHECK_FALSE(t.rotation);
}

TEST_CASE("plant entries accept string or integer ids")
{
    auto m = parse_inbound(frame("plants_update", R"({"plants":[{"id":"p1","position":[1,0,2]},{"id":7,"position":[3,0,4]},{"position":"bad"}]})"));
    REQUIRE(m);
    const auto &e = std::get<EntityUpdateMsg>(m->payload);
    REQUIRE(e.entities);
    REQUIRE(e.entities->size() == 2);
    CHECK((*e.entities)[0].id == "p1");
    CHECK((*e.entities)[1].id == "7");
    CHECK(e.malformed.size() == 1);
}

TEST_CASE("small images are resampled to the observation shape")
{
    std::vector<std::uint8_t> raw(2 * 2 * 3);
    for (std::size_t i = 0; i < 4; ++i)
    {
        raw[i * 3] = static_cast<std::uint8_t>(10 * (i + 1));
        raw[i * 3 + 1] = 0;
        raw[i * 3 + 2] = 0;
    }
    json data{{"image", base64_encode(raw)}, {"image_width", 2}, {"image_height", 2}};
    auto m = parse_inbound(json{{"type", "observation"}, {"data", data}}.dump());
    REQUIRE(m);
    const auto &o = std::get<ObservationMsg>(m->payload);
    REQUIRE(o.image);
    REQUIRE(o.image->size() == kImageBytes);
    CHECK((*o.image)[0] == 10);                                  // top-left
    CHECK((*o.image)[(kImageBytes - 3)] == 40);                  // bottom-right
    CHECK((*o.image)[(kImageWidth - 1) * kImageChannels] == 20); // top-right
}

TEST_CASE("image with the wrong byte count is malformed")
{
    json data{{"image", base64_encode(std::vector<std::uint8_t>(10, 1))}};
    auto m = parse_inbound(json{{"type", "observation"}, {"data", data}}.dump());
    REQUIRE(m);
    const auto &o = std::get<ObservationMsg>(m->payload);
    CHECK_FALSE(o.image);
    CHECK(o.malformed.size() == 1);
}

TEST_CASE("oversized image dimensions are malformed, not resampled")
{
    auto m = parse_inbound(
        R"({"type":"observation","data":{"image":"","image_width":9223372036854775808,"image_height":2}})");
    REQUIRE(m);
    const auto &o = std::get<ObservationMsg>(m->payload);
    CHECK_FALSE(o.image);
    CHECK(o.malformed.size() == 1);

    json data{{"image", base64_encode(std::vector<std::uint8_t>(12, 1))}, {"image_width", 8193}, {"image_height", 1}};
    auto wide = parse_inbound(json{{"type", "observation"}, {"data", data}}.dump());
    REQUIRE(wide);
    CHECK_FALSE(std::get<ObservationMsg>(wide->payload).image);
}

TEST_CASE("base64 decoding is strict")
{
    CHECK(base64_decode("AQID") == std::vector<std::uint8_t>{1, 2, 3});
    CHECK(base64_decode("AQI=") == std::vector<std::uint8_t>{1, 2});
    CHECK(base64_decode("AQIDBA") == std::vector<std::uint8_t>{1, 2, 3, 4});
    CHECK_THROWS_AS(base64_decode("AQ*D"), std::invalid_argument);
    CHECK_THROWS_AS(base64_decode("AQ==x"), std::invalid_argument);
    CHECK_THROWS_AS(base64_decode("AQIDB"), std::invalid_argument);
    CHECK_THROWS_AS(base64_decode("A"), std::invalid_argument);
}

TEST_CASE("outbound messages carry type, data and timestamp")
{
    auto j = json::parse(serialize_outbound(ActionMsg{{0.5f, -1.0f, 0.0f, 1.0f}}, 1234));
    CHECK(j["type"] == "action");
    CHECK(j["timestamp"] == 1234);
    REQUIRE(j["data"]["action"].size() == 4);
    CHECK(j["data"]["action"][0].get<float>() == 0.5f);

    auto r = json::parse(serialize_outbound(ResetRequestMsg{}));
    CHECK(r["type"] == "reset");
    CHECK(r["data"].is_object());
    CHECK(r["data"].empty());

    CHECK(json::parse(serialize_outbound(PongMsg{}))["type"] == "pong");
    auto e = json::parse(serialize_outbound(ErrorMsg{"boom"}));
    CHECK(e["type"] == "error");
    CHECK(e["data"]["message"] == "boom");
}

TEST_CASE("classification result uses the plant wire names")
{
    ClassificationResultMsg m;
    m.label = "healthy";
    m.confidence = 0.75;
    m.frame_id = "f1";
    m.entries.push_back(EntityClassification{"p1", {1, 0, 2}, "healthy", 0.75});
    auto j = json::parse(serialize_outbound(m));
    CHECK(j["type"] == "plant_classification");
    CHECK(j["data"]["overall_prediction"]["label"] == "healthy");
    CHECK(j["data"]["frame_id"] == "f1");
    REQUIRE(j["data"]["plants"].size() == 1);
    CHECK(j["data"]["plants"][0]["plantId"] == "p1");
    CHECK(j["data"]["plants"][0]["prediction"] == "healthy");
    CHECK(j["data"]["plants"][0]["position"][2].get<float>() == 2.0f);
}
