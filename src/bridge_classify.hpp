/*
 * File: src/bridge_classify.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Camera-frame classification relay (ClassificationBridge)
 * Notes:
 *  - One plant_classification reply per camera_feed frame
 *  - Failures are reported to the peer as an `error` message
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/log.hpp"
#include "common/messages.hpp"
#include "common/observation.hpp"

struct Prediction
{
    std::string label;
    double confidence{0.0};
};

class PlantClassifier
{
public:
    virtual ~PlantClassifier() = default;
    // Throws on undecodable input.
    virtual Prediction classify(const std::vector<std::uint8_t> &image) = 0;
    virtual std::string name() const = 0;
};

struct ClassifierConfig
{
    double healthy_ratio{0.35};
    int green_margin{20};
};

// Fraction of green-dominant pixels in interleaved RGB8 decides healthy vs sick.
class GreennessClassifier : public PlantClassifier
{
    ClassifierConfig cfg_;

public:
    explicit GreennessClassifier(ClassifierConfig cfg = {}) : cfg_(cfg)
    {
        if (!(cfg_.healthy_ratio > 0.0 && cfg_.healthy_ratio < 1.0))
            throw std::invalid_argument("healthy_ratio must be in (0, 1)");
    }

    std::string name() const override { return "greenness"; }

    Prediction classify(const std::vector<std::uint8_t> &image) override
    {
        if (image.empty() || image.size() % kImageChannels != 0)
            throw std::invalid_argument("image is not interleaved RGB8 (" + std::to_string(image.size()) + " bytes)");

        const std::size_t pixels = image.size() / kImageChannels;
        std::size_t green = 0;
        for (std::size_t i = 0; i < image.size(); i += kImageChannels)
        {
            const int r = image[i], g = image[i + 1], b = image[i + 2];
            if (g > r + cfg_.green_margin && g > b + cfg_.green_margin)
                ++green;
        }
        const double ratio = static_cast<double>(green) / static_cast<double>(pixels);
        const double t = cfg_.healthy_ratio;
        if (ratio >= t)
            return Prediction{"healthy", 0.5 + 0.5 * (ratio - t) / (1.0 - t)};
        return Prediction{"sick", 0.5 + 0.5 * (t - ratio) / t};
    }
};

class ClassificationBridge
{
    PlantClassifier &classifier_;
    MessageSink &sink_;
    std::atomic<std::uint64_t> frames_{0}, published_{0}, errors_{0};

public:
    ClassificationBridge(PlantClassifier &classifier, MessageSink &sink)
        : classifier_(classifier), sink_(sink) {}

    void attach(MessageSource &source)
    {
        source.on(InboundKind::ImageFrame, [this](const InboundMessage &m)
                  { handle_frame(std::get<ImageFrameMsg>(m.payload)); });
        source.on(InboundKind::Ping, [this](const InboundMessage &)
                  { handle_ping(); });
    }

    void handle_frame(const ImageFrameMsg &frame)
    {
        ++frames_;
        try
        {
            if (frame.image_b64.empty())
                throw std::invalid_argument("no image data provided");
            const auto bytes = base64_decode(frame.image_b64);
            if (bytes.empty())
                throw std::invalid_argument("image decoded to zero bytes");

            Prediction p = classifier_.classify(bytes);
            if (!std::isfinite(p.confidence))
                p.confidence = 0.0;
            p.confidence = std::max(0.0, std::min(1.0, p.confidence));

            ClassificationResultMsg out;
            out.label = p.label;
            out.confidence = p.confidence;
            out.frame_id = frame.frame_id;
            if (frame.entities.empty())
            {
                out.entries.push_back(EntityClassification{"image_center", frame.position, p.label, p.confidence});
            }
            else
            {
                for (std::size_t i = 0; i < frame.entities.size(); ++i)
                {
                    const auto &e = frame.entities[i];
                    const std::string id = e.id.empty() ? "entity_" + std::to_string(i) : e.id;
                    out.entries.push_back(EntityClassification{id, e.position, p.label, p.confidence});
                }
            }

            if (sink_.send(out))
            {
                ++published_;
                log_debug("classify", "frame classified " + p.label + " (" + std::to_string(p.confidence) + "), " +
                                          std::to_string(out.entries.size()) + " entries");
            }
            else
            {
                log_warn("classify", "classification result not delivered: link down");
            }
        }
        catch (const std::exception &e)
        {
            ++errors_;
            log_error("classify", std::string("classification failed: ") + e.what());
            if (!sink_.send(ErrorMsg{std::string("Classification failed: ") + e.what()}))
                log_debug("classify", "error reply not delivered: link down");
        }
    }

    void handle_ping()
    {
        if (!sink_.send(PongMsg{}))
            log_debug("classify", "pong not delivered: link down");
    }

    nlohmann::json stats() const
    {
        return nlohmann::json{
            {"classifier", classifier_.name()},
            {"frames", frames_.load()},
            {"published", published_.load()},
            {"errors", errors_.load()}};
    }
};
