/*
 * File: src/bridge_policy.hpp
 * Project: AGMO Sim Bridge
 * Purpose: Linear tanh control policy over a compact observation feature vector
 * Notes:
 *  - Features never read the camera image
 *  - Weights are row-major [output][input]
 * Last updated: 2026-10-19
 */

#pragma once
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "bridge_checkpoint.hpp"
#include "common/observation.hpp"

constexpr std::size_t kFeatureSize = 13;
using Features = std::array<double, kFeatureSize>;

// position/30, velocity/10, rotation/pi, offset to nearest entity/30, bias
inline Features policy_features(const Observation &obs)
{
    constexpr double kPi = 3.14159265358979323846;
    Features f{};
    const Vec3 pos = obs.position();
    const Vec3 vel = obs.velocity();
    const Vec3 rot = obs.rotation();
    for (std::size_t i = 0; i < 3; ++i)
    {
        f[i] = pos[i] / 30.0;
        f[3 + i] = vel[i] / 10.0;
        f[6 + i] = rot[i] / kPi;
    }
    double best = std::numeric_limits<double>::max();
    for (std::size_t e = 0; e < obs.entity_count; ++e)
    {
        const auto &ep = obs.entity_positions[e];
        const Vec3 d{ep[0] - pos[0], ep[1] - pos[1], ep[2] - pos[2]};
        const double dist = norm3(d);
        if (dist < best)
        {
            best = dist;
            for (std::size_t i = 0; i < 3; ++i)
                f[9 + i] = d[i] / 30.0;
        }
    }
    f[12] = 1.0;
    return f;
}

class LinearPolicy
{
    std::vector<double> w_ = std::vector<double>(kFeatureSize * kActionSize, 0.0);

public:
    static constexpr const char *kAlgorithm = "es-linear";

    std::size_t size() const { return w_.size(); }
    const std::vector<double> &weights() const { return w_; }

    Action act(const Features &f) const
    {
        Action a{};
        for (std::size_t o = 0; o < kActionSize; ++o)
        {
            double z = 0.0;
            for (std::size_t i = 0; i < kFeatureSize; ++i)
                z += w_[o * kFeatureSize + i] * f[i];
            a[o] = static_cast<float>(std::tanh(z));
        }
        return a;
    }

    LinearPolicy perturbed(const std::vector<double> &noise, double sigma) const
    {
        LinearPolicy p = *this;
        for (std::size_t i = 0; i < w_.size(); ++i)
            p.w_[i] += sigma * noise[i];
        return p;
    }

    void apply_update(const std::vector<double> &grad, double learning_rate)
    {
        for (std::size_t i = 0; i < w_.size(); ++i)
            w_[i] += learning_rate * grad[i];
    }

    ModelState state(const std::string &model_name) const
    {
        ModelState m;
        m.model_name = model_name;
        m.algorithm = kAlgorithm;
        m.inputs = kFeatureSize;
        m.outputs = kActionSize;
        m.weights = w_;
        return m;
    }

    // Leaves the policy untouched when the checkpoint does not fit.
    void load(const ModelState &m)
    {
        if (m.algorithm != kAlgorithm)
            throw std::invalid_argument("unsupported algorithm '" + m.algorithm + "'");
        if (m.inputs != kFeatureSize || m.outputs != kActionSize || m.weights.size() != w_.size())
            throw std::invalid_argument("checkpoint shape " + std::to_string(m.outputs) + "x" +
                                        std::to_string(m.inputs) + " does not match policy " +
                                        std::to_string(kActionSize) + "x" + std::to_string(kFeatureSize));
        for (double v : m.weights)
            if (!std::isfinite(v))
                throw std::invalid_argument("checkpoint contains non-finite weights");
        w_ = m.weights;
    }
};
