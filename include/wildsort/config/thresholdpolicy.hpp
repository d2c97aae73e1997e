#pragma once

#include <cmath>
#include <string>

#include <fmt/format.h>

#include <wildsort/core/errors.hpp>
#include <wildsort/config/thresholdconfig.hpp>

namespace wildsort {

/**
 * Immutable set of classification knobs. Every instance is valid: the constructor
 * runs validate() and throws invalid_policy, so downstream stages never re-check.
 */
class threshold_policy {
public:
    threshold_policy();
    explicit threshold_policy(const threshold_config &config);

    float confidence_threshold() const { return m_confidence_threshold; }
    float dominant_species_threshold() const { return m_dominant_species_threshold; }
    int max_species_transitions() const { return m_max_species_transitions; }
    int consecutive_empty_frames() const { return m_consecutive_empty_frames; }
    int max_unreadable_frames() const { return m_max_unreadable_frames; }

    float image_confidence_threshold() const { return m_image_confidence_threshold; }
    int image_min_detections() const { return m_image_min_detections; }
    float image_multi_species_threshold() const { return m_image_multi_species_threshold; }
    float image_unsorted_min_confidence() const { return m_image_unsorted_min_confidence; }
    float image_unsorted_max_confidence() const { return m_image_unsorted_max_confidence; }

    std::string describe() const;

private:
    void validate() const;

    float m_confidence_threshold;
    float m_dominant_species_threshold;
    int m_max_species_transitions;
    int m_consecutive_empty_frames;
    int m_max_unreadable_frames;

    float m_image_confidence_threshold;
    int m_image_min_detections;
    float m_image_multi_species_threshold;
    float m_image_unsorted_min_confidence;
    float m_image_unsorted_max_confidence;
};

// Definitions

inline threshold_policy::threshold_policy()
    : threshold_policy(threshold_config())
{}

inline threshold_policy::threshold_policy(const threshold_config &config)
{
    const threshold_config effective = apply_mode(config);

    m_confidence_threshold = effective.confidence_threshold.value_or(defaults::confidence_threshold);
    m_dominant_species_threshold = effective.dominant_species_threshold.value_or(defaults::dominant_species_threshold);
    m_max_species_transitions = effective.max_species_transitions.value_or(defaults::max_species_transitions);
    m_consecutive_empty_frames = effective.consecutive_empty_frames.value_or(defaults::consecutive_empty_frames);
    m_max_unreadable_frames = effective.max_unreadable_frames.value_or(defaults::max_unreadable_frames);

    m_image_confidence_threshold = effective.image_confidence_threshold.value_or(defaults::image_confidence_threshold);
    m_image_min_detections = effective.image_min_detections.value_or(defaults::image_min_detections);
    m_image_multi_species_threshold = effective.image_multi_species_threshold.value_or(defaults::image_multi_species_threshold);
    m_image_unsorted_min_confidence = effective.image_unsorted_min_confidence.value_or(defaults::image_unsorted_min_confidence);
    m_image_unsorted_max_confidence = effective.image_unsorted_max_confidence.value_or(defaults::image_unsorted_max_confidence);

    validate();
}

inline void threshold_policy::validate() const
{
    auto check_probability = [](const char *name, float value) {
        if (!std::isfinite(value) || value < 0.0f || value > 1.0f)
            throw invalid_policy(fmt::format("{} must be within [0, 1], got {}", name, value));
    };

    auto check_count = [](const char *name, int value, int minimum) {
        if (value < minimum)
            throw invalid_policy(fmt::format("{} must be at least {}, got {}", name, minimum, value));
    };

    check_probability("confidence_threshold", m_confidence_threshold);
    check_probability("dominant_species_threshold", m_dominant_species_threshold);
    check_probability("image_confidence_threshold", m_image_confidence_threshold);
    check_probability("image_multi_species_threshold", m_image_multi_species_threshold);
    check_probability("image_unsorted_min_confidence", m_image_unsorted_min_confidence);
    check_probability("image_unsorted_max_confidence", m_image_unsorted_max_confidence);

    if (m_dominant_species_threshold < 0.5f)
        throw invalid_policy(fmt::format("dominant_species_threshold must be at least 0.5, got {}", m_dominant_species_threshold));

    if (m_image_unsorted_min_confidence >= m_image_unsorted_max_confidence)
        throw invalid_policy(fmt::format("image_unsorted_min_confidence ({}) must be below image_unsorted_max_confidence ({})",
                                         m_image_unsorted_min_confidence, m_image_unsorted_max_confidence));

    check_count("max_species_transitions", m_max_species_transitions, 1);
    check_count("consecutive_empty_frames", m_consecutive_empty_frames, 1);
    check_count("image_min_detections", m_image_min_detections, 1);
    check_count("max_unreadable_frames", m_max_unreadable_frames, 0);
}

inline std::string threshold_policy::describe() const
{
    return fmt::format("video(conf={:.2f}, dominant={:.2f}, transitions<={}, empty_run={}, unreadable<={}) "
                       "image(conf={:.2f}, min_detections={}, multi_gap={:.2f}, unsorted=[{:.2f}, {:.2f}])",
                       m_confidence_threshold, m_dominant_species_threshold, m_max_species_transitions,
                       m_consecutive_empty_frames, m_max_unreadable_frames,
                       m_image_confidence_threshold, m_image_min_detections, m_image_multi_species_threshold,
                       m_image_unsorted_min_confidence, m_image_unsorted_max_confidence);
}

}
