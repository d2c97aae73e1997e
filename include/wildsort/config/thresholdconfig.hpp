#pragma once

#include <algorithm>
#include <optional>
#include <string>

#include <wildsort/core/errors.hpp>

namespace wildsort {
    struct threshold_config {
        typedef enum {
            Balanced,
            HighPrecision,
            HighRecall,
            FastProcessing
        } mode_t;

        // video
        std::optional<float> confidence_threshold;
        std::optional<float> dominant_species_threshold;
        std::optional<int> max_species_transitions;
        std::optional<int> consecutive_empty_frames;
        std::optional<int> max_unreadable_frames;

        // image
        std::optional<float> image_confidence_threshold;
        std::optional<int> image_min_detections;
        std::optional<float> image_multi_species_threshold;
        std::optional<float> image_unsorted_min_confidence;
        std::optional<float> image_unsorted_max_confidence;

        std::optional<mode_t> mode;

        static mode_t modeForString(const std::string &mode)
        {
            if (mode == "balanced")
                return Balanced;

            if (mode == "high_precision")
                return HighPrecision;

            if (mode == "high_recall")
                return HighRecall;

            if (mode == "fast_processing")
                return FastProcessing;

            throw configuration_error("Unknown processing mode '" + mode
                                      + "', expected balanced, high_precision, high_recall or fast_processing");
        }

        static const char *stringForMode(mode_t mode)
        {
            switch (mode) {
            case HighPrecision:
                return "high_precision";
            case HighRecall:
                return "high_recall";
            case FastProcessing:
                return "fast_processing";
            case Balanced:
            default:
                return "balanced";
            }
        }
    };

    namespace defaults {
        constexpr float confidence_threshold = 0.40f;
        constexpr float dominant_species_threshold = 0.9f;
        constexpr int max_species_transitions = 5;
        constexpr int consecutive_empty_frames = 15;
        constexpr int max_unreadable_frames = 10;
        constexpr float image_confidence_threshold = 0.65f;
        constexpr int image_min_detections = 1;
        constexpr float image_multi_species_threshold = 0.60f;
        constexpr float image_unsorted_min_confidence = 0.35f;
        constexpr float image_unsorted_max_confidence = 0.65f;
    }

    // Folds config.mode into the knobs it adjusts. Explicit knobs are the base the
    // preset starts from, defaults fill the rest.
    inline threshold_config apply_mode(threshold_config config)
    {
        switch (config.mode.value_or(threshold_config::Balanced)) {
        case threshold_config::HighPrecision:
            config.confidence_threshold = std::min(config.confidence_threshold.value_or(defaults::confidence_threshold) + 0.1f, 0.95f);
            config.dominant_species_threshold = 0.95f;
            break;
        case threshold_config::HighRecall:
            config.confidence_threshold = std::max(config.confidence_threshold.value_or(defaults::confidence_threshold) - 0.1f, 0.1f);
            config.dominant_species_threshold = 0.7f;
            break;
        case threshold_config::FastProcessing:
            config.consecutive_empty_frames = 5;
            break;
        case threshold_config::Balanced:
        default:
            break;
        }

        config.mode = threshold_config::Balanced;
        return config;
    }
}
