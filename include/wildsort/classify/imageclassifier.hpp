#pragma once

#include <memory>

#include <spdlog/spdlog.h>

#include <wildsort/core/types.hpp>
#include <wildsort/config/thresholdpolicy.hpp>
#include <wildsort/classify/framefilter.hpp>

namespace wildsort {

class image_classifier {
public:
    explicit image_classifier(threshold_policy policy);

    // `accepted` must already be filtered by image_confidence_threshold()
    classification_result classify(const detections_t &accepted) const;

    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    threshold_policy m_policy;
    std::shared_ptr<spdlog::logger> m_logger;
};

// Definitions

inline image_classifier::image_classifier(threshold_policy policy)
    : m_policy(std::move(policy))
    , m_logger(spdlog::default_logger()->clone("wildsort.image"))
{}

inline classification_result image_classifier::classify(const detections_t &accepted) const
{
    classification_result result;
    result.kind = source_kind::Image;
    result.frames = 1;

    const detection *top = strongest(accepted);

    if (accepted.size() < static_cast<std::size_t>(m_policy.image_min_detections())) {
        result.label = classification_label::no_animal();
        result.conf = top ? top->conf : 0.0f;
        return result;
    }

    result.conf = top->conf;

    const detection *second = strongest_other(accepted, *top);
    if (second && top->conf - second->conf < m_policy.image_multi_species_threshold()) {
        m_logger->debug("Ambiguous frame: {} {:.3f} vs {} {:.3f}", top->species_name, top->conf,
                        second->species_name, second->conf);
        result.label = classification_label::unsorted();
        return result;
    }

    if (top->conf >= m_policy.image_unsorted_min_confidence()
        && top->conf <= m_policy.image_unsorted_max_confidence()) {
        m_logger->debug("{} {:.3f} falls in the manual review band", top->species_name, top->conf);
        result.label = classification_label::unsorted();
        return result;
    }

    result.label = classification_label::species(top->species_name);
    return result;
}

inline void image_classifier::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    m_logger = logger;
}

}
