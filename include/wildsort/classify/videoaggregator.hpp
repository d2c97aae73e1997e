#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <wildsort/core/types.hpp>
#include <wildsort/config/thresholdpolicy.hpp>
#include <wildsort/classify/framefilter.hpp>

namespace wildsort {

/**
 * Folds a video's per-frame accepted detections into one classification.
 *
 * Frames must already be filtered by threshold_policy::confidence_threshold() and arrive
 * with strictly increasing frame indices. Each non-empty frame votes for its leading
 * species; switches of the leading species between non-empty frames are transitions.
 * finish() applies the end-of-stream decision and may be called at any point.
 */
class video_aggregator {
public:
    typedef enum {
        Empty,
        Dominant,
        Mixed
    } frame_state_t;

    explicit video_aggregator(threshold_policy policy);

    frame_state_t add_frame(const frame_detections &accepted);
    void skip_frame();
    classification_result finish() const;
    void reset();

    int transitions() const;
    std::size_t unreadable_frames() const;
    const std::map<std::string, int> &species_frame_counts() const;

    void set_logger(std::shared_ptr<spdlog::logger> logger);

    static classification_result aggregate(const threshold_policy &policy, const std::vector<frame_detections> &frames);

private:
    threshold_policy m_policy;

    std::map<std::string, int> m_counts;
    std::map<std::string, int> m_species_ids;
    std::optional<std::string> m_previous_species;
    std::optional<std::size_t> m_last_index;

    int m_transitions = 0;
    int m_empty_run = 0;
    bool m_saw_empty_run = false;
    std::size_t m_frames = 0;
    std::size_t m_empty_frames = 0;
    std::size_t m_mixed_frames = 0;
    std::size_t m_unreadable_frames = 0;

    std::shared_ptr<spdlog::logger> m_logger;
};

// Definitions

inline video_aggregator::video_aggregator(threshold_policy policy)
    : m_policy(std::move(policy))
    , m_logger(spdlog::default_logger()->clone("wildsort.video"))
{}

inline video_aggregator::frame_state_t video_aggregator::add_frame(const frame_detections &accepted)
{
    if (m_last_index && accepted.frame_index <= m_last_index.value())
        throw std::invalid_argument(fmt::format("Frame {} arrived after frame {}, frame indices must increase",
                                                accepted.frame_index, m_last_index.value()));

    m_last_index = accepted.frame_index;
    ++m_frames;

    const detection *leading = strongest(accepted.detections);
    if (!leading) {
        ++m_empty_frames;
        ++m_empty_run;
        if (m_empty_run >= m_policy.consecutive_empty_frames() && !m_saw_empty_run) {
            m_saw_empty_run = true;
            m_logger->debug("Empty run of {} frames reached at frame {}", m_empty_run, accepted.frame_index);
        }

        return Empty;
    }

    m_empty_run = 0;
    ++m_counts[leading->species_name];

    auto id = m_species_ids.find(leading->species_name);
    if (id == m_species_ids.end() || leading->species_id < id->second)
        m_species_ids[leading->species_name] = leading->species_id;

    if (m_previous_species && m_previous_species.value() != leading->species_name) {
        ++m_transitions;
        m_logger->trace("Transition {} -> {} at frame {}", m_previous_species.value(),
                        leading->species_name, accepted.frame_index);
    }
    m_previous_species = leading->species_name;

    std::set<std::string> distinct;
    for (const auto &d : accepted.detections)
        distinct.insert(d.species_name);

    if (distinct.size() > 1) {
        ++m_mixed_frames;
        return Mixed;
    }

    return Dominant;
}

inline void video_aggregator::skip_frame()
{
    ++m_unreadable_frames;
}

inline classification_result video_aggregator::finish() const
{
    classification_result result;
    result.kind = source_kind::Video;
    result.species_frame_counts = m_counts;
    result.transitions = m_transitions;
    result.frames = m_frames;
    result.empty_frames = m_empty_frames;
    result.mixed_frames = m_mixed_frames;
    result.unreadable_frames = m_unreadable_frames;
    result.saw_empty_run = m_saw_empty_run;

    if (m_counts.empty()) {
        result.label = classification_label::no_animal();
        result.conf = 0.0f;
        return result;
    }

    int total_nonempty = 0;
    const std::string *top = nullptr;
    for (const auto &[species, count] : m_counts) {
        total_nonempty += count;

        if (!top) {
            top = &species;
            continue;
        }

        const int top_count = m_counts.at(*top);
        if (count > top_count
            || (count == top_count && m_species_ids.at(species) < m_species_ids.at(*top)))
            top = &species;
    }

    // float, like the threshold it is compared against
    const float top_share = static_cast<float>(m_counts.at(*top)) / static_cast<float>(total_nonempty);
    result.conf = top_share;

    if (m_transitions > m_policy.max_species_transitions()) {
        result.label = classification_label::unsorted();
        m_logger->debug("{} transitions exceed the limit of {}", m_transitions, m_policy.max_species_transitions());
    } else if (top_share >= m_policy.dominant_species_threshold()) {
        result.label = classification_label::species(*top);
    } else {
        result.label = classification_label::unsorted();
        m_logger->debug("{} holds {:.3f} of non-empty frames, below {:.2f}{}", *top, top_share,
                        m_policy.dominant_species_threshold(),
                        m_saw_empty_run ? " (video contained a long empty run)" : "");
    }

    return result;
}

inline void video_aggregator::reset()
{
    m_counts.clear();
    m_species_ids.clear();
    m_previous_species.reset();
    m_last_index.reset();
    m_transitions = 0;
    m_empty_run = 0;
    m_saw_empty_run = false;
    m_frames = 0;
    m_empty_frames = 0;
    m_mixed_frames = 0;
    m_unreadable_frames = 0;
}

inline int video_aggregator::transitions() const
{
    return m_transitions;
}

inline std::size_t video_aggregator::unreadable_frames() const
{
    return m_unreadable_frames;
}

inline const std::map<std::string, int> &video_aggregator::species_frame_counts() const
{
    return m_counts;
}

inline void video_aggregator::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    m_logger = logger;
}

inline classification_result video_aggregator::aggregate(const threshold_policy &policy, const std::vector<frame_detections> &frames)
{
    video_aggregator aggregator(policy);
    for (const auto &frame : frames)
        aggregator.add_frame(frame);

    return aggregator.finish();
}

}
