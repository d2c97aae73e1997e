#pragma once

#include <algorithm>
#include <iterator>

#include <wildsort/core/types.hpp>

namespace wildsort {

// Highest confidence wins, equal confidences go to the lowest species id.
inline bool outranks(const detection &a, const detection &b)
{
    if (a.conf != b.conf)
        return a.conf > b.conf;

    return a.species_id < b.species_id;
}

inline const detection *strongest(const detections_t &detections)
{
    if (detections.empty())
        return nullptr;

    return &*std::min_element(detections.begin(), detections.end(), outranks);
}

// Best detection whose species differs from `other`
inline const detection *strongest_other(const detections_t &detections, const detection &other)
{
    const detection *best = nullptr;
    for (const auto &d : detections) {
        if (d.species_id == other.species_id && d.species_name == other.species_name)
            continue;

        if (!best || outranks(d, *best))
            best = &d;
    }

    return best;
}

class frame_filter {
public:
    explicit frame_filter(float threshold)
        : m_threshold(threshold)
    {}

    // Keeps detections with conf >= threshold, in detector order.
    detections_t apply(const detections_t &raw) const
    {
        detections_t accepted;
        accepted.reserve(raw.size());
        std::copy_if(raw.begin(), raw.end(), std::back_inserter(accepted),
                     [this](const detection &d) { return d.conf >= m_threshold; });

        return accepted;
    }

    frame_detections apply(const frame_detections &raw) const
    {
        return { raw.frame_index, apply(raw.detections) };
    }

    float threshold() const { return m_threshold; }

private:
    float m_threshold;
};

}
