#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core/types.hpp>

namespace wildsort {
    struct detection {
        int species_id = -1;
        std::string species_name;
        float conf = 0.0f;
        std::optional<cv::Rect2f> box;
    };
    using detections_t = std::vector<detection>;

    struct frame_detections {
        std::size_t frame_index = 0;
        detections_t detections;
    };

    enum class source_kind {
        Video,
        Image
    };

    inline const char *to_string(source_kind kind)
    {
        return kind == source_kind::Video ? "video" : "image";
    }

    class classification_label {
    public:
        typedef enum {
            Species,
            Unsorted,
            NoAnimal
        } kind_t;

        static classification_label species(std::string name)
        {
            return classification_label(Species, std::move(name));
        }

        static classification_label unsorted()
        {
            return classification_label(Unsorted, {});
        }

        static classification_label no_animal()
        {
            return classification_label(NoAnimal, {});
        }

        kind_t kind() const { return m_kind; }
        bool is_species() const { return m_kind == Species; }

        // Empty unless kind() == Species
        const std::string &species_name() const { return m_species; }

        std::string name() const
        {
            switch (m_kind) {
            case Species:
                return m_species;
            case Unsorted:
                return "Unsorted";
            case NoAnimal:
            default:
                return "No_Animal";
            }
        }

        bool operator==(const classification_label &other) const
        {
            return m_kind == other.m_kind && m_species == other.m_species;
        }

        bool operator!=(const classification_label &other) const
        {
            return !(*this == other);
        }

    private:
        classification_label(kind_t kind, std::string species)
            : m_kind(kind)
            , m_species(std::move(species))
        {}

        kind_t m_kind;
        std::string m_species;
    };

    struct classification_result {
        classification_label label = classification_label::no_animal();
        float conf = 0.0f;
        source_kind kind = source_kind::Image;

        // video only
        std::map<std::string, int> species_frame_counts;
        int transitions = 0;
        std::size_t frames = 0;
        std::size_t empty_frames = 0;
        std::size_t mixed_frames = 0;
        std::size_t unreadable_frames = 0;
        bool saw_empty_run = false;
    };
}
