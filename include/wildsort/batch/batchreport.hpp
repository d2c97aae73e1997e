#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <wildsort/core/types.hpp>
#include <wildsort/routing/taxonomyresolver.hpp>

namespace wildsort {

struct batch_error {
    typedef enum {
        DetectorFailure,
        DestinationExists,
        MoveFailed,
        Other
    } kind_t;

    kind_t kind = Other;
    std::string message;

    static const char *stringForKind(kind_t kind)
    {
        switch (kind) {
        case DetectorFailure:
            return "detector_failure";
        case DestinationExists:
            return "destination_exists";
        case MoveFailed:
            return "move_failed";
        case Other:
        default:
            return "other";
        }
    }
};

struct report_entry {
    std::filesystem::path file;
    std::optional<classification_result> result;
    std::optional<routing_decision> routing;
    std::optional<std::filesystem::path> routed_to;
    std::chrono::duration<double> elapsed { 0.0 };
    std::optional<batch_error> error;

    bool ok() const { return !error.has_value(); }
};

struct batch_summary {
    std::size_t total_files = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    double success_rate = 0.0;
    double average_confidence = 0.0;
    std::chrono::duration<double> total_time { 0.0 };
    std::chrono::duration<double> average_time { 0.0 };
    std::map<std::string, std::size_t> species_counts;   // Species labels only
    std::size_t unsorted = 0;
    std::size_t no_animal = 0;
    std::map<std::string, std::size_t> kind_counts;
    std::map<std::string, std::size_t> error_counts;
};

// Append-only record of one batch run
class batch_report {
public:
    void append(report_entry entry) { m_entries.emplace_back(std::move(entry)); }
    void clear() { m_entries.clear(); }

    const std::vector<report_entry> &entries() const { return m_entries; }
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    const report_entry &at(std::size_t index) const { return m_entries.at(index); }

    batch_summary summarize() const;

private:
    std::vector<report_entry> m_entries;
};

// Definitions

inline batch_summary batch_report::summarize() const
{
    batch_summary summary;
    summary.total_files = m_entries.size();

    double confidence_sum = 0.0;
    std::size_t classified = 0;
    for (const auto &entry : m_entries) {
        if (entry.ok())
            ++summary.succeeded;
        else
            ++summary.error_counts[batch_error::stringForKind(entry.error->kind)];

        summary.total_time += entry.elapsed;

        if (entry.result) {
            const classification_label &label = entry.result->label;
            switch (label.kind()) {
            case classification_label::Species:
                ++summary.species_counts[label.species_name()];
                break;
            case classification_label::Unsorted:
                ++summary.unsorted;
                break;
            case classification_label::NoAnimal:
            default:
                ++summary.no_animal;
                break;
            }

            ++summary.kind_counts[to_string(entry.result->kind)];
            confidence_sum += entry.result->conf;
            ++classified;
        }
    }

    summary.failed = summary.total_files - summary.succeeded;

    if (summary.total_files > 0) {
        summary.success_rate = static_cast<double>(summary.succeeded) / summary.total_files;
        summary.average_time = summary.total_time / static_cast<double>(summary.total_files);
    }

    if (classified > 0)
        summary.average_confidence = confidence_sum / classified;

    return summary;
}

}
