#pragma once

#include <algorithm>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <wildsort/batch/batchreport.hpp>

namespace wildsort {

inline std::string progress_bar(std::size_t done, std::size_t total, std::size_t width = 40)
{
    const double ratio = total == 0 ? 1.0 : static_cast<double>(done) / total;
    const std::size_t filled = std::min(width, static_cast<std::size_t>(ratio * width));

    return fmt::format("[{}{}] {:3d}%", std::string(filled, '#'), std::string(width - filled, '-'),
                       static_cast<int>(ratio * 100));
}

inline void log_summary(const std::shared_ptr<spdlog::logger> &logger, const std::string &title, const batch_summary &summary)
{
    logger->info("==== {} ====", title);
    logger->info("Total files: {}", summary.total_files);
    logger->info("Succeeded: {} ({:.1f}%)", summary.succeeded, summary.success_rate * 100.0);
    logger->info("Average confidence: {:.3f}", summary.average_confidence);
    logger->info("Total processing time: {:.2f}s", summary.total_time.count());
    logger->info("Average processing time: {:.2f}s", summary.average_time.count());

    auto percentage = [&summary](std::size_t count) {
        return summary.total_files ? 100.0 * count / summary.total_files : 0.0;
    };

    for (const auto &[species, count] : summary.species_counts)
        logger->info("Species: {} {} ({:.1f}%)", species, count, percentage(count));

    logger->info("Unsorted: {} ({:.1f}%)", summary.unsorted, percentage(summary.unsorted));
    logger->info("No_Animal: {} ({:.1f}%)", summary.no_animal, percentage(summary.no_animal));

    for (const auto &[kind, count] : summary.kind_counts)
        logger->info("File type: {} {}", kind, count);

    for (const auto &[error, count] : summary.error_counts)
        logger->warn("Errors: {} {}", error, count);
}

}
