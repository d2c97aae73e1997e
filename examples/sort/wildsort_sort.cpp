#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>

#include <wildsort/core/errors.hpp>
#include <wildsort/core/media.hpp>
#include <wildsort/config/configloader.hpp>
#include <wildsort/config/thresholdpolicy.hpp>
#include <wildsort/batch/manifestdetector.hpp>
#include <wildsort/batch/orchestrator.hpp>

#include "../common/helpers.hpp"

namespace {
std::atomic<bool> interrupted { false };

void on_interrupt(int)
{
    interrupted = true;
}
}

int main(int argc, char* argv[])
{
    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger()->clone("wildsort.examples.sort");
    argparse::ArgumentParser parser("wildsort_sort");
    parser.add_argument("--config")
        .help("Path to the YAML configuration (names, taxonomy, processing)")
        .required();
    parser.add_argument("--manifest")
        .help("Path to the YAML detection manifest recorded from the detector")
        .required();
    parser.add_argument("--source")
        .help("Folder with videos/images to sort. Repeat for several folders")
        .required()
        .append();
    parser.add_argument("--output")
        .help("Output root, receives Sorted/, Unsorted/ and No_Animal/")
        .required();
    parser.add_argument("--mode")
        .help("Processing mode, overrides the configuration")
        .choices("balanced", "high_precision", "high_recall", "fast_processing");
    parser.add_argument("--subfolders")
        .help("Sort every source folder into <output>/<folder name>")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("--verbose")
        .help("Log per-frame decisions")
        .default_value(false)
        .implicit_value(true);

    try {
        parser.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        logger->critical(err.what());
        std::exit(1);
    }

    if (parser.get<bool>("--verbose"))
        spdlog::set_level(spdlog::level::debug);

    std::unique_ptr<wildsort::threshold_policy> policy;
    wildsort::app_config config;
    std::shared_ptr<wildsort::manifest_detector> detector;
    try {
        config = wildsort::load_config(parser.get<std::string>("--config"));
        if (auto mode = parser.present("--mode"))
            config.thresholds.mode = wildsort::threshold_config::modeForString(mode.value());

        policy = std::make_unique<wildsort::threshold_policy>(config.thresholds);
        detector = wildsort::manifest_detector::from_file(parser.get<std::string>("--manifest"), config.names);
    }
    catch (const std::runtime_error& err) {
        logger->critical(err.what());
        std::exit(1);
    }

    logger->info("Policy: {}", policy->describe());
    logger->info("Detection manifest covers {} files", detector->file_count());

    std::signal(SIGINT, on_interrupt);

    const std::filesystem::path output_root = parser.get<std::string>("--output");
    const bool subfolders = parser.get<bool>("--subfolders");
    int exit_code = 0;

    for (const auto &source : parser.get<std::vector<std::string>>("--source")) {
        if (interrupted)
            break;

        const std::filesystem::path source_dir(source);
        if (!std::filesystem::is_directory(source_dir)) {
            logger->error("Source folder {} doesn't exist. Skipping!", source);
            exit_code = 1;
            continue;
        }

        std::vector<std::filesystem::path> files;
        try {
            files = wildsort::collect_media(source_dir);
        } catch (const std::filesystem::filesystem_error &err) {
            logger->error("Could not list {}: {}", source, err.what());
            exit_code = 1;
            continue;
        }

        if (files.empty()) {
            logger->warn("No video or image files found in {}", source);
            continue;
        }

        std::filesystem::path folder_name = source_dir.lexically_normal().filename();
        if (folder_name.empty())
            folder_name = source_dir.lexically_normal().parent_path().filename();

        wildsort::batch_orchestrator orchestrator(*policy, config.tax, detector,
                                                  subfolders ? output_root / folder_name : output_root);

        try {
            orchestrator.start(files);
        } catch (const wildsort::configuration_error &err) {
            logger->critical(err.what());
            return 1;
        }

        // Poll so that Ctrl+C can cancel between files
        for (;;) {
            if (interrupted)
                orchestrator.cancel();

            std::optional<wildsort::batch_event> event = orchestrator.try_next_event();
            if (!event) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }

            if (event->type == wildsort::batch_event::Finished)
                break;

            if (event->type == wildsort::batch_event::Progress)
                logger->info("{} {}/{}", wildsort::progress_bar(event->progress.files_done, event->progress.total_files),
                             event->progress.files_done, event->progress.total_files);
        }

        const wildsort::batch_report report = orchestrator.wait();
        wildsort::log_summary(logger, folder_name.string(), report.summarize());

        if (orchestrator.state() == wildsort::batch_state::Cancelled)
            logger->warn("Sorting of {} was cancelled", source);
    }

    return exit_code;
}
