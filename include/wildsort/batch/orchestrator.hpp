#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <wildsort/core/errors.hpp>
#include <wildsort/core/types.hpp>
#include <wildsort/config/taxonomy.hpp>
#include <wildsort/config/thresholdpolicy.hpp>
#include <wildsort/classify/framefilter.hpp>
#include <wildsort/classify/imageclassifier.hpp>
#include <wildsort/classify/videoaggregator.hpp>
#include <wildsort/routing/filesystem.hpp>
#include <wildsort/routing/router.hpp>
#include <wildsort/routing/taxonomyresolver.hpp>
#include <wildsort/batch/batchreport.hpp>
#include <wildsort/batch/detector.hpp>
#include <wildsort/batch/eventchannel.hpp>

namespace wildsort {

enum class batch_state {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

inline const char *to_string(batch_state state)
{
    switch (state) {
    case batch_state::Idle:
        return "idle";
    case batch_state::Running:
        return "running";
    case batch_state::Completed:
        return "completed";
    case batch_state::Cancelled:
        return "cancelled";
    case batch_state::Failed:
    default:
        return "failed";
    }
}

struct batch_progress {
    std::size_t files_done = 0;
    std::size_t total_files = 0;
};

struct batch_event {
    typedef enum {
        Progress,
        FileProcessed,
        Finished
    } type_t;

    type_t type = Progress;
    batch_progress progress;
    std::optional<report_entry> entry;      // FileProcessed
    batch_state state = batch_state::Running;
};

/**
 * Drives files one at a time through detection, classification and routing.
 *
 * Run-level problems (empty taxonomy, no detector, unusable output root, a run already in
 * progress) throw configuration_error before the first file. Anything that goes wrong with
 * a single file is recorded in that file's report entry and the batch moves on.
 *
 * run() works on the calling thread. start() runs on a worker thread; progress arrives
 * in order through next_event()/try_next_event() and through the optional callbacks,
 * which are invoked on the worker. cancel() is honoured between files.
 */
class batch_orchestrator {
public:
    using progress_callback = std::function<void(const batch_progress &)>;
    using entry_callback = std::function<void(const report_entry &)>;

    batch_orchestrator(threshold_policy policy, taxonomy tax, std::shared_ptr<detector> det,
                       std::filesystem::path outputRoot, std::shared_ptr<file_system> fs = nullptr);
    ~batch_orchestrator();

    batch_orchestrator(const batch_orchestrator &) = delete;
    batch_orchestrator &operator=(const batch_orchestrator &) = delete;

    batch_report run(const std::vector<std::filesystem::path> &files);
    void start(std::vector<std::filesystem::path> files);
    batch_report wait();
    void cancel();

    batch_state state() const;
    const threshold_policy &policy() const;

    std::optional<batch_event> next_event();
    std::optional<batch_event> try_next_event();

    void on_progress(progress_callback callback);
    void on_file_processed(entry_callback callback);
    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    void begin_run(std::size_t total_files);
    void execute(const std::vector<std::filesystem::path> &files);
    void fail_run(const std::string &reason);
    void publish(batch_event event);

    template <typename Callback, typename Arg>
    void invoke_callback(const char *name, const Callback &callback, const Arg &arg);

    report_entry process_file(const std::filesystem::path &file);
    classification_result classify_video(detection_stream &stream, const std::filesystem::path &file);
    classification_result classify_image(detection_stream &stream);

    threshold_policy m_policy;
    std::filesystem::path m_output_root;
    std::shared_ptr<file_system> m_fs;
    std::shared_ptr<detector> m_detector;
    taxonomy_resolver m_resolver;
    router m_router;
    video_aggregator m_aggregator;
    image_classifier m_classifier;

    std::atomic<batch_state> m_state { batch_state::Idle };
    std::atomic<bool> m_cancel_requested { false };
    batch_report m_report;
    std::thread m_worker;
    event_channel<batch_event> m_events;

    progress_callback m_progress_callback;
    entry_callback m_entry_callback;
    std::shared_ptr<spdlog::logger> m_logger;
};

// Definitions

inline batch_orchestrator::batch_orchestrator(threshold_policy policy, taxonomy tax, std::shared_ptr<detector> det,
                                              std::filesystem::path outputRoot, std::shared_ptr<file_system> fs)
    : m_policy(policy)
    , m_output_root(std::move(outputRoot))
    , m_fs(fs ? fs : std::make_shared<local_file_system>())
    , m_detector(det)
    , m_resolver(std::move(tax), m_output_root, m_fs)
    , m_router(m_fs)
    , m_aggregator(policy)
    , m_classifier(policy)
    , m_logger(spdlog::default_logger()->clone("wildsort.batch"))
{}

inline batch_orchestrator::~batch_orchestrator()
{
    if (m_worker.joinable()) {
        cancel();
        m_worker.join();
    }
}

inline batch_report batch_orchestrator::run(const std::vector<std::filesystem::path> &files)
{
    begin_run(files.size());
    execute(files);
    return m_report;
}

inline void batch_orchestrator::start(std::vector<std::filesystem::path> files)
{
    begin_run(files.size());
    m_worker = std::thread([this, files = std::move(files)]() {
        execute(files);
    });
}

inline batch_report batch_orchestrator::wait()
{
    if (m_worker.joinable())
        m_worker.join();

    return m_report;
}

inline void batch_orchestrator::cancel()
{
    if (m_state.load() != batch_state::Running) {
        m_logger->debug("Cancel ignored, batch is {}", to_string(m_state.load()));
        return;
    }

    m_cancel_requested = true;
    m_logger->info("Cancellation requested, stopping after the current file");
}

inline batch_state batch_orchestrator::state() const
{
    return m_state.load();
}

inline const threshold_policy &batch_orchestrator::policy() const
{
    return m_policy;
}

inline std::optional<batch_event> batch_orchestrator::next_event()
{
    return m_events.next();
}

inline std::optional<batch_event> batch_orchestrator::try_next_event()
{
    return m_events.try_next();
}

inline void batch_orchestrator::on_progress(progress_callback callback)
{
    m_progress_callback = std::move(callback);
}

inline void batch_orchestrator::on_file_processed(entry_callback callback)
{
    m_entry_callback = std::move(callback);
}

inline void batch_orchestrator::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    m_logger = logger;
}

inline void batch_orchestrator::begin_run(std::size_t total_files)
{
    if (m_state.load() == batch_state::Running)
        throw configuration_error("A batch is already running");

    if (m_worker.joinable())
        m_worker.join();

    m_report.clear();
    m_events.reset();
    m_cancel_requested = false;

    if (!m_detector)
        fail_run("No detector was provided");

    if (m_resolver.tax().empty())
        fail_run("Taxonomy is empty, nothing could be sorted");

    try {
        m_fs->create_directories(m_output_root);
    } catch (const std::filesystem::filesystem_error &e) {
        fail_run(fmt::format("Output folder {} is not usable: {}", m_output_root.string(), e.what()));
    }

    if (!m_fs->is_directory(m_output_root))
        fail_run(fmt::format("Output path {} is not a folder", m_output_root.string()));

    m_logger->info("Starting batch of {} files into {}", total_files, m_output_root.string());
    m_logger->debug("Policy: {}", m_policy.describe());
    m_state = batch_state::Running;
}

inline void batch_orchestrator::fail_run(const std::string &reason)
{
    m_logger->error(reason);
    m_state = batch_state::Failed;
    m_events.close();
    throw configuration_error(reason);
}

inline void batch_orchestrator::execute(const std::vector<std::filesystem::path> &files)
{
    const std::size_t total = files.size();
    publish({ batch_event::Progress, { 0, total }, std::nullopt, batch_state::Running });

    batch_state final_state = batch_state::Completed;
    for (std::size_t i = 0; i < total; ++i) {
        if (m_cancel_requested.load()) {
            final_state = batch_state::Cancelled;
            m_logger->info("Batch cancelled after {} of {} files", i, total);
            break;
        }

        report_entry entry = process_file(files[i]);
        m_report.append(entry);

        invoke_callback("file processed", m_entry_callback, entry);

        publish({ batch_event::FileProcessed, { i + 1, total }, std::move(entry), batch_state::Running });
        publish({ batch_event::Progress, { i + 1, total }, std::nullopt, batch_state::Running });
    }

    m_state = final_state;

    const batch_summary summary = m_report.summarize();
    m_logger->info("Batch {}: {} processed, {} failed, {:.2f}s", to_string(final_state),
                   summary.total_files, summary.failed, summary.total_time.count());

    publish({ batch_event::Finished, { m_report.size(), total }, std::nullopt, final_state });
    m_events.close();
}

inline void batch_orchestrator::publish(batch_event event)
{
    if (event.type == batch_event::Progress)
        invoke_callback("progress", m_progress_callback, event.progress);

    m_events.push(std::move(event));
}

// Exceptions thrown by caller callbacks are logged and do not end the run
template <typename Callback, typename Arg>
inline void batch_orchestrator::invoke_callback(const char *name, const Callback &callback, const Arg &arg)
{
    if (!callback)
        return;

    try {
        callback(arg);
    } catch (const std::exception &e) {
        m_logger->error("The {} callback threw, continuing the batch: {}", name, e.what());
    }
}

inline report_entry batch_orchestrator::process_file(const std::filesystem::path &file)
{
    report_entry entry;
    entry.file = file;
    const auto started = std::chrono::steady_clock::now();

    try {
        std::unique_ptr<detection_stream> stream = m_detector->open(file);
        if (!stream)
            throw detector_failure(fmt::format("Detector returned no stream for {}", file.string()));

        entry.result = stream->kind() == source_kind::Video ? classify_video(*stream, file)
                                                           : classify_image(*stream);
        entry.routing = m_resolver.resolve(entry.result->label);
        entry.routed_to = m_router.route(file, entry.routing.value());

        m_logger->info("{}: {} ({:.3f}) -> {}", file.filename().string(), entry.result->label.name(),
                       entry.result->conf, entry.routing->destination.string());
    } catch (const detector_failure &e) {
        entry.error = batch_error { batch_error::DetectorFailure, e.what() };
    } catch (const destination_exists &e) {
        entry.error = batch_error { batch_error::DestinationExists, e.what() };
    } catch (const move_failed &e) {
        entry.error = batch_error { batch_error::MoveFailed, e.what() };
    } catch (const std::exception &e) {
        entry.error = batch_error { batch_error::Other, e.what() };
    }

    if (entry.error)
        m_logger->warn("{}: {} ({})", file.filename().string(), entry.error->message,
                       batch_error::stringForKind(entry.error->kind));

    entry.elapsed = std::chrono::steady_clock::now() - started;
    return entry;
}

inline classification_result batch_orchestrator::classify_video(detection_stream &stream, const std::filesystem::path &file)
{
    const frame_filter filter(m_policy.confidence_threshold());
    m_aggregator.reset();

    for (;;) {
        std::optional<frame_detections> frame;
        try {
            frame = stream.next();
        } catch (const detector_failure &e) {
            m_aggregator.skip_frame();
            m_logger->debug("{}: {}", file.filename().string(), e.what());

            if (m_aggregator.unreadable_frames() > static_cast<std::size_t>(m_policy.max_unreadable_frames()))
                throw detector_failure(fmt::format("{} unreadable frames, the limit is {}",
                                                   m_aggregator.unreadable_frames(), m_policy.max_unreadable_frames()));
            continue;
        }

        if (!frame)
            break;

        try {
            m_aggregator.add_frame(filter.apply(frame.value()));
        } catch (const std::invalid_argument &e) {
            throw detector_failure(e.what());
        }
    }

    return m_aggregator.finish();
}

inline classification_result batch_orchestrator::classify_image(detection_stream &stream)
{
    const frame_filter filter(m_policy.image_confidence_threshold());

    const std::optional<frame_detections> frame = stream.next();
    return m_classifier.classify(frame ? filter.apply(frame->detections) : detections_t());
}

}
