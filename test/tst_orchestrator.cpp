#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include <wildsort/batch/orchestrator.hpp>

#include "testhelpers.hpp"

using namespace wildsort;
using wildsort::test::make_detection;
using wildsort::test::make_frame;
using wildsort::test::scripted_detector;
using wildsort::test::scripted_file_system;
using wildsort::test::temp_dir;
using wildsort::test::write_file;

class TestOrchestrator : public ::testing::Test {
protected:
    static void SetUpTestSuite() {}

    static void TearDownTestSuite() {}

    void SetUp() override
    {
        tax.add_category("Predators", { "Wolf", "Bear" });
        tax.add_category("Ungulates", { "Deer", "Elk" });
        det = std::make_shared<scripted_detector>();
        output = scratch.path() / "out";
    }

    void TearDown() override {}

    std::filesystem::path add_video(const std::string &name, int id, const std::string &species, std::size_t frames)
    {
        scripted_detector::recording rec;
        rec.kind = source_kind::Video;
        for (std::size_t i = 0; i < frames; ++i) {
            if (species.empty())
                rec.frames.emplace_back(make_frame(i));
            else
                rec.frames.emplace_back(make_frame(i, { make_detection(id, species, 0.9f) }));
        }

        det->add(name, rec);
        return write_file(scratch.path() / "in" / name, name);
    }

    std::filesystem::path add_image(const std::string &name, detections_t detections)
    {
        scripted_detector::recording rec;
        rec.kind = source_kind::Image;
        rec.frames.emplace_back(make_frame(0, std::move(detections)));

        det->add(name, rec);
        return write_file(scratch.path() / "in" / name, name);
    }

    std::filesystem::path add_recording(const std::string &name, scripted_detector::recording rec)
    {
        det->add(name, std::move(rec));
        return write_file(scratch.path() / "in" / name, name);
    }

    std::unique_ptr<batch_orchestrator> make_orchestrator(threshold_policy policy = threshold_policy(),
                                                          std::shared_ptr<file_system> fs = nullptr)
    {
        return std::make_unique<batch_orchestrator>(policy, tax, det, output, fs);
    }

    temp_dir scratch { "batch" };
    taxonomy tax;
    std::shared_ptr<scripted_detector> det;
    std::filesystem::path output;
};

TEST_F(TestOrchestrator, RoutesEveryFile)
{
    const std::vector<std::filesystem::path> files = {
        add_video("wolf.mp4", 0, "Wolf", 5),
        add_image("deer.jpg", { make_detection(1, "Deer", 0.9f) }),
        add_video("empty.mp4", 0, "", 4),
        add_image("lynx.jpg", { make_detection(7, "Lynx", 0.95f) }),
        add_image("mixed.jpg", { make_detection(3, "Bear", 0.80f), make_detection(0, "Wolf", 0.78f) }),
    };

    auto orchestrator = make_orchestrator();
    const batch_report report = orchestrator->run(files);

    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
    ASSERT_EQ(report.size(), files.size());
    for (const auto &entry : report.entries())
        EXPECT_TRUE(entry.ok()) << entry.file;

    EXPECT_TRUE(std::filesystem::exists(output / "Sorted" / "Predators" / "Wolf" / "wolf.mp4"));
    EXPECT_TRUE(std::filesystem::exists(output / "Sorted" / "Ungulates" / "Deer" / "deer.jpg"));
    EXPECT_TRUE(std::filesystem::exists(output / "No_Animal" / "empty.mp4"));
    EXPECT_TRUE(std::filesystem::exists(output / "Sorted" / "Other" / "Lynx" / "lynx.jpg"));
    EXPECT_TRUE(std::filesystem::exists(output / "Unsorted" / "mixed.jpg"));

    for (const auto &file : files)
        EXPECT_FALSE(std::filesystem::exists(file)) << file;

    EXPECT_EQ(report.at(0).result->label, classification_label::species("Wolf"));
    EXPECT_EQ(report.at(0).routed_to, output / "Sorted" / "Predators" / "Wolf" / "wolf.mp4");
    EXPECT_EQ(report.at(3).routing->category, "Other");

    const batch_summary summary = report.summarize();
    EXPECT_EQ(summary.succeeded, 5u);
    EXPECT_EQ(summary.kind_counts.at("video"), 2u);
}

TEST_F(TestOrchestrator, FileErrorsDoNotStopBatch)
{
    const auto unknown = write_file(scratch.path() / "in" / "unknown.mp4", "?");
    const auto clash = add_image("clash.jpg", { make_detection(1, "Deer", 0.9f) });
    write_file(output / "Sorted" / "Ungulates" / "Deer" / "clash.jpg", "already here");
    const auto wolf = add_video("wolf.mp4", 0, "Wolf", 3);

    auto orchestrator = make_orchestrator();
    const batch_report report = orchestrator->run({ unknown, clash, wolf });

    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
    ASSERT_EQ(report.size(), 3u);

    ASSERT_FALSE(report.at(0).ok());
    EXPECT_EQ(report.at(0).error->kind, batch_error::DetectorFailure);
    EXPECT_TRUE(std::filesystem::exists(unknown));

    ASSERT_FALSE(report.at(1).ok());
    EXPECT_EQ(report.at(1).error->kind, batch_error::DestinationExists);
    EXPECT_TRUE(report.at(1).result.has_value());
    EXPECT_TRUE(std::filesystem::exists(clash));

    EXPECT_TRUE(report.at(2).ok());
    EXPECT_EQ(report.summarize().failed, 2u);
}

TEST_F(TestOrchestrator, UnreadableFramesAreSkippedUpToLimit)
{
    threshold_config config;
    config.max_unreadable_frames = 1;

    scripted_detector::recording tolerable;
    tolerable.frames = { make_frame(0, { make_detection(0, "Wolf", 0.9f) }), std::nullopt,
                         make_frame(2, { make_detection(0, "Wolf", 0.9f) }) };
    const auto ok = add_recording("ok.mp4", tolerable);

    scripted_detector::recording broken;
    broken.frames = { std::nullopt, make_frame(1, { make_detection(0, "Wolf", 0.9f) }), std::nullopt };
    const auto bad = add_recording("bad.mp4", broken);

    auto orchestrator = make_orchestrator(threshold_policy(config));
    const batch_report report = orchestrator->run({ ok, bad });

    ASSERT_TRUE(report.at(0).ok());
    EXPECT_EQ(report.at(0).result->unreadable_frames, 1u);
    EXPECT_EQ(report.at(0).result->label, classification_label::species("Wolf"));

    ASSERT_FALSE(report.at(1).ok());
    EXPECT_EQ(report.at(1).error->kind, batch_error::DetectorFailure);
    EXPECT_TRUE(std::filesystem::exists(bad));
}

TEST_F(TestOrchestrator, OutOfOrderFramesFailTheFile)
{
    scripted_detector::recording rec;
    rec.frames = { make_frame(3), make_frame(1) };
    const auto file = add_recording("shuffled.mp4", rec);

    const batch_report report = make_orchestrator()->run({ file });

    ASSERT_FALSE(report.at(0).ok());
    EXPECT_EQ(report.at(0).error->kind, batch_error::DetectorFailure);
}

TEST_F(TestOrchestrator, EmptyTaxonomyFailsTheRun)
{
    const auto file = add_video("wolf.mp4", 0, "Wolf", 2);
    batch_orchestrator orchestrator(threshold_policy(), taxonomy(), det, output);

    EXPECT_THROW(orchestrator.run({ file }), configuration_error);
    EXPECT_EQ(orchestrator.state(), batch_state::Failed);
    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_FALSE(orchestrator.next_event().has_value());
}

TEST_F(TestOrchestrator, MissingDetectorFailsTheRun)
{
    batch_orchestrator orchestrator(threshold_policy(), tax, nullptr, output);

    EXPECT_THROW(orchestrator.start({}), configuration_error);
    EXPECT_EQ(orchestrator.state(), batch_state::Failed);
}

TEST_F(TestOrchestrator, UnusableOutputRootFailsTheRun)
{
    auto fs = std::make_shared<scripted_file_system>();
    fs->create_error = std::errc::permission_denied;

    auto orchestrator = make_orchestrator(threshold_policy(), fs);
    EXPECT_THROW(orchestrator->run({ add_video("wolf.mp4", 0, "Wolf", 1) }), configuration_error);
    EXPECT_EQ(orchestrator->state(), batch_state::Failed);

    const auto plain_file = write_file(scratch.path() / "not_a_folder", "x");
    batch_orchestrator blocked(threshold_policy(), tax, det, plain_file);
    EXPECT_THROW(blocked.run({}), configuration_error);
}

TEST_F(TestOrchestrator, CancelStopsAfterCurrentFile)
{
    std::vector<std::filesystem::path> files;
    for (int i = 0; i < 5; ++i)
        files.push_back(add_video(fmt::format("wolf_{}.mp4", i), 0, "Wolf", 2));

    auto orchestrator = make_orchestrator();
    int opened = 0;
    det->on_open = [&](const std::filesystem::path &) {
        if (++opened == 3)
            orchestrator->cancel();
    };

    const batch_report report = orchestrator->run(files);

    EXPECT_EQ(orchestrator->state(), batch_state::Cancelled);
    EXPECT_EQ(report.size(), 3u);
    EXPECT_TRUE(report.at(2).ok());
    EXPECT_TRUE(std::filesystem::exists(files[3]));
    EXPECT_TRUE(std::filesystem::exists(files[4]));
}

TEST_F(TestOrchestrator, CancelWhileIdleIsIgnored)
{
    auto orchestrator = make_orchestrator();
    orchestrator->cancel();
    EXPECT_EQ(orchestrator->state(), batch_state::Idle);

    const batch_report report = orchestrator->run({ add_video("wolf.mp4", 0, "Wolf", 2) });
    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
    EXPECT_EQ(report.size(), 1u);
}

TEST_F(TestOrchestrator, EventsArriveInOrder)
{
    const std::vector<std::filesystem::path> files = {
        add_video("a.mp4", 0, "Wolf", 2),
        add_image("b.jpg", { make_detection(1, "Deer", 0.9f) }),
    };

    auto orchestrator = make_orchestrator();
    std::vector<std::size_t> progress;
    std::vector<std::filesystem::path> processed;
    orchestrator->on_progress([&](const batch_progress &p) { progress.push_back(p.files_done); });
    orchestrator->on_file_processed([&](const report_entry &e) { processed.push_back(e.file); });

    orchestrator->start(files);

    std::vector<batch_event> events;
    while (std::optional<batch_event> event = orchestrator->next_event())
        events.push_back(std::move(event.value()));

    const batch_report report = orchestrator->wait();
    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
    EXPECT_EQ(report.size(), 2u);

    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(events[0].type, batch_event::Progress);
    EXPECT_EQ(events[0].progress.files_done, 0u);
    EXPECT_EQ(events[0].progress.total_files, 2u);
    EXPECT_EQ(events[1].type, batch_event::FileProcessed);
    ASSERT_TRUE(events[1].entry.has_value());
    EXPECT_EQ(events[1].entry->file, files[0]);
    EXPECT_EQ(events[2].type, batch_event::Progress);
    EXPECT_EQ(events[2].progress.files_done, 1u);
    EXPECT_EQ(events[3].type, batch_event::FileProcessed);
    EXPECT_EQ(events[4].progress.files_done, 2u);
    EXPECT_EQ(events[5].type, batch_event::Finished);
    EXPECT_EQ(events[5].state, batch_state::Completed);

    EXPECT_EQ(progress, (std::vector<std::size_t> { 0, 1, 2 }));
    EXPECT_EQ(processed, files);
}

TEST_F(TestOrchestrator, EachRunStartsWithFreshReport)
{
    auto orchestrator = make_orchestrator();

    const batch_report first = orchestrator->run({ add_video("a.mp4", 0, "Wolf", 1), add_video("b.mp4", 0, "Wolf", 1) });
    EXPECT_EQ(first.size(), 2u);

    const batch_report second = orchestrator->run({ add_video("c.mp4", 2, "Elk", 1) });
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second.at(0).result->label, classification_label::species("Elk"));
}

TEST_F(TestOrchestrator, StartWhileRunningIsRejected)
{
    const auto file = add_video("a.mp4", 0, "Wolf", 1);

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    det->on_open = [&](const std::filesystem::path &) {
        entered.set_value();
        released.wait();
    };

    auto orchestrator = make_orchestrator();
    orchestrator->start({ file });
    entered.get_future().wait();

    EXPECT_EQ(orchestrator->state(), batch_state::Running);
    EXPECT_THROW(orchestrator->start({ file }), configuration_error);
    EXPECT_THROW(orchestrator->run({ file }), configuration_error);

    release.set_value();
    const batch_report report = orchestrator->wait();
    EXPECT_EQ(report.size(), 1u);
    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
}

TEST_F(TestOrchestrator, MoveFailuresAreRecordedPerFile)
{
    auto fs = std::make_shared<scripted_file_system>();
    fs->rename_error = std::errc::permission_denied;

    const std::vector<std::filesystem::path> files = {
        add_video("a.mp4", 0, "Wolf", 1),
        add_image("b.jpg", { make_detection(1, "Deer", 0.9f) }),
    };

    auto orchestrator = make_orchestrator(threshold_policy(), fs);
    const batch_report report = orchestrator->run(files);

    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
    for (const auto &entry : report.entries()) {
        ASSERT_FALSE(entry.ok());
        EXPECT_EQ(entry.error->kind, batch_error::MoveFailed);
        EXPECT_TRUE(std::filesystem::exists(entry.file));
    }
}

TEST_F(TestOrchestrator, ThrowingCallbacksDoNotStallTheRun)
{
    const std::vector<std::filesystem::path> files = {
        add_video("a.mp4", 0, "Wolf", 1),
        add_video("b.mp4", 0, "Wolf", 1),
    };

    auto orchestrator = make_orchestrator();
    orchestrator->on_file_processed([](const report_entry &) { throw std::runtime_error("entry callback"); });
    orchestrator->on_progress([](const batch_progress &) { throw std::runtime_error("progress callback"); });

    const batch_report report = orchestrator->run(files);
    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
    EXPECT_EQ(report.size(), 2u);

    std::optional<batch_event> last;
    while (std::optional<batch_event> event = orchestrator->try_next_event())
        last = event;
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->type, batch_event::Finished);

    EXPECT_NO_THROW(orchestrator->run({}));
    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
}

TEST_F(TestOrchestrator, ThrowingCallbackOnWorkerStillFinishes)
{
    auto orchestrator = make_orchestrator();
    orchestrator->on_file_processed([](const report_entry &) { throw std::runtime_error("entry callback"); });

    orchestrator->start({ add_video("a.mp4", 0, "Wolf", 1) });

    std::optional<batch_event> last;
    while (std::optional<batch_event> event = orchestrator->next_event())
        last = event;

    EXPECT_EQ(orchestrator->wait().size(), 1u);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->type, batch_event::Finished);
    EXPECT_EQ(orchestrator->state(), batch_state::Completed);
}

TEST_F(TestOrchestrator, CancelFromCallerThreadStopsWorker)
{
    std::vector<std::filesystem::path> files;
    for (int i = 0; i < 4; ++i)
        files.push_back(add_video(fmt::format("wolf_{}.mp4", i), 0, "Wolf", 2));

    std::atomic<int> opened { 0 };
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    det->on_open = [&](const std::filesystem::path &) {
        if (++opened == 2) {
            entered.set_value();
            released.wait();
        }
    };

    auto orchestrator = make_orchestrator();
    orchestrator->start(files);
    entered.get_future().wait();

    orchestrator->cancel();
    release.set_value();

    std::vector<batch_event> events;
    while (std::optional<batch_event> event = orchestrator->next_event())
        events.push_back(std::move(event.value()));

    const batch_report report = orchestrator->wait();
    EXPECT_EQ(orchestrator->state(), batch_state::Cancelled);
    EXPECT_EQ(report.size(), static_cast<std::size_t>(opened.load()));
    EXPECT_EQ(report.size(), 2u);
    EXPECT_TRUE(std::filesystem::exists(files[2]));
    EXPECT_TRUE(std::filesystem::exists(files[3]));

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, batch_event::Finished);
    EXPECT_EQ(events.back().state, batch_state::Cancelled);
    EXPECT_EQ(events.back().progress.files_done, 2u);
    EXPECT_EQ(events.back().progress.total_files, 4u);
}
