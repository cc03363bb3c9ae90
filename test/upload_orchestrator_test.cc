#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/model/feedback.h>
#include <core/upload/upload_orchestrator.h>
#include <core/util/config.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using namespace pipecdn::core;
using nlohmann::json;

namespace {

class RecordingEngine : public TransferEngine {
public:
    void BeginUpload(const UploadRequest& request) override {
        requests.push_back(request);
        if (fail) {
            throw std::runtime_error("engine unavailable");
        }
    }

    std::vector<UploadRequest> requests;
    bool fail = false;
};

class UploadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = Settings{};
        orchestrator.SetFeedbackCallback([this](Feedback&& item) { feedbacks.push_back(item); });
        orchestrator.SetCompletionCallback([this](const feedback::UploadCompleted& completed) {
            completions.push_back(completed);
        });
    }

    std::size_t CountFeedback(FeedbackType type) const {
        return std::count_if(feedbacks.begin(), feedbacks.end(), [type](const Feedback& f) {
            return f.type == type;
        });
    }

    boost::asio::io_context ioc;
    RecordingEngine engine;
    UploadOrchestrator orchestrator{ioc, engine, "user-1"};
    std::vector<Feedback> feedbacks;
    std::vector<feedback::UploadCompleted> completions;
};

} // namespace

TEST_F(UploadOrchestratorTest, UploadRunsToCompletion) {
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    ASSERT_EQ(engine.requests.size(), 1u);
    EXPECT_EQ(engine.requests[0].task_id, id);
    EXPECT_EQ(engine.requests[0].user_id, "user-1");
    EXPECT_EQ(orchestrator.GetTask(id)->status, TaskStatus::kUploading);

    orchestrator.HandleProgress(json{{"id", id}, {"uploaded", 0}, {"total", 1000}});
    EXPECT_DOUBLE_EQ(orchestrator.GetTask(id)->progress, 0.0);

    auto outcome = orchestrator.HandleProgress(
        json{{"id", id}, {"uploaded", 1000}, {"total", 1000}, {"completed", true}});
    EXPECT_EQ(outcome, RouteOutcome::kCompleted);

    auto task = *orchestrator.GetTask(id);
    EXPECT_EQ(task.status, TaskStatus::kSuccess);
    EXPECT_DOUBLE_EQ(task.progress, 100.0);
    ASSERT_EQ(completions.size(), 1u);
    EXPECT_EQ(completions[0].id, id);
    EXPECT_EQ(CountFeedback(FeedbackType::kUploadCompleted), 1u);

    orchestrator.HandleProgress(
        json{{"id", id}, {"uploaded", 1000}, {"total", 1000}, {"completed", true}});
    EXPECT_EQ(completions.size(), 1u);
}

TEST_F(UploadOrchestratorTest, BareFractionUpdatesNewestUpload) {
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    EXPECT_EQ(orchestrator.HandleProgress(json(0.5)), RouteOutcome::kUpdated);
    EXPECT_DOUBLE_EQ(orchestrator.GetTask(id)->progress, 50.0);
}

TEST_F(UploadOrchestratorTest, FalseErrorFlagDoesNotFailTheTask) {
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    auto outcome = orchestrator.HandleProgress(
        json{{"id", id}, {"uploaded", 100}, {"total", 1000}, {"error", false}});
    EXPECT_EQ(outcome, RouteOutcome::kUpdated);

    auto task = *orchestrator.GetTask(id);
    EXPECT_EQ(task.status, TaskStatus::kUploading);
    EXPECT_FALSE(task.error);
    EXPECT_DOUBLE_EQ(task.progress, 10.0);
}

TEST_F(UploadOrchestratorTest, MalformedPayloadIsReported) {
    orchestrator.StartUpload("a.bin", "a.bin");
    EXPECT_EQ(orchestrator.HandleProgress(json("half")), RouteOutcome::kMalformed);
}

TEST_F(UploadOrchestratorTest, CancelledTaskIgnoresLaterProgress) {
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    orchestrator.HandleProgress(json{{"id", id}, {"uploaded", 100}, {"total", 1000}});

    EXPECT_TRUE(orchestrator.CancelUpload(id));
    EXPECT_FALSE(orchestrator.CancelUpload(id));
    EXPECT_FALSE(orchestrator.CancelUpload("unknown"));

    auto outcome = orchestrator.HandleProgress(
        json{{"id", id}, {"uploaded", 1000}, {"total", 1000}, {"completed", true}});
    EXPECT_EQ(outcome, RouteOutcome::kSuppressed);

    auto task = *orchestrator.GetTask(id);
    EXPECT_EQ(task.status, TaskStatus::kCancelled);
    EXPECT_EQ(task.uploaded_bytes, 100u);
    EXPECT_DOUBLE_EQ(task.progress, 10.0);
    EXPECT_TRUE(completions.empty());
}

TEST_F(UploadOrchestratorTest, MissingAccountFailsWithoutContactingEngine) {
    orchestrator.SetUserId("");
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    EXPECT_TRUE(engine.requests.empty());
    auto task = *orchestrator.GetTask(id);
    EXPECT_EQ(task.status, TaskStatus::kError);
    EXPECT_EQ(task.error, "Not logged in or session expired");
}

TEST_F(UploadOrchestratorTest, EngineFailureMovesTaskToError) {
    engine.fail = true;
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    auto task = *orchestrator.GetTask(id);
    EXPECT_EQ(task.status, TaskStatus::kError);
    EXPECT_EQ(task.error, "engine unavailable");
}

TEST_F(UploadOrchestratorTest, BlankRemoteNameFallsBackToFileName) {
    auto id = orchestrator.StartUpload("/home/me/videos/clip.mp4", "  ");
    EXPECT_EQ(orchestrator.GetTask(id)->remote_file_name, "clip.mp4");
    EXPECT_EQ(engine.requests[0].remote_file_name, "clip.mp4");
}

TEST_F(UploadOrchestratorTest, RequestUsesConfiguredDefaults) {
    settings.default_tier = "priority";
    settings.default_epochs = 12;
    orchestrator.StartUpload("a.bin", "a.bin");
    orchestrator.StartUpload("b.bin", "b.bin", "archive", 3);

    ASSERT_EQ(engine.requests.size(), 2u);
    EXPECT_EQ(engine.requests[0].tier, "priority");
    EXPECT_EQ(engine.requests[0].epochs, 12u);
    EXPECT_EQ(engine.requests[1].tier, "archive");
    EXPECT_EQ(engine.requests[1].epochs, 3u);
}

TEST_F(UploadOrchestratorTest, TaskIdsAreUnique) {
    auto a = orchestrator.StartUpload("a.bin", "a.bin");
    auto b = orchestrator.StartUpload("a.bin", "a.bin");
    EXPECT_NE(a, b);
    EXPECT_EQ(orchestrator.Tasks()->size(), 2u);
}

TEST_F(UploadOrchestratorTest, ResetDropsTasksAndPendingEvents) {
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    orchestrator.events().Post(json{{"id", id}, {"uploaded", 10}, {"total", 100}});
    orchestrator.events().Post(json(0.9));

    orchestrator.ResetTasks();
    EXPECT_EQ(orchestrator.events().size(), 0u);
    EXPECT_EQ(orchestrator.Tasks()->size(), 0u);
    EXPECT_EQ(orchestrator.ProcessPending(), 0u);
    EXPECT_EQ(CountFeedback(FeedbackType::kTasksReset), 1u);

    EXPECT_EQ(orchestrator.HandleProgress(json{{"id", id}, {"uploaded", 50}, {"total", 100}}),
              RouteOutcome::kCorrelationMiss);
}

TEST_F(UploadOrchestratorTest, FeedbackCarriesTaskSnapshots) {
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    ASSERT_GE(feedbacks.size(), 2u);
    EXPECT_EQ(feedbacks[0].type, FeedbackType::kTaskStarted);
    EXPECT_EQ(feedbacks[0].data["task_id"].get<std::string>(), id);
    EXPECT_EQ(feedbacks[1].type, FeedbackType::kTaskUpdated);
    EXPECT_EQ(feedbacks[1].data["task"]["id"].get<std::string>(), id);
    EXPECT_EQ(feedbacks[1].data["task"]["status"], "Uploading");
    EXPECT_EQ(feedbacks[1].data["summary"]["active_count"], 1);
}

TEST_F(UploadOrchestratorTest, SummaryTracksActiveUploads) {
    auto a = orchestrator.StartUpload("a.bin", "a.bin");
    auto b = orchestrator.StartUpload("b.bin", "b.bin");
    orchestrator.HandleProgress(json{{"id", a}, {"uploaded", 30}, {"total", 100}});
    orchestrator.HandleProgress(json{{"id", b}, {"uploaded", 10}, {"total", 100}});

    auto summary = orchestrator.Summary();
    EXPECT_EQ(summary.active_count, 2u);
    EXPECT_EQ(summary.percent, 20);

    orchestrator.HandleProgress(json{{"id", b}, {"completed", true}});
    EXPECT_EQ(orchestrator.Summary().active_count, 1u);
    EXPECT_EQ(orchestrator.Summary().percent, 30);
}

TEST_F(UploadOrchestratorTest, EventLoopDrainsPostedEvents) {
    auto id = orchestrator.StartUpload("a.bin", "a.bin");
    orchestrator.Start();
    orchestrator.events().Post(json{{"id", id}, {"uploaded", 500}, {"total", 1000}});
    orchestrator.events().Post(json{{"id", id}, {"uploaded", 1000}, {"total", 1000}});

    ioc.run_for(100ms);
    EXPECT_EQ(orchestrator.GetTask(id)->status, TaskStatus::kSuccess);
    EXPECT_EQ(completions.size(), 1u);

    orchestrator.Stop();
    ioc.restart();
    ioc.run_for(50ms);
    EXPECT_TRUE(ioc.stopped());
}
