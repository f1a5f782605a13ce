#include "chsync/sync/worker.hpp"

#include "../remote/fake_transport.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <future>

using chsync::CancellationToken;
using chsync::Settings;
using chsync::events::NullObserver;
using chsync::network::HttpRequest;
using chsync::sync::RunOutcome;
using chsync::sync::UploadMode;
using chsync::sync::UploadOrchestrator;
using chsync::sync::UploadRequest;
using chsync::sync::UploadWorker;
using chsync::testing::FakeTransport;
using chsync::testing::RecordingSleeper;
using chsync::testing::telegram_error;

namespace {

const std::string kToken = "123456789:AAbbCCddEEffGGhhIIjjKKllMMnnOOppQQr";

UploadRequest make_request(const std::string& channel) {
    return UploadRequest{kToken, channel, std::filesystem::temp_directory_path(), UploadMode::Fresh};
}

} // namespace

class UploadWorkerTest : public ::testing::Test {
protected:
    FakeTransport telegram_;
    FakeTransport index_;
    NullObserver observer_;
    RecordingSleeper sleeper_;
    CancellationToken token_;
    UploadOrchestrator orchestrator_{telegram_, index_, Settings{}, observer_, token_, sleeper_};
};

TEST_F(UploadWorkerTest, WaitReturnsRunResult) {
    UploadWorker worker(orchestrator_);
    ASSERT_TRUE(worker.start(make_request("bad channel")).is_ok());

    auto result = worker.wait();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().outcome, RunOutcome::Failed);
    EXPECT_NE(result.value().message.find("Invalid channel ID format"), std::string::npos);
    EXPECT_FALSE(worker.is_running());
}

TEST_F(UploadWorkerTest, WaitWithoutStartIsAnError) {
    UploadWorker worker(orchestrator_);
    auto result = worker.wait();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), "No upload has been started");
}

TEST_F(UploadWorkerTest, SecondStartWhileRunningIsRejected) {
    std::promise<void> release;
    auto released = release.get_future().share();
    std::promise<void> entered;
    telegram_.on("/getMe", [&entered, released](const HttpRequest&) {
        entered.set_value();
        released.wait();
        return telegram_error(401, "Unauthorized");
    });

    UploadWorker worker(orchestrator_);
    ASSERT_TRUE(worker.start(make_request("@my_channel")).is_ok());
    entered.get_future().wait();

    EXPECT_TRUE(worker.is_running());
    auto second = worker.start(make_request("@my_channel"));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error(), "An upload is already in progress");

    release.set_value();
    auto result = worker.wait();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().outcome, RunOutcome::Failed);
}

TEST_F(UploadWorkerTest, CancelStopsRunAtNextCheckpoint) {
    std::promise<void> release;
    auto released = release.get_future().share();
    std::promise<void> entered;
    telegram_.on("/getMe", [&entered, released](const HttpRequest&) {
        entered.set_value();
        released.wait();
        return chsync::testing::telegram_ok({{"id", 42}, {"is_bot", true}, {"username", "uploader_bot"}});
    });

    UploadWorker worker(orchestrator_);
    ASSERT_TRUE(worker.start(make_request("@my_channel")).is_ok());
    entered.get_future().wait();

    worker.cancel();
    release.set_value();

    auto result = worker.wait();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().outcome, RunOutcome::Cancelled);
    EXPECT_EQ(telegram_.count("/getChat"), 0u);
}
