#include "check_runner.hpp"
#include "mocks.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {

constexpr const char* kUrl = "https://status.example.com/";
constexpr const char* kMarker = "I'm alive";

Config make_config(int max_attempts, bool email_enabled = true) {
    Config config;
    config.url = kUrl;
    config.expected_text = kMarker;
    config.retry_delay_seconds = 60;
    config.max_attempts = max_attempts;
    config.email.enabled = email_enabled;
    config.email.smtp.host = "mail.example.com";
    config.email.smtp.port = 587;
    config.email.from = "monitor@example.com";
    config.email.to = {"oncall@example.com", "backup@example.com"};
    config.email.subject = "Status page is DOWN";
    return config;
}

} // namespace

class CheckRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<StrictMock<MockMailTransport>>();
    }

    RunOutcome run(const Config& config) {
        LivenessChecker checker(renderers_.factory());
        AlertNotifier notifier(transport_);
        CheckRunner runner(config, checker, notifier, pause_.fn());
        return runner.run();
    }

    ScriptedRendererFactory renderers_;
    RecordingPause pause_;
    std::shared_ptr<StrictMock<MockMailTransport>> transport_;
};

TEST_F(CheckRunnerTest, AliveOnFirstAttemptStopsImmediately) {
    renderers_.add_document("<html><body>I'm alive</body></html>");

    auto outcome = run(make_config(2));

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts_used, 1);
    EXPECT_EQ(renderers_.calls(), 1);
    EXPECT_TRUE(pause_.pauses.empty());
    EXPECT_EQ(outcome.notification.status, DeliveryStatus::NotAttempted);
}

TEST_F(CheckRunnerTest, TwoMissesExhaustAndNotifyOnce) {
    renderers_.add_document("<html>maintenance</html>");
    renderers_.add_document("<html>maintenance</html>");

    EXPECT_CALL(*transport_, send(_, "monitor@example.com",
                                  ElementsAre("oncall@example.com", "backup@example.com"),
                                  "Status page is DOWN", ::testing::HasSubstr(kUrl)))
        .Times(1);

    auto outcome = run(make_config(2));

    EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    EXPECT_EQ(outcome.attempts_used, 2);
    EXPECT_EQ(renderers_.calls(), 2);
    EXPECT_THAT(pause_.pauses, ElementsAre(std::chrono::seconds(60)));
    EXPECT_EQ(outcome.notification.status, DeliveryStatus::Sent);
}

TEST_F(CheckRunnerTest, RenderErrorThenAliveSucceedsWithoutAlert) {
    renderers_.add_render_error("net::ERR_CONNECTION_REFUSED");
    renderers_.add_document("prefix I'm alive suffix");

    auto outcome = run(make_config(3));

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_EQ(outcome.attempts_used, 2);
    EXPECT_EQ(renderers_.calls(), 2);
    EXPECT_EQ(pause_.pauses.size(), 1u);
    ASSERT_EQ(outcome.attempts.size(), 2u);
    EXPECT_EQ(outcome.attempts[0].status, AttemptStatus::Errored);
    EXPECT_EQ(outcome.attempts[1].status, AttemptStatus::Alive);
}

TEST_F(CheckRunnerTest, DisabledNotificationStillCompletesRun) {
    renderers_.add_document("down");
    renderers_.add_render_error("timeout");

    auto outcome = run(make_config(2, false));

    EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    EXPECT_EQ(outcome.notification.status, DeliveryStatus::Disabled);
    EXPECT_TRUE(outcome.notification.ok());
}

TEST_F(CheckRunnerTest, DeliveryFailureKeepsExhaustedStatus) {
    renderers_.add_document("down");
    renderers_.add_document("down");

    EXPECT_CALL(*transport_, send(_, _, _, _, _))
        .WillOnce(Throw(MailError("535 Authentication credentials invalid")));

    auto outcome = run(make_config(2));

    EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    EXPECT_EQ(outcome.notification.status, DeliveryStatus::Failed);
    EXPECT_EQ(outcome.notification.error, "535 Authentication credentials invalid");
}

TEST_F(CheckRunnerTest, ZeroAttemptsSkipsStraightToNotification) {
    EXPECT_CALL(*transport_, send(_, _, _, _, _)).Times(1);

    auto outcome = run(make_config(0));

    EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    EXPECT_EQ(outcome.attempts_used, 0);
    EXPECT_EQ(renderers_.calls(), 0);
    EXPECT_TRUE(pause_.pauses.empty());
    EXPECT_EQ(outcome.notification.status, DeliveryStatus::Sent);
}

TEST_F(CheckRunnerTest, AttemptsNeverExceedMaxAndPausesAreOneFewer) {
    for (int max_attempts = 1; max_attempts <= 5; ++max_attempts) {
        ScriptedRendererFactory renderers;
        RecordingPause pause;
        auto transport = std::make_shared<StrictMock<MockMailTransport>>();
        EXPECT_CALL(*transport, send(_, _, _, _, _)).Times(1);

        for (int i = 0; i < max_attempts; ++i) {
            renderers.add_document("nothing to see");
        }

        Config config = make_config(max_attempts);
        LivenessChecker checker(renderers.factory());
        AlertNotifier notifier(transport);
        CheckRunner runner(config, checker, notifier, pause.fn());
        auto outcome = runner.run();

        EXPECT_EQ(renderers.calls(), max_attempts) << "max_attempts=" << max_attempts;
        EXPECT_EQ(static_cast<int>(pause.pauses.size()), max_attempts - 1) << "max_attempts=" << max_attempts;
        EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    }
}

TEST_F(CheckRunnerTest, MarkerMatchIsCaseSensitive) {
    renderers_.add_document("<p>i'm ALIVE</p>");

    EXPECT_CALL(*transport_, send(_, _, _, _, _)).Times(1);

    auto outcome = run(make_config(1));

    EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    ASSERT_EQ(outcome.attempts.size(), 1u);
    EXPECT_EQ(outcome.attempts[0].status, AttemptStatus::NotAlive);
}

TEST_F(CheckRunnerTest, UnexpectedFaultCountsAsFailedAttempt) {
    int factory_calls = 0;
    LivenessChecker checker([&factory_calls]() -> std::unique_ptr<PageRenderer> {
        ++factory_calls;
        auto renderer = std::make_unique<StrictMock<MockPageRenderer>>();
        EXPECT_CALL(*renderer, open(_)).WillOnce(Throw(std::logic_error("driver crashed")));
        EXPECT_CALL(*renderer, close()).Times(1);
        return renderer;
    });
    AlertNotifier notifier(transport_);
    EXPECT_CALL(*transport_, send(_, _, _, _, _)).Times(1);

    Config config = make_config(2);
    CheckRunner runner(config, checker, notifier, pause_.fn());
    auto outcome = runner.run();

    EXPECT_EQ(factory_calls, 2);
    EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    ASSERT_EQ(outcome.attempts.size(), 2u);
    EXPECT_EQ(outcome.attempts[0].status, AttemptStatus::Errored);
    EXPECT_EQ(outcome.attempts[0].detail, "driver crashed");
}

TEST_F(CheckRunnerTest, NonStandardThrowIsContainedAtAttemptBoundary) {
    LivenessChecker checker([]() -> std::unique_ptr<PageRenderer> {
        throw 42;
    });
    AlertNotifier notifier(transport_);
    EXPECT_CALL(*transport_, send(_, _, _, _, _)).Times(1);

    Config config = make_config(2);
    CheckRunner runner(config, checker, notifier, pause_.fn());
    RunOutcome outcome;
    ASSERT_NO_THROW(outcome = runner.run());

    EXPECT_EQ(outcome.status, RunStatus::Exhausted);
    EXPECT_EQ(outcome.attempts_used, 2);
    EXPECT_EQ(outcome.attempts[1].detail, "unknown error");
}

TEST_F(CheckRunnerTest, InterruptedPauseCancelsWithoutAlert) {
    renderers_.add_document("down");
    pause_.allow = false;

    auto outcome = run(make_config(3));

    EXPECT_EQ(outcome.status, RunStatus::Cancelled);
    EXPECT_EQ(outcome.attempts_used, 1);
    EXPECT_EQ(renderers_.calls(), 1);
    EXPECT_EQ(outcome.notification.status, DeliveryStatus::NotAttempted);
}

TEST_F(CheckRunnerTest, UsesConfiguredRetryDelay) {
    renderers_.add_document("down");
    renderers_.add_document("down");
    renderers_.add_document("I'm alive");

    Config config = make_config(3);
    config.retry_delay_seconds = 0;

    LivenessChecker checker(renderers_.factory());
    AlertNotifier notifier(transport_);
    CheckRunner runner(config, checker, notifier, pause_.fn());
    auto outcome = runner.run();

    EXPECT_EQ(outcome.status, RunStatus::Succeeded);
    EXPECT_THAT(pause_.pauses, ElementsAre(std::chrono::seconds(0), std::chrono::seconds(0)));
}

TEST(RunOutcomeTest, DescribeSummarizesTerminalState) {
    RunOutcome success;
    success.status = RunStatus::Succeeded;
    success.attempts_used = 2;
    EXPECT_EQ(describe(success, 3), "succeeded on attempt 2/3");

    RunOutcome failed;
    failed.status = RunStatus::Exhausted;
    failed.attempts_used = 2;
    failed.notification.status = DeliveryStatus::Failed;
    failed.notification.error = "connection refused";
    EXPECT_EQ(describe(failed, 2), "failed after 2 attempts, notification failed (connection refused)");

    RunOutcome cancelled;
    cancelled.status = RunStatus::Cancelled;
    cancelled.attempts_used = 1;
    EXPECT_EQ(describe(cancelled, 2), "cancelled after 1/2 attempts");
}
