#include "worker_fixture.h"
#include "monitoring/metrics.h"

#include <stdexcept>

using ForwardingWorkerTest = WorkerFixture;

TEST_F(ForwardingWorkerTest, OneWayDeliveryAcknowledgesExactlyOnce) {
    store.push(makeMessage("m1"));
    sender.script({oneWay()});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 1u);
    EXPECT_EQ(store.ackedIds(), std::vector<std::string>({"m1"}));
    EXPECT_EQ(recorder.count("reply"), 0u);
    EXPECT_EQ(recorder.count("fault"), 0u);
    EXPECT_TRUE(worker().state().succeeded);
    EXPECT_EQ(worker().state().attemptCount, 0);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST_F(ForwardingWorkerTest, TwoWayDeliveryRunsReplySequenceOnResponse) {
    store.push(makeMessage("m1"));
    sender.script({respond("202")});

    worker().run();

    EXPECT_EQ(store.ackCount(), 1u);
    ASSERT_EQ(recorder.count("reply"), 1u);
    auto calls = recorder.snapshot();
    EXPECT_EQ(calls[0].message.property(MessageProperty::HttpStatus).value_or(""), "202");
    EXPECT_EQ(calls[0].message.body["status"], "202");
}

TEST_F(ForwardingWorkerTest, RetryableFailureGoesThroughFaultSequenceThenRetries) {
    store.push(makeMessage("m1"));
    sender.script({fail("connection refused"), respond("200")});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 2u);
    EXPECT_EQ(recorder.count("fault"), 1u);
    EXPECT_EQ(recorder.count("reply"), 1u);
    EXPECT_EQ(store.ackCount(), 1u);
    EXPECT_EQ(clock.sleeps(), std::vector<long long>({500}));
    EXPECT_EQ(worker().state().attemptCount, 0);
}

TEST_F(ForwardingWorkerTest, DeactivatesAfterMaxAttemptsWithoutFourthAttempt) {
    config.maxDeliveryAttempts = 3;
    store.push(makeMessage("m1"));
    sender.script({fail("connection reset")});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 3u);
    EXPECT_EQ(store.ackCount(), 0u);
    EXPECT_EQ(store.pending(), 1u);
    EXPECT_TRUE(processor.isDeactivated());
    EXPECT_TRUE(worker().isTerminated());
    EXPECT_EQ(recorder.count("fault"), 3u);
    EXPECT_EQ(recorder.count("deactivate"), 1u);
    EXPECT_EQ(worker().state().attemptCount, 3);
    // no backoff after the final attempt
    EXPECT_EQ(clock.sleeps(), std::vector<long long>({500, 500}));

    worker().run();
    EXPECT_EQ(sender.sendCount(), 3u);
}

TEST_F(ForwardingWorkerTest, DropsAfterMaxAttemptsAndKeepsPolling) {
    config.maxDeliveryAttempts = 3;
    config.dropOnMaxAttempts = true;
    store.push(makeMessage("m1"));
    store.push(makeMessage("m2"));
    sender.script({fail("timeout"), fail("timeout"), fail("timeout"), oneWay()});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 3u);
    EXPECT_EQ(store.ackedIds(), std::vector<std::string>({"m1"}));
    EXPECT_FALSE(processor.isDeactivated());
    EXPECT_FALSE(worker().isTerminated());
    EXPECT_EQ(worker().state().attemptCount, 0);
    EXPECT_TRUE(worker().state().succeeded);
    EXPECT_EQ(recorder.count("deactivate"), 0u);

    worker().run();

    EXPECT_EQ(sender.sendCount(), 4u);
    EXPECT_EQ(store.ackedIds(), std::vector<std::string>({"m1", "m2"}));
}

TEST_F(ForwardingWorkerTest, NonRetryErrorTextEndsCycleWithoutBackoff) {
    config.nonRetryStatusCodes = {"404"};
    store.push(makeMessage("m1"));
    sender.script({fail("HTTP/1.1 404 Not Found")});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 1u);
    EXPECT_TRUE(clock.sleeps().empty());
    EXPECT_EQ(recorder.count("fault"), 0u);
    EXPECT_EQ(store.ackCount(), 1u);
    EXPECT_FALSE(processor.isDeactivated());
}

TEST_F(ForwardingWorkerTest, NonRetryFailureIsNotCountedAsDelivered) {
    config.nonRetryStatusCodes = {"404"};
    store.push(makeMessage("m1"));
    store.push(makeMessage("m2"));
    sender.script({fail("HTTP/1.1 404 Not Found"), respondWithError("Error 404 Not Found")});

    auto& metrics = Metrics::instance();
    const int64_t delivered = metrics.get("forwarder_delivered_total");
    const int64_t nonRetry = metrics.get("forwarder_non_retry_total");

    worker().run();
    worker().run();

    EXPECT_EQ(store.ackedIds(), std::vector<std::string>({"m1", "m2"}));
    EXPECT_EQ(metrics.get("forwarder_delivered_total"), delivered);
    EXPECT_EQ(metrics.get("forwarder_non_retry_total"), nonRetry + 2);
    EXPECT_EQ(worker().state().attemptCount, 0);
}

TEST_F(ForwardingWorkerTest, ErrorMarkerMatchingNonRetryCodeIsNotRetried) {
    config.nonRetryStatusCodes = {"400"};
    store.push(makeMessage("m1"));
    sender.script({respondWithError("Transport error: 400 Bad Request")});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 1u);
    EXPECT_EQ(recorder.count("reply"), 1u);
    EXPECT_EQ(recorder.count("fault"), 0u);
    EXPECT_EQ(store.ackCount(), 1u);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST_F(ForwardingWorkerTest, ErrorMarkerWithoutMatchIsRetried) {
    config.nonRetryStatusCodes = {"400"};
    store.push(makeMessage("m1"));
    sender.script({respondWithError("Connection timed out"), respond("200")});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 2u);
    EXPECT_EQ(recorder.count("fault"), 1u);
    EXPECT_EQ(recorder.count("reply"), 1u);
    EXPECT_EQ(store.ackCount(), 1u);
}

TEST_F(ForwardingWorkerTest, ErrorHttpStatusesAreRetried) {
    store.push(makeMessage("m1"));
    sender.script({respond("503"), respond("301"), respond("200")});

    worker().run();

    EXPECT_EQ(sender.sendCount(), 3u);
    ASSERT_EQ(recorder.count("fault"), 2u);
    auto calls = recorder.snapshot();
    EXPECT_EQ(calls[0].message.property(MessageProperty::HttpStatus).value_or(""), "503");
    EXPECT_EQ(calls[1].message.property(MessageProperty::HttpStatus).value_or(""), "301");
    EXPECT_EQ(store.ackCount(), 1u);
}

TEST_F(ForwardingWorkerTest, MissingTargetIsAcknowledgedWithoutSending) {
    config.targetEndpoint.clear();
    store.push(makeMessage("m1"));

    worker().run();

    EXPECT_EQ(sender.sendCount(), 0u);
    EXPECT_EQ(store.ackedIds(), std::vector<std::string>({"m1"}));
}

TEST_F(ForwardingWorkerTest, UnresolvableTargetIsAcknowledgedWithoutSending) {
    config.targetEndpoint = "nowhere";
    store.push(makeMessage("m1"));

    worker().run();

    EXPECT_EQ(sender.sendCount(), 0u);
    EXPECT_EQ(store.ackCount(), 1u);
}

TEST_F(ForwardingWorkerTest, MessageTargetTakesPrecedenceOverDefault) {
    Message m = makeMessage("m1");
    m.setProperty(MessageProperty::TargetEndpoint, "audit");
    store.push(m);
    store.push(makeMessage("m2"));
    config.throttle = true;
    config.pollIntervalMs = 600;

    worker().run();

    EXPECT_EQ(sender.endpoints(), std::vector<std::string>({"audit", "backend"}));
}

TEST_F(ForwardingWorkerTest, EachAttemptStartsFromTheStoredPayload) {
    store.push(makeMessage("m1", {{"order", 7}}));
    sender.script({
        [](const Endpoint&, Message& m) -> std::optional<Message> {
            m.body["order"] = 99;
            m.setProperty("scratch", "dirty");
            throw DeliveryError("write failed", "broken pipe");
        },
        oneWay()
    });

    worker().run();

    auto sent = sender.sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1].body["order"], 7);
    EXPECT_FALSE(sent[1].hasProperty("scratch"));
}

TEST_F(ForwardingWorkerTest, AttachesNumericNonRetryCodesForTheTransport) {
    config.nonRetryStatusCodes = {"404", "timeout", "400"};
    store.push(makeMessage("m1"));

    worker().run();

    auto sent = sender.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].property(MessageProperty::NonErrorHttpStatusCodes).value_or(""), "400,404");
}

TEST_F(ForwardingWorkerTest, ClearsStaleSenderErrorMarkerAfterFetch) {
    Message m = makeMessage("m1");
    m.setProperty(MessageProperty::BlockingSenderError, "true");
    store.push(m);

    worker().run();

    auto sent = sender.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_FALSE(sent[0].hasProperty(MessageProperty::BlockingSenderError));
}

TEST_F(ForwardingWorkerTest, DeadConsumerSkipsSendAndIsNotRetried) {
    store.alive = false;
    store.push(makeMessage("m1"));

    worker().run();

    EXPECT_EQ(sender.sendCount(), 0u);
    EXPECT_EQ(store.ackCount(), 1u);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST_F(ForwardingWorkerTest, UnboundedRetriesContinueUntilSuccess) {
    config.maxDeliveryAttempts = -1;
    store.push(makeMessage("m1"));
    std::vector<ScriptedSender::Step> steps(10, fail("503 Service Unavailable"));
    steps.push_back(oneWay());
    sender.script(steps);

    worker().run();

    EXPECT_EQ(sender.sendCount(), 11u);
    EXPECT_EQ(clock.sleeps().size(), 10u);
    EXPECT_EQ(store.ackCount(), 1u);
    EXPECT_FALSE(processor.isDeactivated());
}

TEST_F(ForwardingWorkerTest, NonDeliveryExceptionsAreRetryable) {
    config.nonRetryStatusCodes = {"404"};
    store.push(makeMessage("m1"));
    sender.script({
        [](const Endpoint&, Message&) -> std::optional<Message> {
            throw std::runtime_error("404 in an unrelated error");
        },
        oneWay()
    });

    worker().run();

    EXPECT_EQ(sender.sendCount(), 2u);
    EXPECT_EQ(recorder.count("fault"), 1u);
}

TEST_F(ForwardingWorkerTest, TerminatedWorkerDoesNotFetch) {
    store.push(makeMessage("m1"));

    EXPECT_TRUE(worker().terminate());
    EXPECT_EQ(clock.interrupts.load(), 1);

    worker().run();

    EXPECT_EQ(store.receiveCount(), 0);
    EXPECT_EQ(sender.sendCount(), 0u);
    EXPECT_TRUE(worker().isTerminated());
}

TEST_F(ForwardingWorkerTest, DeactivatedProcessorTerminatesWorker) {
    processor.deactivated = true;
    store.push(makeMessage("m1"));

    worker().run();

    EXPECT_EQ(store.receiveCount(), 0);
    EXPECT_TRUE(worker().isTerminated());
    EXPECT_EQ(processor.deactivateCalls.load(), 0);
}

TEST_F(ForwardingWorkerTest, UnexpectedFailureDeactivatesProcessor) {
    sequences.add(std::make_shared<FunctionSequence>("fault", [](Message&) {
        throw std::runtime_error("fault sequence crashed");
    }));
    store.push(makeMessage("m1"));
    sender.script({fail("connection refused")});

    EXPECT_NO_THROW(worker().run());

    EXPECT_TRUE(processor.isDeactivated());
    EXPECT_TRUE(worker().isTerminated());
    EXPECT_EQ(recorder.count("deactivate"), 1u);
    EXPECT_EQ(store.ackCount(), 0u);
}

TEST_F(ForwardingWorkerTest, NonStandardExceptionRunsDeactivateSequence) {
    store.push(makeMessage("m1"));
    sender.script({[](const Endpoint&, Message&) -> std::optional<Message> { throw 42; }});
    const int64_t deactivations = Metrics::instance().get("forwarder_deactivations_total");

    EXPECT_NO_THROW(worker().run());

    EXPECT_TRUE(processor.isDeactivated());
    EXPECT_TRUE(worker().isTerminated());
    ASSERT_EQ(recorder.count("deactivate"), 1u);
    EXPECT_EQ(recorder.snapshot().back().messageId, "m1");
    EXPECT_EQ(store.ackCount(), 0u);
    EXPECT_EQ(Metrics::instance().get("forwarder_deactivations_total"), deactivations + 1);
}

TEST_F(ForwardingWorkerTest, MissingConsumerDeactivatesProcessor) {
    store.refuseConsumer = true;

    EXPECT_NO_THROW(worker().run());

    EXPECT_FALSE(worker().isInitialized());
    EXPECT_TRUE(processor.isDeactivated());
    EXPECT_EQ(recorder.count("deactivate"), 0u);
}

TEST_F(ForwardingWorkerTest, InitializesOnlyOnce) {
    worker().run();
    worker().run();

    EXPECT_TRUE(worker().isInitialized());
    EXPECT_EQ(store.consumersCreated(), 1);
}

TEST_F(ForwardingWorkerTest, StartupDelayAppliesToFirstRunOnly) {
    config.deactivatedAtStartup = true;
    config.startupDelayMs = 5000;

    worker().run();
    worker().run();

    EXPECT_EQ(clock.sleeps(), std::vector<long long>({5000}));
}

TEST_F(ForwardingWorkerTest, StateIsResetForEveryMessage) {
    config.maxDeliveryAttempts = 5;
    store.push(makeMessage("m1"));
    store.push(makeMessage("m2"));
    sender.script({fail("reset"), fail("reset"), oneWay()});

    worker().run();
    EXPECT_EQ(worker().state().attemptCount, 0);
    EXPECT_TRUE(worker().state().succeeded);

    sender.script({fail("reset"), oneWay()});
    worker().run();

    EXPECT_EQ(store.ackedIds(), std::vector<std::string>({"m1", "m2"}));
    EXPECT_FALSE(processor.isDeactivated());
}
