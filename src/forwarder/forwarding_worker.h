#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "core/config_loader.h"
#include "forwarder/delivery_attempt.h"
#include "forwarder/endpoint_registry.h"
#include "forwarder/message_processor.h"
#include "forwarder/message_sender.h"
#include "forwarder/message_store.h"
#include "forwarder/outcome_classifier.h"
#include "forwarder/retry_policy.h"
#include "forwarder/sequence.h"
#include "forwarder/sequence_dispatcher.h"
#include "forwarder/worker_clock.h"
#include "forwarder/worker_state.h"

// Collaborators a worker runs against. All of them outlive the worker.
struct WorkerContext {
    MessageProcessor& processor;
    MessageStore& store;
    MessageSender& sender;
    const SequenceRegistry& sequences;
    const EndpointRegistry& endpoints;
    WorkerClock& clock;
};

/**
 * Forwarding Worker
 *
 * Pulls one message at a time from the store and forwards it to its target
 * endpoint, retrying until it is delivered, dropped, or the worker is
 * deactivated. Only one message is in flight per worker.
 *
 * run() is re-invoked by the owning processor's scheduler. A single
 * invocation returns after one iteration (no throttling), after the store
 * runs dry (cron mode), or once it has held the thread for more than a
 * one-second slice (throttling).
 */
class ForwardingWorker {
public:
    ForwardingWorker(const WorkerConfig& config, const WorkerContext& ctx);

    ForwardingWorker(const ForwardingWorker&) = delete;
    ForwardingWorker& operator=(const ForwardingWorker&) = delete;

    void run();

    // Safe to call from any thread. Once terminated a worker never resumes.
    bool terminate();
    void destroy();

    bool isInitialized() const { return initialized_; }
    bool isTerminated() const { return terminated_.load(); }
    const WorkerState& state() const { return state_; }
    const WorkerConfig& config() const { return config_; }

private:
    void init();
    void resetService();

    // Delivery/retry cycle for one fetched message.
    void dispatch(const Message& stored);
    void completeDelivery(const std::string& messageId, const std::string& endpointName);
    void settleWithoutDelivery(const std::string& messageId, const std::string& reason);
    void prepareToRetry(Message& message);

    std::optional<Endpoint> resolveTarget(const Message& message) const;
    void acknowledge(const std::string& messageId);
    void deactivateProcessor(Message* message);
    bool sleep(long millis);
    std::string tag() const;

    // Below this poll interval the worker paces itself instead of relying
    // on the scheduler tick.
    static constexpr long THRESHOLD_INTERVAL_MS = 1000;
    static constexpr long MAX_SLICE_MS = 1000;

    WorkerConfig config_;
    WorkerContext ctx_;

    OutcomeClassifier classifier_;
    RetryPolicy retryPolicy_;
    SequenceDispatcher sequences_;
    DeliveryAttempt delivery_;

    std::unique_ptr<MessageConsumer> consumer_;
    WorkerState state_;
    std::atomic<bool> terminated_{false};
    bool initialized_ = false;
    bool deactivatedAtStartup_;
};
