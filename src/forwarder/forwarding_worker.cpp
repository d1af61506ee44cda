#include "forwarder/forwarding_worker.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <chrono>
#include <stdexcept>

using std::chrono::milliseconds;

ForwardingWorker::ForwardingWorker(const WorkerConfig& config, const WorkerContext& ctx)
    : config_(config)
    , ctx_(ctx)
    , classifier_(config.nonRetryStatusCodes)
    , retryPolicy_(config.maxDeliveryAttempts, config.retryIntervalMs, config.dropOnMaxAttempts)
    , sequences_(ctx.sequences, config.processorName,
                 config.replySequence, config.faultSequence, config.deactivateSequence)
    , delivery_(ctx.sender, classifier_)
    , deactivatedAtStartup_(config.deactivatedAtStartup) {}

std::string ForwardingWorker::tag() const {
    return "[" + ctx_.processor.name() + "] ";
}

bool ForwardingWorker::sleep(long millis) {
    if (millis <= 0)
        return true;
    bool completed = ctx_.clock.sleepFor(milliseconds(millis), terminated_);
    if (!completed) {
        Logger::instance().log(LogLevel::Debug,
            tag() + "Worker was interrupted while sleeping");
    }
    return completed;
}

void ForwardingWorker::run() {
    const auto startTime = ctx_.clock.now();

    if (deactivatedAtStartup_) {
        // Gives the scheduler time to pause a processor that starts inactive.
        if (!ctx_.clock.sleepFor(milliseconds(config_.startupDelayMs), terminated_)) {
            Logger::instance().log(LogLevel::Warn,
                tag() + "Initial delay interrupted when worker started as inactive");
        }
        deactivatedAtStartup_ = false;
    }

    if (!initialized_) {
        try {
            init();
        } catch (const std::exception& ex) {
            Logger::instance().log(LogLevel::Fatal,
                tag() + "Initialization failed, deactivating the message processor: " + ex.what());
            deactivateProcessor(nullptr);
            return;
        } catch (...) {
            Logger::instance().log(LogLevel::Fatal,
                tag() + "Initialization failed with an unknown error, deactivating the message processor");
            deactivateProcessor(nullptr);
            return;
        }
    }

    const bool loops = config_.throttle || config_.cronMode();

    while (!terminated_) {
        resetService();
        std::optional<Message> message;

        try {
            if (!ctx_.processor.isDeactivated()) {
                message = consumer_->receive();
                if (message) {
                    Metrics::instance().inc("forwarder_messages_fetched_total");

                    // left over from an earlier run of this message
                    message->removeProperty(MessageProperty::BlockingSenderError);

                    dispatch(*message);
                } else {
                    Logger::instance().log(LogLevel::Debug,
                        tag() + "No messages were received");

                    // store is drained, wait for the next trigger
                    if (config_.cronMode())
                        break;
                }
            } else {
                // The processor may have been deactivated before this
                // worker was first scheduled.
                terminated_ = true;
                Logger::instance().log(LogLevel::Debug,
                    tag() + "Exiting worker since the message processor is deactivated");
                break;
            }
        } catch (const std::exception& ex) {
            Logger::instance().log(LogLevel::Fatal,
                tag() + "Deactivating the message processor: " + ex.what());
            deactivateProcessor(message ? &*message : nullptr);
        } catch (...) {
            Logger::instance().log(LogLevel::Fatal,
                tag() + "Deactivating the message processor after an unknown error");
            deactivateProcessor(message ? &*message : nullptr);
        }

        if (terminated_)
            break;

        if (config_.cronMode()) {
            sleep(config_.throttleIntervalMs);
        }

        if (config_.pollIntervalMs > 0 && config_.pollIntervalMs < THRESHOLD_INTERVAL_MS) {
            sleep(config_.pollIntervalMs);
        }

        // hand the thread back to the scheduler
        if (config_.throttle &&
            ctx_.clock.now() - startTime > milliseconds(MAX_SLICE_MS)) {
            break;
        }

        if (!loops)
            break;
    }

    Logger::instance().log(LogLevel::Debug, tag() + "Exiting worker iteration");
}

void ForwardingWorker::init() {
    std::vector<std::string> errors;
    ConfigLoader::validateWorkerConfig(config_, errors);
    if (!errors.empty()) {
        throw std::runtime_error("invalid worker configuration: " + errors.front());
    }

    consumer_ = ctx_.store.createConsumer();
    if (!consumer_) {
        throw std::runtime_error("message store [" + ctx_.store.name() + "] did not provide a consumer");
    }

    initialized_ = true;
    Logger::instance().log(LogLevel::Info,
        tag() + "Worker initialized on store [" + ctx_.store.name() + "]");
}

void ForwardingWorker::resetService() {
    state_.reset();
}

std::optional<Endpoint> ForwardingWorker::resolveTarget(const Message& message) const {
    std::string name = message.property(MessageProperty::TargetEndpoint).value_or("");
    if (name.empty())
        name = config_.targetEndpoint;
    if (name.empty())
        return std::nullopt;

    auto endpoint = ctx_.endpoints.resolve(name);
    if (!endpoint) {
        Logger::instance().log(LogLevel::Warn,
            tag() + "Target endpoint [" + name + "] is not defined");
    }
    return endpoint;
}

void ForwardingWorker::dispatch(const Message& stored) {
    Logger::instance().log(LogLevel::Debug,
        tag() + "Sending message " + stored.id + " to the endpoint");

    auto endpoint = resolveTarget(stored);
    if (!endpoint) {
        // Nowhere to deliver it; keeping it would block the store forever.
        Logger::instance().log(LogLevel::Warn,
            tag() + "Property " + MessageProperty::TargetEndpoint +
            " not found for message " + stored.id + ", hence removing the message");
        Metrics::instance().inc("forwarder_undeliverable_total");
        acknowledge(stored.id);
        return;
    }

    while (!state_.succeeded && !terminated_) {
        // Each attempt starts from the stored payload, never from a copy
        // a failed attempt may have modified.
        Message working = stored;
        std::optional<Message> response;
        bool settled = false;

        try {
            if (consumer_->isAlive()) {
                response = delivery_.attempt(working, *endpoint);
            } else {
                Logger::instance().log(LogLevel::Warn,
                    tag() + "Store consumer is not alive, message " + stored.id + " was not sent");
            }
            state_.succeeded = true;
        } catch (const DeliveryError& ex) {
            DeliveryVerdict verdict = classifier_.classifyError(ex.cause());
            if (verdict.outcome == DeliveryOutcome::NonRetryableFailure) {
                settleWithoutDelivery(stored.id, ex.cause());
                settled = true;
            } else {
                Logger::instance().log(LogLevel::Error,
                    tag() + "Failed to send message " + stored.id +
                    " to endpoint [" + endpoint->name + "]: " + ex.what());
                Metrics::instance().inc("forwarder_delivery_failures_total");
                sequences_.sendThroughFaultSeq(working);
            }
        } catch (const std::exception& ex) {
            Logger::instance().log(LogLevel::Error,
                tag() + "Failed to send message " + stored.id +
                " to endpoint [" + endpoint->name + "]: " + ex.what());
            Metrics::instance().inc("forwarder_delivery_failures_total");
            sequences_.sendThroughFaultSeq(working);
        }

        if (state_.succeeded && !settled) {
            if (response) {
                DeliveryVerdict verdict = classifier_.classifyResponse(*response);
                switch (verdict.outcome) {
                    case DeliveryOutcome::Success:
                        sequences_.sendThroughReplySeq(*response);
                        completeDelivery(stored.id, endpoint->name);
                        break;

                    case DeliveryOutcome::NonRetryableFailure:
                        sequences_.sendThroughReplySeq(*response);
                        settleWithoutDelivery(stored.id, verdict.reason);
                        break;

                    case DeliveryOutcome::RetryableFailure:
                        state_.succeeded = false;
                        Logger::instance().log(LogLevel::Error,
                            tag() + "Endpoint [" + endpoint->name + "] rejected message " +
                            stored.id + ": " + verdict.reason);
                        Metrics::instance().inc("forwarder_delivery_failures_total");
                        sequences_.sendThroughFaultSeq(*response);
                        break;
                }
            } else {
                // one-way exchange, nothing to inspect
                completeDelivery(stored.id, endpoint->name);
            }
        }

        if (!state_.succeeded) {
            prepareToRetry(working);
        }
    }
}

void ForwardingWorker::completeDelivery(const std::string& messageId, const std::string& endpointName) {
    acknowledge(messageId);
    state_.attemptCount = 0;
    state_.succeeded = true;
    Metrics::instance().inc("forwarder_delivered_total");

    Logger::instance().log(LogLevel::Debug,
        tag() + "Successfully sent message " + messageId + " to endpoint [" + endpointName + "]");
}

// The endpoint refused the message for good; it leaves the store but does
// not count as delivered.
void ForwardingWorker::settleWithoutDelivery(const std::string& messageId, const std::string& reason) {
    acknowledge(messageId);
    state_.attemptCount = 0;
    state_.succeeded = true;
    Metrics::instance().inc("forwarder_non_retry_total");

    Logger::instance().log(LogLevel::Info,
        tag() + "Message " + messageId + " will not be retried: " + reason);
}

void ForwardingWorker::prepareToRetry(Message& message) {
    RetryDecision decision = retryPolicy_.onFailure(state_, terminated_);

    switch (decision.verdict) {
        case RetryVerdict::Skipped:
            return;

        case RetryVerdict::Dropped:
            acknowledge(message.id);
            Metrics::instance().inc("forwarder_dropped_total");
            Logger::instance().log(LogLevel::Info,
                tag() + "Removed failed message " + message.id +
                " after " + std::to_string(retryPolicy_.maxDeliveryAttempts()) +
                " attempts and continuing");
            return;

        case RetryVerdict::Deactivated:
            terminate();
            deactivateProcessor(&message);
            Logger::instance().log(LogLevel::Error,
                tag() + "Message processor stopped after reaching " +
                std::to_string(retryPolicy_.maxDeliveryAttempts()) + " delivery attempts");
            return;

        case RetryVerdict::WillRetry:
            Logger::instance().log(LogLevel::Debug,
                tag() + "Retrying after " + std::to_string(decision.delay.count()) +
                " ms with attempt count " + std::to_string(state_.attemptCount));
            sleep(static_cast<long>(decision.delay.count()));
            return;
    }
}

void ForwardingWorker::acknowledge(const std::string& messageId) {
    if (!consumer_->ack()) {
        Logger::instance().log(LogLevel::Error,
            tag() + "Failed to acknowledge message " + messageId + " at the store");
    }
}

void ForwardingWorker::deactivateProcessor(Message* message) {
    if (message) {
        try {
            sequences_.sendThroughDeactivateSeq(*message);
        } catch (const std::exception& ex) {
            Logger::instance().log(LogLevel::Error,
                tag() + "Deactivate sequence failed: " + ex.what());
        }
    }

    terminated_ = true;
    ctx_.processor.deactivate();
    Metrics::instance().inc("forwarder_deactivations_total");
}

bool ForwardingWorker::terminate() {
    terminated_ = true;
    ctx_.clock.interrupt();

    Logger::instance().log(LogLevel::Debug,
        tag() + "Successfully terminated worker");
    return true;
}

void ForwardingWorker::destroy() {
    terminate();
}
