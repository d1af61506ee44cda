#include "processor/scheduled_processor.h"
#include "core/crash_containment.h"
#include "core/logger.h"

#include <algorithm>

ScheduledForwardingProcessor::ScheduledForwardingProcessor(
    const WorkerConfig& config,
    MessageStore& store,
    MessageSender& sender,
    const SequenceRegistry& sequences,
    const EndpointRegistry& endpoints
)
    : config_(config)
    , ctx_{*this, store, sender, sequences, endpoints, clock_} {
    // an inactive processor waits for activate() before running at all
    deactivated_ = config_.deactivatedAtStartup;
    worker_ = std::make_unique<ForwardingWorker>(config_, ctx_);
}

ScheduledForwardingProcessor::~ScheduledForwardingProcessor() {
    stop();
}

std::string ScheduledForwardingProcessor::name() const {
    return config_.processorName;
}

bool ScheduledForwardingProcessor::isDeactivated() const {
    return deactivated_;
}

bool ScheduledForwardingProcessor::isRunning() const {
    return running_;
}

std::chrono::milliseconds ScheduledForwardingProcessor::tick() const {
    // the scheduler does not fire faster than once a second; shorter
    // intervals are paced by the worker itself
    return std::chrono::milliseconds(std::max(config_.pollIntervalMs, 1000L));
}

void ScheduledForwardingProcessor::start() {
    if (running_) return;

    if (deactivated_) {
        Logger::instance().log(LogLevel::Info,
            "Processor [" + name() + "] is deactivated, not starting");
        return;
    }

    if (thread_.joinable())
        thread_.join();

    {
        std::lock_guard<std::mutex> lock(mtx_);
        replaceTerminatedWorker();
    }

    running_ = true;
    Logger::instance().log(LogLevel::Info,
        "Processor [" + name() + "] starting");

    thread_ = std::thread(&ScheduledForwardingProcessor::schedulerLoop, this);
}

void ScheduledForwardingProcessor::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_ = false;
        if (worker_)
            worker_->terminate();
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        Logger::instance().log(LogLevel::Info,
            "Processor [" + name() + "] stopped");
    }
}

void ScheduledForwardingProcessor::deactivate() {
    if (deactivated_.exchange(true))
        return;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (worker_)
            worker_->terminate();
    }
    cv_.notify_all();

    Logger::instance().log(LogLevel::Warn,
        "Processor [" + name() + "] deactivated");
}

void ScheduledForwardingProcessor::activate() {
    if (!deactivated_ && running_)
        return;

    // the scheduler thread exits on its own once deactivated
    if (thread_.joinable())
        thread_.join();

    {
        std::lock_guard<std::mutex> lock(mtx_);
        replaceTerminatedWorker();
        deactivated_ = false;
    }

    Logger::instance().log(LogLevel::Info,
        "Processor [" + name() + "] activated");
    start();
}

// A terminated worker never resumes, so every restart gets a new one.
// Called with mtx_ held.
void ScheduledForwardingProcessor::replaceTerminatedWorker() {
    if (worker_ && !worker_->isTerminated())
        return;

    WorkerConfig fresh = config_;
    // the startup grace delay applies to the first worker only
    fresh.deactivatedAtStartup = false;
    worker_ = std::make_unique<ForwardingWorker>(fresh, ctx_);
}

void ScheduledForwardingProcessor::schedulerLoop() {
    Logger::instance().log(LogLevel::Info,
        "Processor [" + name() + "] scheduler started");

    while (running_ && !deactivated_) {
        bool ok = CrashContainment::instance().executeSafely(
            "processor [" + name() + "]",
            [this]() { worker_->run(); });

        if (!ok) {
            deactivate();
            break;
        }

        if (worker_->isTerminated())
            break;

        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, tick(), [this]() {
            return !running_ || deactivated_;
        });
    }

    running_ = false;
    Logger::instance().log(LogLevel::Info,
        "Processor [" + name() + "] scheduler exited");
}
