#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/config_loader.h"
#include "forwarder/forwarding_worker.h"
#include "forwarder/message_processor.h"
#include "forwarder/worker_clock.h"

// Hosts one forwarding worker on its own thread and re-invokes run() on
// every scheduler tick until stopped or deactivated.
class ScheduledForwardingProcessor : public MessageProcessor {
public:
    ScheduledForwardingProcessor(
        const WorkerConfig& config,
        MessageStore& store,
        MessageSender& sender,
        const SequenceRegistry& sequences,
        const EndpointRegistry& endpoints);
    ~ScheduledForwardingProcessor() override;

    std::string name() const override;
    bool isDeactivated() const override;

    // May be called from the worker thread itself; never blocks.
    void deactivate() override;

    // Clears the deactivated flag and restarts the scheduler thread. Not
    // callable from the worker thread.
    void activate();

    // Replaces a worker terminated by an earlier stop() with a fresh one.
    void start();
    void stop();
    bool isRunning() const;

private:
    void schedulerLoop();
    void replaceTerminatedWorker();
    std::chrono::milliseconds tick() const;

    WorkerConfig config_;
    SystemWorkerClock clock_;
    WorkerContext ctx_;

    std::unique_ptr<ForwardingWorker> worker_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> deactivated_{false};
};
