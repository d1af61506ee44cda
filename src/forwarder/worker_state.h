#pragma once

// Per-message delivery state, owned by a single worker.
struct WorkerState {
    int attemptCount = 0;
    bool succeeded = false;

    void reset() {
        attemptCount = 0;
        succeeded = false;
    }
};
