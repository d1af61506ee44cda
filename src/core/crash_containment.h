#pragma once

#include <functional>
#include <string>

/**
 * Crash Containment
 *
 * Top-level exception boundary for code running on worker threads.
 * Nothing thrown inside executeSafely() reaches the thread entry point.
 */
class CrashContainment {
public:
    static CrashContainment& instance();

    // Execute function with exception containment
    // Returns true if executed successfully, false if an exception was caught
    bool executeSafely(const std::string& context, const std::function<void()>& fn);

private:
    CrashContainment() = default;
};
