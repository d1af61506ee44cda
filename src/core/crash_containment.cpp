#include "core/crash_containment.h"
#include "core/logger.h"

#include <exception>

CrashContainment& CrashContainment::instance() {
    static CrashContainment inst;
    return inst;
}

bool CrashContainment::executeSafely(const std::string& context, const std::function<void()>& fn) {
    try {
        fn();
        return true;
    } catch (const std::exception& ex) {
        Logger::instance().log(LogLevel::Fatal,
            "CrashContainment: Exception in " + context + ": " + ex.what());
        return false;
    } catch (...) {
        Logger::instance().log(LogLevel::Fatal,
            "CrashContainment: Unknown exception in " + context);
        return false;
    }
}
