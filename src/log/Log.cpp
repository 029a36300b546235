#include "thermo/log/Log.hpp"

#include <iostream>
#include <mutex>

namespace thermo::log {

namespace {

void writeStdout(std::string_view message) {
    std::cout << message;
    std::cout.flush();
}

void writeStderr(std::string_view message) {
    std::cerr << message;
    std::cerr.flush();
}

// The print worker, the I/O thread and callers all log concurrently, and a
// test may swap the sinks while they do.
struct Sinks {
    std::mutex mutex;
    LogHandler info = writeStdout;
    LogHandler error = writeStderr;
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

void install(LogHandler& slot, LogHandler handler, void (*fallback)(std::string_view)) {
    slot = handler ? std::move(handler) : LogHandler(fallback);
}

// Copies the handler out so a slow sink never holds the lock.
void dispatch(LogHandler Sinks::*slot, std::string_view message) {
    auto& s = sinks();
    LogHandler handler;
    {
        std::lock_guard lock(s.mutex);
        handler = s.*slot;
    }
    if (handler) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.info, std::move(handler), writeStdout);
}

void setErrorLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.error, std::move(handler), writeStderr);
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.info, std::move(infoHandler), writeStdout);
    install(s.error, std::move(errorHandler), writeStderr);
}

void resetLogHandlers() {
    setLogHandlers(nullptr, nullptr);
}

void logInfo(std::string_view message) {
    dispatch(&Sinks::info, message);
}

void logError(std::string_view message) {
    dispatch(&Sinks::error, message);
}

void Channel::emit(Severity severity, std::string_view body) const {
    std::string line;
    line.reserve(tag.size() + body.size() + 4);
    line += '[';
    line += tag;
    line += "] ";
    line += body;
    if (line.back() != '\n') {
        line += '\n';
    }
    dispatch(severity == Severity::Error ? &Sinks::error : &Sinks::info, line);
}

} // namespace thermo::log
