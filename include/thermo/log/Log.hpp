#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace thermo::log {

using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(msg);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(msg);
}

/**
 * @brief Component-tagged front end for the process-wide handlers.
 *
 * `Channel{"TsplEncoder"}.info("speed ", 3)` emits "[TsplEncoder] speed 3\n".
 * The channel holds no state beyond its tag, so it is cheap to keep as a
 * static in each translation unit.
 */
class Channel {
public:
    explicit constexpr Channel(std::string_view tag) : tag(tag) {}

    template<typename... Args>
    void info(Args&&... args) const {
        emit(Severity::Info, detail::buildLogMessage(std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(Args&&... args) const {
        emit(Severity::Error, detail::buildLogMessage(std::forward<Args>(args)...));
    }

    constexpr std::string_view name() const { return tag; }

private:
    enum class Severity { Info, Error };

    /// Prefixes the tag, terminates the line and hands it to the sink.
    void emit(Severity severity, std::string_view body) const;

    std::string_view tag;
};

} // namespace thermo::log

namespace thermo {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logError;
} // namespace thermo
