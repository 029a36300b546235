#pragma once

#include "thermo/core/Expected.hpp"

#include <string>
#include <system_error>

namespace thermo {

/**
 * @brief Classification of everything that can go wrong while printing.
 *
 * Only the fatal kinds ever reach a job status. `CapabilityUnsupported` is
 * produced by capability negotiation and absorbed by the encoder fallbacks.
 */
enum class ErrorKind {
    Document,              // unreadable or empty document; fails before any page
    Transport,             // cannot open or write the printer link
    Render,                // a page cannot be rasterized
    Encode,                // the mandatory bitmap directive cannot be produced
    CapabilityUnsupported, // optional device feature missing
    Rejected               // job refused at submission
};

const char* toString(ErrorKind kind);

struct JobError {
    ErrorKind kind = ErrorKind::Document;
    std::string message;

    bool isFatal() const { return kind != ErrorKind::CapabilityUnsupported; }

    /// "<kind>: <message>", used in log lines.
    std::string describe() const;

    static JobError document(std::string message) { return {ErrorKind::Document, std::move(message)}; }
    static JobError transport(std::string message) { return {ErrorKind::Transport, std::move(message)}; }
    static JobError render(std::string message) { return {ErrorKind::Render, std::move(message)}; }
    static JobError encode(std::string message) { return {ErrorKind::Encode, std::move(message)}; }
    static JobError rejected(std::string message) { return {ErrorKind::Rejected, std::move(message)}; }

    /// Wraps a low-level error code, appending its message in parentheses.
    static JobError fromErrorCode(ErrorKind kind, std::string message, const std::error_code& ec);
};

template <typename T>
using JobResult = expected<T, JobError>;

} // namespace thermo
