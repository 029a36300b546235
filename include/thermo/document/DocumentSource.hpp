#pragma once

#include "thermo/core/JobError.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

namespace thermo::document {

/**
 * @brief Document bytes as handed over by the submitter.
 *
 * The source may be a pipe or socket, so it is read exactly once, front to
 * back, into a local seekable copy before any page is rendered.
 */
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    /// Short label for logs and failure reasons.
    virtual std::string name() const = 0;

    /// Streams the whole document into @p out and returns the byte count.
    virtual JobResult<std::size_t> copyTo(std::ostream& out) = 0;
};

/// Non-seekable source reading from an already open stream (e.g. stdin).
class StreamDocumentSource : public DocumentSource {
public:
    StreamDocumentSource(std::istream& input, std::string label);

    std::string name() const override { return label; }
    JobResult<std::size_t> copyTo(std::ostream& out) override;

private:
    std::istream& input;
    std::string label;
};

/// Source backed by a file on disk.
class FileDocumentSource : public DocumentSource {
public:
    explicit FileDocumentSource(std::filesystem::path path);

    std::string name() const override { return path.string(); }
    JobResult<std::size_t> copyTo(std::ostream& out) override;

private:
    std::filesystem::path path;
};

} // namespace thermo::document
