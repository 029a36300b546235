#include "thermo/document/SeekableCopy.hpp"

#include "thermo/log/Log.hpp"

#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace thermo::document {

namespace {
const log::Channel LOG{"SeekableCopy"};
}

JobResult<SeekableCopy> SeekableCopy::create(DocumentSource& source,
                                             const std::filesystem::path& directory) {
    std::string pattern = (directory / "print_job-XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    const int fd = ::mkstemp(name.data());
    if (fd < 0) {
        const std::error_code ec(errno, std::generic_category());
        LOG.error("cannot create temporary file in ", directory.string(), ": ", ec.message());
        return unexpected(JobError::fromErrorCode(ErrorKind::Document,
            "cannot create local copy of " + source.name(), ec));
    }
    ::close(fd);

    // From here on the guard owns the file, so every early return removes it.
    SeekableCopy copy(std::filesystem::path(name.data()), 0);

    std::ofstream out(copy.filePath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected(JobError::document("cannot open local copy of " + source.name()));
    }

    auto copied = source.copyTo(out);
    if (!copied) {
        return unexpected(copied.error());
    }
    out.close();
    if (!out) {
        return unexpected(JobError::document("cannot flush local copy of " + source.name()));
    }
    if (*copied == 0) {
        return unexpected(JobError::document("Document is empty: " + source.name()));
    }

    copy.byteCount = *copied;
    LOG.info("copied ", source.name(), " (", copy.byteCount, " bytes) to ", copy.filePath.string());
    return std::move(copy);
}

SeekableCopy::SeekableCopy(std::filesystem::path path, std::uintmax_t bytes)
: filePath(std::move(path))
, byteCount(bytes) {}

SeekableCopy::~SeekableCopy() {
    release();
}

SeekableCopy::SeekableCopy(SeekableCopy&& other) noexcept
: filePath(std::move(other.filePath))
, byteCount(other.byteCount) {
    other.filePath.clear();
    other.byteCount = 0;
}

SeekableCopy& SeekableCopy::operator=(SeekableCopy&& other) noexcept {
    if (this != &other) {
        release();
        filePath = std::move(other.filePath);
        byteCount = other.byteCount;
        other.filePath.clear();
        other.byteCount = 0;
    }
    return *this;
}

void SeekableCopy::release() {
    if (filePath.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(filePath, ec);
    if (ec) {
        LOG.error("cannot delete ", filePath.string(), ": ", ec.message());
    }
    filePath.clear();
    byteCount = 0;
}

} // namespace thermo::document
