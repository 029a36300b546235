#pragma once

#include "thermo/core/JobError.hpp"
#include "thermo/document/DocumentSource.hpp"

#include <cstdint>
#include <filesystem>

namespace thermo::document {

/**
 * @brief Locally owned temporary file holding a full copy of a document.
 *
 * Page renderers need random access, which the submitted source cannot be
 * relied on to provide. The copy lives until `release()` or destruction,
 * whichever comes first; releasing twice is a no-op.
 */
class SeekableCopy {
public:
    /// Drains @p source into a fresh file under @p directory.
    static JobResult<SeekableCopy> create(DocumentSource& source,
                                          const std::filesystem::path& directory);

    SeekableCopy() = default;
    ~SeekableCopy();

    SeekableCopy(const SeekableCopy&) = delete;
    SeekableCopy& operator=(const SeekableCopy&) = delete;
    SeekableCopy(SeekableCopy&& other) noexcept;
    SeekableCopy& operator=(SeekableCopy&& other) noexcept;

    const std::filesystem::path& path() const { return filePath; }
    std::uintmax_t size() const { return byteCount; }
    bool isHeld() const { return !filePath.empty(); }

    /// Deletes the file. Idempotent.
    void release();

private:
    SeekableCopy(std::filesystem::path path, std::uintmax_t bytes);

    std::filesystem::path filePath;
    std::uintmax_t byteCount = 0;
};

} // namespace thermo::document
