#pragma once

#include "thermo/config/PrinterConfig.hpp"
#include "thermo/core/Expected.hpp"
#include "thermo/core/PrintSettings.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>

namespace thermo::config {

/**
 * @brief User-facing printer preferences as persisted on disk.
 *
 * The file is plain `key=value` lines; `#` starts a comment. Values keep the
 * units the user edits (indices and 0-200 sliders) and are mapped to
 * pipeline units only by `toPrintSettings()`.
 */
struct PrinterPreferences {
    std::string paperType = "Gap"; // "Gap" | "Black Mark" | "Continuous"
    int darknessIndex = 5;
    int speedIndex = 2;
    int ditheringIndex = 1;        // 0 threshold, 1 Floyd-Steinberg, 2 Atkinson, 3 ordered
    int paperWidthMm = DEFAULT_PAPER_WIDTH_MM;
    int threshold = DEFAULT_THRESHOLD;
    int contrast = 100;            // 0..200, 100 = unchanged
    int brightness = 100;          // 0..200, 100 = unchanged
    std::string printerMac;
    std::string printerName;

    /// Parses @p in over the defaults. Unknown keys are ignored; malformed
    /// values keep their default and are logged.
    static PrinterPreferences parse(std::istream& in);

    /// Missing file -> defaults. Fails only when the file exists but cannot be read.
    static expected<PrinterPreferences> load(const std::filesystem::path& path);

    void write(std::ostream& out) const;
    expected<void> save(const std::filesystem::path& path) const;

    /// Immutable snapshot for one job.
    core::PrintSettings toPrintSettings() const;
};

} // namespace thermo::config
