#include "thermo/config/PrinterPreferences.hpp"

#include "thermo/log/Log.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string_view>
#include <system_error>

namespace thermo::config {

namespace {

const log::Channel LOG{"PrinterPreferences"};

constexpr float BRIGHTNESS_STEP = 1.28f; // slider unit -> gray levels

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::optional<int> parseInt(std::string_view text) {
    const std::string value(text);
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(value.c_str(), &end, 10);
    if (errno != 0 || end != value.c_str() + value.size() || parsed < INT_MIN || parsed > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

// Accepts "78" and "78.0"; the width was historically stored as a float.
std::optional<int> parseWidth(std::string_view text) {
    const std::string value(text);
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(value.c_str(), &end);
    if (errno != 0 || end != value.c_str() + value.size()) {
        return std::nullopt;
    }
    // Also rejects NaN; the cast below is only defined once the range holds.
    if (!(parsed >= MIN_PAPER_WIDTH_MM && parsed <= MAX_PAPER_WIDTH_MM)) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

void assignInt(int& field, std::string_view key, std::string_view value, int lineNo) {
    if (auto parsed = parseInt(value)) {
        field = *parsed;
    } else {
        LOG.error("line ", lineNo, ": bad value '", value, "' for ", key, ", keeping ", field);
    }
}

core::MediaSensing mediaFromPaperType(const std::string& paperType) {
    if (paperType == "Black Mark") {
        return core::MediaSensing::BlackMark;
    }
    if (paperType == "Continuous") {
        return core::MediaSensing::Continuous;
    }
    return core::MediaSensing::Gap;
}

core::DitherMode ditherFromIndex(int index) {
    switch (index) {
        case 1: return core::DitherMode::FloydSteinberg;
        case 2: return core::DitherMode::Atkinson;
        case 3: return core::DitherMode::OrderedBayer;
        default: return core::DitherMode::Threshold;
    }
}

} // namespace

PrinterPreferences PrinterPreferences::parse(std::istream& in) {
    PrinterPreferences prefs;
    std::string line;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        const std::string_view text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        const auto eq = text.find('=');
        if (eq == std::string_view::npos) {
            LOG.error("line ", lineNo, ": expected key=value, got '", text, "'");
            continue;
        }
        const std::string_view key = trim(text.substr(0, eq));
        const std::string_view value = trim(text.substr(eq + 1));

        if (key == "paper_type") {
            if (value == "Gap" || value == "Black Mark" || value == "Continuous") {
                prefs.paperType = std::string(value);
            } else {
                LOG.error("line ", lineNo, ": unknown paper_type '", value, "', keeping ", prefs.paperType);
            }
        } else if (key == "darkness_index") {
            assignInt(prefs.darknessIndex, key, value, lineNo);
        } else if (key == "speed_index") {
            assignInt(prefs.speedIndex, key, value, lineNo);
        } else if (key == "dithering_index") {
            assignInt(prefs.ditheringIndex, key, value, lineNo);
        } else if (key == "paper_width") {
            if (auto width = parseWidth(value)) {
                prefs.paperWidthMm = *width;
            } else {
                LOG.error("line ", lineNo, ": bad paper_width '", value, "', keeping ", prefs.paperWidthMm);
            }
        } else if (key == "threshold") {
            assignInt(prefs.threshold, key, value, lineNo);
        } else if (key == "contrast") {
            assignInt(prefs.contrast, key, value, lineNo);
        } else if (key == "brightness") {
            assignInt(prefs.brightness, key, value, lineNo);
        } else if (key == "printer_mac") {
            prefs.printerMac = std::string(value);
        } else if (key == "printer_name") {
            prefs.printerName = std::string(value);
        }
        // Anything else belongs to a newer or older version; ignore it.
    }
    return prefs;
}

expected<PrinterPreferences> PrinterPreferences::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return unexpected(ec);
        }
        LOG.info(path.string(), " not found, using defaults");
        return PrinterPreferences{};
    }

    std::ifstream in(path);
    if (!in) {
        LOG.error("cannot read ", path.string());
        return unexpected(std::make_error_code(std::errc::permission_denied));
    }
    return parse(in);
}

void PrinterPreferences::write(std::ostream& out) const {
    out << "paper_type=" << paperType << '\n'
        << "darkness_index=" << darknessIndex << '\n'
        << "speed_index=" << speedIndex << '\n'
        << "dithering_index=" << ditheringIndex << '\n'
        << "paper_width=" << paperWidthMm << '\n'
        << "threshold=" << threshold << '\n'
        << "contrast=" << contrast << '\n'
        << "brightness=" << brightness << '\n'
        << "printer_mac=" << printerMac << '\n'
        << "printer_name=" << printerName << '\n';
}

expected<void> PrinterPreferences::save(const std::filesystem::path& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        LOG.error("cannot write ", path.string());
        return unexpected(std::make_error_code(std::errc::permission_denied));
    }
    write(out);
    out.flush();
    if (!out) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

core::PrintSettings PrinterPreferences::toPrintSettings() const {
    core::PrintSettings settings;
    settings.paperWidthMm = paperWidthMm;
    settings.media = mediaFromPaperType(paperType);
    settings.darknessLevel = darknessIndex;
    settings.speedLevel = speedIndex;
    settings.dither = ditherFromIndex(ditheringIndex);
    settings.threshold = threshold;
    settings.contrast = static_cast<float>(contrast) / 100.0f;
    settings.brightness = static_cast<float>(brightness - 100) * BRIGHTNESS_STEP;
    return settings;
}

} // namespace thermo::config
