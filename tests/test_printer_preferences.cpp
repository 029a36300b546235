#include "thermo/config/PrinterPreferences.hpp"

#include "support/TestMacros.hpp"

#include <filesystem>
#include <sstream>
#include <string>

using namespace thermo;
using config::PrinterPreferences;

static void testDefaults() {
    std::istringstream empty("");
    const auto prefs = PrinterPreferences::parse(empty);
    const auto settings = prefs.toPrintSettings();

    ASSERT_EQ(settings.paperWidthMm, 78, "default width");
    ASSERT_TRUE(settings.media == core::MediaSensing::Gap, "default media");
    ASSERT_EQ(settings.darknessLevel, 5, "default darkness");
    ASSERT_EQ(settings.speedLevel, 2, "default speed");
    ASSERT_TRUE(settings.dither == core::DitherMode::FloydSteinberg, "default dither");
    ASSERT_EQ(settings.threshold, 128, "default threshold");
    ASSERT_NEAR(settings.contrast, 1.0, 1e-6, "neutral contrast");
    ASSERT_NEAR(settings.brightness, 0.0, 1e-6, "neutral brightness");
}

static void testParseAndMap() {
    std::istringstream in(
        "# printer settings\n"
        "paper_type = Black Mark\n"
        "darkness_index=8\n"
        "speed_index=0\n"
        "dithering_index=3\n"
        "paper_width=58.0\n"
        "threshold=100\n"
        "contrast=150\n"
        "brightness=50\n"
        "printer_mac=00:11:22:33:44:55\n"
        "printer_name=B300 Front Desk\n"
        "future_option=whatever\n");
    const auto prefs = PrinterPreferences::parse(in);
    ASSERT_EQ(prefs.printerMac, std::string("00:11:22:33:44:55"), "mac kept");
    ASSERT_EQ(prefs.printerName, std::string("B300 Front Desk"), "name keeps spaces");

    const auto settings = prefs.toPrintSettings();
    ASSERT_TRUE(settings.media == core::MediaSensing::BlackMark, "black mark media");
    ASSERT_EQ(settings.darknessLevel, 8, "darkness index");
    ASSERT_EQ(settings.speedLevel, 0, "speed index");
    ASSERT_TRUE(settings.dither == core::DitherMode::OrderedBayer, "ordered dither");
    ASSERT_EQ(settings.paperWidthMm, 58, "width from float text");
    ASSERT_EQ(settings.threshold, 100, "threshold");
    ASSERT_NEAR(settings.contrast, 1.5, 1e-6, "contrast slider / 100");
    ASSERT_NEAR(settings.brightness, -64.0, 1e-4, "brightness slider centred on 100");
}

static void testMalformedValuesKeepDefaults() {
    std::istringstream in(
        "darkness_index=dark\n"
        "paper_type=Roll\n"
        "paper_width=-3\n"
        "this line has no equals sign\n"
        "threshold=90\n");
    const auto prefs = PrinterPreferences::parse(in);
    ASSERT_EQ(prefs.darknessIndex, 5, "bad integer ignored");
    ASSERT_EQ(prefs.paperType, std::string("Gap"), "unknown paper type ignored");
    ASSERT_EQ(prefs.paperWidthMm, 78, "negative width ignored");
    ASSERT_EQ(prefs.threshold, 90, "later good lines still parsed");
}

static void testOutOfRangeNumbers() {
    std::istringstream in(
        "paper_width=1e10\n"
        "darkness_index=4294967296\n"
        "speed_index=-9999999999\n"
        "threshold=140\n");
    const auto prefs = PrinterPreferences::parse(in);
    ASSERT_EQ(prefs.paperWidthMm, 78, "huge width ignored");
    ASSERT_EQ(prefs.darknessIndex, 5, "integer wider than int ignored");
    ASSERT_EQ(prefs.speedIndex, 2, "negative overflow ignored");
    ASSERT_EQ(prefs.threshold, 140, "in-range value still parsed");

    std::istringstream overflow("paper_width=300000000\n");
    ASSERT_EQ(PrinterPreferences::parse(overflow).paperWidthMm, 78, "width that would overflow dots ignored");

    std::istringstream notANumber("paper_width=nan\n");
    ASSERT_EQ(PrinterPreferences::parse(notANumber).paperWidthMm, 78, "nan width ignored");

    std::istringstream widest("paper_width=" + std::to_string(config::MAX_PAPER_WIDTH_MM) + "\n");
    ASSERT_EQ(PrinterPreferences::parse(widest).paperWidthMm, config::MAX_PAPER_WIDTH_MM, "widest head accepted");

    std::istringstream tooWide("paper_width=" + std::to_string(config::MAX_PAPER_WIDTH_MM + 1) + "\n");
    ASSERT_EQ(PrinterPreferences::parse(tooWide).paperWidthMm, 78, "one past the widest head ignored");
}

static void testDitherIndexMapping() {
    PrinterPreferences prefs;
    prefs.ditheringIndex = 0;
    ASSERT_TRUE(prefs.toPrintSettings().dither == core::DitherMode::Threshold, "0 threshold");
    prefs.ditheringIndex = 2;
    ASSERT_TRUE(prefs.toPrintSettings().dither == core::DitherMode::Atkinson, "2 atkinson");
    prefs.ditheringIndex = 9;
    ASSERT_TRUE(prefs.toPrintSettings().dither == core::DitherMode::Threshold, "unknown falls back to threshold");
    prefs.paperType = "Continuous";
    ASSERT_TRUE(prefs.toPrintSettings().media == core::MediaSensing::Continuous, "continuous media");
}

static void testSaveAndLoad() {
    const auto path = std::filesystem::temp_directory_path() / "thermo-test-prefs.conf";
    PrinterPreferences prefs;
    prefs.paperType = "Continuous";
    prefs.speedIndex = 4;
    prefs.printerName = "Shipping";
    ASSERT_TRUE(prefs.save(path).has_value(), "preferences saved");

    auto loaded = PrinterPreferences::load(path);
    ASSERT_TRUE(loaded.has_value(), "preferences loaded");
    ASSERT_EQ(loaded->paperType, std::string("Continuous"), "paper type persisted");
    ASSERT_EQ(loaded->speedIndex, 4, "speed persisted");
    ASSERT_EQ(loaded->printerName, std::string("Shipping"), "name persisted");
    std::filesystem::remove(path);

    auto missing = PrinterPreferences::load(path);
    ASSERT_TRUE(missing.has_value(), "missing file gives defaults");
    ASSERT_EQ(missing->darknessIndex, 5, "defaults when missing");
}

int main() {
    testDefaults();
    testParseAndMap();
    testMalformedValuesKeepDefaults();
    testOutOfRangeNumbers();
    testDitherIndexMapping();
    testSaveAndLoad();
    return testing::report("PrinterPreferences");
}
