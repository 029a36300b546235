#include "thermo/config/PrinterPreferences.hpp"
#include "thermo/document/DocumentSource.hpp"
#include "thermo/document/NetpbmDocument.hpp"
#include "thermo/io/IoService.hpp"
#include "thermo/io/TimeoutConfig.hpp"
#include "thermo/job/PrintService.hpp"
#include "thermo/log/Log.hpp"
#include "thermo/transport/FileTransport.hpp"
#include "thermo/transport/SerialTransport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace thermo;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

struct Options {
    std::string document;      // "-" reads stdin
    std::string port;          // serial device
    std::string output;        // spool file instead of a printer
    std::string prefsPath = "thermo-print.conf";
    bool legacyBitmap = false;
    bool noBlackMark = false;
    std::optional<int> settleMs;
    std::optional<int> timeoutMs;
};

void printUsage() {
    std::cerr
        << "usage: thermo-print <document|-> [--port <device>] [--output <file>]\n"
        << "                    [--prefs <file>] [--settle-ms <n>] [--timeout-ms <n>]\n"
        << "                    [--legacy-bitmap] [--no-black-mark]\n"
        << "\n"
        << "Prints a multi-page netpbm document (P4/P5/P6) to a TSPL label printer.\n"
        << "Without --port or --output, printer_mac from the preferences file is used.\n";
}

std::optional<int> parseCount(const char* text) {
    char* end = nullptr;
    const long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 0) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<Options> parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

        if (arg == "--port" || arg == "--output" || arg == "--prefs") {
            const char* value = next();
            if (!value) {
                std::cerr << arg << " needs a value\n";
                return std::nullopt;
            }
            (arg == "--port" ? opts.port : arg == "--output" ? opts.output : opts.prefsPath) = value;
        } else if (arg == "--settle-ms" || arg == "--timeout-ms") {
            const char* value = next();
            std::optional<int> parsed;
            if (value) {
                parsed = parseCount(value);
            }
            if (!parsed) {
                std::cerr << arg << " needs a non-negative number\n";
                return std::nullopt;
            }
            (arg == "--settle-ms" ? opts.settleMs : opts.timeoutMs) = *parsed;
        } else if (arg == "--legacy-bitmap") {
            opts.legacyBitmap = true;
        } else if (arg == "--no-black-mark") {
            opts.noBlackMark = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (opts.document.empty()) {
            opts.document = arg;
        } else {
            std::cerr << "unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    if (opts.document.empty()) {
        return std::nullopt;
    }
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    const auto parsed = parseArgs(argc, argv);
    if (!parsed) {
        printUsage();
        return 2;
    }
    const Options& opts = *parsed;

    auto prefs = config::PrinterPreferences::load(opts.prefsPath);
    if (!prefs) {
        logError("[thermo-print] cannot load ", opts.prefsPath, ": ", prefs.error().message(), "\n");
        return 1;
    }

    std::optional<io::TimeoutConfig::ScopedOverride> timeoutOverride;
    if (opts.timeoutMs) {
        timeoutOverride.emplace(std::chrono::milliseconds(*opts.timeoutMs));
    }

    auto caps = transport::TransportCapabilities::full();
    if (opts.legacyBitmap) {
        caps.bitmap = transport::BitmapSignature::Legacy;
    }
    if (opts.noBlackMark) {
        caps.blackMarkSensing = false;
    }

    const bool spool = !opts.output.empty();
    std::string printerId = spool ? opts.output : (!opts.port.empty() ? opts.port : prefs->printerMac);

    // The I/O thread must outlive the service so queued status handlers still run.
    io::IoService& ioService = io::ensureIoService();

    job::PrintServiceConfig serviceConfig;
    if (opts.settleMs) {
        serviceConfig.orchestrator.settleDelay = std::chrono::milliseconds(*opts.settleMs);
    }
    serviceConfig.rendererFactory = [](const std::string& path) {
        return document::NetpbmDocument::open(path);
    };
    serviceConfig.transportFactory = [spool, caps]() -> std::unique_ptr<transport::Transport> {
        if (spool) {
            return std::make_unique<transport::FileTransport>(caps);
        }
        transport::SerialOptions serial;
        serial.writeTimeout = io::TimeoutConfig::defaultTimeout();
        serial.capabilities = caps;
        return std::make_unique<transport::SerialTransport>(serial);
    };

    std::promise<job::JobStatus> terminal;
    auto done = terminal.get_future();

    job::PrintService service(
        std::move(serviceConfig),
        [&terminal](const job::JobStatus& status) {
            switch (status.kind) {
                case job::JobStatusKind::PageProgress:
                    std::cout << "page " << status.page << "/" << status.pageCount << " sent\n";
                    break;
                case job::JobStatusKind::Started:
                    std::cout << "printing...\n";
                    break;
                default:
                    terminal.set_value(status);
                    break;
            }
        },
        ioService.executor());
    service.start();

    std::shared_ptr<document::DocumentSource> source;
    if (opts.document == "-") {
        source = std::make_shared<document::StreamDocumentSource>(std::cin, "stdin");
    } else {
        source = std::make_shared<document::FileDocumentSource>(opts.document);
    }

    job::JobRequest request;
    request.printerId = printerId;
    request.printerName = prefs->printerName;
    request.document = std::move(source);
    request.settings = prefs->toPrintSettings();

    auto submitted = service.submit(std::move(request));
    if (!submitted) {
        logError("[thermo-print] ", submitted.error().message, "\n");
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    bool cancelSent = false;
    while (done.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted.load() && !cancelSent) {
            logInfo("[thermo-print] cancelling after the current page\n");
            service.cancel(*submitted);
            cancelSent = true;
        }
    }

    const job::JobStatus status = done.get();
    service.stop();

    switch (status.kind) {
        case job::JobStatusKind::Completed:
            std::cout << "done\n";
            return 0;
        case job::JobStatusKind::Cancelled:
            std::cout << "cancelled\n";
            return 130;
        default:
            std::cerr << "failed: " << status.message << "\n";
            return 1;
    }
}
