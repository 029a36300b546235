#include "thermo/core/JobError.hpp"
#include "thermo/io/TimeoutConfig.hpp"
#include "thermo/transport/FileTransport.hpp"
#include "thermo/transport/SerialTransport.hpp"

#include "support/TestMacros.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <unistd.h>

using namespace thermo;

static std::string readAvailable(int fd, std::size_t want) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    char buf[256];
    while (out.size() < want && std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, 50) <= 0) continue;
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

static void testSerialOverPty() {
    const int master = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (master < 0) {
        logInfo("no pseudo terminals here, skipping serial round trip\n");
        return;
    }
    ASSERT_TRUE(::grantpt(master) == 0 && ::unlockpt(master) == 0, "pty unlocked");
    const char* slave = ::ptsname(master);
    ASSERT_TRUE(slave != nullptr, "pty slave name");
    if (!slave) {
        ::close(master);
        return;
    }

    transport::SerialOptions options;
    options.writeTimeout = std::chrono::milliseconds(2000);
    transport::SerialTransport serial(options);
    ASSERT_TRUE(!serial.isOpen(), "starts closed");

    auto opened = serial.open(slave);
    ASSERT_TRUE(opened.has_value(), "pty slave opens as a serial port");
    ASSERT_TRUE(serial.isOpen(), "open after open()");

    // Raw mode: CR LF and high bytes must pass through untouched.
    std::string program = "CLS\r\nBITMAP 0,0,1,1,0,";
    program.push_back('\x7f');
    program += "\r\nPRINT 1\r\n";
    auto written = serial.write(reinterpret_cast<const std::uint8_t*>(program.data()), program.size());
    ASSERT_TRUE(written.has_value(), "write succeeds");
    ASSERT_EQ(readAvailable(master, program.size()), program, "bytes arrive unchanged");

    serial.close();
    serial.close();
    ASSERT_TRUE(!serial.isOpen(), "close is idempotent");

    auto afterClose = serial.write(reinterpret_cast<const std::uint8_t*>("X"), 1);
    ASSERT_TRUE(!afterClose.has_value(), "write on a closed port fails");
    ::close(master);
}

static void testSerialOpenFailure() {
    transport::SerialTransport serial;
    auto opened = serial.open("/dev/thermo-no-such-printer");
    ASSERT_TRUE(!opened.has_value(), "missing device fails");
    ASSERT_TRUE(!serial.isOpen(), "still closed");

    const auto err = JobError::fromErrorCode(ErrorKind::Transport,
                                             "Cannot connect to printer: /dev/thermo-no-such-printer",
                                             opened.error());
    ASSERT_TRUE(err.message.find("/dev/thermo-no-such-printer (") != std::string::npos,
                "reason carries device and cause");
    ASSERT_EQ(err.describe().rfind("transport: ", 0), std::size_t{0}, "describe prefixes the kind");
}

static void testTimeoutOverride() {
    const auto before = io::TimeoutConfig::defaultTimeout();
    {
        io::TimeoutConfig::ScopedOverride scoped(std::chrono::milliseconds(1234));
        transport::SerialOptions options;
        ASSERT_EQ(options.writeTimeout.count(), 1234, "options pick up the override");
    }
    ASSERT_EQ(io::TimeoutConfig::defaultTimeout().count(), before.count(), "override restored");
    ASSERT_EQ(io::TimeoutConfig::sanitize(std::chrono::milliseconds(-5)).count(), 0, "negative clamps to zero");
}

static void testFileTransport() {
    const auto path = std::filesystem::temp_directory_path() / "thermo-test-spool.prn";
    transport::FileTransport spool;
    ASSERT_TRUE(!spool.write(reinterpret_cast<const std::uint8_t*>("X"), 1).has_value(), "closed spool rejects");
    ASSERT_TRUE(spool.open(path.string()).has_value(), "spool opens");

    const std::string first = "SIZE 78 mm,10 mm\r\n";
    const std::string second = "PRINT 1\r\n";
    ASSERT_TRUE(spool.write(reinterpret_cast<const std::uint8_t*>(first.data()), first.size()).has_value(), "first write");
    ASSERT_TRUE(spool.write(reinterpret_cast<const std::uint8_t*>(second.data()), second.size()).has_value(), "second write");
    spool.close();
    spool.close();

    std::ifstream in(path, std::ios::binary);
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_EQ(content, first + second, "spool holds both streams in order");
    in.close();
    std::filesystem::remove(path);

    ASSERT_TRUE(!spool.open("/nonexistent-dir/spool.prn").has_value(), "bad spool path fails");
}

static void testCapabilities() {
    const auto caps = transport::TransportCapabilities::full();
    ASSERT_TRUE(caps.supportsSpeed(1) && caps.supportsSpeed(5), "speeds 1-5");
    ASSERT_TRUE(!caps.supportsSpeed(6), "speed 6 unsupported");
    ASSERT_TRUE(caps.supportsDensity(1) && caps.supportsDensity(15), "densities 1-15");
    ASSERT_TRUE(!caps.supportsDensity(16), "density 16 unsupported");
    ASSERT_TRUE(caps.blackMarkSensing, "black mark sensing");
    ASSERT_TRUE(caps.bitmap == transport::BitmapSignature::Extended, "extended bitmap");
}

int main() {
    testSerialOverPty();
    testSerialOpenFailure();
    testTimeoutOverride();
    testFileTransport();
    testCapabilities();
    return testing::report("Transport");
}
