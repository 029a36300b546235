#include "thermo/transport/SerialTransport.hpp"

#include "thermo/io/Deadline.hpp"
#include "thermo/log/Log.hpp"

namespace thermo::transport {

namespace asio = io::asio;

namespace {
const log::Channel LOG{"SerialTransport"};
}

SerialTransport::SerialTransport(SerialOptions options)
: options_(std::move(options))
, io_(io::shared_io_context())
, strand_(asio::make_strand(*io_))
, port_(strand_) {}

SerialTransport::~SerialTransport() {
    close();
}

expected<void> SerialTransport::open(const std::string& devicePath) {
    close();

    std::error_code ec;
    port_ = io::serial_port(strand_);
    port_.open(devicePath, ec);
    if (ec) {
        LOG.error("open ", devicePath, " failed: ", ec.message());
        return unexpected(ec);
    }

    if (ec = configurePort(); ec) {
        LOG.error("configure ", devicePath, " failed: ", ec.message());
        port_.close(ec);
        return unexpected(ec);
    }

    devicePath_ = devicePath;
    LOG.info("opened ", devicePath, " at ", options_.baudRate, " baud, write timeout ",
             options_.writeTimeout.count(), "ms");
    return {};
}

std::error_code SerialTransport::configurePort() {
    std::error_code ec;
    port_.set_option(io::serial_port::baud_rate(options_.baudRate), ec);
    if (ec) return ec;
    port_.set_option(io::serial_port::character_size(8), ec);
    if (ec) return ec;
    port_.set_option(io::serial_port::parity(io::serial_port::parity::none), ec);
    if (ec) return ec;
    port_.set_option(io::serial_port::stop_bits(io::serial_port::stop_bits::one), ec);
    if (ec) return ec;
    port_.set_option(io::serial_port::flow_control(io::serial_port::flow_control::none), ec);
    return ec;
}

expected<void> SerialTransport::write(const std::uint8_t* data, std::size_t size) {
    if (!port_.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }
    if (size == 0) {
        return {};
    }

    auto ec = io::with_deadline(port_.get_executor(), options_.writeTimeout,
        [&](auto completion){
            asio::async_write(port_, asio::buffer(data, size),
                [completion](const std::error_code& op_ec, std::size_t){
                    completion(op_ec);
                });
        },
        [&]{ std::error_code ignored; port_.cancel(ignored); }
    );

    if (ec) {
        LOG.error("write of ", size, " bytes to ", devicePath_, " failed: ", ec.message());
        return unexpected(ec);
    }
    return {};
}

void SerialTransport::close() {
    if (!port_.is_open()) {
        return;
    }
    std::error_code ec;
    // Pattern: cancel pending writes, then close.
    port_.cancel(ec);
    port_.close(ec);
    LOG.info("closed ", devicePath_);
    devicePath_.clear();
}

} // namespace thermo::transport
