#include "thermo/transport/FileTransport.hpp"

#include "thermo/log/Log.hpp"

#include <system_error>

namespace thermo::transport {

namespace {
const log::Channel LOG{"FileTransport"};
}

FileTransport::FileTransport(TransportCapabilities caps)
: caps(std::move(caps)) {}

FileTransport::~FileTransport() {
    close();
}

expected<void> FileTransport::open(const std::string& target) {
    close();
    out.open(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG.error("cannot open ", target);
        return unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    path = target;
    LOG.info("writing to ", path);
    return {};
}

expected<void> FileTransport::write(const std::uint8_t* data, std::size_t size) {
    if (!out.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
        LOG.error("write of ", size, " bytes to ", path, " failed");
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

void FileTransport::close() {
    if (!out.is_open()) {
        return;
    }
    out.close();
    LOG.info("closed ", path);
    path.clear();
}

} // namespace thermo::transport
