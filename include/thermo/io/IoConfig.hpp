#pragma once

#include <asio.hpp>
#include <system_error>   // std::error_code

namespace thermo::io {

/**
 * @brief Centralises Asio aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `thermo::io::asio` as the standalone Asio namespace.
 * - `thermo::io::serial_port` for printer links.
 */
namespace asio = ::asio;

using serial_port = asio::serial_port;
using error_code = std::error_code;

} // namespace thermo::io
