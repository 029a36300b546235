// Expected.hpp
// -----------------------------------------------------------------------------
// Central aliases for tl::expected / tl::unexpected so the rest of the codebase
// names the success/error pair consistently. Transport-level calls default to
// std::error_code; pipeline stages use thermo::JobError so a failure carries
// its kind and a human-readable reason up to the job status.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace thermo {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace thermo
