#pragma once

#include <asio.hpp>       // standalone Asio
#include <system_error>   // std::error_code

namespace rotbridge::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `rotbridge::net::asio` as the standalone Asio namespace.
 * - `rotbridge::net::tcp` as the protocol alias.
 * - `rotbridge::net::error_code` for helpers that report plain error codes.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;
} // namespace rotbridge::net
