#pragma once
#include "rotbridge/net/NetConfig.hpp"
#include <string>

namespace rotbridge::net {

/**
 * resolve
 *
 * Simple synchronous DNS lookup helper. Given `host` and `service` (e.g.
 * "rotator.local" and "6555") it returns a list of endpoints. Numeric hosts
 * resolve without touching DNS. Used with the TcpClient connect overload
 * that accepts resolver results.
 */
inline rotbridge::net::error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    tcp::resolver::results_type& out)
{
    rotbridge::net::error_code ec;
    tcp::resolver r(io);
    out = r.resolve(host, service, ec);
    return ec;
}

} // namespace rotbridge::net
