#pragma once
#include "rotbridge/net/NetConfig.hpp"
#include <memory>

namespace rotbridge::net {

/**
 * @brief Process-wide `asio::io_context` driven by one background I/O thread.
 *
 * Every socket, acceptor, timer and signal handler in the bridge completes on
 * this one thread. Session threads issue an async operation, then block on a
 * condition variable (see `with_deadline`) until the I/O thread reports the
 * result, so there is never more than one thread touching a socket's state.
 *
 * The service starts on first use and is torn down at process exit (work
 * guard released, loop stopped, thread joined). Destroy sockets before that.
 */

/// Start the I/O thread now instead of on the first socket.
void ensureNetService();

/// Shared ownership of the loop, for objects that outlive a call.
std::shared_ptr<asio::io_context> shared_io_context();

asio::io_context& io_context();

/// True when called from the I/O thread (blocking helpers must not be).
bool onNetServiceThread();

} // namespace rotbridge::net
