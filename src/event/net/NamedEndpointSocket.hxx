// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "PendingSocketOperation.hxx"
#include "event/Chrono.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/Logger.hxx"

#include <boost/intrusive/list.hpp>

#include <functional>
#include <memory>

class EventLoop;
class LocalSocketAddress;
struct NamedEndpointConfig;

/**
 * A connection-oriented local (AF_LOCAL) stream socket which can be
 * bound to a path, connected to a path, and which can pass one file
 * descriptor per call to its peer (SCM_RIGHTS).
 *
 * All operations are attempted immediately.  If the socket is not
 * ready, the operation is suspended until the #EventLoop reports
 * readiness or the timeout expires; either way, the callback is
 * invoked exactly once.  Synchronous errors are thrown; errors
 * which occur after the operation was suspended are logged and
 * reported to the callback as failure.
 *
 * Destroying this object (or calling Close()) cancels all pending
 * operations without invoking their callbacks.
 */
class NamedEndpointSocket {
	EventLoop &event_loop;

	const LLogger logger{"named_endpoint"};

	UniqueSocketDescriptor socket;

	using OperationList =
		boost::intrusive::list<PendingSocketOperation,
				       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
				       boost::intrusive::constant_time_size<false>>;

	/**
	 * Operations which are waiting for the socket to become
	 * ready.  They delete themselves when they finish.
	 */
	OperationList operations;

	class AcceptOperation;
	class ConnectOperation;
	class SendOperation;
	class ReceiveOperation;

public:
	/**
	 * @param peer the accepted connection, or nullptr on timeout
	 * or error
	 */
	using AcceptCallback = std::function<void(std::unique_ptr<NamedEndpointSocket> peer)>;

	/**
	 * @param endpoint the connected endpoint (i.e. the object
	 * Connect() was called on), or nullptr on timeout or error
	 */
	using ConnectCallback = std::function<void(NamedEndpointSocket *endpoint)>;

	using SendCallback = std::function<void(bool success)>;

	/**
	 * @param fd the received descriptor; undefined if the peer
	 * has closed the connection, if the message did not contain
	 * exactly one descriptor, on timeout or on error
	 */
	using ReceiveCallback = std::function<void(UniqueFileDescriptor fd)>;

	using ReceiveSocketCallback = std::function<void(UniqueSocketDescriptor s)>;
	using ReceiveEndpointCallback = std::function<void(std::unique_ptr<NamedEndpointSocket> endpoint)>;

	explicit NamedEndpointSocket(EventLoop &_event_loop) noexcept;

	/**
	 * Adopt an existing socket (e.g. one that was accepted or
	 * received from a peer) and switch it to non-blocking mode.
	 */
	NamedEndpointSocket(EventLoop &_event_loop,
			    UniqueSocketDescriptor _socket) noexcept;

	~NamedEndpointSocket() noexcept;

	NamedEndpointSocket(const NamedEndpointSocket &) = delete;
	NamedEndpointSocket &operator=(const NamedEndpointSocket &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	bool IsDefined() const noexcept {
		return socket.IsDefined();
	}

	SocketDescriptor GetSocket() const noexcept {
		return socket;
	}

	/**
	 * Does this object have operations which wait for the socket
	 * to become ready?
	 */
	bool HasPendingOperations() const noexcept {
		return !operations.empty();
	}

	/**
	 * Cancel all pending operations (without invoking their
	 * callbacks) and close the socket.
	 */
	void Close() noexcept;

	/**
	 * Create a new non-blocking AF_LOCAL stream socket, replacing
	 * (and closing) the current one.
	 *
	 * Throws on error.
	 */
	void InitSocket();

	/**
	 * Create a new socket and bind it to the given address.
	 *
	 * Throws on error.
	 */
	void Bind(const LocalSocketAddress &address);

	/**
	 * Create a new socket, bind it and (if configured) listen.
	 * A stale socket file is deleted first if the configuration
	 * says so.
	 *
	 * Throws on error.
	 */
	void Bind(const NamedEndpointConfig &config);

	/**
	 * Throws on error.
	 */
	void Listen(int backlog);

	/**
	 * Accept one connection on a listening socket.
	 *
	 * Throws on synchronous error.
	 *
	 * @param timeout the maximum duration to wait; negative means
	 * wait forever
	 */
	void Accept(Event::Duration timeout, AcceptCallback callback);

	/**
	 * Create a new socket and connect it to the given address.
	 * If the connection is established immediately, the callback
	 * is invoked before this method returns.  On timeout or
	 * error, the socket is closed.
	 *
	 * Throws on synchronous error (e.g. if there is no socket at
	 * the given path); the socket is closed in that case.
	 */
	void Connect(const LocalSocketAddress &address,
		     Event::Duration timeout, ConnectCallback callback);

	/**
	 * Send a file descriptor to the peer.  The caller keeps its
	 * own copy of the descriptor and may close it right after
	 * this method returns.
	 *
	 * Throws on synchronous error.
	 */
	void SendDescriptor(FileDescriptor fd, SendCallback callback,
			    Event::Duration timeout=Event::NO_TIMEOUT);

	/**
	 * Receive a file descriptor from the peer.
	 *
	 * Throws on synchronous error.
	 */
	void ReceiveDescriptor(ReceiveCallback callback,
			       Event::Duration timeout=Event::NO_TIMEOUT);

	void SendFile(FileDescriptor fd, SendCallback callback,
		      Event::Duration timeout=Event::NO_TIMEOUT) {
		SendDescriptor(fd, std::move(callback), timeout);
	}

	void SendSocket(SocketDescriptor s, SendCallback callback,
			Event::Duration timeout=Event::NO_TIMEOUT) {
		SendDescriptor(s.ToFileDescriptor(), std::move(callback),
			       timeout);
	}

	/**
	 * Send the socket of another endpoint to the peer.
	 */
	void SendEndpoint(const NamedEndpointSocket &other,
			  SendCallback callback,
			  Event::Duration timeout=Event::NO_TIMEOUT) {
		SendSocket(other.GetSocket(), std::move(callback), timeout);
	}

	void ReceiveFile(ReceiveCallback callback,
			 Event::Duration timeout=Event::NO_TIMEOUT) {
		ReceiveDescriptor(std::move(callback), timeout);
	}

	void ReceiveSocket(ReceiveSocketCallback callback,
			   Event::Duration timeout=Event::NO_TIMEOUT);

	/**
	 * Receive a socket and wrap it in a new #NamedEndpointSocket
	 * on the same #EventLoop.
	 */
	void ReceiveEndpoint(ReceiveEndpointCallback callback,
			     Event::Duration timeout=Event::NO_TIMEOUT);

private:
	/**
	 * Create a #PendingSocketOperation of the given type, start
	 * it and register it in #operations.
	 */
	template<typename T, typename... Args>
	void Suspend(unsigned direction, Event::Duration timeout,
		     Args&&... args);
};
