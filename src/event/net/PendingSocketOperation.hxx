// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/SocketEvent.hxx"
#include "event/TimerEvent.hxx"
#include "time/ExponentialBackoff.hxx"

#include <boost/intrusive/list_hook.hpp>

#include <exception>
#include <string_view>

class LLogger;

/**
 * An operation on a non-blocking socket which could not complete
 * immediately and waits for the socket to become ready.  Each time
 * the socket reports readiness, TryOperation() is invoked again,
 * until it succeeds, fails or the deadline expires.  After that,
 * exactly one of the terminal methods is called and the object
 * deletes itself.
 *
 * The operation works on a duplicate of the socket, which allows
 * several operations (e.g. one send and one receive) to be pending
 * on the same socket at the same time.
 *
 * The owner keeps instances in an intrusive list; destroying the
 * owner calls Dispose() on all of them, which frees all resources
 * without invoking any terminal method.
 */
class PendingSocketOperation
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	const LLogger &logger;

	/**
	 * A short description of the operation, used in log
	 * messages.
	 */
	const std::string_view name;

	SocketEvent socket_event;

	/**
	 * Expires at the absolute deadline passed to Start().
	 */
	TimerEvent timeout_event;

	/**
	 * Used instead of #socket_event while the kernel keeps
	 * reporting readiness but the operation still blocks.
	 */
	TimerEvent retry_event;

	ExponentialBackoff backoff{ExponentialBackoffConfig{
		std::chrono::milliseconds{1},
		std::chrono::milliseconds{100},
	}};

	/**
	 * The #SocketEvent flags being waited for.
	 */
	unsigned direction = 0;

public:
	PendingSocketOperation(EventLoop &event_loop, const LLogger &_logger,
			       std::string_view _name) noexcept;

	virtual ~PendingSocketOperation() noexcept;

	PendingSocketOperation(const PendingSocketOperation &) = delete;
	PendingSocketOperation &operator=(const PendingSocketOperation &) = delete;

	auto &GetEventLoop() const noexcept {
		return socket_event.GetEventLoop();
	}

	/**
	 * Begin waiting.  Throws on error; in that case, the caller
	 * still owns this object.
	 *
	 * @param s the socket; it is duplicated, and the caller keeps
	 * ownership of the original
	 * @param _direction SocketEvent::READ or SocketEvent::WRITE
	 * @param timeout the maximum duration to wait; a negative value
	 * means no timeout
	 */
	void Start(SocketDescriptor s, unsigned _direction,
		   Event::Duration timeout);

	/**
	 * Destroy this object without invoking a terminal method.
	 */
	void Dispose() noexcept {
		delete this;
	}

protected:
	/**
	 * The duplicate socket which shall be used by
	 * TryOperation().
	 */
	SocketDescriptor GetSocket() const noexcept {
		return socket_event.GetSocket();
	}

	/**
	 * Attempt the operation.  Throws on error.
	 *
	 * @return true if the operation is complete, false if it
	 * would block
	 */
	virtual bool TryOperation() = 0;

	virtual void OnOperationDone() noexcept = 0;
	virtual void OnOperationTimeout() noexcept = 0;
	virtual void OnOperationError(std::exception_ptr error) noexcept = 0;

private:
	/**
	 * Release the socket, cancel all events and detach from the
	 * owner's list.
	 */
	void Finish() noexcept;

	void Done() noexcept;
	void Fail(std::exception_ptr error) noexcept;

	void OnSocketReady(unsigned events) noexcept;
	void OnTimeout() noexcept;
	void OnRetry() noexcept;
};
