// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "BackendEvents.hxx"
#include "net/SocketDescriptor.hxx"
#include "util/BindMethod.hxx"

#include <boost/intrusive/list_hook.hpp>

class EventLoop;

/**
 * Registers interest in readiness of a socket with the #EventLoop.
 * The callback is invoked (level-triggered) for as long as one of
 * the scheduled events is ready.
 *
 * The socket is not owned by this class, unless Close() is used.
 */
class SocketEvent final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>,
	  public EventPollBackendEvents
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void(unsigned events) noexcept>;
	const Callback callback;

	SocketDescriptor fd;

	/**
	 * The events registered with epoll_ctl().
	 */
	unsigned scheduled_flags = 0;

	/**
	 * The events reported by epoll_wait(), to be passed to the
	 * callback by Dispatch().
	 */
	unsigned ready_flags = 0;

public:
	/**
	 * epoll_wait() reports these even if they were not
	 * requested.
	 */
	static constexpr unsigned IMPLICIT_FLAGS = ERROR|HANGUP;

	SocketEvent(EventLoop &_loop, Callback _callback,
		    SocketDescriptor _fd=SocketDescriptor::Undefined()) noexcept
		:loop(_loop), callback(_callback), fd(_fd) {}

	~SocketEvent() noexcept {
		Cancel();
	}

	SocketEvent(const SocketEvent &) = delete;
	SocketEvent &operator=(const SocketEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	bool IsDefined() const noexcept {
		return fd.IsDefined();
	}

	SocketDescriptor GetSocket() const noexcept {
		return fd;
	}

	/**
	 * Assign a socket.  There must not be one already.
	 */
	void Open(SocketDescriptor _fd) noexcept;

	/**
	 * Unregister and close the socket.
	 */
	void Close() noexcept;

	/**
	 * Replace the set of events this object is interested in;
	 * zero unregisters it.
	 *
	 * @return true on success, false on error (with errno set)
	 */
	bool Schedule(unsigned flags) noexcept;

	void Cancel() noexcept {
		Schedule(0);
	}

	bool ScheduleRead() noexcept {
		return Schedule(scheduled_flags | READ);
	}

	bool IsReadPending() const noexcept {
		return scheduled_flags & READ;
	}

private:
	void Dispatch() noexcept;
};
