// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PendingSocketOperation.hxx"
#include "system/Error.hxx"
#include "io/Logger.hxx"

#include <cassert>

PendingSocketOperation::PendingSocketOperation(EventLoop &event_loop,
					       const LLogger &_logger,
					       std::string_view _name) noexcept
	:logger(_logger), name(_name),
	 socket_event(event_loop, BIND_THIS_METHOD(OnSocketReady)),
	 timeout_event(event_loop, BIND_THIS_METHOD(OnTimeout)),
	 retry_event(event_loop, BIND_THIS_METHOD(OnRetry)) {}

PendingSocketOperation::~PendingSocketOperation() noexcept
{
	socket_event.Close();
}

void
PendingSocketOperation::Start(SocketDescriptor s, unsigned _direction,
			      Event::Duration timeout)
{
	assert(!socket_event.IsDefined());
	assert(_direction == SocketEvent::READ ||
	       _direction == SocketEvent::WRITE);

	const auto dup = s.ToFileDescriptor().DuplicateCloseOnExec();
	if (!dup.IsDefined())
		throw MakeErrno("Failed to duplicate socket");

	socket_event.Open(SocketDescriptor::FromFileDescriptor(dup));

	direction = _direction;
	if (!socket_event.Schedule(direction))
		throw MakeErrno("Failed to register socket");

	if (timeout >= Event::Duration::zero())
		timeout_event.Schedule(timeout);

	logger(4, "suspending ", name);
}

inline void
PendingSocketOperation::Finish() noexcept
{
	socket_event.Close();
	timeout_event.Cancel();
	retry_event.Cancel();

	/* the terminal method may destroy the owner, which must not
	   dispose this object again */
	unlink();
}

inline void
PendingSocketOperation::Done() noexcept
{
	Finish();
	OnOperationDone();
	delete this;
}

inline void
PendingSocketOperation::Fail(std::exception_ptr error) noexcept
{
	logger(2, name, " failed: ", error);

	Finish();
	OnOperationError(std::move(error));
	delete this;
}

void
PendingSocketOperation::OnSocketReady(unsigned events) noexcept
{
	logger(4, "resuming ", name);

	try {
		if (TryOperation()) {
			Done();
			return;
		}
	} catch (...) {
		Fail(std::current_exception());
		return;
	}

	if (events & (SocketEvent::ERROR|SocketEvent::HANGUP)) {
		/* the kernel will keep reporting this condition, and
		   polling again would spin; retry after a delay */
		socket_event.Cancel();
		retry_event.Schedule(backoff.Next());
	} else
		backoff.Reset();

	logger(4, "suspending ", name);
}

void
PendingSocketOperation::OnTimeout() noexcept
{
	logger(2, name, " timed out");

	Finish();
	OnOperationTimeout();
	delete this;
}

void
PendingSocketOperation::OnRetry() noexcept
{
	if (!socket_event.Schedule(direction))
		Fail(std::make_exception_ptr(MakeErrno("Failed to register socket")));
}
