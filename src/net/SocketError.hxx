// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx" // IWYU pragma: export

#include <errno.h>

typedef int socket_error_t;

[[gnu::pure]]
static inline socket_error_t
GetSocketError() noexcept
{
	return errno;
}

/**
 * Does the error code returned by a non-blocking send()/sendmsg()
 * mean that the socket buffer is full and the call has to be
 * retried later?
 */
constexpr bool
IsSocketErrorSendWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

/**
 * Does the error code returned by a non-blocking recv()/recvmsg()
 * mean that there is no data yet?
 */
constexpr bool
IsSocketErrorReceiveWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

/**
 * Does the error code returned by a non-blocking connect() mean
 * that the connection has not yet completed?
 *
 * On Linux, connecting a local socket never returns EINPROGRESS;
 * instead, EAGAIN means that the listener's backlog is full.
 */
constexpr bool
IsSocketErrorConnectWouldBlock(socket_error_t code) noexcept
{
	return code == EINPROGRESS || code == EAGAIN ||
		code == EWOULDBLOCK || code == EALREADY;
}

constexpr bool
IsSocketErrorAcceptWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

static inline std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept
{
	return MakeErrno(code, msg);
}

static inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}
