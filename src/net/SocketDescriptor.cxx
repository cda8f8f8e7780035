// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketDescriptor.hxx"
#include "SocketAddress.hxx"

#include <errno.h>
#include <sys/socket.h>

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
#ifdef SOCK_CLOEXEC
	/* implemented since Linux 2.6.27 */
	type |= SOCK_CLOEXEC;
#endif

	int new_fd = socket(domain, type, protocol);
	if (new_fd < 0)
		return false;

	Set(new_fd);

#ifndef SOCK_CLOEXEC
	EnableCloseOnExec();
#endif

	return true;
}

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
#ifdef SOCK_NONBLOCK
	type |= SOCK_NONBLOCK;
#endif

	if (!Create(domain, type, protocol))
		return false;

#ifndef SOCK_NONBLOCK
	SetNonBlocking();
#endif

	return true;
}

int
SocketDescriptor::GetError() const noexcept
{
	int s_err = 0;
	return GetOption(SOL_SOCKET, SO_ERROR,
			 &s_err, sizeof(s_err)) == sizeof(s_err)
		? s_err
		: errno;
}

std::size_t
SocketDescriptor::GetOption(int level, int name,
			    void *value, std::size_t size) const noexcept
{
	socklen_t size2 = size;
	return getsockopt(fd, level, name, value, &size2) == 0
		? size2
		: 0;
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	return setsockopt(fd, level, name, value, size) == 0;
}

bool
SocketDescriptor::SetSendBuffer(unsigned size) const noexcept
{
	return SetIntOption(SOL_SOCKET, SO_SNDBUF, size);
}

bool
SocketDescriptor::Bind(SocketAddress address) const noexcept
{
	return bind(fd, address.GetAddress(), address.GetSize()) == 0;
}

bool
SocketDescriptor::Listen(int backlog) const noexcept
{
	return listen(fd, backlog) == 0;
}

SocketDescriptor
SocketDescriptor::AcceptNonBlock() const noexcept
{
#ifdef __linux__
	int connection_fd = ::accept4(fd, nullptr, nullptr,
				      SOCK_CLOEXEC|SOCK_NONBLOCK);
#else
	int connection_fd = ::accept(fd, nullptr, nullptr);
	if (connection_fd >= 0) {
		SocketDescriptor result{connection_fd};
		result.EnableCloseOnExec();
		result.SetNonBlocking();
	}
#endif

	return SocketDescriptor(connection_fd);
}

bool
SocketDescriptor::Connect(SocketAddress address) const noexcept
{
	return ::connect(fd, address.GetAddress(), address.GetSize()) == 0;
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest, int flags) const noexcept
{
	flags |= MSG_DONTWAIT;
	return ::recv(Get(), dest.data(), dest.size(), flags);
}

ssize_t
SocketDescriptor::Send(std::span<const std::byte> src, int flags) const noexcept
{
#ifdef MSG_NOSIGNAL
	flags |= MSG_NOSIGNAL;
#endif

	return ::send(Get(), src.data(), src.size(), flags);
}

ssize_t
SocketDescriptor::Receive(struct msghdr &msg, int flags) const noexcept
{
	return ::recvmsg(Get(), &msg, flags);
}

ssize_t
SocketDescriptor::Send(const struct msghdr &msg, int flags) const noexcept
{
#ifdef MSG_NOSIGNAL
	flags |= MSG_NOSIGNAL;
#endif

	return ::sendmsg(Get(), &msg, flags);
}
