// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketPair.hxx"
#include "SocketError.hxx"

#include <sys/socket.h>

std::pair<UniqueSocketDescriptor, UniqueSocketDescriptor>
CreateSocketPairNonBlock(int type)
{
	int sv[2];
	if (socketpair(AF_LOCAL, type | SOCK_CLOEXEC | SOCK_NONBLOCK, 0, sv))
		throw MakeSocketError("socketpair() failed");

	return {
		UniqueSocketDescriptor{AdoptTag{}, sv[0]},
		UniqueSocketDescriptor{AdoptTag{}, sv[1]},
	};
}
