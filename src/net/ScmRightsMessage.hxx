// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <cstddef>

#include <sys/socket.h>
#include <sys/uio.h>

/**
 * A message carrying exactly one file descriptor in a SCM_RIGHTS
 * control message, accompanied by one dummy payload byte.  The
 * payload byte is necessary because some kernels (the BSD family)
 * drop ancillary data attached to an empty payload.
 *
 * A #msghdr returned by MakeHeader() points into this object; it
 * must not be used after the object has been moved or destroyed.
 */
class ScmRightsMessage {
	static constexpr std::size_t CONTROL_SIZE = CMSG_SPACE(sizeof(int));
	static constexpr std::size_t CONTROL_N_LONGS =
		(CONTROL_SIZE + sizeof(long) - 1) / sizeof(long);

	/* long for alignment of the cmsghdr */
	long control[CONTROL_N_LONGS];

	std::byte payload;

	struct iovec iov;

	ScmRightsMessage() noexcept = default;

public:
	/**
	 * The dummy payload byte which accompanies the descriptor.
	 */
	static constexpr std::byte PAYLOAD{0x21};

	/**
	 * Build the envelope for sending the given descriptor.  The
	 * caller keeps ownership of it; the kernel duplicates it
	 * during the transfer.
	 */
	static ScmRightsMessage ForSend(FileDescriptor fd) noexcept;

	/**
	 * Build an empty buffer for recvmsg().
	 */
	static ScmRightsMessage ForReceive() noexcept;

	/**
	 * The number of control bytes used by the envelope.  Sender
	 * and receiver agree on this value.
	 */
	static constexpr std::size_t EncodedSize() noexcept {
		return CMSG_LEN(sizeof(int));
	}

	/**
	 * Construct a #msghdr pointing into this object, suitable for
	 * sendmsg() and recvmsg().
	 */
	struct msghdr MakeHeader() noexcept;

	/**
	 * Extract the descriptor from a message filled by recvmsg().
	 * Returns an undefined descriptor if the peer has closed the
	 * connection or if the envelope is missing or malformed; in
	 * the latter case, all descriptors which came with it are
	 * closed.
	 *
	 * @param msg the header passed to recvmsg()
	 * @param nbytes the return value of recvmsg()
	 */
	static UniqueFileDescriptor Decode(const struct msghdr &msg,
					   ssize_t nbytes) noexcept;
};
