// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ScmRightsMessage.hxx"

#include <string.h>

ScmRightsMessage
ScmRightsMessage::ForSend(FileDescriptor fd) noexcept
{
	ScmRightsMessage m;
	memset(m.control, 0, sizeof(m.control));
	m.payload = PAYLOAD;

	auto *cmsg = reinterpret_cast<struct cmsghdr *>(m.control);
	cmsg->cmsg_level = SOL_SOCKET;
	cmsg->cmsg_type = SCM_RIGHTS;
	cmsg->cmsg_len = EncodedSize();

	const int value = fd.Get();
	memcpy(CMSG_DATA(cmsg), &value, sizeof(value));

	return m;
}

ScmRightsMessage
ScmRightsMessage::ForReceive() noexcept
{
	ScmRightsMessage m;
	memset(m.control, 0, sizeof(m.control));
	m.payload = std::byte{};
	return m;
}

struct msghdr
ScmRightsMessage::MakeHeader() noexcept
{
	iov.iov_base = &payload;
	iov.iov_len = sizeof(payload);

	struct msghdr msg{};
	msg.msg_iov = &iov;
	msg.msg_iovlen = 1;
	msg.msg_control = control;
	msg.msg_controllen = CMSG_SPACE(sizeof(int));
	return msg;
}

UniqueFileDescriptor
ScmRightsMessage::Decode(const struct msghdr &_msg, ssize_t nbytes) noexcept
{
	/* CMSG_NXTHDR() wants a non-const pointer, but does not
	   modify anything */
	auto &msg = const_cast<struct msghdr &>(_msg);

	bool valid = nbytes > 0 && (msg.msg_flags & MSG_CTRUNC) == 0;
	UniqueFileDescriptor result;

	for (struct cmsghdr *cmsg = CMSG_FIRSTHDR(&msg); cmsg != nullptr;
	     cmsg = CMSG_NXTHDR(&msg, cmsg)) {
		if (cmsg->cmsg_level != SOL_SOCKET ||
		    cmsg->cmsg_type != SCM_RIGHTS ||
		    cmsg->cmsg_len < CMSG_LEN(0)) {
			valid = false;
			continue;
		}

		if (cmsg->cmsg_len != EncodedSize())
			valid = false;

		/* adopt every descriptor in this control message, so
		   none of them leaks if the envelope is rejected */
		const std::size_t n = (cmsg->cmsg_len - CMSG_LEN(0)) / sizeof(int);
		const auto *data = CMSG_DATA(cmsg);
		for (std::size_t i = 0; i < n; ++i) {
			int value;
			memcpy(&value, data + i * sizeof(value), sizeof(value));

			UniqueFileDescriptor fd{AdoptTag{}, value};
			if (result.IsDefined())
				valid = false;
			else
				result = std::move(fd);
		}
	}

	if (!valid)
		return {};

	return result;
}
