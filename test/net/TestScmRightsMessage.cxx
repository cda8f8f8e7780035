// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "net/ScmRightsMessage.hxx"
#include "net/SocketPair.hxx"
#include "net/SocketError.hxx"
#include "system/Error.hxx"

#include <gtest/gtest.h>

#include <cstring>
#include <span>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <linux/kcmp.h>
#include <sys/syscall.h>
#endif

/**
 * Do both descriptors refer to the same open file description?
 */
[[gnu::pure]]
static bool
IsSame(FileDescriptor a, FileDescriptor b) noexcept
{
#ifdef __linux__
	const pid_t pid = getpid();
	if (const long result = syscall(__NR_kcmp, pid, pid, KCMP_FILE,
					a.Get(), b.Get());
	    result >= 0)
		return result == 0;
#endif

	struct stat sa, sb;
	return fstat(a.Get(), &sa) == 0 && fstat(b.Get(), &sb) == 0 &&
		sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}

static std::pair<UniqueFileDescriptor, UniqueFileDescriptor>
CreatePipe()
{
	int fds[2];
	if (pipe2(fds, O_CLOEXEC|O_NONBLOCK) < 0)
		throw MakeErrno("pipe2() failed");

	return {
		UniqueFileDescriptor{AdoptTag{}, fds[0]},
		UniqueFileDescriptor{AdoptTag{}, fds[1]},
	};
}

/**
 * Have all write ends of the pipe been closed?
 */
static bool
IsPipeClosed(FileDescriptor r) noexcept
{
	std::byte buffer[16];
	return r.Read(buffer) == 0;
}

static UniqueFileDescriptor
ReceiveOne(SocketDescriptor s)
{
	auto m = ScmRightsMessage::ForReceive();
	auto msg = m.MakeHeader();
	const auto nbytes = s.Receive(msg, MSG_CMSG_CLOEXEC);
	if (nbytes < 0)
		throw MakeSocketError("recvmsg() failed");

	return ScmRightsMessage::Decode(msg, nbytes);
}

/**
 * Send an arbitrary number of descriptors in one SCM_RIGHTS
 * message, bypassing #ScmRightsMessage.
 */
static void
SendRaw(SocketDescriptor s, std::span<const int> fds)
{
	alignas(struct cmsghdr) std::byte control[CMSG_SPACE(4 * sizeof(int))]{};
	ASSERT_LE(fds.size(), 4U);

	std::byte payload{0x21};
	struct iovec iov{&payload, sizeof(payload)};

	struct msghdr msg{};
	msg.msg_iov = &iov;
	msg.msg_iovlen = 1;

	if (!fds.empty()) {
		msg.msg_control = control;
		msg.msg_controllen = CMSG_SPACE(fds.size() * sizeof(int));

		struct cmsghdr *cmsg = CMSG_FIRSTHDR(&msg);
		cmsg->cmsg_level = SOL_SOCKET;
		cmsg->cmsg_type = SCM_RIGHTS;
		cmsg->cmsg_len = CMSG_LEN(fds.size() * sizeof(int));
		memcpy(CMSG_DATA(cmsg), fds.data(), fds.size() * sizeof(int));
	}

	ASSERT_EQ(s.Send(msg), 1);
}

TEST(ScmRightsMessage, SendLayout)
{
	auto m = ScmRightsMessage::ForSend(FileDescriptor{42});
	const auto msg = m.MakeHeader();

	ASSERT_EQ(msg.msg_iovlen, 1U);
	ASSERT_EQ(msg.msg_iov[0].iov_len, 1U);
	EXPECT_EQ(*(const std::byte *)msg.msg_iov[0].iov_base,
		  ScmRightsMessage::PAYLOAD);
	EXPECT_EQ(ScmRightsMessage::PAYLOAD, std::byte{'!'});

	EXPECT_EQ(msg.msg_controllen, CMSG_SPACE(sizeof(int)));
	EXPECT_EQ(ScmRightsMessage::EncodedSize(), CMSG_LEN(sizeof(int)));

	const struct cmsghdr *cmsg = CMSG_FIRSTHDR(&msg);
	ASSERT_NE(cmsg, nullptr);
	EXPECT_EQ(cmsg->cmsg_level, SOL_SOCKET);
	EXPECT_EQ(cmsg->cmsg_type, SCM_RIGHTS);
	EXPECT_EQ(cmsg->cmsg_len, ScmRightsMessage::EncodedSize());

	int fd;
	memcpy(&fd, CMSG_DATA(cmsg), sizeof(fd));
	EXPECT_EQ(fd, 42);
}

TEST(ScmRightsMessage, ReceiveLayout)
{
	auto m = ScmRightsMessage::ForReceive();
	const auto msg = m.MakeHeader();

	ASSERT_EQ(msg.msg_iovlen, 1U);
	EXPECT_EQ(msg.msg_iov[0].iov_len, 1U);
	EXPECT_EQ(msg.msg_controllen, CMSG_SPACE(sizeof(int)));
	EXPECT_EQ(msg.msg_name, nullptr);
}

TEST(ScmRightsMessage, Transfer)
{
	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	auto [r, w] = CreatePipe();

	auto m = ScmRightsMessage::ForSend(w);
	ASSERT_EQ(a.Send(m.MakeHeader()), 1);

	auto fd = ReceiveOne(b);
	ASSERT_TRUE(fd.IsDefined());
	EXPECT_NE(fd.Get(), w.Get());
	EXPECT_TRUE(IsSame(fd, w));
	EXPECT_FALSE(IsSame(fd, r));

	/* the received descriptor has close-on-exec */
	EXPECT_NE(fcntl(fd.Get(), F_GETFD) & FD_CLOEXEC, 0);

	/* nothing left */
	EXPECT_THROW(ReceiveOne(b), std::system_error);
}

TEST(ScmRightsMessage, PeerClosed)
{
	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	a.Close();

	auto fd = ReceiveOne(b);
	EXPECT_FALSE(fd.IsDefined());
}

TEST(ScmRightsMessage, NoDescriptor)
{
	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	SendRaw(a, {});

	auto fd = ReceiveOne(b);
	EXPECT_FALSE(fd.IsDefined());
}

TEST(ScmRightsMessage, TooManyDescriptors)
{
	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	auto [r, w] = CreatePipe();

	const int fds[] = {w.Get(), w.Get()};
	SendRaw(a, fds);
	w.Close();

	/* the envelope is rejected and both descriptors are closed */
	auto fd = ReceiveOne(b);
	EXPECT_FALSE(fd.IsDefined());
	EXPECT_TRUE(IsPipeClosed(r));
}

TEST(ScmRightsMessage, Truncated)
{
	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	auto [r, w] = CreatePipe();

	const int fds[] = {w.Get(), w.Get(), w.Get(), w.Get()};
	SendRaw(a, fds);
	w.Close();

	auto fd = ReceiveOne(b);
	EXPECT_FALSE(fd.IsDefined());
	EXPECT_TRUE(IsPipeClosed(r));
}

TEST(ScmRightsMessage, WrongType)
{
	alignas(struct cmsghdr) std::byte control[CMSG_SPACE(sizeof(int))]{};
	std::byte payload{0x21};
	struct iovec iov{&payload, sizeof(payload)};

	struct msghdr msg{};
	msg.msg_iov = &iov;
	msg.msg_iovlen = 1;
	msg.msg_control = control;
	msg.msg_controllen = sizeof(control);

	struct cmsghdr *cmsg = CMSG_FIRSTHDR(&msg);
	cmsg->cmsg_level = SOL_SOCKET;
	cmsg->cmsg_type = SCM_RIGHTS + 1;
	cmsg->cmsg_len = CMSG_LEN(sizeof(int));
	const int value = -1;
	memcpy(CMSG_DATA(cmsg), &value, sizeof(value));

	EXPECT_FALSE(ScmRightsMessage::Decode(msg, 1).IsDefined());

	cmsg->cmsg_level = SOL_SOCKET + 1;
	cmsg->cmsg_type = SCM_RIGHTS;
	EXPECT_FALSE(ScmRightsMessage::Decode(msg, 1).IsDefined());
}

TEST(ScmRightsMessage, Empty)
{
	struct msghdr msg{};
	EXPECT_FALSE(ScmRightsMessage::Decode(msg, 0).IsDefined());
	EXPECT_FALSE(ScmRightsMessage::Decode(msg, 1).IsDefined());
	EXPECT_FALSE(ScmRightsMessage::Decode(msg, -1).IsDefined());
}
