// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "event/net/NamedEndpointSocket.hxx"
#include "event/Loop.hxx"
#include "event/TimerEvent.hxx"
#include "net/LocalSocketAddress.hxx"
#include "net/NamedEndpointConfig.hxx"
#include "net/SocketPair.hxx"
#include "net/SocketError.hxx"
#include "system/Error.hxx"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <thread>

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono_literals;
using std::string_view_literals::operator""sv;

namespace {

/**
 * Invokes a function when the timer expires.
 */
class FunctionTimer {
	TimerEvent event;
	const std::function<void()> function;

public:
	FunctionTimer(EventLoop &event_loop, std::function<void()> _function) noexcept
		:event(event_loop, BIND_THIS_METHOD(OnTimer)),
		 function(std::move(_function)) {}

	void Schedule(Event::Duration d) noexcept {
		event.Schedule(d);
	}

private:
	void OnTimer() noexcept {
		function();
	}
};

/**
 * Deletes the socket file on construction and destruction.
 */
class TemporarySocketPath {
	const std::string path;

public:
	explicit TemporarySocketPath(std::string_view name)
		:path(fmt::format("/tmp/fdpass-test-{}-{}.sock", getpid(), name))
	{
		unlink(path.c_str());
	}

	~TemporarySocketPath() noexcept {
		unlink(path.c_str());
	}

	LocalSocketAddress GetAddress() const {
		return LocalSocketAddress{path};
	}
};

} // anonymous namespace

/**
 * Create an anonymous temporary file containing "hello".
 */
static UniqueFileDescriptor
CreateHelloFile()
{
	char path[] = "/tmp/fdpass-test-XXXXXX";
	UniqueFileDescriptor fd{AdoptTag{}, mkostemp(path, O_CLOEXEC)};
	if (!fd.IsDefined())
		throw MakeErrno("mkostemp() failed");

	unlink(path);

	static constexpr auto hello = "hello"sv;
	if (fd.Write(std::as_bytes(std::span{hello})) != (ssize_t)hello.size())
		throw MakeErrno("write() failed");

	return fd;
}

static std::string
ReadContents(FileDescriptor fd)
{
	char buffer[64];
	const auto nbytes = pread(fd.Get(), buffer, sizeof(buffer), 0);
	if (nbytes < 0)
		throw MakeErrno("pread() failed");

	return {buffer, std::size_t(nbytes)};
}

[[gnu::pure]]
static bool
IsSameFile(FileDescriptor a, FileDescriptor b) noexcept
{
	struct stat sa, sb;
	return fstat(a.Get(), &sa) == 0 && fstat(b.Get(), &sb) == 0 &&
		sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}

/**
 * Send data until the socket buffer is full.
 */
static void
FillSocket(SocketDescriptor s)
{
	ASSERT_TRUE(s.SetSendBuffer(4096));

	static constexpr std::byte chunk[1024]{};
	while (s.Send(chunk) > 0) {}
	ASSERT_TRUE(IsSocketErrorSendWouldBlock(GetSocketError()));

	while (s.Send(std::span{chunk}.first(1)) > 0) {}
	ASSERT_TRUE(IsSocketErrorSendWouldBlock(GetSocketError()));
}

/**
 * Read everything until the socket would block.
 */
static void
DrainSocket(SocketDescriptor s) noexcept
{
	std::byte buffer[4096];
	while (s.Receive(buffer) > 0) {}
}

TEST(NamedEndpointSocket, EndToEnd)
{
	const TemporarySocketPath path{"e2e"};

	EventLoop event_loop;

	NamedEndpointConfig config;
	config.address = path.GetAddress();
	config.listen = 4;

	NamedEndpointSocket server{event_loop};
	server.Bind(config);

	const auto file = CreateHelloFile();

	std::unique_ptr<NamedEndpointSocket> peer;
	unsigned n_accepted = 0, n_sent = 0;
	bool sent = false;

	server.Accept(2s, [&](std::unique_ptr<NamedEndpointSocket> _peer){
		++n_accepted;
		peer = std::move(_peer);
		ASSERT_TRUE(peer);
		ASSERT_TRUE(peer->IsDefined());

		peer->SendFile(file, [&](bool success){
			++n_sent;
			sent = success;
		}, 2s);
	});

	EXPECT_TRUE(server.HasPendingOperations());

	NamedEndpointSocket client{event_loop};
	unsigned n_connected = 0, n_received = 0;
	UniqueFileDescriptor received;

	const auto start = Event::Clock::now();

	client.Connect(config.address, 2s, [&](NamedEndpointSocket *connected){
		++n_connected;
		ASSERT_EQ(connected, &client);

		connected->ReceiveFile([&](UniqueFileDescriptor fd){
			++n_received;
			received = std::move(fd);
		}, 2s);
	});

	event_loop.Run();

	EXPECT_LT(Event::Clock::now() - start, 2s);
	EXPECT_TRUE(event_loop.IsEmpty());
	EXPECT_FALSE(server.HasPendingOperations());
	EXPECT_FALSE(client.HasPendingOperations());

	EXPECT_EQ(n_accepted, 1U);
	EXPECT_EQ(n_sent, 1U);
	EXPECT_TRUE(sent);
	EXPECT_EQ(n_connected, 1U);
	EXPECT_EQ(n_received, 1U);

	ASSERT_TRUE(received.IsDefined());
	EXPECT_NE(received.Get(), file.Get());
	EXPECT_TRUE(IsSameFile(received, file));
	EXPECT_EQ(ReadContents(received), "hello");
}

TEST(NamedEndpointSocket, BindTwice)
{
	const TemporarySocketPath path{"bind-twice"};

	EventLoop event_loop;
	NamedEndpointSocket a{event_loop}, b{event_loop};

	a.Bind(path.GetAddress());
	EXPECT_TRUE(a.IsDefined());

	EXPECT_THROW(b.Bind(path.GetAddress()), std::system_error);
	EXPECT_FALSE(b.IsDefined());

	/* with "unlink_stale", the old socket file is replaced */
	NamedEndpointConfig config;
	config.address = path.GetAddress();
	b.Bind(config);
	EXPECT_TRUE(b.IsDefined());
}

TEST(NamedEndpointSocket, ConfigCheck)
{
	EventLoop event_loop;
	NamedEndpointSocket s{event_loop};

	const NamedEndpointConfig config{};
	EXPECT_THROW(config.Check(), std::invalid_argument);
	EXPECT_THROW(s.Bind(config), std::invalid_argument);
	EXPECT_FALSE(s.IsDefined());
}

TEST(NamedEndpointSocket, ConnectNoSuchFile)
{
	const TemporarySocketPath path{"missing"};

	EventLoop event_loop;
	NamedEndpointSocket client{event_loop};

	unsigned n_callbacks = 0;

	try {
		client.Connect(path.GetAddress(), 1s,
			       [&](NamedEndpointSocket *){ ++n_callbacks; });
		FAIL() << "Connect() did not throw";
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsFileNotFound(e));
	}

	EXPECT_EQ(n_callbacks, 0U);
	EXPECT_FALSE(client.IsDefined());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, ConnectTimeout)
{
	const TemporarySocketPath path{"connect-timeout"};

	EventLoop event_loop;

	NamedEndpointSocket server{event_loop};
	server.Bind(path.GetAddress());

	/* the backlog holds only one connection */
	server.Listen(0);

	NamedEndpointSocket first{event_loop};
	unsigned n_first = 0;
	first.Connect(path.GetAddress(), 1s, [&](NamedEndpointSocket *connected){
		++n_first;
		EXPECT_EQ(connected, &first);
	});
	ASSERT_EQ(n_first, 1U);

	NamedEndpointSocket second{event_loop};
	unsigned n_second = 0;
	NamedEndpointSocket *result = &second;

	const auto start = Event::Clock::now();

	second.Connect(path.GetAddress(), 100ms, [&](NamedEndpointSocket *connected){
		++n_second;
		result = connected;
	});

	EXPECT_EQ(n_second, 0U);
	EXPECT_TRUE(second.HasPendingOperations());

	event_loop.Run();

	const auto duration = Event::Clock::now() - start;
	EXPECT_GE(duration, 90ms);
	EXPECT_LT(duration, 2s);

	EXPECT_EQ(n_second, 1U);
	EXPECT_EQ(result, nullptr);
	EXPECT_FALSE(second.IsDefined());
	EXPECT_FALSE(second.HasPendingOperations());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, ConnectListenerClosed)
{
	const TemporarySocketPath path{"connect-listener-closed"};

	EventLoop event_loop;

	NamedEndpointSocket server{event_loop};
	server.Bind(path.GetAddress());
	server.Listen(0);

	NamedEndpointSocket first{event_loop};
	first.Connect(path.GetAddress(), 1s, [](NamedEndpointSocket *){});
	ASSERT_TRUE(first.IsDefined());

	NamedEndpointSocket second{event_loop};
	unsigned n_second = 0;
	NamedEndpointSocket *result = &second;

	second.Connect(path.GetAddress(), 2s, [&](NamedEndpointSocket *connected){
		++n_second;
		result = connected;
	});
	ASSERT_EQ(n_second, 0U);

	FunctionTimer close_server{event_loop, [&server]{
		server.Close();
	}};
	close_server.Schedule(20ms);

	const auto start = Event::Clock::now();
	event_loop.Run();

	/* the refusal arrives long before the timeout */
	EXPECT_LT(Event::Clock::now() - start, 1s);

	EXPECT_EQ(n_second, 1U);
	EXPECT_EQ(result, nullptr);
	EXPECT_FALSE(second.IsDefined());
	EXPECT_FALSE(second.HasPendingOperations());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, ConnectAfterAccept)
{
	const TemporarySocketPath path{"connect-after-accept"};

	EventLoop event_loop;

	NamedEndpointSocket server{event_loop};
	server.Bind(path.GetAddress());
	server.Listen(0);

	NamedEndpointSocket first{event_loop};
	first.Connect(path.GetAddress(), 1s, [](NamedEndpointSocket *){});
	ASSERT_TRUE(first.IsDefined());

	NamedEndpointSocket second{event_loop};
	unsigned n_second = 0;
	NamedEndpointSocket *result = nullptr;

	second.Connect(path.GetAddress(), 2s, [&](NamedEndpointSocket *connected){
		++n_second;
		result = connected;
	});
	ASSERT_EQ(n_second, 0U);

	/* make room in the backlog */
	std::unique_ptr<NamedEndpointSocket> peer;
	server.Accept(1s, [&](std::unique_ptr<NamedEndpointSocket> _peer){
		peer = std::move(_peer);
	});
	ASSERT_TRUE(peer);

	event_loop.Run();

	EXPECT_EQ(n_second, 1U);
	EXPECT_EQ(result, &second);
	EXPECT_TRUE(second.IsDefined());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, AcceptTimeout)
{
	const TemporarySocketPath path{"accept-timeout"};

	EventLoop event_loop;

	NamedEndpointConfig config;
	config.address = path.GetAddress();
	config.listen = 4;

	NamedEndpointSocket server{event_loop};
	server.Bind(config);

	unsigned n_callbacks = 0;
	server.Accept(50ms, [&](std::unique_ptr<NamedEndpointSocket> peer){
		++n_callbacks;
		EXPECT_FALSE(peer);
	});

	event_loop.Run();

	EXPECT_EQ(n_callbacks, 1U);

	/* the listener survives the timeout */
	EXPECT_TRUE(server.IsDefined());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, PeerClosed)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket endpoint{event_loop, std::move(a)};

	unsigned n_callbacks = 0;
	endpoint.ReceiveFile([&](UniqueFileDescriptor fd){
		++n_callbacks;
		EXPECT_FALSE(fd.IsDefined());
	}, 1s);

	EXPECT_EQ(n_callbacks, 0U);

	b.Close();
	event_loop.Run();

	EXPECT_EQ(n_callbacks, 1U);
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, TimeoutAfterIdle)
{
	EventLoop event_loop;

	/* let the loop run once, then stay idle for a while before
	   the next operation is started */
	FunctionTimer timer{event_loop, []{}};
	timer.Schedule(1ms);
	event_loop.Run();

	std::this_thread::sleep_for(300ms);

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket endpoint{event_loop, std::move(a)};

	unsigned n_callbacks = 0;

	const auto start = Event::Clock::now();
	endpoint.ReceiveFile([&](UniqueFileDescriptor fd){
		++n_callbacks;
		EXPECT_FALSE(fd.IsDefined());
	}, 200ms);

	event_loop.Run();

	/* the deadline is measured from the ReceiveFile() call, not
	   from the previous loop iteration */
	EXPECT_GE(Event::Clock::now() - start, 190ms);
	EXPECT_EQ(n_callbacks, 1U);
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, ReceiveTimeout)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket endpoint{event_loop, std::move(a)};

	unsigned n_callbacks = 0;
	endpoint.ReceiveFile([&](UniqueFileDescriptor fd){
		++n_callbacks;
		EXPECT_FALSE(fd.IsDefined());
	}, 50ms);

	event_loop.Run();

	EXPECT_EQ(n_callbacks, 1U);
	EXPECT_TRUE(endpoint.IsDefined());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, SendWouldBlock)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	FillSocket(a);

	NamedEndpointSocket sender{event_loop, std::move(a)};
	NamedEndpointSocket receiver{event_loop, std::move(b)};

	const auto file = CreateHelloFile();

	unsigned n_sent = 0;
	bool sent = false;
	sender.SendFile(file, [&](bool success){
		++n_sent;
		sent = success;
	}, 2s);

	ASSERT_EQ(n_sent, 0U);
	ASSERT_TRUE(sender.HasPendingOperations());

	FunctionTimer drain{event_loop, [&receiver]{
		DrainSocket(receiver.GetSocket());
	}};
	drain.Schedule(50ms);

	event_loop.Run();

	EXPECT_EQ(n_sent, 1U);
	EXPECT_TRUE(sent);
	EXPECT_TRUE(event_loop.IsEmpty());

	/* the descriptor arrives after the filler data */
	unsigned n_received = 0;
	UniqueFileDescriptor received;
	receiver.ReceiveFile([&](UniqueFileDescriptor fd){
		++n_received;
		received = std::move(fd);
	}, 1s);

	event_loop.Run();

	EXPECT_EQ(n_received, 1U);
	ASSERT_TRUE(received.IsDefined());
	EXPECT_TRUE(IsSameFile(received, file));
	EXPECT_EQ(ReadContents(received), "hello");
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, SendTimeout)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	FillSocket(a);

	NamedEndpointSocket sender{event_loop, std::move(a)};

	unsigned n_sent = 0;
	bool sent = true;

	const auto file = CreateHelloFile();
	sender.SendFile(file, [&](bool success){
		++n_sent;
		sent = success;
	}, 100ms);

	event_loop.Run();

	EXPECT_EQ(n_sent, 1U);
	EXPECT_FALSE(sent);
	EXPECT_FALSE(sender.HasPendingOperations());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, SendPeerClosed)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	FillSocket(a);

	NamedEndpointSocket sender{event_loop, std::move(a)};
	UniqueSocketDescriptor peer{std::move(b)};

	const auto file = CreateHelloFile();

	unsigned n_sent = 0;
	bool sent = true;
	sender.SendFile(file, [&](bool success){
		++n_sent;
		sent = success;
	}, 2s);

	ASSERT_EQ(n_sent, 0U);

	FunctionTimer close_peer{event_loop, [&peer]{
		peer.Close();
	}};
	close_peer.Schedule(20ms);

	const auto start = Event::Clock::now();
	event_loop.Run();

	EXPECT_LT(Event::Clock::now() - start, 1s);
	EXPECT_EQ(n_sent, 1U);
	EXPECT_FALSE(sent);
	EXPECT_FALSE(sender.HasPendingOperations());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, SendToClosedPeer)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket sender{event_loop, std::move(a)};
	b.Close();

	const auto file = CreateHelloFile();

	unsigned n_sent = 0;

	try {
		sender.SendFile(file, [&](bool){ ++n_sent; }, 1s);
		FAIL() << "SendFile() did not throw";
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsErrno(e, EPIPE));
	}

	EXPECT_EQ(n_sent, 0U);
	EXPECT_FALSE(sender.HasPendingOperations());
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, ConcurrentSendReceive)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	FillSocket(a);

	NamedEndpointSocket endpoint{event_loop, std::move(a)};
	NamedEndpointSocket peer{event_loop, std::move(b)};

	const auto file = CreateHelloFile();

	unsigned n_sent = 0, n_received = 0;
	UniqueFileDescriptor received;

	endpoint.ReceiveFile([&](UniqueFileDescriptor fd){
		++n_received;
		received = std::move(fd);
	}, 2s);

	endpoint.SendFile(file, [&](bool success){
		++n_sent;
		EXPECT_TRUE(success);
	}, 2s);

	FunctionTimer timer{event_loop, [&]{
		DrainSocket(peer.GetSocket());
		peer.SendFile(file, [](bool success){
			EXPECT_TRUE(success);
		});
	}};
	timer.Schedule(20ms);

	event_loop.Run();

	EXPECT_EQ(n_sent, 1U);
	EXPECT_EQ(n_received, 1U);
	ASSERT_TRUE(received.IsDefined());
	EXPECT_TRUE(IsSameFile(received, file));
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, SendEndpoint)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket sender{event_loop, std::move(a)};
	NamedEndpointSocket receiver{event_loop, std::move(b)};

	/* a third socket pair, one end of which is passed around */
	auto [c, d] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket payload{event_loop, std::move(c)};

	bool sent = false;
	sender.SendEndpoint(payload, [&](bool success){ sent = success; });
	EXPECT_TRUE(sent);

	std::unique_ptr<NamedEndpointSocket> received;
	receiver.ReceiveEndpoint([&](std::unique_ptr<NamedEndpointSocket> endpoint){
		received = std::move(endpoint);
	});

	ASSERT_TRUE(received);
	ASSERT_TRUE(received->IsDefined());
	EXPECT_EQ(&received->GetEventLoop(), &event_loop);

	/* the received socket is connected to "d" */
	static constexpr std::byte x{'x'};
	ASSERT_EQ(d.Send(std::span{&x, 1}), 1);

	std::byte buffer[4];
	EXPECT_EQ(received->GetSocket().Receive(buffer), 1);
	EXPECT_EQ(buffer[0], x);

	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, ReceiveSocketSentinel)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket receiver{event_loop, std::move(b)};

	/* a message without a descriptor */
	static constexpr std::byte x{'x'};
	ASSERT_EQ(a.Send(std::span{&x, 1}), 1);

	unsigned n_callbacks = 0;
	receiver.ReceiveSocket([&](UniqueSocketDescriptor s){
		++n_callbacks;
		EXPECT_FALSE(s.IsDefined());
	});

	EXPECT_EQ(n_callbacks, 1U);
	EXPECT_TRUE(event_loop.IsEmpty());
}

TEST(NamedEndpointSocket, DestroyPending)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);

	unsigned n_callbacks = 0;

	{
		NamedEndpointSocket endpoint{event_loop, std::move(a)};
		endpoint.ReceiveFile([&](UniqueFileDescriptor){
			++n_callbacks;
		});

		ASSERT_FALSE(event_loop.IsEmpty());
	}

	/* the pending operation was disposed silently */
	EXPECT_TRUE(event_loop.IsEmpty());
	event_loop.Run();
	EXPECT_EQ(n_callbacks, 0U);
}

TEST(NamedEndpointSocket, ClosePending)
{
	EventLoop event_loop;

	auto [a, b] = CreateSocketPairNonBlock(SOCK_STREAM);
	NamedEndpointSocket endpoint{event_loop, std::move(a)};

	unsigned n_callbacks = 0;
	endpoint.ReceiveFile([&](UniqueFileDescriptor){
		++n_callbacks;
	});

	endpoint.Close();
	EXPECT_FALSE(endpoint.IsDefined());
	EXPECT_FALSE(endpoint.HasPendingOperations());
	EXPECT_TRUE(event_loop.IsEmpty());

	/* data arriving later does not wake anything up */
	static constexpr std::byte x{'x'};
	b.Send(std::span{&x, 1});

	event_loop.Run();
	EXPECT_EQ(n_callbacks, 0U);
}
