// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "NamedEndpointSocket.hxx"
#include "event/Loop.hxx"
#include "net/LocalSocketAddress.hxx"
#include "net/NamedEndpointConfig.hxx"
#include "net/ScmRightsMessage.hxx"
#include "net/SocketError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "lib/fmt/SocketAddressFormatter.hxx"
#include "system/Error.hxx"

#include <optional>

#include <errno.h>
#include <unistd.h>

/**
 * Attempt a non-blocking connect().
 *
 * Throws on error.
 *
 * @return true if the socket is connected, false if the attempt
 * would block
 */
static bool
TryConnect(SocketDescriptor s, const LocalSocketAddress &address)
{
	if (s.Connect(address))
		return true;

	const auto e = GetSocketError();
	if (e == EISCONN)
		/* a previous attempt has succeeded meanwhile */
		return true;

	if (IsSocketErrorConnectWouldBlock(e))
		return false;

	throw FmtErrno(e, "Failed to connect to {}", address);
}

/**
 * Throws on error.
 *
 * @return the new connection or an undefined socket if the attempt
 * would block
 */
static UniqueSocketDescriptor
TryAccept(SocketDescriptor s)
{
	UniqueSocketDescriptor result{s.AcceptNonBlock()};
	if (!result.IsDefined()) {
		const auto e = GetSocketError();
		if (!IsSocketErrorAcceptWouldBlock(e))
			throw MakeSocketError(e, "Failed to accept connection");
	}

	return result;
}

/**
 * Throws on error.
 *
 * @return true if the descriptor was sent, false if the attempt
 * would block
 */
static bool
TrySendDescriptor(SocketDescriptor s, FileDescriptor fd)
{
	auto message = ScmRightsMessage::ForSend(fd);
	if (s.Send(message.MakeHeader()) >= 0)
		return true;

	const auto e = GetSocketError();
	if (IsSocketErrorSendWouldBlock(e))
		return false;

	throw MakeSocketError(e, "Failed to send descriptor");
}

/**
 * Throws on error.
 *
 * @return the received descriptor (undefined if there was none), or
 * std::nullopt if the attempt would block
 */
static std::optional<UniqueFileDescriptor>
TryReceiveDescriptor(SocketDescriptor s)
{
	int flags = 0;
#ifdef MSG_CMSG_CLOEXEC
	flags |= MSG_CMSG_CLOEXEC;
#endif

	auto message = ScmRightsMessage::ForReceive();
	auto msg = message.MakeHeader();
	const auto nbytes = s.Receive(msg, flags);
	if (nbytes < 0) {
		const auto e = GetSocketError();
		if (IsSocketErrorReceiveWouldBlock(e))
			return std::nullopt;

		throw MakeSocketError(e, "Failed to receive descriptor");
	}

	return ScmRightsMessage::Decode(msg, nbytes);
}

class NamedEndpointSocket::AcceptOperation final
	: public PendingSocketOperation
{
	NamedEndpointSocket &endpoint;
	const AcceptCallback callback;

	UniqueSocketDescriptor peer;

public:
	AcceptOperation(NamedEndpointSocket &_endpoint,
			AcceptCallback &&_callback) noexcept
		:PendingSocketOperation(_endpoint.event_loop, _endpoint.logger,
					"accept"),
		 endpoint(_endpoint), callback(std::move(_callback)) {}

protected:
	/* virtual methods from PendingSocketOperation */
	bool TryOperation() override {
		peer = TryAccept(GetSocket());
		return peer.IsDefined();
	}

	void OnOperationDone() noexcept override {
		callback(std::make_unique<NamedEndpointSocket>(endpoint.event_loop,
							       std::move(peer)));
	}

	void OnOperationTimeout() noexcept override {
		callback(nullptr);
	}

	void OnOperationError(std::exception_ptr) noexcept override {
		callback(nullptr);
	}
};

class NamedEndpointSocket::ConnectOperation final
	: public PendingSocketOperation
{
	NamedEndpointSocket &endpoint;
	const LocalSocketAddress address;
	const ConnectCallback callback;

public:
	ConnectOperation(NamedEndpointSocket &_endpoint,
			 const LocalSocketAddress &_address,
			 ConnectCallback &&_callback) noexcept
		:PendingSocketOperation(_endpoint.event_loop, _endpoint.logger,
					"connect"),
		 endpoint(_endpoint), address(_address),
		 callback(std::move(_callback)) {}

protected:
	/* virtual methods from PendingSocketOperation */
	bool TryOperation() override {
		if (const int e = GetSocket().GetError(); e != 0)
			throw FmtErrno(e, "Failed to connect to {}",
					     address);

		return TryConnect(GetSocket(), address);
	}

	void OnOperationDone() noexcept override {
		endpoint.logger.Fmt(3, "Connected to {}", address);
		callback(&endpoint);
	}

	void OnOperationTimeout() noexcept override {
		endpoint.Close();
		callback(nullptr);
	}

	void OnOperationError(std::exception_ptr) noexcept override {
		endpoint.Close();
		callback(nullptr);
	}
};

class NamedEndpointSocket::SendOperation final
	: public PendingSocketOperation
{
	/**
	 * Our own copy of the descriptor to be sent, so the caller
	 * may close theirs.
	 */
	const UniqueFileDescriptor fd;

	const SendCallback callback;

public:
	SendOperation(NamedEndpointSocket &endpoint,
		      UniqueFileDescriptor &&_fd,
		      SendCallback &&_callback) noexcept
		:PendingSocketOperation(endpoint.event_loop, endpoint.logger,
					"send"),
		 fd(std::move(_fd)), callback(std::move(_callback)) {}

protected:
	/* virtual methods from PendingSocketOperation */
	bool TryOperation() override {
		return TrySendDescriptor(GetSocket(), fd);
	}

	void OnOperationDone() noexcept override {
		callback(true);
	}

	void OnOperationTimeout() noexcept override {
		callback(false);
	}

	void OnOperationError(std::exception_ptr) noexcept override {
		callback(false);
	}
};

class NamedEndpointSocket::ReceiveOperation final
	: public PendingSocketOperation
{
	const ReceiveCallback callback;

	UniqueFileDescriptor fd;

public:
	ReceiveOperation(NamedEndpointSocket &endpoint,
			 ReceiveCallback &&_callback) noexcept
		:PendingSocketOperation(endpoint.event_loop, endpoint.logger,
					"receive"),
		 callback(std::move(_callback)) {}

protected:
	/* virtual methods from PendingSocketOperation */
	bool TryOperation() override {
		auto result = TryReceiveDescriptor(GetSocket());
		if (!result)
			return false;

		fd = std::move(*result);
		return true;
	}

	void OnOperationDone() noexcept override {
		callback(std::move(fd));
	}

	void OnOperationTimeout() noexcept override {
		callback(UniqueFileDescriptor{});
	}

	void OnOperationError(std::exception_ptr) noexcept override {
		callback(UniqueFileDescriptor{});
	}
};

NamedEndpointSocket::NamedEndpointSocket(EventLoop &_event_loop) noexcept
	:event_loop(_event_loop) {}

NamedEndpointSocket::NamedEndpointSocket(EventLoop &_event_loop,
					 UniqueSocketDescriptor _socket) noexcept
	:event_loop(_event_loop), socket(std::move(_socket))
{
	if (socket.IsDefined())
		socket.SetNonBlocking();
}

NamedEndpointSocket::~NamedEndpointSocket() noexcept
{
	operations.clear_and_dispose([](PendingSocketOperation *o){
		o->Dispose();
	});
}

void
NamedEndpointSocket::Close() noexcept
{
	operations.clear_and_dispose([](PendingSocketOperation *o){
		o->Dispose();
	});

	socket.Close();
}

template<typename T, typename... Args>
inline void
NamedEndpointSocket::Suspend(unsigned direction, Event::Duration timeout,
			     Args&&... args)
{
	auto operation = std::make_unique<T>(*this, std::forward<Args>(args)...);
	operation->Start(socket, direction, timeout);
	operations.push_back(*operation.release());
}

void
NamedEndpointSocket::InitSocket()
{
	Close();

	UniqueSocketDescriptor s;
	if (!s.CreateNonBlock(AF_LOCAL, SOCK_STREAM, 0))
		throw MakeSocketError("Failed to create socket");

	socket = std::move(s);
}

void
NamedEndpointSocket::Bind(const LocalSocketAddress &address)
{
	InitSocket();

	if (!socket.Bind(address)) {
		const auto e = GetSocketError();
		Close();
		throw FmtErrno(e, "Failed to bind to {}", address);
	}

	logger.Fmt(3, "Bound to {}", address);
}

void
NamedEndpointSocket::Bind(const NamedEndpointConfig &config)
{
	config.Check();

	if (config.unlink_stale) {
		const char *path = config.address.GetLocalPath();
		if (path != nullptr && unlink(path) < 0 && errno != ENOENT)
			throw FmtErrno("Failed to delete {}", path);
	}

	Bind(config.address);

	if (config.listen > 0)
		Listen(config.listen);
}

void
NamedEndpointSocket::Listen(int backlog)
{
	if (!socket.Listen(backlog))
		throw MakeSocketError("Failed to listen");
}

void
NamedEndpointSocket::Accept(Event::Duration timeout, AcceptCallback callback)
{
	auto peer = TryAccept(socket);
	if (peer.IsDefined()) {
		callback(std::make_unique<NamedEndpointSocket>(event_loop,
							       std::move(peer)));
		return;
	}

	Suspend<AcceptOperation>(SocketEvent::READ, timeout,
				 std::move(callback));
}

void
NamedEndpointSocket::Connect(const LocalSocketAddress &address,
			     Event::Duration timeout, ConnectCallback callback)
{
	InitSocket();

	bool connected;

	try {
		connected = TryConnect(socket, address);
		if (!connected)
			Suspend<ConnectOperation>(SocketEvent::WRITE, timeout,
						  address, std::move(callback));
	} catch (...) {
		Close();
		throw;
	}

	if (connected) {
		logger.Fmt(3, "Connected to {}", address);
		callback(this);
	}
}

void
NamedEndpointSocket::SendDescriptor(FileDescriptor fd, SendCallback callback,
				    Event::Duration timeout)
{
	if (TrySendDescriptor(socket, fd)) {
		callback(true);
		return;
	}

	UniqueFileDescriptor copy{fd.DuplicateCloseOnExec()};
	if (!copy.IsDefined())
		throw MakeErrno("Failed to duplicate descriptor");

	Suspend<SendOperation>(SocketEvent::WRITE, timeout,
			       std::move(copy), std::move(callback));
}

void
NamedEndpointSocket::ReceiveDescriptor(ReceiveCallback callback,
				       Event::Duration timeout)
{
	if (auto fd = TryReceiveDescriptor(socket)) {
		callback(std::move(*fd));
		return;
	}

	Suspend<ReceiveOperation>(SocketEvent::READ, timeout,
				  std::move(callback));
}

void
NamedEndpointSocket::ReceiveSocket(ReceiveSocketCallback callback,
				   Event::Duration timeout)
{
	ReceiveDescriptor([callback = std::move(callback)](UniqueFileDescriptor fd){
		callback(UniqueSocketDescriptor{std::move(fd)});
	}, timeout);
}

void
NamedEndpointSocket::ReceiveEndpoint(ReceiveEndpointCallback callback,
				     Event::Duration timeout)
{
	ReceiveDescriptor([&loop = event_loop, callback = std::move(callback)](UniqueFileDescriptor fd){
		if (!fd.IsDefined()) {
			callback(nullptr);
			return;
		}

		callback(std::make_unique<NamedEndpointSocket>(loop,
							       UniqueSocketDescriptor{std::move(fd)}));
	}, timeout);
}
