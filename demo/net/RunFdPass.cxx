// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "event/Loop.hxx"
#include "event/net/NamedEndpointSocket.hxx"
#include "net/NamedEndpointConfig.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/Logger.hxx"
#include "system/Error.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/PrintException.hxx"

#include <array>
#include <memory>
#include <span>
#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

static bool success;

static void
CopyToStdout(FileDescriptor src)
{
	const FileDescriptor dest{STDOUT_FILENO};
	std::array<std::byte, 8192> buffer;

	while (true) {
		const auto nbytes = src.Read(buffer);
		if (nbytes < 0)
			throw MakeErrno("Failed to read");

		if (nbytes == 0)
			break;

		if (dest.Write(std::span{buffer}.first(nbytes)) != nbytes)
			throw MakeErrno("Failed to write");
	}
}

static void
Serve(EventLoop &event_loop, const NamedEndpointConfig &config,
      const char *file_path)
{
	UniqueFileDescriptor file;
	if (!file.OpenReadOnly(file_path))
		throw FmtErrno("Failed to open {}", file_path);

	NamedEndpointSocket listener{event_loop};
	listener.Bind(config);

	std::unique_ptr<NamedEndpointSocket> client;

	listener.Accept(Event::NO_TIMEOUT, [&](std::unique_ptr<NamedEndpointSocket> peer){
		if (!peer) {
			fprintf(stderr, "Failed to accept connection\n");
			return;
		}

		client = std::move(peer);

		try {
			client->SendFile(file, [](bool ok){
				success = ok;
				if (!ok)
					fprintf(stderr, "Failed to send descriptor\n");
			}, config.io_timeout);
		} catch (...) {
			PrintException(std::current_exception());
		}
	});

	event_loop.Run();

	if (const char *path = config.address.GetLocalPath())
		unlink(path);
}

static void
Fetch(EventLoop &event_loop, const NamedEndpointConfig &config)
{
	NamedEndpointSocket endpoint{event_loop};

	endpoint.Connect(config.address, config.connect_timeout, [&config](NamedEndpointSocket *connected){
		if (connected == nullptr) {
			fprintf(stderr, "Failed to connect\n");
			return;
		}

		try {
			connected->ReceiveFile([](UniqueFileDescriptor fd){
				if (!fd.IsDefined()) {
					fprintf(stderr, "No descriptor received\n");
					return;
				}

				try {
					CopyToStdout(fd);
					success = true;
				} catch (...) {
					PrintException(std::current_exception());
				}
			}, config.io_timeout);
		} catch (...) {
			PrintException(std::current_exception());
		}
	});

	event_loop.Run();
}

static void
Usage()
{
	fprintf(stderr, "usage: run-fdpass [-v] serve PATH FILE\n"
		"       run-fdpass [-v] fetch PATH [TIMEOUT]\n");
}

int
main(int argc, char **argv) noexcept
try {
	unsigned verbose = 1;

	int i = 1;
	for (; i < argc && argv[i][0] == '-'; ++i) {
		if (strcmp(argv[i], "-v") == 0)
			++verbose;
		else {
			Usage();
			return EXIT_FAILURE;
		}
	}

	SetLogLevel(verbose);

	const int n_args = argc - i;
	if (n_args < 2) {
		Usage();
		return EXIT_FAILURE;
	}

	const char *const mode = argv[i];

	NamedEndpointConfig config;
	config.address.SetLocal(argv[i + 1]);

	EventLoop event_loop;

	if (strcmp(mode, "serve") == 0 && n_args == 3) {
		config.listen = 1;
		Serve(event_loop, config, argv[i + 2]);
	} else if (strcmp(mode, "fetch") == 0 && n_args <= 3) {
		if (n_args == 3) {
			char *endptr;
			const double seconds = strtod(argv[i + 2], &endptr);
			if (endptr == argv[i + 2] || *endptr != 0)
				throw std::invalid_argument{"Malformed timeout"};

			config.connect_timeout = config.io_timeout =
				Event::FromSeconds(seconds);
		}

		Fetch(event_loop, config);
	} else {
		Usage();
		return EXIT_FAILURE;
	}

	return success ? EXIT_SUCCESS : EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
