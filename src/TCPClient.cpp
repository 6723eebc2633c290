
#ifndef F_TCPClient_cpp
#define F_TCPClient_cpp

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <netdb.h>
#include <sys/socket.h>
#include "src/tcp_util.cpp"

namespace TCP {
	using std::string;
	using std::string_view;

	/*
		owns (at most) one outgoing connection, closed on destruction.
		opening a new connection closes the previous one.
	*/
	struct TCPClient {
		TCPConnection connection;

		TCPClient() = default;
		~TCPClient() {
			close_connection();
		}
		TCPClient(const TCPClient&) = delete;
		TCPClient& operator=(const TCPClient&) = delete;

		int open_connection(const string& hostname, const string& portname) {
			close_connection();

			addrinfo* results;
			const int addr_status = get_potential_socket_addresses_for_peer(hostname, portname, results);
			if (addr_status != 0) {
				fprintf(stderr, "[get_potential_socket_addresses_for_peer] ERROR: %s\n", gai_strerror(addr_status));
				return EXIT_FAILURE;
			}

			const int status = try_to_connect(results, connection.socket);
			freeaddrinfo(results);
			if(status != EXIT_SUCCESS) {
				fprintf(stderr, "[open_connection] failed to connect to %s:%s (err: %s)\n", hostname.c_str(), portname.c_str(), strerror(errno));
				return EXIT_FAILURE;
			}
			return EXIT_SUCCESS;
		}

		void close_connection() {
			connection.close();
		}

		bool send_all(const string_view& data) {
			return connection.send_all(data.data(), data.length());
		}

		// signal end-of-request to the peer, while still being able to read its reply.
		void shutdown_send() {
			if(connection.fd() != NONE_SOCKET_FD) shutdown(connection.fd(), SHUT_WR);
		}

		// read until the peer closes (or the connection errors).
		string recv_until_close() {
			string data;
			char temp[4096];
			while(true) {
				const ssize_t len = connection.recv(temp, sizeof(temp));
				if(len <= 0) break;
				data.append(temp, len);
			}
			return data;
		}
	};
}

#endif
