
#ifndef F_tcp_util_cpp
#define F_tcp_util_cpp

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace TCP {
	using std::string;

	const int NONE_SOCKET_FD = -1;

	/*
	struct sockaddr_in {
		u_int16_t		sin4_family;	// Address family, AF_INET
		u_int16_t		sin4_port;		// Port number
		in4_addr		sin4_addr;		// Internet address
		unsigned char	sin4_zero[8];	// Padding to ensure same size as struct sockaddr
	};
	struct sockaddr_in6 {
		u_int16_t	sin6_family;	// address family, AF_INET6
		u_int16_t	sin6_port;		// port number, Network Byte Order
		u_int32_t	sin6_flowinfo;	// IPv6 flow information
		in6_addr	sin6_addr;		// IPv6 address
		u_int32_t	sin6_scope_id;	// Scope ID
	};
	*/
	using sockaddr_storage	= sockaddr_storage;
	using socklen_t			= socklen_t;
	using addrinfo			= addrinfo;

	struct TCPSocket {
		int					fd = NONE_SOCKET_FD;
		sockaddr_storage	addr;
		socklen_t			addrlen = 0;
	};

	/*
		a plain (blocking) socket connection.

		send/recv follow the return convention of the underlying syscalls:
		> 0: number of bytes transferred.
		  0: connection closed by peer (recv only).
		 -1: an error occurred, errno is set.
	*/
	struct TCPConnection {
		TCPSocket socket;

		TCPConnection() = default;
		TCPConnection(const TCPSocket& socket) : socket(socket) {}

		int fd() const {
			return socket.fd;
		}

		ssize_t send(const char* src, const size_t count) {
			ssize_t len;
			do { len = ::send(socket.fd, src, count, MSG_NOSIGNAL); } while(len == -1 && errno == EINTR);
			return len;
		}

		ssize_t recv(char* dst, const size_t count) {
			ssize_t len;
			do { len = ::recv(socket.fd, dst, count, 0); } while(len == -1 && errno == EINTR);
			return len;
		}

		// send entire buffer, returns false if connection closed or errored first.
		bool send_all(const char* src, const size_t count) {
			size_t x = 0;
			while(x < count) {
				const ssize_t len = this->send(src + x, count - x);
				if(len <= 0) return false;
				x += len;
			}
			return true;
		}

		void close() {
			if(socket.fd != NONE_SOCKET_FD) {
				::close(socket.fd);
				socket.fd = NONE_SOCKET_FD;
			}
		}
	};

	/* sources:
		https://en.wikipedia.org/wiki/Getaddrinfo
		https://beej.us/guide/bgnet/
	*/

	// get linked-list of potential socket addresses for binding.
	int get_potential_socket_addresses_for_listening(const string& hostname, const string& portname, addrinfo*& results) {
		addrinfo hints;
		memset(&hints, 0, sizeof(hints));
		hints.ai_family		= AF_UNSPEC;
		hints.ai_socktype	= SOCK_STREAM;
		hints.ai_flags		= AI_PASSIVE;
		const char* host = hostname.empty() ? NULL : hostname.c_str();
		return getaddrinfo(host, portname.c_str(), &hints, &results);
	}

	// get linked-list of potential socket addresses for connecting to a peer with given hostname and port.
	int get_potential_socket_addresses_for_peer(const string& hostname, const string& portname, addrinfo*& results) {
		addrinfo hints;
		memset(&hints, 0, sizeof(hints));
		hints.ai_family		= AF_UNSPEC;
		hints.ai_socktype	= SOCK_STREAM;
		return getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
	}

	// loop through all the potential socket addresses and connect to the first we can.
	int try_to_connect(const addrinfo* results, TCPSocket& tcpsocket) {
		for(const addrinfo* p = results; p != NULL; p = p->ai_next) {
			const int sockfd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
			if (sockfd == -1) continue;
			if (connect(sockfd, p->ai_addr, p->ai_addrlen) == -1) {
				close(sockfd);
				continue;
			}

			// copy connection info of successfull connection.
			tcpsocket.fd = sockfd;
			memcpy(&tcpsocket.addr, p->ai_addr, p->ai_addrlen);
			tcpsocket.addrlen = p->ai_addrlen;
			return EXIT_SUCCESS;
		}
		return EXIT_FAILURE;
	}

	// loop through all the potential socket addresses and listen on the first we can bind.
	int try_to_listen(const addrinfo* results, TCPSocket& tcpsocket, const int backlog) {
		for(const addrinfo* p = results; p != NULL; p = p->ai_next) {
			const int listenfd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
			if (listenfd == -1) continue;

			// allow reusing socket-address after closing (fixes "address already in use").
			const int yes = 1;
			setsockopt(listenfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(int));

			if (bind(listenfd, p->ai_addr, p->ai_addrlen) == -1) {
				close(listenfd);
				continue;
			}
			if(listen(listenfd, backlog) == -1) {
				close(listenfd);
				return EXIT_FAILURE;
			}

			// copy connection info of successfull bind.
			tcpsocket.fd = listenfd;
			memcpy(&tcpsocket.addr, p->ai_addr, p->ai_addrlen);
			tcpsocket.addrlen = p->ai_addrlen;
			return EXIT_SUCCESS;
		}
		return EXIT_FAILURE;
	}

	// accept connection.
	int try_to_accept(const TCPSocket& listen_socket, TCPSocket& new_socket) {
		// https://stackoverflow.com/questions/24515526/error-invalid-argument-while-trying-to-accept-a-connection-from-a-client
		// https://linux.die.net/man/2/accept
		memset(&new_socket.addr, 0, sizeof(new_socket.addr));
		new_socket.addrlen = sizeof(new_socket.addr);

		int newfd = accept(listen_socket.fd, (sockaddr*)&new_socket.addr, &new_socket.addrlen);
		if(newfd == -1) return EXIT_FAILURE;

		new_socket.fd = newfd;
		return EXIT_SUCCESS;
	}

	string get_address_string(const sockaddr_storage& addr) {
		char buf[INET6_ADDRSTRLEN] = "";
		if(addr.ss_family == AF_INET) {
			inet_ntop(AF_INET, &((const sockaddr_in*)&addr)->sin_addr, buf, sizeof(buf));
		}
		if(addr.ss_family == AF_INET6) {
			inet_ntop(AF_INET6, &((const sockaddr_in6*)&addr)->sin6_addr, buf, sizeof(buf));
		}
		return string(buf);
	}

	// get local port a socket is bound to (useful after binding port "0").
	int get_socket_port(const int sockfd) {
		sockaddr_storage addr;
		socklen_t addrlen = sizeof(addr);
		if(getsockname(sockfd, (sockaddr*)&addr, &addrlen) == -1) return -1;
		if(addr.ss_family == AF_INET)  return ntohs(((const sockaddr_in*)&addr)->sin_port);
		if(addr.ss_family == AF_INET6) return ntohs(((const sockaddr_in6*)&addr)->sin6_port);
		return -1;
	}
}

#endif
