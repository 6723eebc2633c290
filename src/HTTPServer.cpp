/*
This was written with the help of the following guides:
<Beej's networking guide (c)>
https://bhch.github.io/posts/2017/11/writing-an-http-server-from-scratch/
https://developer.mozilla.org/en-US/docs/Web/HTTP/Guides/Messages
*/

#ifndef F_HTTPServer_cpp
#define F_HTTPServer_cpp

#include <atomic>
#include <condition_variable>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <netdb.h>
#include <sys/socket.h>

#include "src/tcp_util.cpp"
#include "src/http_message.cpp"
#include "src/router.cpp"
#include "src/utils/commandline.cpp"
#include "src/utils/time_util.cpp"

namespace HTTPD {
	using std::string;
	using utils::time_util::time64_ns;
	using TCP::TCPSocket;
	using TCP::TCPConnection;

	const string DEFAULT_HOSTNAME = "127.0.0.1";
	const string DEFAULT_PORTNAME = "4221";
	const int LISTEN_BACKLOG = 64;

	struct server_config {
		string hostname = DEFAULT_HOSTNAME;
		string portname = DEFAULT_PORTNAME;
		static_file_server_config files;

		/*
			recognized arguments:
			--directory <path>	root directory for "/files/" (optional).
			--port <port>		defaults to 4221 ("0" picks any free port).
			--host <address>	defaults to 127.0.0.1.
		*/
		static server_config from_arguments(const utils::commandline::cmd_arguments& args) {
			server_config config;
			config.hostname = args.get("--host", DEFAULT_HOSTNAME);
			config.portname = args.get("--port", DEFAULT_PORTNAME);
			if(args.contains("--directory")) config.files.directory = args.named_arguments.at("--directory");
			return config;
		}
	};

	/*
		accepts connections, and runs exactly one request-response exchange
		per connection on its own (detached) thread, then closes it.

		connection threads only share the (read-only) file server config,
		which each one receives as its own copy.

		the listening socket is only closed by the destructor, so stop_listen()
		never touches an fd the accept loop may have released.
		run_accept_loop() returns once every connection it spawned has finished.
	*/
	struct HTTPServer {
		const string hostname;
		const string portname;
		const static_file_server_config config;
		TCPSocket listen_socket;
		std::atomic<bool> shutting_down;
		// connection threads still running.
		int active_connections;
		std::mutex connections_mutex;
		std::condition_variable connections_done;

		HTTPServer(const server_config& sc):
			hostname(sc.hostname),
			portname(sc.portname),
			config(sc.files),
			shutting_down(false),
			active_connections(0)
		{}
		~HTTPServer() {
			this->close_listen_socket();
		}
		HTTPServer(const HTTPServer&) = delete;
		HTTPServer& operator=(const HTTPServer&) = delete;

		/* bind and start listening for connections. */
		int start_listen() {
			if(listen_socket.fd != TCP::NONE_SOCKET_FD) {
				fprintf(stderr, "error: server already listening.\n");
				return EXIT_FAILURE;
			}

			addrinfo* results;
			const int addr_status = TCP::get_potential_socket_addresses_for_listening(hostname, portname, results);
			if (addr_status != 0) {
				fprintf(stderr, "[get_potential_socket_addresses_for_listening] ERROR: %s\n", gai_strerror(addr_status));
				return EXIT_FAILURE;
			}

			const int status = TCP::try_to_listen(results, listen_socket, LISTEN_BACKLOG);
			freeaddrinfo(results);
			if(status != EXIT_SUCCESS) {
				fprintf(stderr, "error: failed to listen for connections (err: %s)\n", strerror(errno));
				return EXIT_FAILURE;
			}

			printf("listening for connections on %s:%i (listen_sockfd: %i)\n", hostname.c_str(), listen_port(), listen_socket.fd);
			if(config.directory) printf("serving files from: %s\n", config.directory->c_str());
			return EXIT_SUCCESS;
		}

		// port the listening socket is actually bound to.
		int listen_port() const {
			return TCP::get_socket_port(listen_socket.fd);
		}

		/* accept connections until stop_listen() is called, then wait for in-flight connections. */
		void run_accept_loop() {
			while(!shutting_down) {
				TCPSocket new_socket;
				if(TCP::try_to_accept(listen_socket, new_socket) == EXIT_FAILURE) {
					if(shutting_down) break;
					fprintf(stderr, "error: failed to accept connection (err: %s)\n", strerror(errno));
					continue;
				}

				// spawn worker thread.
				connection_started();
				try {
					std::thread worker_thread(&HTTPServer::connection_func, this, config, new_socket);
					worker_thread.detach();
				} catch (const std::system_error& e) {
					fprintf(stderr, "error: failed to spawn connection thread (err: %s)\n", e.what());
					TCPConnection(new_socket).close();
					connection_finished();
				}
			}
			wait_for_connections();
		}

		/*
			make run_accept_loop() return - safe to call from another thread.
			the fd is only read here, it stays open until the destructor runs.
		*/
		void stop_listen() {
			shutting_down = true;
			if(listen_socket.fd != TCP::NONE_SOCKET_FD) shutdown(listen_socket.fd, SHUT_RDWR);
		}

		int connection_count() {
			std::unique_lock lock(connections_mutex);
			return active_connections;
		}

		void connection_started() {
			std::unique_lock lock(connections_mutex);
			active_connections++;
		}

		void connection_finished() {
			std::unique_lock lock(connections_mutex);
			active_connections--;
			connections_done.notify_all();
		}

		void wait_for_connections() {
			std::unique_lock lock(connections_mutex);
			connections_done.wait(lock, [this]() { return active_connections == 0; });
		}

		void close_listen_socket() {
			if(listen_socket.fd != TCP::NONE_SOCKET_FD) {
				close(listen_socket.fd);
				listen_socket.fd = TCP::NONE_SOCKET_FD;
			}
		}

		void connection_func(const static_file_server_config config, const TCPSocket socket) {
			TCPConnection connection(socket);
			try {
				handle_connection(config, connection);
			} catch (const std::exception& e) {
				fprintf(stdout, "[handle_connection] fd=%i, exception: %s\n", connection.fd(), e.what());
			}
			connection.close();
			// last access to the server: it may be destroyed once this returns.
			connection_finished();
		}

		/*
			run a single exchange: recv request -> route -> handle -> send response.
			if the request can't be read, the connection is closed without a response.
		*/
		static void handle_connection(const static_file_server_config& config, TCPConnection& connection) {
			const string ipstr = TCP::get_address_string(connection.socket.addr);
			time64_ns t0 = time64_ns::now();

			// get request.
			http_buffer recvbuf(RECV_CHUNK_SIZE);
			http_request request;
			ERROR_CODE err = recv_http_request(connection, recvbuf, request);
			if(err != ERROR_CODE::SUCCESS) {
				fprintf(stdout, "[handle_connection] fd=%i, ip=%s, error=%s\n", connection.fd(), ipstr.c_str(), ERROR_MESSAGE.at(err).c_str());
				return;
			}
			time64_ns t1 = time64_ns::now();

			// build response.
			const ROUTE route = match_route(request.method, request.path);
			http_response response = handle_route(route, config, request);
			time64_ns t2 = time64_ns::now();

			// send response.
			MessageBuffer sendbuf(HEAD_BUFFER_SIZE);
			err = send_http_response(connection, response, sendbuf);
			if(err != ERROR_CODE::SUCCESS) {
				fprintf(stdout, "[handle_connection] fd=%i, ip=%s, error=%s (errno: %s)\n", connection.fd(), ipstr.c_str(), ERROR_MESSAGE.at(err).c_str(), strerror(errno));
				return;
			}
			time64_ns t3 = time64_ns::now();

			printf("[%li] fd=%i, method=%s, route=%s, status=%i, ip=%s, path=%s, reqlen=%lu, reslen=%lu, dt=[%li, %li, %li]\n",
				t3.value_ms(),
				connection.fd(),
				request.method.c_str(),
				ROUTE_NAME.at(route).c_str(),
				response.status_code,
				ipstr.c_str(),
				request.path.c_str(),
				request.body.length(),
				response.body.length(),
				(t1 - t0).value_us(),
				(t2 - t1).value_us(),
				(t3 - t2).value_us()
			);
		}
	};
}

#endif
