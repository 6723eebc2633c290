/*
 * This was written with the help of the following guides:
 * https://bhch.github.io/posts/2017/11/writing-an-http-server-from-scratch/
 * https://developer.mozilla.org/en-US/docs/Web/HTTP/Guides/Messages
 */

#ifndef F_HTTPClient_cpp
#define F_HTTPClient_cpp

#include <cstdlib>
#include <string>
#include "src/TCPClient.cpp"
#include "src/http_message.cpp"

namespace HTTPD {
	using string = std::string;

	/*
		sends one request per connection, and reads the response
		until its "Content-Length" is reached (or the server closes).
	*/
	struct HTTPClient : TCP::TCPClient {
		HTTPClient(): TCPClient() {}

		ERROR_CODE fetch(const string& hostname, const string& portname, http_request& request, http_response& response) {
			if(open_connection(hostname, portname) != EXIT_SUCCESS) return ERROR_CODE::IO_ERROR;

			ERROR_CODE err;
			MessageBuffer sendbuf(HEAD_BUFFER_SIZE);
			err = send_http_request(connection, request, sendbuf);
			if(err != ERROR_CODE::SUCCESS) {
				close_connection();
				return err;
			}

			http_buffer recvbuf(RECV_CHUNK_SIZE);
			err = recv_http_response(connection, recvbuf, response);
			close_connection();
			return err;
		}
	};
}

#endif
