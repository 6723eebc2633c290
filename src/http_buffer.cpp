
#ifndef F_http_buffer_cpp
#define F_http_buffer_cpp

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include "src/tcp_util.cpp"

namespace HTTPD {
	using std::string;

	/*
	 receive buffer for reading a request off a connection.

	 data is received in chunks, so a chunk may hold the end of one line
	 plus the start of the next (or the start of the body); the unread
	 remainder stays in the buffer for the next read.

	 typical buffer layout:
	 |....R-----W.........|
	 - data is written at write position W.
	 - data is read from read position R.
	 */
	struct http_buffer {
		char*	data;
		size_t	capacity;
		size_t	write_position;
		size_t	read_position;

		http_buffer(size_t initial_capacity) {
			data = new char[initial_capacity];
			capacity = initial_capacity;
			write_position = 0;
			read_position = 0;
		}
		~http_buffer() {
			delete[] data;
		}
		http_buffer(const http_buffer&) = delete;
		http_buffer& operator=(const http_buffer&) = delete;

		// length of string between read_position and write_position.
		size_t length() const {
			return write_position - read_position;
		}

		// amount of writable space left in buffer.
		size_t capacity_remaining() const {
			return capacity - write_position;
		}

		// shift data so that read_position starts at 0.
		void shift_to_start() {
			const size_t len = this->length();
			memmove(data+0, data+read_position, len);
			read_position = 0;
			write_position = len;
		}

		// make room for N additional characters, shifting or growing as needed.
		void reserve(size_t count) {
			if(capacity_remaining() >= count) return;
			shift_to_start();
			if(capacity_remaining() >= count) return;
			const size_t new_capacity = std::max((capacity * 3) / 2, write_position + count);
			char* new_data = new char[new_capacity];
			memcpy(new_data, data, write_position);
			delete[] data;
			data = new_data;
			capacity = new_capacity;
		}

		std::string_view view() const {
			return std::string_view(data + read_position, this->length());
		}

		// extract first N characters from buffer - advances read position.
		string read(size_t len) {
			len = std::min(len, this->length());
			string str(data + read_position, len);
			read_position += len;
			return str;
		}

		// receive up to N characters into buffer - advances write position.
		ssize_t buffer_recv(TCP::TCPConnection& connection, size_t count) {
			reserve(count);
			ssize_t len = connection.recv(data + write_position, count);
			if(len > 0) write_position += len;
			return len;
		}
	};
}

#endif
