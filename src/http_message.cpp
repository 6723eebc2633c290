
#ifndef F_http_message_cpp
#define F_http_message_cpp

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include "src/utils/string_util.cpp"
#include "src/definitions/headers.cpp"
#include "src/definitions/status_codes.cpp"
#include "src/http_structs.cpp"
#include "src/http_buffer.cpp"
#include "src/MessageBuffer.cpp"
#include "src/tcp_util.cpp"

namespace HTTPD {
	using std::string;
	using std::string_view;
	using namespace utils::string_util;

	const size_t	KB = 1024;
	const string	HTTP_HEADER_NEWLINE		= "\r\n";
	const string	HTTP_HEADER_SEPARATOR	= ": ";
	const size_t	RECV_CHUNK_SIZE			= 4 * KB;
	const size_t	HEAD_BUFFER_SIZE		= 1 * KB;

	enum ERROR_CODE {
		SUCCESS = 0,
		RECV_CLOSED,
		IO_ERROR,
		MALFORMED_REQUEST_LINE,
		MALFORMED_STATUS_LINE,
		MALFORMED_HEADER,
		TRUNCATED_BODY,
	};
	const std::map<ERROR_CODE, string> ERROR_MESSAGE {
		{SUCCESS				, "SUCCESS"},
		{RECV_CLOSED			, "RECV_CLOSED"},
		{IO_ERROR				, "IO_ERROR"},
		{MALFORMED_REQUEST_LINE	, "MALFORMED_REQUEST_LINE"},
		{MALFORMED_STATUS_LINE	, "MALFORMED_STATUS_LINE"},
		{MALFORMED_HEADER		, "MALFORMED_HEADER"},
		{TRUNCATED_BODY			, "TRUNCATED_BODY"},
	};


	// returns false unless the whole string is a non-negative decimal integer.
	bool string_to_size(const string_view& str, size_t& value) {
		if(str.empty()) return false;
		uint64_t result = 0;
		const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
		if(ec != std::errc() || ptr != str.data() + str.size()) return false;
		value = result;
		return true;
	}


	// ============================================================
	// stream reading.
	// ------------------------------------------------------------

	/*
		reads lines and fixed-size blocks off a connection.
		bytes received past the end of the current line are kept in
		the buffer for the next call.
	*/
	struct http_reader {
		TCP::TCPConnection&	connection;
		http_buffer&		buffer;
		bool				eof = false;

		http_reader(TCP::TCPConnection& connection, http_buffer& buffer) :
			connection(connection),
			buffer(buffer)
		{}

		// receive another chunk into buffer.
		ERROR_CODE recv_chunk() {
			const ssize_t len = buffer.buffer_recv(connection, RECV_CHUNK_SIZE);
			if(len == 0) eof = true;
			if(len == 0) return ERROR_CODE::RECV_CLOSED;
			if(len <  0) return ERROR_CODE::IO_ERROR;
			return ERROR_CODE::SUCCESS;
		}

		/*
			read up to (and consume) the next "\n", returning the line without it.
			a trailing "\r" is left in place for the caller to trim.
			if the peer closes mid-line, the partial line is returned;
			RECV_CLOSED is only returned once nothing at all is left.
		*/
		ERROR_CODE read_line(string& line) {
			size_t scan_pos = 0;
			while(true) {
				const size_t pos = buffer.view().find('\n', scan_pos);
				if(pos != string::npos) {
					line = buffer.read(pos + 1);
					line.pop_back();
					return ERROR_CODE::SUCCESS;
				}
				scan_pos = buffer.length();
				if(eof) {
					if(buffer.length() == 0) return ERROR_CODE::RECV_CLOSED;
					line = buffer.read(buffer.length());
					return ERROR_CODE::SUCCESS;
				}
				const ERROR_CODE err = recv_chunk();
				if(err == ERROR_CODE::IO_ERROR) return err;
			}
		}

		// read exactly N bytes, RECV_CLOSED if the peer closes first.
		ERROR_CODE read_exact(const size_t count, string& data) {
			data.clear();
			while(true) {
				data.append(buffer.read(count - data.length()));
				if(data.length() == count) return ERROR_CODE::SUCCESS;
				if(eof) return ERROR_CODE::RECV_CLOSED;
				const ERROR_CODE err = recv_chunk();
				if(err == ERROR_CODE::IO_ERROR) return err;
			}
		}

		// read everything until the peer closes.
		ERROR_CODE read_until_close(string& data) {
			data.clear();
			while(true) {
				data.append(buffer.read(buffer.length()));
				if(eof) return ERROR_CODE::SUCCESS;
				const ERROR_CODE err = recv_chunk();
				if(err == ERROR_CODE::IO_ERROR) return err;
			}
		}
	};


	// ============================================================
	// parsing.
	// ------------------------------------------------------------

	ERROR_CODE parse_request_line(const string_view& line, http_request& request) {
		// NOTE: tokens past the third are ignored.
		const std::vector<string_view> list = split_whitespace(line);
		if(list.size() < 3) return ERROR_CODE::MALFORMED_REQUEST_LINE;
		request.method		= string(list[0]);
		request.path		= string(list[1]);
		request.protocol	= string(list[2]);
		return ERROR_CODE::SUCCESS;
	}

	ERROR_CODE parse_status_line(const string_view& line, http_response& response) {
		const std::vector<string_view> list = split_whitespace(line);
		if(list.size() < 2) return ERROR_CODE::MALFORMED_STATUS_LINE;
		size_t status_code;
		if(!string_to_size(list[1], status_code)) return ERROR_CODE::MALFORMED_STATUS_LINE;
		response.protocol		= string(list[0]);
		response.status_code	= status_code;
		return ERROR_CODE::SUCCESS;
	}

	/*
		header lines must contain ": ", and are split on the first one,
		so values may themselves contain ": ".
		lines whose name or value trims to nothing are dropped, not rejected.
	*/
	ERROR_CODE parse_header_line(const string_view& line, header_dict& headers) {
		string_view key, val;
		if(!split_pair(line, HTTP_HEADER_SEPARATOR, key, val)) return ERROR_CODE::MALFORMED_HEADER;
		key = trim(key);
		val = trim(val);
		if(key.empty() || val.empty()) return ERROR_CODE::SUCCESS;
		headers[string(key)] = string(val);
		return ERROR_CODE::SUCCESS;
	}

	// read header lines until the empty line that ends the head section.
	ERROR_CODE recv_headers(http_reader& reader, header_dict& headers) {
		string line;
		while(true) {
			const ERROR_CODE err = reader.read_line(line);
			// peer closed without sending the terminating empty line - treat as end of head.
			if(err == ERROR_CODE::RECV_CLOSED) return ERROR_CODE::SUCCESS;
			if(err != ERROR_CODE::SUCCESS) return err;
			const string_view str = trim_trailing_cr(line);
			if(str.empty()) return ERROR_CODE::SUCCESS;
			const ERROR_CODE parse_err = parse_header_line(str, headers);
			if(parse_err != ERROR_CODE::SUCCESS) return parse_err;
		}
	}

	// a missing or unparsable "Content-Length" counts as 0.
	size_t get_content_length(const header_dict& headers) {
		size_t content_length = 0;
		if(headers.contains(HEADERS::content_length)) {
			if(!string_to_size(headers.at(HEADERS::content_length), content_length)) content_length = 0;
		}
		return content_length;
	}

	ERROR_CODE recv_http_request(TCP::TCPConnection& connection, http_buffer& recvbuf, http_request& request) {
		http_reader reader(connection, recvbuf);
		ERROR_CODE err;

		// get request line, skipping blank lines in front of it.
		string line;
		do {
			err = reader.read_line(line);
			if(err != ERROR_CODE::SUCCESS) return err;
		} while(is_blank(line));
		err = parse_request_line(trim_trailing_cr(line), request);
		if(err != ERROR_CODE::SUCCESS) return err;

		err = recv_headers(reader, request.headers);
		if(err != ERROR_CODE::SUCCESS) return err;

		const size_t content_length = get_content_length(request.headers);
		err = reader.read_exact(content_length, request.body);
		if(err == ERROR_CODE::RECV_CLOSED) return ERROR_CODE::TRUNCATED_BODY;
		return err;
	}

	ERROR_CODE recv_http_response(TCP::TCPConnection& connection, http_buffer& recvbuf, http_response& response) {
		http_reader reader(connection, recvbuf);
		ERROR_CODE err;

		string line;
		err = reader.read_line(line);
		if(err != ERROR_CODE::SUCCESS) return err;
		err = parse_status_line(trim_trailing_cr(line), response);
		if(err != ERROR_CODE::SUCCESS) return err;

		err = recv_headers(reader, response.headers);
		if(err != ERROR_CODE::SUCCESS) return err;

		// without "Content-Length" the body runs until the server closes the connection.
		if(!response.headers.contains(HEADERS::content_length)) return reader.read_until_close(response.body);
		err = reader.read_exact(get_content_length(response.headers), response.body);
		if(err == ERROR_CODE::RECV_CLOSED) return ERROR_CODE::TRUNCATED_BODY;
		return err;
	}


	// ============================================================
	// serialization.
	// ------------------------------------------------------------

	/*
		a non-empty body always gets "Content-Length" set from its actual length,
		replacing whatever the handler put there.
		an empty body only carries the header if the handler set it.
	*/
	void set_content_length(header_dict& headers, const string& body) {
		if(body.length() > 0) headers[HEADERS::content_length] = int_to_string(body.length());
	}

	void append_headers(MessageBuffer& buffer, const header_dict& headers) {
		for(const auto& [key,val] : headers) {
			buffer.append(key);
			buffer.append(HTTP_HEADER_SEPARATOR);
			buffer.append(val);
			buffer.append(HTTP_HEADER_NEWLINE);
		}
		buffer.append(HTTP_HEADER_NEWLINE);
	}

	void append_message(MessageBuffer& buffer, http_request& request) {
		set_content_length(request.headers, request.body);
		// append start line.
		buffer.append(request.method);
		buffer.append(" ");
		buffer.append(request.path);
		buffer.append(" ");
		buffer.append(request.protocol);
		buffer.append(HTTP_HEADER_NEWLINE);
		// append headers and content.
		append_headers(buffer, request.headers);
		buffer.append(request.body);
	}

	void append_message(MessageBuffer& buffer, http_response& response) {
		set_content_length(response.headers, response.body);
		// append start line.
		buffer.append(response.protocol);
		buffer.append(" ");
		buffer.append(int_to_string(int32_t(response.status_code)));
		buffer.append(" ");
		buffer.append(get_status_text(response.status_code));
		buffer.append(HTTP_HEADER_NEWLINE);
		// append headers and content.
		append_headers(buffer, response.headers);
		buffer.append(response.body);
	}

	ERROR_CODE send_http_response(TCP::TCPConnection& connection, http_response& response, MessageBuffer& sendbuf) {
		sendbuf.clear();
		append_message(sendbuf, response);
		if(!connection.send_all(sendbuf.data, sendbuf.length)) return ERROR_CODE::IO_ERROR;
		return ERROR_CODE::SUCCESS;
	}

	ERROR_CODE send_http_request(TCP::TCPConnection& connection, http_request& request, MessageBuffer& sendbuf) {
		sendbuf.clear();
		append_message(sendbuf, request);
		if(!connection.send_all(sendbuf.data, sendbuf.length)) return ERROR_CODE::IO_ERROR;
		return ERROR_CODE::SUCCESS;
	}
}

#endif
