#include <gtest/gtest.h>

#include <string>
#include <thread>
#include "src/http_message.cpp"
#include "test/test_helpers.cpp"

using namespace HTTPD;
using test_helpers::parse_request;
using test_helpers::serialize;
using std::string;

// ============================================================
// request parsing.
// ------------------------------------------------------------

TEST(RequestParserTest, ParsesRequestLineHeadersAndBody) {
	http_request request;
	const string raw =
		"POST /files/a.txt HTTP/1.1\r\n"
		"Host: localhost:4221\r\n"
		"Content-Length: 5\r\n"
		"\r\n"
		"hello";
	ASSERT_EQ(parse_request(raw, request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.method, "POST");
	EXPECT_EQ(request.path, "/files/a.txt");
	EXPECT_EQ(request.protocol, "HTTP/1.1");
	EXPECT_EQ(request.headers.size(), 2u);
	EXPECT_EQ(request.headers.at("Host"), "localhost:4221");
	EXPECT_EQ(request.headers.at("Content-Length"), "5");
	EXPECT_EQ(request.body, "hello");
}

TEST(RequestParserTest, RoundTripsSerializedRequest) {
	http_request sent;
	sent.method = "PUT";
	sent.path = "/some/path%20with?query=1";
	sent.protocol = "HTTP/1.0";
	sent.headers["Accept"] = "*/*";
	sent.headers["X-Multi"] = "a: b: c";
	sent.headers["user-agent"] = "curl/8.0";
	sent.body = string("line1\r\nline2\n\0binary", 20);

	http_request parsed;
	ASSERT_EQ(parse_request(serialize(sent), parsed), ERROR_CODE::SUCCESS);
	EXPECT_EQ(parsed.method, sent.method);
	EXPECT_EQ(parsed.path, sent.path);
	EXPECT_EQ(parsed.protocol, sent.protocol);
	EXPECT_EQ(parsed.headers, sent.headers);
	EXPECT_EQ(parsed.body, sent.body);
}

TEST(RequestParserTest, UnknownMethodIsKeptAsIs) {
	http_request request;
	ASSERT_EQ(parse_request("BREW /pot HTCPCP/1.0\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.method, "BREW");
	EXPECT_EQ(request.protocol, "HTCPCP/1.0");
}

TEST(RequestParserTest, PathIsNotNormalized) {
	http_request request;
	ASSERT_EQ(parse_request("GET /files/../a%2Fb// HTTP/1.1\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.path, "/files/../a%2Fb//");
}

TEST(RequestParserTest, RejectsRequestLineWithTooFewTokens) {
	http_request request;
	EXPECT_EQ(parse_request("GET /\r\n\r\n", request), ERROR_CODE::MALFORMED_REQUEST_LINE);
	http_request request2;
	EXPECT_EQ(parse_request("GARBAGE\r\n\r\n", request2), ERROR_CODE::MALFORMED_REQUEST_LINE);
}

TEST(RequestParserTest, IgnoresTokensPastTheThird) {
	http_request request;
	ASSERT_EQ(parse_request("GET / HTTP/1.1 extra\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.method, "GET");
	EXPECT_EQ(request.path, "/");
	EXPECT_EQ(request.protocol, "HTTP/1.1");
}

TEST(RequestParserTest, RejectsHeaderWithoutSeparator) {
	http_request request;
	EXPECT_EQ(parse_request("GET / HTTP/1.1\r\nHost:localhost\r\n\r\n", request), ERROR_CODE::MALFORMED_HEADER);
	http_request request2;
	EXPECT_EQ(parse_request("GET / HTTP/1.1\r\nno separator here\r\n\r\n", request2), ERROR_CODE::MALFORMED_HEADER);
}

TEST(RequestParserTest, SplitsHeaderOnFirstSeparatorOnly) {
	http_request request;
	ASSERT_EQ(parse_request("GET / HTTP/1.1\r\nX-Note: a: b: c\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.headers.at("X-Note"), "a: b: c");
}

TEST(RequestParserTest, DropsHeadersThatTrimToEmpty) {
	http_request request;
	const string raw =
		"GET / HTTP/1.1\r\n"
		"X-Empty: \r\n"
		": no-name\r\n"
		"X-Spaces:    \r\n"
		"\r\n";
	ASSERT_EQ(parse_request(raw, request), ERROR_CODE::SUCCESS);
	EXPECT_TRUE(request.headers.empty());
}

TEST(RequestParserTest, TrimsHeaderNameAndValue) {
	http_request request;
	ASSERT_EQ(parse_request("GET / HTTP/1.1\r\nX-Empty:  value\r\n  X-Pad : padded \t\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.headers.at("X-Empty"), "value");
	EXPECT_EQ(request.headers.at("X-Pad"), "padded");
}

TEST(RequestParserTest, LastDuplicateHeaderWins) {
	http_request request;
	ASSERT_EQ(parse_request("GET / HTTP/1.1\r\nX-A: first\r\nX-A: second\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.headers.size(), 1u);
	EXPECT_EQ(request.headers.at("X-A"), "second");
}

TEST(RequestParserTest, HeaderNamesAreCaseSensitive) {
	http_request request;
	ASSERT_EQ(parse_request("GET / HTTP/1.1\r\nuser-agent: lower\r\nUser-Agent: upper\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.headers.size(), 2u);
	EXPECT_EQ(request.headers.at("user-agent"), "lower");
	EXPECT_EQ(request.headers.at("User-Agent"), "upper");
}

TEST(RequestParserTest, AcceptsBareLineFeeds) {
	http_request request;
	ASSERT_EQ(parse_request("POST /echo/x HTTP/1.1\nHost: a\nContent-Length: 3\n\nabc", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.path, "/echo/x");
	EXPECT_EQ(request.protocol, "HTTP/1.1");
	EXPECT_EQ(request.headers.at("Host"), "a");
	EXPECT_EQ(request.body, "abc");
}

TEST(RequestParserTest, SkipsBlankLinesBeforeRequestLine) {
	http_request request;
	ASSERT_EQ(parse_request("\r\n  \r\n\nGET /user-agent HTTP/1.1\r\n\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.method, "GET");
	EXPECT_EQ(request.path, "/user-agent");
}

TEST(RequestParserTest, MissingContentLengthMeansNoBody) {
	http_request request;
	ASSERT_EQ(parse_request("POST /files/x HTTP/1.1\r\n\r\nignored", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.body, "");
}

TEST(RequestParserTest, UnparsableContentLengthMeansNoBody) {
	for(const string value : { "abc", "-5", "12abc", "+3", "" }) {
		http_request request;
		const string raw = "POST /files/x HTTP/1.1\r\nContent-Length: " + value + "\r\n\r\nbody";
		ASSERT_EQ(parse_request(raw, request), ERROR_CODE::SUCCESS) << "value: " << value;
		EXPECT_EQ(request.body, "") << "value: " << value;
	}
}

TEST(RequestParserTest, ReadsExactlyContentLengthBytes) {
	http_request request;
	ASSERT_EQ(parse_request("POST /files/x HTTP/1.1\r\nContent-Length: 4\r\n\r\nabcdefgh", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.body, "abcd");
}

TEST(RequestParserTest, ReportsTruncatedBody) {
	http_request request;
	EXPECT_EQ(parse_request("POST /files/x HTTP/1.1\r\nContent-Length: 10\r\n\r\nhello", request), ERROR_CODE::TRUNCATED_BODY);
}

TEST(RequestParserTest, ReadsBodySpanningManyChunks) {
	const string body(RECV_CHUNK_SIZE * 25 + 17, 'z');
	http_request request;
	const string raw = "POST /files/big HTTP/1.1\r\nContent-Length: " + std::to_string(body.length()) + "\r\n\r\n" + body;
	ASSERT_EQ(parse_request(raw, request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.body.length(), body.length());
	EXPECT_EQ(request.body, body);
}

TEST(RequestParserTest, ReportsClosedConnectionBeforeRequestLine) {
	http_request request;
	EXPECT_EQ(parse_request("", request), ERROR_CODE::RECV_CLOSED);
	http_request request2;
	EXPECT_EQ(parse_request("\r\n\r\n", request2), ERROR_CODE::RECV_CLOSED);
}

TEST(RequestParserTest, HeadEndedByCloseIsAccepted) {
	http_request request;
	ASSERT_EQ(parse_request("GET /echo/abc HTTP/1.1\r\nHost: a\r\n", request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.path, "/echo/abc");
	EXPECT_EQ(request.headers.at("Host"), "a");
}

TEST(RequestParserTest, DoesNotWaitForCloseWhenRequestIsComplete) {
	// the peer keeps its end open, as a client waiting for a response would.
	test_helpers::socket_pair sp;
	const string raw = "POST /files/x HTTP/1.1\r\nContent-Length: 2\r\n\r\nok";
	ASSERT_EQ(send(sp.peer_fd, raw.data(), raw.length(), MSG_NOSIGNAL), ssize_t(raw.length()));

	http_buffer recvbuf(RECV_CHUNK_SIZE);
	http_request request;
	ASSERT_EQ(recv_http_request(sp.connection, recvbuf, request), ERROR_CODE::SUCCESS);
	EXPECT_EQ(request.body, "ok");
}

// ============================================================
// response serialization.
// ------------------------------------------------------------

TEST(ResponseWriterTest, WritesStatusLineSortedHeadersAndBody) {
	http_response response;
	response.status_code = 200;
	response.headers["Content-Type"] = "text/plain";
	response.headers["X-Custom"] = "1";
	response.body = "abc";
	EXPECT_EQ(serialize(response),
		"HTTP/1.1 200 OK\r\n"
		"Content-Length: 3\r\n"
		"Content-Type: text/plain\r\n"
		"X-Custom: 1\r\n"
		"\r\n"
		"abc");
}

TEST(ResponseWriterTest, OmitsContentLengthForEmptyBody) {
	http_response response;
	response.status_code = 404;
	EXPECT_EQ(serialize(response), "HTTP/1.1 404 Not Found\r\n\r\n");
}

TEST(ResponseWriterTest, ReplacesWrongContentLength) {
	http_response response;
	response.status_code = 200;
	response.headers["Content-Length"] = "999";
	response.body = "12345";
	EXPECT_EQ(serialize(response), "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n12345");
}

TEST(ResponseWriterTest, KeepsExplicitZeroContentLength) {
	http_response response;
	response.status_code = 200;
	response.headers["Content-Length"] = "0";
	EXPECT_EQ(serialize(response), "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
}

TEST(ResponseWriterTest, UsesFixedStatusTextTable) {
	http_response created;
	created.status_code = 201;
	EXPECT_EQ(serialize(created), "HTTP/1.1 201 Created\r\n\r\n");

	http_response server_error;
	server_error.status_code = 500;
	EXPECT_EQ(serialize(server_error), "HTTP/1.1 500 Internal error\r\n\r\n");

	http_response forbidden;
	forbidden.status_code = 403;
	EXPECT_EQ(serialize(forbidden), "HTTP/1.1 403 Internal error\r\n\r\n");
}

TEST(ResponseWriterTest, BodyBytesAreWrittenVerbatim) {
	http_response response;
	response.status_code = 200;
	response.body = string("\0\r\n\xff", 4);
	const string bytes = serialize(response);
	EXPECT_EQ(bytes, string("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\n\0\r\n\xff", 42));
}

TEST(ResponseWriterTest, SendsResponseOverConnection) {
	test_helpers::socket_pair sp;
	http_response response;
	response.status_code = 200;
	response.headers["Content-Type"] = "text/plain";
	response.body = "hi";

	MessageBuffer sendbuf(4);
	ASSERT_EQ(send_http_response(sp.connection, response, sendbuf), ERROR_CODE::SUCCESS);
	sp.connection.close();
	EXPECT_EQ(sp.peer_recv_all(), "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nContent-Type: text/plain\r\n\r\nhi");
}

TEST(ResponseWriterTest, SendToClosedPeerIsAnIoError) {
	test_helpers::socket_pair sp;
	sp.close_peer();
	http_response response;
	response.body = "data";
	MessageBuffer sendbuf(HEAD_BUFFER_SIZE);
	EXPECT_EQ(send_http_response(sp.connection, response, sendbuf), ERROR_CODE::IO_ERROR);
}

// ============================================================
// response parsing (client side).
// ------------------------------------------------------------

TEST(ResponseParserTest, ReadsWhatTheWriterWrites) {
	test_helpers::socket_pair sp;
	http_response sent;
	sent.status_code = 201;
	sent.headers["Content-Type"] = "application/octet-stream";
	sent.body = "payload";
	const string bytes = serialize(sent);
	ASSERT_EQ(send(sp.peer_fd, bytes.data(), bytes.length(), MSG_NOSIGNAL), ssize_t(bytes.length()));

	http_buffer recvbuf(16);
	http_response received;
	ASSERT_EQ(recv_http_response(sp.connection, recvbuf, received), ERROR_CODE::SUCCESS);
	EXPECT_EQ(received.protocol, "HTTP/1.1");
	EXPECT_EQ(received.status_code, 201);
	EXPECT_EQ(received.headers, sent.headers);
	EXPECT_EQ(received.body, "payload");
}

TEST(ResponseParserTest, BodyWithoutContentLengthRunsToClose) {
	test_helpers::socket_pair sp;
	const string bytes = "HTTP/1.1 200 OK\r\n\r\nuntil the end";
	ASSERT_EQ(send(sp.peer_fd, bytes.data(), bytes.length(), MSG_NOSIGNAL), ssize_t(bytes.length()));
	sp.close_peer();

	http_buffer recvbuf(RECV_CHUNK_SIZE);
	http_response received;
	ASSERT_EQ(recv_http_response(sp.connection, recvbuf, received), ERROR_CODE::SUCCESS);
	EXPECT_EQ(received.status_code, 200);
	EXPECT_EQ(received.body, "until the end");
}

TEST(ResponseParserTest, RejectsNonNumericStatus) {
	test_helpers::socket_pair sp;
	const string bytes = "HTTP/1.1 abc OK\r\n\r\n";
	ASSERT_EQ(send(sp.peer_fd, bytes.data(), bytes.length(), MSG_NOSIGNAL), ssize_t(bytes.length()));
	sp.close_peer();

	http_buffer recvbuf(RECV_CHUNK_SIZE);
	http_response received;
	EXPECT_EQ(recv_http_response(sp.connection, recvbuf, received), ERROR_CODE::MALFORMED_STATUS_LINE);
}
