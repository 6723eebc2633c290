#ifndef F_handlers_echo_server_cpp
#define F_handlers_echo_server_cpp

#include <string>
#include "src/http_structs.cpp"
#include "src/utils/string_util.cpp"
#include "src/definitions/headers.cpp"
#include "src/definitions/content_types.cpp"

namespace HTTPD::Handlers::echo_server {
	using std::string;

	const string ECHO_PREFIX = "/echo/";
	const string USER_AGENT_UNKNOWN = "Unknown";

	// carries an explicit "Content-Length", even when the body is empty.
	http_response text_response(const string& body) {
		http_response response;
		response.status_code = 200;
		response.headers[HEADERS::content_type] = CONTENT_TYPES::text;
		response.headers[HEADERS::content_length] = utils::string_util::int_to_string(body.length());
		response.body = body;
		return response;
	}

	// "/echo/abc" -> "abc".
	http_response handle_echo(const http_request& request) {
		return text_response(request.path.substr(ECHO_PREFIX.length()));
	}

	http_response handle_user_agent(const http_request& request) {
		const auto it = request.headers.find(HEADERS::user_agent);
		return text_response(it != request.headers.end() ? it->second : USER_AGENT_UNKNOWN);
	}

	http_response handle_success(const http_request&) {
		http_response response;
		response.status_code = 200;
		response.headers[HEADERS::content_type] = CONTENT_TYPES::text;
		return response;
	}

	http_response handle_not_found(const http_request&) {
		http_response response;
		response.status_code = 404;
		return response;
	}
}

#endif
