
#ifndef F_router_cpp
#define F_router_cpp

#include <map>
#include <string>
#include "src/http_structs.cpp"
#include "src/definitions/methods.cpp"
#include "src/handlers/echo_server.cpp"
#include "src/handlers/static_file_server.cpp"

namespace HTTPD {
	using std::string;
	using Handlers::static_file_server::static_file_server_config;

	enum ROUTE {
		ROUTE_ECHO,
		ROUTE_USER_AGENT,
		ROUTE_FILE_GET,
		ROUTE_FILE_POST,
		ROUTE_SUCCESS,
		ROUTE_NOT_FOUND,
	};
	const std::map<ROUTE, string> ROUTE_NAME {
		{ROUTE_ECHO			, "ECHO"},
		{ROUTE_USER_AGENT	, "USER_AGENT"},
		{ROUTE_FILE_GET		, "FILE_GET"},
		{ROUTE_FILE_POST	, "FILE_POST"},
		{ROUTE_SUCCESS		, "SUCCESS"},
		{ROUTE_NOT_FOUND	, "NOT_FOUND"},
	};

	/*
		rules are checked in order, first match wins.
		paths are compared as-is: no query parsing, no trailing-slash or case folding.
	*/
	ROUTE match_route(const string& method, const string& path) {
		if(path.starts_with(Handlers::echo_server::ECHO_PREFIX)) return ROUTE_ECHO;
		if(path == "/user-agent") return ROUTE_USER_AGENT;
		if(path.starts_with(Handlers::static_file_server::FILES_PREFIX)) {
			if(method == METHODS::GET ) return ROUTE_FILE_GET;
			if(method == METHODS::POST) return ROUTE_FILE_POST;
			return ROUTE_NOT_FOUND;
		}
		if(path == "/") return ROUTE_SUCCESS;
		return ROUTE_NOT_FOUND;
	}

	http_response handle_route(const ROUTE route, const static_file_server_config& config, const http_request& request) {
		using namespace Handlers;
		switch(route) {
			case ROUTE_ECHO:		return echo_server::handle_echo(request);
			case ROUTE_USER_AGENT:	return echo_server::handle_user_agent(request);
			case ROUTE_FILE_GET:	return static_file_server::handle_file_get(config, request);
			case ROUTE_FILE_POST:	return static_file_server::handle_file_post(config, request);
			case ROUTE_SUCCESS:		return echo_server::handle_success(request);
			case ROUTE_NOT_FOUND:	return echo_server::handle_not_found(request);
		}
		return echo_server::handle_not_found(request);
	}

	http_response handle_request(const static_file_server_config& config, const http_request& request) {
		return handle_route(match_route(request.method, request.path), config, request);
	}
}

#endif
