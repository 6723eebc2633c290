
#ifndef F_http_structs_cpp
#define F_http_structs_cpp

#include <map>
#include <string>

namespace HTTPD {
	using std::string;

	const string HTTP_PROTOCOL_1_1 = "HTTP/1.1";

	// header names are case-sensitive, and iterate in ascending byte order.
	using header_dict = std::map<string, string>;

	struct http_request {
		// start line.
		string		method;		// opaque token, ex: "GET".
		string		path;		// raw request-target, ex: "/files/a.txt".
		string		protocol;	// raw version token, ex: "HTTP/1.1".
		// headers.
		header_dict	headers;
		// content.
		string		body;
	};

	struct http_response {
		// start line.
		string	protocol = HTTP_PROTOCOL_1_1;
		int		status_code = 200;
		// headers.
		header_dict	headers;
		// content.
		string	body;
	};
}

#endif
