#ifndef F_definitions_headers_cpp
#define F_definitions_headers_cpp

#include <string>
/*
NOTE: header names are stored and compared exactly as received (case-sensitive),
so these constants use the canonical capitalization clients send.
https://developer.mozilla.org/en-US/docs/Web/HTTP/Guides/Messages

https://developer.mozilla.org/en-US/docs/Glossary/Request_header
https://developer.mozilla.org/en-US/docs/Glossary/Representation_header
*/
namespace HTTPD::HEADERS {
	using string = std::string;

	// ============================================================
	// request headers.
	// ------------------------------------------------------------

	const string user_agent	= "User-Agent";

	// ============================================================
	// representation headers.
	// ------------------------------------------------------------

	const string content_type	= "Content-Type";
	const string content_length	= "Content-Length";
}

#endif
