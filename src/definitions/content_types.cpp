#ifndef F_definitions_content_types_cpp
#define F_definitions_content_types_cpp

#include <string>
/*
https://developer.mozilla.org/en-US/docs/Web/HTTP/Reference/Headers/Content-Type
https://www.iana.org/assignments/media-types/media-types.xhtml
*/
namespace HTTPD::CONTENT_TYPES {
	using string = std::string;

	// text.
	const string text	= "text/plain";

	// application.
	const string binary	= "application/octet-stream";
}

#endif
