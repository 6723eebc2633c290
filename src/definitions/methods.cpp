#ifndef F_definitions_methods_cpp
#define F_definitions_methods_cpp

#include <string>
/*
https://www.rfc-editor.org/rfc/rfc7231#section-4

NOTE: methods are compared case-sensitively (rfc7231 section 4.1),
and any other token is carried through the parser untouched.
only the methods the router distinguishes are listed here.
*/
namespace HTTPD::METHODS {
	using string = std::string;

	const string GET	= "GET";	// read a file.
	const string POST	= "POST";	// create or replace a file.
}

#endif
