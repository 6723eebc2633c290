#ifndef F_definitions_status_codes_cpp
#define F_definitions_status_codes_cpp

#include <map>
#include <string>
/*
https://developer.mozilla.org/en-US/docs/Web/HTTP/Reference/Status
*/
namespace HTTPD {
	const std::map<int, std::string> STATUS_CODES(
		{
			{ 200, "OK"},
			{ 201, "Created"},

			// requested resource not found.
			{ 404, "Not Found"},
		}
	);

	// any code not in the table is reported with a generic message.
	const std::string STATUS_TEXT_UNKNOWN = "Internal error";

	std::string get_status_text(const int status_code) {
		if(STATUS_CODES.contains(status_code)) return STATUS_CODES.at(status_code);
		return STATUS_TEXT_UNKNOWN;
	}
}

#endif
