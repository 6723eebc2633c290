#ifndef F_utils_string_util_cpp
#define F_utils_string_util_cpp

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace utils::string_util {
	using std::string;
	using std::string_view;

	string int_to_string(const size_t val) {
		char temp[32];
		int len = snprintf(temp, 32, "%zu", val);
		return string(temp, len);
	}
	string int_to_string(const int32_t val) {
		char temp[24];
		int len = snprintf(temp, 24, "%i", val);
		return string(temp, len);
	}

	bool is_whitespace_ascii(const char c) {
		return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
	}

	// remove whitespace from both ends.
	string_view trim(const string_view& str) {
		size_t a = 0;
		size_t b = str.length();
		while(a < b && is_whitespace_ascii(str[a])) a++;
		while(a < b && is_whitespace_ascii(str[b-1])) b--;
		return str.substr(a, b-a);
	}

	bool is_blank(const string_view& str) {
		return trim(str).empty();
	}

	// remove a single trailing carriage-return, if present.
	string_view trim_trailing_cr(const string_view& str) {
		if(str.ends_with('\r')) return str.substr(0, str.length() - 1);
		return str;
	}

	/*
		split string on runs of whitespace, discarding empty tokens.
		ex: "  GET   /  HTTP/1.1 " -> ["GET", "/", "HTTP/1.1"]
	*/
	std::vector<string_view> split_whitespace(const string_view& str) {
		std::vector<string_view> list;
		size_t x = 0;
		while(x < str.length()) {
			while(x < str.length() && is_whitespace_ascii(str[x])) x++;
			const size_t beg = x;
			while(x < str.length() && !is_whitespace_ascii(str[x])) x++;
			if(x > beg) list.push_back(str.substr(beg, x-beg));
		}
		return list;
	}

	// split on first occurrence of delimiter, returns false if delimiter was not found.
	bool split_pair(const string_view& str, const string_view& delim, string_view& first, string_view& second) {
		const size_t pos = str.find(delim);
		if(pos == string::npos) return false;
		first  = str.substr(0, pos);
		second = str.substr(pos + delim.length());
		return true;
	}
}

#endif
