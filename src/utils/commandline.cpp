#ifndef F_utils_commandline_cpp
#define F_utils_commandline_cpp

#include <map>
#include <string>
#include <vector>

namespace utils::commandline {
	using std::string;

	/*
		splits argv into positional and named arguments.

		a named argument is any token starting with "-" (or "--"),
		and takes the token that follows it as its value.
		the leading dashes are kept in the key, ex: "--directory".
		a named argument at the end of argv gets an empty value.
	*/
	struct cmd_arguments {
		string program;
		std::vector<string> positional_arguments;
		std::map<string, string> named_arguments;

		cmd_arguments(const int argc, const char** argv) {
			if(argc > 0) program = argv[0];
			int x = 1;
			while(x < argc) {
				const string arg = argv[x++];
				if(arg.length() > 1 && arg.starts_with("-")) {
					named_arguments[arg] = (x < argc) ? string(argv[x++]) : string();
				} else {
					positional_arguments.push_back(arg);
				}
			}
		}

		bool contains(const string& key) const {
			return named_arguments.contains(key);
		}

		string get(const string& key, const string& default_value) const {
			return named_arguments.contains(key) ? named_arguments.at(key) : default_value;
		}
	};
}

#endif
