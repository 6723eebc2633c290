#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include "src/utils/commandline.cpp"
#include "src/HTTPServer.cpp"

using std::string;
namespace fs = std::filesystem;

/*
build:
cmake -S . -B build && cmake --build build

run:
./build/tinyhttpd --directory /tmp/files
./build/tinyhttpd --directory /tmp/files --port 5000 --host 0.0.0.0
*/

int main(const int argc, const char** argv) {
	utils::commandline::cmd_arguments args(argc, argv);
	const HTTPD::server_config config = HTTPD::server_config::from_arguments(args);

	// a missing directory is not fatal: file requests will simply fail.
	if(config.files.directory) {
		std::error_code ec;
		if(!fs::is_directory(*config.files.directory, ec)) {
			fprintf(stderr, "warning: --directory is not a directory: %s\n", config.files.directory->c_str());
		}
	}

	HTTPD::HTTPServer server(config);
	if(server.start_listen() != EXIT_SUCCESS) exit(EXIT_FAILURE);
	server.run_accept_loop();
	return EXIT_SUCCESS;
}
