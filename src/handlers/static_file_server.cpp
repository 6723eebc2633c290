#ifndef F_handlers_static_file_server_cpp
#define F_handlers_static_file_server_cpp

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "src/http_structs.cpp"
#include "src/utils/string_util.cpp"
#include "src/definitions/headers.cpp"
#include "src/definitions/content_types.cpp"

/*
https://man7.org/linux/man-pages/man2/open.2.html
https://man7.org/linux/man-pages/man2/pread.2.html
https://man7.org/linux/man-pages/man2/write.2.html
https://man7.org/linux/man-pages/man2/close.2.html

NOTE: target paths are used as given: "..", absolute segments and symlinks are
not checked, so a request can reach outside the configured directory.
NOTE: concurrent POSTs to the same file are not serialized - the last writer wins.
*/
namespace HTTPD::Handlers::static_file_server {
	using std::string;
	namespace fs = std::filesystem;

	const string FILES_PREFIX = "/files/";

	struct static_file_server_config {
		std::optional<string> directory;// root directory of served files (if any).
	};

	// "/files/a.txt" -> "<directory>/a.txt".
	string get_target_path(const static_file_server_config& config, const http_request& request) {
		return *config.directory + "/" + request.path.substr(FILES_PREFIX.length());
	}

	bool read_file(const string& path, string& data) {
		std::error_code ec;
		if(!fs::is_regular_file(path, ec)) {
			fprintf(stderr, "[read_file] not a regular file: %s [%s]\n", ec ? ec.message().c_str() : "", path.c_str());
			return false;
		}

		int fd = open(path.c_str(), O_RDONLY);
		if(fd == -1) {
			fprintf(stderr, "[read_file] failed to open file: %s [%s]\n", strerror(errno), path.c_str());
			return false;
		}

		struct stat st;
		if(fstat(fd, &st) == -1) {
			fprintf(stderr, "[read_file] failed to stat file: %s [%s]\n", strerror(errno), path.c_str());
			close(fd);
			return false;
		}

		// the file may shrink while being read, so stop at end-of-file.
		data.resize(st.st_size);
		size_t x = 0;
		while(x < data.length()) {
			ssize_t n_read = pread(fd, data.data() + x, data.length() - x, x);
			if(n_read == -1 && errno == EINTR) continue;
			if(n_read == -1) {
				fprintf(stderr, "[read_file] failed to read file: %s [%s]\n", strerror(errno), path.c_str());
				close(fd);
				return false;
			}
			if(n_read == 0) break;
			x += n_read;
		}
		data.resize(x);
		close(fd);
		return true;
	}

	bool write_file(const string& path, const string& data) {
		int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
		if(fd == -1) {
			fprintf(stderr, "[write_file] failed to open file: %s [%s]\n", strerror(errno), path.c_str());
			return false;
		}

		size_t x = 0;
		while(x < data.length()) {
			ssize_t n_write = write(fd, data.data() + x, data.length() - x);
			if(n_write == -1 && errno == EINTR) continue;
			if(n_write == -1) {
				fprintf(stderr, "[write_file] failed to write file: %s [%s]\n", strerror(errno), path.c_str());
				close(fd);
				return false;
			}
			x += n_write;
		}

		if(close(fd) == -1) {
			fprintf(stderr, "[write_file] failed to close file: %s [%s]\n", strerror(errno), path.c_str());
			return false;
		}
		return true;
	}

	http_response handle_file_get(const static_file_server_config& config, const http_request& request) {
		http_response response;
		if(!config.directory || !read_file(get_target_path(config, request), response.body)) {
			response.body.clear();
			response.status_code = 404;
			return response;
		}
		response.status_code = 200;
		response.headers[HEADERS::content_type] = CONTENT_TYPES::binary;
		response.headers[HEADERS::content_length] = utils::string_util::int_to_string(response.body.length());
		return response;
	}

	http_response handle_file_post(const static_file_server_config& config, const http_request& request) {
		http_response response;
		if(!config.directory || !write_file(get_target_path(config, request), request.body)) {
			response.status_code = 500;
			return response;
		}
		response.status_code = 201;
		return response;
	}
}

#endif
