#ifndef F_utils_time_util_cpp
#define F_utils_time_util_cpp

#include <chrono>
#include <cstdint>

namespace utils::time_util {
	/*
		nanosecond timestamp (or duration), stored as a plain integer
		so it can be added, subtracted and printed without ceremony.
	*/
	struct time64_ns {
		int64_t value;

		time64_ns() : value(0) {}
		time64_ns(const int64_t value) : value(value) {}

		static time64_ns now() {
			const auto t = std::chrono::system_clock::now().time_since_epoch();
			return time64_ns(std::chrono::duration_cast<std::chrono::nanoseconds>(t).count());
		}

		int64_t value_ns() const { return value; }
		int64_t value_us() const { return value / 1000; }
		int64_t value_ms() const { return value / 1000000; }

		time64_ns operator+(const time64_ns& other) const { return time64_ns(value + other.value); }
		time64_ns operator-(const time64_ns& other) const { return time64_ns(value - other.value); }
	};
}

#endif
