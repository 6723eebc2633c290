
#ifndef F_MessageBuffer_cpp
#define F_MessageBuffer_cpp

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace HTTPD {
	using std::string;
	using std::string_view;

	/*
		growable byte buffer that outgoing messages are serialized into,
		so a whole message can be handed to send() in as few calls as possible.
	*/
	struct MessageBuffer {
		char* data;
		size_t capacity;
		size_t length;

		MessageBuffer(size_t capacity) {
			this->data = new char[capacity];
			this->capacity = capacity;
			this->length = 0;
		}
		~MessageBuffer() {
			delete[] data;
		}
		MessageBuffer(const MessageBuffer&) = delete;
		MessageBuffer& operator=(const MessageBuffer&) = delete;

		void clear() {
			length = 0;
		}

		void set_capacity(size_t new_capacity) {
			char* new_data = new char[new_capacity];
			size_t new_length = std::min(length, new_capacity);
			memcpy(new_data, data, new_length * sizeof(data[0]));
			delete[] data;
			data		= new_data;
			capacity	= new_capacity;
			length		= new_length;
		}
		void reserve(size_t new_capacity) {
			if(new_capacity > capacity) set_capacity(std::max(new_capacity, (capacity * 3) / 2));
		}

		string_view view() const {
			return string_view(data, length);
		}

		void append(const string_view& str) {
			reserve(length + str.length());
			memcpy(data+length, str.data(), str.length() * sizeof(str[0]));
			length += str.length();
		}
	};
}

#endif
