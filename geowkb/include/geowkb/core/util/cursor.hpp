#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/exception.hpp"

#include <type_traits>

namespace geowkb {

namespace core {

// Forward-only reader over an immutable buffer. Multi-byte values are decoded as little endian regardless of the
// host byte order.
class Cursor {
private:
	const_data_ptr_t start;
	const_data_ptr_t ptr;
	const_data_ptr_t end;

	static bool HostIsLittleEndian() {
		const uint16_t probe = 1;
		uint8_t first_byte;
		memcpy(&first_byte, &probe, sizeof(uint8_t));
		return first_byte == 1;
	}

public:
	explicit Cursor(const_data_ptr_t start, const_data_ptr_t end) : start(start), ptr(start), end(end) {
		D_ASSERT(start <= end);
	}

	explicit Cursor(const string &blob)
	    : start(const_data_ptr_cast(blob.data())), ptr(start), end(start + blob.size()) {
	}

	idx_t Position() const {
		return static_cast<idx_t>(ptr - start);
	}

	idx_t Remaining() const {
		D_ASSERT(ptr <= end);
		return static_cast<idx_t>(end - ptr);
	}

	bool IsAtEnd() const {
		return ptr == end;
	}

	// Throws if fewer than "bytes" bytes are left, without advancing
	void Require(idx_t bytes) const {
		if (bytes > Remaining()) {
			throw TruncatedInputException("Trying to read %d bytes at offset %d, but only %d bytes remain", bytes,
			                              Position(), Remaining());
		}
	}

	const_data_ptr_t ReadBytes(idx_t bytes) {
		Require(bytes);
		auto result = ptr;
		ptr += bytes;
		return result;
	}

	template <class T>
	T Read() {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		static_assert(sizeof(T) == 1, "Use ReadLE for multi-byte values");
		T result;
		memcpy(&result, ReadBytes(sizeof(T)), sizeof(T));
		return result;
	}

	template <class T>
	T ReadLE() {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		auto src = ReadBytes(sizeof(T));

		uint8_t buf[sizeof(T)];
		if (HostIsLittleEndian()) {
			memcpy(buf, src, sizeof(T));
		} else {
			for (idx_t i = 0; i < sizeof(T); i++) {
				buf[i] = src[sizeof(T) - i - 1];
			}
		}
		T result;
		memcpy(&result, buf, sizeof(T));
		return result;
	}
};

} // namespace core

} // namespace geowkb
