#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

enum class WKBErrorType : uint8_t {
	INVALID_INPUT = 0,
	UNSUPPORTED_BYTE_ORDER,
	UNSUPPORTED_GEOMETRY_TYPE,
	UNKNOWN_GEOMETRY_TYPE,
	NESTED_TYPE_MISMATCH,
	TRUNCATED_INPUT,
	MIXED_GEOMETRY_TYPE,
	INVALID_GEOMETRY
};

//! Base class of every error raised while decoding WKB.
//! The raw message is kept next to the DuckDB formatted one so callers can report it without the exception prefix.
class WKBException : public Exception {
public:
	WKBException(WKBErrorType error_type, const string &msg);

	WKBErrorType GetErrorType() const {
		return error_type;
	}
	const string &GetMessage() const {
		return message;
	}
	//! The position of the offending buffer in a batch, if the error was raised by a batch read
	optional_idx GetElementIndex() const {
		return element_index;
	}

	static string ErrorTypeToString(WKBErrorType type);
	static ExceptionType GetExceptionType(WKBErrorType type);

	//! Throw an error of the same kind as "error", prefixed with the batch element that caused it
	static void ThrowForElement(const WKBException &error, idx_t element_index, const string &element_id);

private:
	template <class T>
	static void ThrowWithIndex(const string &msg, idx_t element_index);

	WKBErrorType error_type;
	string message;
	optional_idx element_index;
};

class InvalidWKBInputException : public WKBException {
public:
	explicit InvalidWKBInputException(const string &msg) : WKBException(WKBErrorType::INVALID_INPUT, msg) {
	}

	template <typename... ARGS>
	explicit InvalidWKBInputException(const string &msg, ARGS... params)
	    : InvalidWKBInputException(ConstructMessage(msg, params...)) {
	}
};

class UnsupportedByteOrderException : public WKBException {
public:
	explicit UnsupportedByteOrderException(const string &msg)
	    : WKBException(WKBErrorType::UNSUPPORTED_BYTE_ORDER, msg) {
	}

	template <typename... ARGS>
	explicit UnsupportedByteOrderException(const string &msg, ARGS... params)
	    : UnsupportedByteOrderException(ConstructMessage(msg, params...)) {
	}
};

class UnsupportedGeometryTypeException : public WKBException {
public:
	explicit UnsupportedGeometryTypeException(const string &msg)
	    : WKBException(WKBErrorType::UNSUPPORTED_GEOMETRY_TYPE, msg) {
	}

	template <typename... ARGS>
	explicit UnsupportedGeometryTypeException(const string &msg, ARGS... params)
	    : UnsupportedGeometryTypeException(ConstructMessage(msg, params...)) {
	}
};

class UnknownGeometryTypeException : public WKBException {
public:
	explicit UnknownGeometryTypeException(const string &msg)
	    : WKBException(WKBErrorType::UNKNOWN_GEOMETRY_TYPE, msg) {
	}

	template <typename... ARGS>
	explicit UnknownGeometryTypeException(const string &msg, ARGS... params)
	    : UnknownGeometryTypeException(ConstructMessage(msg, params...)) {
	}
};

class NestedTypeMismatchException : public WKBException {
public:
	explicit NestedTypeMismatchException(const string &msg) : WKBException(WKBErrorType::NESTED_TYPE_MISMATCH, msg) {
	}

	template <typename... ARGS>
	explicit NestedTypeMismatchException(const string &msg, ARGS... params)
	    : NestedTypeMismatchException(ConstructMessage(msg, params...)) {
	}
};

class TruncatedInputException : public WKBException {
public:
	explicit TruncatedInputException(const string &msg) : WKBException(WKBErrorType::TRUNCATED_INPUT, msg) {
	}

	template <typename... ARGS>
	explicit TruncatedInputException(const string &msg, ARGS... params)
	    : TruncatedInputException(ConstructMessage(msg, params...)) {
	}
};

class MixedGeometryTypeException : public WKBException {
public:
	explicit MixedGeometryTypeException(const string &msg) : WKBException(WKBErrorType::MIXED_GEOMETRY_TYPE, msg) {
	}

	template <typename... ARGS>
	explicit MixedGeometryTypeException(const string &msg, ARGS... params)
	    : MixedGeometryTypeException(ConstructMessage(msg, params...)) {
	}
};

// Only raised when geometry validation is enabled in the reader options
class InvalidGeometryException : public WKBException {
public:
	explicit InvalidGeometryException(const string &msg) : WKBException(WKBErrorType::INVALID_GEOMETRY, msg) {
	}

	template <typename... ARGS>
	explicit InvalidGeometryException(const string &msg, ARGS... params)
	    : InvalidGeometryException(ConstructMessage(msg, params...)) {
	}
};

} // namespace core

} // namespace geowkb
