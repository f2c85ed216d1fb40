#include "geowkb/core/exception.hpp"

namespace geowkb {

namespace core {

WKBException::WKBException(WKBErrorType error_type, const string &msg)
    : Exception(GetExceptionType(error_type), msg), error_type(error_type), message(msg) {
}

string WKBException::ErrorTypeToString(WKBErrorType type) {
	switch (type) {
	case WKBErrorType::INVALID_INPUT:
		return "Invalid Input";
	case WKBErrorType::UNSUPPORTED_BYTE_ORDER:
		return "Unsupported Byte Order";
	case WKBErrorType::UNSUPPORTED_GEOMETRY_TYPE:
		return "Unsupported Geometry Type";
	case WKBErrorType::UNKNOWN_GEOMETRY_TYPE:
		return "Unknown Geometry Type";
	case WKBErrorType::NESTED_TYPE_MISMATCH:
		return "Nested Type Mismatch";
	case WKBErrorType::TRUNCATED_INPUT:
		return "Truncated Input";
	case WKBErrorType::MIXED_GEOMETRY_TYPE:
		return "Mixed Geometry Type";
	case WKBErrorType::INVALID_GEOMETRY:
		return "Invalid Geometry";
	default:
		return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(type));
	}
}

ExceptionType WKBException::GetExceptionType(WKBErrorType type) {
	switch (type) {
	case WKBErrorType::UNSUPPORTED_BYTE_ORDER:
	case WKBErrorType::UNSUPPORTED_GEOMETRY_TYPE:
		return ExceptionType::NOT_IMPLEMENTED;
	case WKBErrorType::TRUNCATED_INPUT:
		return ExceptionType::SERIALIZATION;
	default:
		return ExceptionType::INVALID_INPUT;
	}
}

template <class T>
void WKBException::ThrowWithIndex(const string &msg, idx_t element_index) {
	T error(msg);
	static_cast<WKBException &>(error).element_index = element_index;
	throw error;
}

void WKBException::ThrowForElement(const WKBException &error, idx_t element_index, const string &element_id) {
	// Elements are numbered from 1 in messages, matching the default ids
	auto msg = StringUtil::Format("WKB element %d (id '%s'): %s", element_index + 1, element_id, error.GetMessage());
	switch (error.GetErrorType()) {
	case WKBErrorType::INVALID_INPUT:
		ThrowWithIndex<InvalidWKBInputException>(msg, element_index);
		break;
	case WKBErrorType::UNSUPPORTED_BYTE_ORDER:
		ThrowWithIndex<UnsupportedByteOrderException>(msg, element_index);
		break;
	case WKBErrorType::UNSUPPORTED_GEOMETRY_TYPE:
		ThrowWithIndex<UnsupportedGeometryTypeException>(msg, element_index);
		break;
	case WKBErrorType::UNKNOWN_GEOMETRY_TYPE:
		ThrowWithIndex<UnknownGeometryTypeException>(msg, element_index);
		break;
	case WKBErrorType::NESTED_TYPE_MISMATCH:
		ThrowWithIndex<NestedTypeMismatchException>(msg, element_index);
		break;
	case WKBErrorType::TRUNCATED_INPUT:
		ThrowWithIndex<TruncatedInputException>(msg, element_index);
		break;
	case WKBErrorType::MIXED_GEOMETRY_TYPE:
		ThrowWithIndex<MixedGeometryTypeException>(msg, element_index);
		break;
	case WKBErrorType::INVALID_GEOMETRY:
		ThrowWithIndex<InvalidGeometryException>(msg, element_index);
		break;
	default:
		throw InternalException("WKBException::ThrowForElement: unhandled error type");
	}
}

} // namespace core

} // namespace geowkb
