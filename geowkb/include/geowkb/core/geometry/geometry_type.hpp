#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

enum class GeometryType : uint8_t {
	POINT = 0,
	LINESTRING,
	POLYGON,
	MULTIPOINT,
	MULTILINESTRING,
	MULTIPOLYGON,
	GEOMETRYCOLLECTION
};

struct GeometryTypes {
	static bool IsSinglePart(GeometryType type) {
		return type == GeometryType::POINT || type == GeometryType::LINESTRING;
	}

	static bool IsMultiPart(GeometryType type) {
		return type == GeometryType::POLYGON || type == GeometryType::MULTIPOINT ||
		       type == GeometryType::MULTILINESTRING || type == GeometryType::MULTIPOLYGON ||
		       type == GeometryType::GEOMETRYCOLLECTION;
	}

	static string ToString(GeometryType type) {
		switch (type) {
		case GeometryType::POINT:
			return "POINT";
		case GeometryType::LINESTRING:
			return "LINESTRING";
		case GeometryType::POLYGON:
			return "POLYGON";
		case GeometryType::MULTIPOINT:
			return "MULTIPOINT";
		case GeometryType::MULTILINESTRING:
			return "MULTILINESTRING";
		case GeometryType::MULTIPOLYGON:
			return "MULTIPOLYGON";
		case GeometryType::GEOMETRYCOLLECTION:
			return "GEOMETRYCOLLECTION";
		default:
			return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(type));
		}
	}
};

//------------------------------------------------------------------------------
// WKB header values
//------------------------------------------------------------------------------

enum class WKBByteOrder : uint8_t {
	XDR = 0, // Big endian
	NDR = 1, // Little endian
};

// The type codes as they appear on the wire (1-indexed, unlike GeometryType)
enum class WKBGeometryType : uint32_t {
	POINT = 1,
	LINESTRING = 2,
	POLYGON = 3,
	MULTIPOINT = 4,
	MULTILINESTRING = 5,
	MULTIPOLYGON = 6,
	GEOMETRYCOLLECTION = 7
};

struct WKBGeometryTypes {
	static bool IsKnownCode(uint32_t code) {
		return code >= static_cast<uint32_t>(WKBGeometryType::POINT) &&
		       code <= static_cast<uint32_t>(WKBGeometryType::GEOMETRYCOLLECTION);
	}

	// Only valid for known codes
	static GeometryType ToGeometryType(WKBGeometryType type) {
		return static_cast<GeometryType>(static_cast<uint32_t>(type) - 1);
	}

	static uint32_t ToCode(GeometryType type) {
		return static_cast<uint32_t>(type) + 1;
	}

	// True if the code looks like an ISO (1000-offset) or EWKB (flag bits) variant of a known type
	static bool IsDimensionalVariant(uint32_t code) {
		if ((code & 0xE0000000) != 0) {
			return IsKnownCode(code & 0x0000FFFF);
		}
		auto iso_props = code / 1000;
		return iso_props >= 1 && iso_props <= 3 && IsKnownCode(code % 1000);
	}
};

} // namespace core

} // namespace geowkb
