#include "geowkb/common.hpp"
#include "geowkb/core/geometry/wkb_reader.hpp"
#include "geowkb/core/geometry/geometry.hpp"

namespace geowkb {

namespace core {

// Smallest number of bytes each kind of counted item can occupy, used to bound the memory reserved up front
static constexpr idx_t WKB_HEADER_SIZE = sizeof(uint8_t) + sizeof(uint32_t);
static constexpr idx_t WKB_COUNT_SIZE = sizeof(uint32_t);
static constexpr idx_t MIN_RING_SIZE = WKB_COUNT_SIZE;
static constexpr idx_t MIN_NESTED_POINT_SIZE = WKB_HEADER_SIZE + VertexXY::WKB_SIZE;
static constexpr idx_t MIN_NESTED_LINESTRING_SIZE = WKB_HEADER_SIZE + WKB_COUNT_SIZE;
static constexpr idx_t MIN_NESTED_POLYGON_SIZE = WKB_HEADER_SIZE + WKB_COUNT_SIZE;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------
WKBReaderOptions WKBReaderOptions::FromNamedParameters(const named_parameter_map_t &input) {
	WKBReaderOptions result;
	for (auto &kv : input) {
		bool *target;
		if (StringUtil::CIEquals(kv.first, "validate_geometry")) {
			target = &result.validate_geometry;
		} else if (StringUtil::CIEquals(kv.first, "reject_trailing_bytes")) {
			target = &result.reject_trailing_bytes;
		} else {
			throw InvalidWKBInputException("Unknown WKB reader option '%s'", kv.first);
		}
		if (kv.second.IsNull() || kv.second.type().id() != LogicalTypeId::BOOLEAN) {
			throw InvalidWKBInputException("WKB reader option '%s' must be a BOOLEAN", kv.first);
		}
		*target = BooleanValue::Get(kv.second);
	}
	return result;
}

//------------------------------------------------------------------------------
// Primitives
//------------------------------------------------------------------------------
WKBByteOrder WKBReader::ReadByteOrder(Cursor &cursor) {
	auto order = cursor.Read<uint8_t>();
	if (order == static_cast<uint8_t>(WKBByteOrder::NDR)) {
		return WKBByteOrder::NDR;
	}
	if (order == static_cast<uint8_t>(WKBByteOrder::XDR)) {
		throw UnsupportedByteOrderException("WKB Reader: Only little endian (NDR) WKB is supported, got big endian (XDR)");
	}
	throw UnsupportedByteOrderException("WKB Reader: Only little endian (NDR) WKB is supported, got byte order flag %d",
	                                    static_cast<int>(order));
}

uint32_t WKBReader::ReadTypeCode(Cursor &cursor) {
	return cursor.ReadLE<uint32_t>();
}

uint32_t WKBReader::ReadCount(Cursor &cursor) {
	return cursor.ReadLE<uint32_t>();
}

idx_t WKBReader::ReserveCount(const Cursor &cursor, uint32_t count, idx_t min_item_size) {
	// Never reserve more items than the remaining bytes could hold, the reads themselves report the truncation
	return MinValue<idx_t>(count, cursor.Remaining() / min_item_size);
}

double WKBReader::ReadDouble(Cursor &cursor) {
	return cursor.ReadLE<double>();
}

VertexXY WKBReader::ReadVertex(Cursor &cursor) {
	auto x = ReadDouble(cursor);
	auto y = ReadDouble(cursor);
	return VertexXY(x, y);
}

//------------------------------------------------------------------------------
// Headers
//------------------------------------------------------------------------------
GeometryType WKBReader::ReadHeader(Cursor &cursor) {
	ReadByteOrder(cursor);
	auto code = ReadTypeCode(cursor);
	if (code == static_cast<uint32_t>(WKBGeometryType::GEOMETRYCOLLECTION)) {
		throw UnsupportedGeometryTypeException("WKB Reader: GeometryCollection is not a supported geometry type");
	}
	if (!WKBGeometryTypes::IsKnownCode(code)) {
		if (WKBGeometryTypes::IsDimensionalVariant(code)) {
			throw UnknownGeometryTypeException(
			    "WKB Reader: Geometry type code %d is a Z, M or SRID variant, only 2D geometries are supported", code);
		}
		throw UnknownGeometryTypeException("WKB Reader: Unknown geometry type code %d, supported geometry types are "
		                                   "Point, LineString, Polygon, MultiPoint, MultiLineString, and MultiPolygon",
		                                   code);
	}
	return WKBGeometryTypes::ToGeometryType(static_cast<WKBGeometryType>(code));
}

void WKBReader::ReadNestedHeader(Cursor &cursor, GeometryType parent_type, GeometryType expected_type) {
	ReadByteOrder(cursor);
	auto code = ReadTypeCode(cursor);
	if (code == static_cast<uint32_t>(WKBGeometryType::GEOMETRYCOLLECTION)) {
		throw UnsupportedGeometryTypeException("WKB Reader: GeometryCollection is not a supported geometry type");
	}
	if (code != WKBGeometryTypes::ToCode(expected_type)) {
		throw NestedTypeMismatchException("WKB Reader: %s may contain only %s geometries, got type code %d",
		                                  GeometryTypes::ToString(parent_type), GeometryTypes::ToString(expected_type),
		                                  code);
	}
}

//------------------------------------------------------------------------------
// Shared sequences
//------------------------------------------------------------------------------
vector<VertexXY> WKBReader::ReadVertices(Cursor &cursor) const {
	auto count = ReadCount(cursor);
	vector<VertexXY> vertices;
	vertices.reserve(ReserveCount(cursor, count, VertexXY::WKB_SIZE));
	for (uint32_t i = 0; i < count; i++) {
		vertices.push_back(ReadVertex(cursor));
	}
	return vertices;
}

vector<Geometry> WKBReader::ReadRings(Cursor &cursor) const {
	auto ring_count = ReadCount(cursor);
	vector<Geometry> rings;
	rings.reserve(ReserveCount(cursor, ring_count, MIN_RING_SIZE));
	for (uint32_t i = 0; i < ring_count; i++) {
		auto ring = Polygon::CreateRing(ReadVertices(cursor));
		if (options.validate_geometry) {
			if (ring.Count() < 4) {
				throw InvalidGeometryException("WKB Reader: Polygon ring %d has %d vertices, at least 4 are required",
				                               i, ring.Count());
			}
			if (!SinglePartGeometry::IsClosed(ring)) {
				throw InvalidGeometryException("WKB Reader: Polygon ring %d is not closed", i);
			}
		}
		rings.push_back(std::move(ring));
	}
	return rings;
}

//------------------------------------------------------------------------------
// Geometries
//------------------------------------------------------------------------------
Geometry WKBReader::ReadPoint(Cursor &cursor) const {
	return Point::Create(ReadVertex(cursor));
}

Geometry WKBReader::ReadLineString(Cursor &cursor) const {
	auto line_string = LineString::Create(ReadVertices(cursor));
	if (options.validate_geometry && line_string.Count() == 1) {
		throw InvalidGeometryException("WKB Reader: LineString must be empty or have at least 2 vertices, got 1");
	}
	return line_string;
}

Geometry WKBReader::ReadPolygon(Cursor &cursor) const {
	return Polygon::Create(ReadRings(cursor));
}

Geometry WKBReader::ReadMultiPoint(Cursor &cursor) const {
	auto count = ReadCount(cursor);
	vector<Geometry> points;
	points.reserve(ReserveCount(cursor, count, MIN_NESTED_POINT_SIZE));
	for (uint32_t i = 0; i < count; i++) {
		ReadNestedHeader(cursor, GeometryType::MULTIPOINT, GeometryType::POINT);
		points.push_back(ReadPoint(cursor));
	}
	return MultiPoint::Create(std::move(points));
}

Geometry WKBReader::ReadMultiLineString(Cursor &cursor) const {
	auto count = ReadCount(cursor);
	vector<Geometry> line_strings;
	line_strings.reserve(ReserveCount(cursor, count, MIN_NESTED_LINESTRING_SIZE));
	for (uint32_t i = 0; i < count; i++) {
		ReadNestedHeader(cursor, GeometryType::MULTILINESTRING, GeometryType::LINESTRING);
		line_strings.push_back(ReadLineString(cursor));
	}
	return MultiLineString::Create(std::move(line_strings));
}

Geometry WKBReader::ReadMultiPolygon(Cursor &cursor) const {
	auto count = ReadCount(cursor);
	vector<Geometry> polygons;
	polygons.reserve(ReserveCount(cursor, count, MIN_NESTED_POLYGON_SIZE));
	for (uint32_t i = 0; i < count; i++) {
		ReadNestedHeader(cursor, GeometryType::MULTIPOLYGON, GeometryType::POLYGON);
		polygons.push_back(ReadPolygon(cursor));
	}
	return MultiPolygon::Create(std::move(polygons));
}

Geometry WKBReader::ReadGeometry(Cursor &cursor) const {
	auto type = ReadHeader(cursor);
	switch (type) {
	case GeometryType::POINT:
		return ReadPoint(cursor);
	case GeometryType::LINESTRING:
		return ReadLineString(cursor);
	case GeometryType::POLYGON:
		return ReadPolygon(cursor);
	case GeometryType::MULTIPOINT:
		return ReadMultiPoint(cursor);
	case GeometryType::MULTILINESTRING:
		return ReadMultiLineString(cursor);
	case GeometryType::MULTIPOLYGON:
		return ReadMultiPolygon(cursor);
	default:
		throw InternalException("WKB Reader: Unexpected geometry type %s", GeometryTypes::ToString(type));
	}
}

//------------------------------------------------------------------------------
// Entry points
//------------------------------------------------------------------------------
Geometry WKBReader::Read(const_data_ptr_t wkb, idx_t size) const {
	Cursor cursor(wkb, wkb + size);
	auto geom = ReadGeometry(cursor);
	if (options.reject_trailing_bytes && !cursor.IsAtEnd()) {
		throw InvalidWKBInputException("WKB Reader: %d trailing bytes after %s geometry", cursor.Remaining(),
		                               GeometryTypes::ToString(geom.GetType()));
	}
	return geom;
}

Geometry WKBReader::Read(const string &wkb) const {
	return Read(const_data_ptr_cast(wkb.data()), wkb.size());
}

} // namespace core

} // namespace geowkb
