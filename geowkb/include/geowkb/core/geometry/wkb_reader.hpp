#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/util/cursor.hpp"

namespace geowkb {

namespace core {

struct WKBReaderOptions {
	//! Reject linestrings with a single vertex and polygon rings that are open or have fewer than 4 vertices
	bool validate_geometry = false;
	//! Reject buffers that have bytes left over after the geometry
	bool reject_trailing_bytes = false;

	//! Read the options from a set of named parameters ("validate_geometry", "reject_trailing_bytes")
	static WKBReaderOptions FromNamedParameters(const named_parameter_map_t &input);
};

// Decodes little endian, 2D WKB into a Geometry.
// Big endian input, GeometryCollection and the Z/M/SRID variants are rejected.
class WKBReader {
private:
	WKBReaderOptions options;

	// Primitives
	static WKBByteOrder ReadByteOrder(Cursor &cursor);
	static uint32_t ReadTypeCode(Cursor &cursor);
	static uint32_t ReadCount(Cursor &cursor);
	static idx_t ReserveCount(const Cursor &cursor, uint32_t count, idx_t min_item_size);
	static double ReadDouble(Cursor &cursor);
	static VertexXY ReadVertex(Cursor &cursor);

	// Headers
	static GeometryType ReadHeader(Cursor &cursor);
	static void ReadNestedHeader(Cursor &cursor, GeometryType parent_type, GeometryType expected_type);

	// Shared sequences
	vector<VertexXY> ReadVertices(Cursor &cursor) const;
	vector<Geometry> ReadRings(Cursor &cursor) const;

	// Geometries
	Geometry ReadPoint(Cursor &cursor) const;
	Geometry ReadLineString(Cursor &cursor) const;
	Geometry ReadPolygon(Cursor &cursor) const;
	Geometry ReadMultiPoint(Cursor &cursor) const;
	Geometry ReadMultiLineString(Cursor &cursor) const;
	Geometry ReadMultiPolygon(Cursor &cursor) const;
	Geometry ReadGeometry(Cursor &cursor) const;

public:
	WKBReader() = default;
	explicit WKBReader(WKBReaderOptions options_p) : options(options_p) {
	}

	const WKBReaderOptions &GetOptions() const {
		return options;
	}

	Geometry Read(const_data_ptr_t wkb, idx_t size) const;
	Geometry Read(const string &wkb) const;
};

} // namespace core

} // namespace geowkb
