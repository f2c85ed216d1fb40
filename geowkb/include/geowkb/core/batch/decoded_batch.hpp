#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry.hpp"

namespace geowkb {

namespace core {

// The layout a decoded batch is folded into, one per kind of container the builder produces
enum class BatchShape : uint8_t {
	//! All POINT: a single coordinate table, one row per element
	POINTS = 0,
	//! All MULTIPOINT: one coordinate table per element
	POINT_SETS,
	//! All LINESTRING or all MULTILINESTRING: one path per element
	LINES,
	//! All POLYGON or all MULTIPOLYGON: one ring group per element
	POLYGONS
};

struct PointSet {
	string id;
	vector<VertexXY> points;
};

struct LinePath {
	string id;
	vector<vector<VertexXY>> lines;
};

struct RingGroup {
	string id;
	vector<vector<VertexXY>> rings;
};

struct DecodedBatch {
	static constexpr const char *UNKNOWN_CRS = "NA";

	//! The geometry type shared by every element
	GeometryType geometry_type = GeometryType::POINT;
	BatchShape shape = BatchShape::POINTS;
	//! Passed through untouched
	string crs = UNKNOWN_CRS;

	vector<string> ids;
	vector<Geometry> geometries;

	// Only the member matching "shape" is populated
	vector<VertexXY> points;
	vector<PointSet> point_sets;
	vector<LinePath> lines;
	vector<RingGroup> polygons;

	idx_t Count() const {
		return ids.size();
	}

	string ToString() const;
	void Print() const;

	static BatchShape GetShape(GeometryType type);
	static string ShapeToString(BatchShape shape);
};

} // namespace core

} // namespace geowkb
