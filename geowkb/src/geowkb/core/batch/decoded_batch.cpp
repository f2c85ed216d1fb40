#include "geowkb/core/batch/decoded_batch.hpp"

namespace geowkb {

namespace core {

constexpr const char *DecodedBatch::UNKNOWN_CRS;

BatchShape DecodedBatch::GetShape(GeometryType type) {
	switch (type) {
	case GeometryType::POINT:
		return BatchShape::POINTS;
	case GeometryType::MULTIPOINT:
		return BatchShape::POINT_SETS;
	case GeometryType::LINESTRING:
	case GeometryType::MULTILINESTRING:
		return BatchShape::LINES;
	case GeometryType::POLYGON:
	case GeometryType::MULTIPOLYGON:
		return BatchShape::POLYGONS;
	default:
		throw InternalException("DecodedBatch::GetShape: no batch shape for geometry type %s",
		                        GeometryTypes::ToString(type));
	}
}

string DecodedBatch::ShapeToString(BatchShape shape) {
	switch (shape) {
	case BatchShape::POINTS:
		return "POINTS";
	case BatchShape::POINT_SETS:
		return "POINT_SETS";
	case BatchShape::LINES:
		return "LINES";
	case BatchShape::POLYGONS:
		return "POLYGONS";
	default:
		return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(shape));
	}
}

string DecodedBatch::ToString() const {
	string result = StringUtil::Format("DecodedBatch (type: %s, shape: %s, crs: %s, count: %d)\n",
	                                   GeometryTypes::ToString(geometry_type), ShapeToString(shape), crs, Count());
	for (idx_t i = 0; i < geometries.size(); i++) {
		result += "  " + ids[i] + ": " + geometries[i].ToString() + "\n";
	}
	return result;
}

void DecodedBatch::Print() const {
	Printer::Print(ToString());
}

} // namespace core

} // namespace geowkb
