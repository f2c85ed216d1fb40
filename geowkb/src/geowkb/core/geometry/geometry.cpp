#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/util/math.hpp"

namespace geowkb {

namespace core {

//------------------------------------------------------------------------------
// ToString
//------------------------------------------------------------------------------
// Produces the parenthesized body of the WKT text, without the type name
struct WKTBodyOp {
	static string Case(Geometry::Tags::Point, const Geometry &geom) {
		auto vertex = Point::GetVertex(geom);
		return "(" + MathUtil::format_coord(vertex.x, vertex.y) + ")";
	}

	static string Case(Geometry::Tags::LineString, const Geometry &geom) {
		string result = "(";
		const auto &vertices = SinglePartGeometry::Vertices(geom);
		for (idx_t i = 0; i < vertices.size(); i++) {
			if (i > 0) {
				result += ", ";
			}
			result += MathUtil::format_coord(vertices[i].x, vertices[i].y);
		}
		result += ")";
		return result;
	}

	static string Case(Geometry::Tags::MultiPartGeometry, const Geometry &geom) {
		string result = "(";
		bool first = true;
		for (const auto &part : geom) {
			if (!first) {
				result += ", ";
			}
			first = false;
			result += Geometry::IsEmpty(part) ? "EMPTY" : Geometry::Match<WKTBodyOp>(part);
		}
		result += ")";
		return result;
	}
};

string Geometry::ToString() const {
	auto name = GeometryTypes::ToString(type);
	if (Geometry::IsEmpty(*this)) {
		return name + " EMPTY";
	}
	return name + " " + Geometry::Match<WKTBodyOp>(*this);
}

} // namespace core

} // namespace geowkb
