#pragma once

#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry_type.hpp"
#include "geowkb/core/geometry/vertex.hpp"

namespace geowkb {

namespace core {

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
// A decoded geometry value. Single-part geometries (points, linestrings and polygon rings) own their vertices,
// multi-part geometries (polygons and the multi-geometries) own their parts. Values are immutable once created.
class Geometry {
	friend struct SinglePartGeometry;
	friend struct MultiPartGeometry;

private:
	GeometryType type;
	vector<VertexXY> vertices;
	vector<Geometry> parts;

	explicit Geometry(GeometryType type) : type(type) {
	}

public:
	// By default, create an empty point
	Geometry() : type(GeometryType::POINT) {
	}

	GeometryType GetType() const {
		return type;
	}

	uint32_t Count() const {
		return static_cast<uint32_t>(IsSinglePart() ? vertices.size() : parts.size());
	}

	bool IsMultiPart() const {
		return GeometryTypes::IsMultiPart(type);
	}
	bool IsSinglePart() const {
		return GeometryTypes::IsSinglePart(type);
	}

	const Geometry &operator[](uint32_t index) const {
		D_ASSERT(index < parts.size());
		return parts[index];
	}
	const Geometry *begin() const {
		return parts.data();
	}
	const Geometry *end() const {
		return parts.data() + parts.size();
	}

	bool operator==(const Geometry &other) const {
		return type == other.type && vertices == other.vertices && parts == other.parts;
	}
	bool operator!=(const Geometry &other) const {
		return !(*this == other);
	}

public:
	// Used for tag dispatching
	struct Tags {
		// Base types
		struct AnyGeometry {};
		struct SinglePartGeometry : public AnyGeometry {};
		struct MultiPartGeometry : public AnyGeometry {};
		struct CollectionGeometry : public MultiPartGeometry {};
		// Concrete types
		struct Point : public SinglePartGeometry {};
		struct LineString : public SinglePartGeometry {};
		struct Polygon : public MultiPartGeometry {};
		struct MultiPoint : public CollectionGeometry {};
		struct MultiLineString : public CollectionGeometry {};
		struct MultiPolygon : public CollectionGeometry {};
	};

	// GEOMETRYCOLLECTION is never produced by the reader, so it has no case here
	template <class T, class... ARGS>
	static auto Match(const Geometry &geom, ARGS &&...args)
	    -> decltype(T::Case(std::declval<Tags::Point>(), std::declval<const Geometry &>(), std::declval<ARGS>()...)) {
		switch (geom.type) {
		case GeometryType::POINT:
			return T::Case(Tags::Point {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::LINESTRING:
			return T::Case(Tags::LineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::POLYGON:
			return T::Case(Tags::Polygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOINT:
			return T::Case(Tags::MultiPoint {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTILINESTRING:
			return T::Case(Tags::MultiLineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOLYGON:
			return T::Case(Tags::MultiPolygon {}, geom, std::forward<ARGS>(args)...);
		default:
			throw InternalException("Geometry::Match: unsupported geometry type %s",
			                        GeometryTypes::ToString(geom.type));
		}
	}

	static bool IsEmpty(const Geometry &geom);

	// Total number of vertices, recursing into parts
	static uint32_t VertexCount(const Geometry &geom);

	// Render as WKT-like text, e.g. "POINT (1 3)". Meant for diagnostics, not for round-tripping.
	string ToString() const;
};

inline bool Geometry::IsEmpty(const Geometry &geom) {
	struct op {
		static bool Case(Geometry::Tags::SinglePartGeometry, const Geometry &geom) {
			return geom.vertices.empty();
		}
		static bool Case(Geometry::Tags::MultiPartGeometry, const Geometry &geom) {
			for (const auto &part : geom) {
				if (!Geometry::Match<op>(part)) {
					return false;
				}
			}
			return true;
		}
	};
	return Geometry::Match<op>(geom);
}

inline uint32_t Geometry::VertexCount(const Geometry &geom) {
	struct op {
		static uint32_t Case(Geometry::Tags::SinglePartGeometry, const Geometry &geom) {
			return static_cast<uint32_t>(geom.vertices.size());
		}
		static uint32_t Case(Geometry::Tags::MultiPartGeometry, const Geometry &geom) {
			uint32_t count = 0;
			for (const auto &part : geom) {
				count += Geometry::Match<op>(part);
			}
			return count;
		}
	};
	return Geometry::Match<op>(geom);
}

//------------------------------------------------------------------------------
// Accessors
//------------------------------------------------------------------------------

//------------------------------------------------------------------------------
// SinglePartGeometry
//------------------------------------------------------------------------------
struct SinglePartGeometry {
	static const vector<VertexXY> &Vertices(const Geometry &geom) {
		D_ASSERT(geom.IsSinglePart());
		return geom.vertices;
	}

	static VertexXY GetVertex(const Geometry &geom, uint32_t index) {
		D_ASSERT(geom.IsSinglePart());
		D_ASSERT(index < geom.vertices.size());
		return geom.vertices[index];
	}

	// Check if the geometry is closed (first and last vertex are the same)
	// A geometry with 1 vertex is considered closed, 0 vertices are considered open
	static bool IsClosed(const Geometry &geom) {
		D_ASSERT(geom.IsSinglePart());
		if (geom.vertices.empty()) {
			return false;
		}
		return geom.vertices.front() == geom.vertices.back();
	}

protected:
	static Geometry Create(GeometryType type, vector<VertexXY> vertices) {
		D_ASSERT(GeometryTypes::IsSinglePart(type));
		Geometry geom(type);
		geom.vertices = std::move(vertices);
		return geom;
	}
};

//------------------------------------------------------------------------------
// MultiPartGeometry
//------------------------------------------------------------------------------
struct MultiPartGeometry {
	static const Geometry &Part(const Geometry &geom, uint32_t index) {
		D_ASSERT(geom.IsMultiPart());
		D_ASSERT(index < geom.parts.size());
		return geom.parts[index];
	}

	static uint32_t PartCount(const Geometry &geom) {
		D_ASSERT(geom.IsMultiPart());
		return static_cast<uint32_t>(geom.parts.size());
	}

protected:
	static Geometry Create(GeometryType type, GeometryType part_type, vector<Geometry> parts) {
		D_ASSERT(GeometryTypes::IsMultiPart(type));
#ifdef DEBUG
		for (const auto &part : parts) {
			D_ASSERT(part.GetType() == part_type);
		}
#endif
		(void)part_type;
		Geometry geom(type);
		geom.parts = std::move(parts);
		return geom;
	}
};

//------------------------------------------------------------------------------
// Concrete geometries
//------------------------------------------------------------------------------
struct Point : public SinglePartGeometry {
	static Geometry Create(const VertexXY &vertex) {
		return SinglePartGeometry::Create(GeometryType::POINT, vector<VertexXY> {vertex});
	}

	static VertexXY GetVertex(const Geometry &geom) {
		D_ASSERT(geom.GetType() == GeometryType::POINT);
		return SinglePartGeometry::GetVertex(geom, 0);
	}
};

struct LineString : public SinglePartGeometry {
	static Geometry Create(vector<VertexXY> vertices) {
		return SinglePartGeometry::Create(GeometryType::LINESTRING, std::move(vertices));
	}
};

// Rings are stored as LINESTRING parts, ring 0 is the exterior ring
struct Polygon : public MultiPartGeometry {
	static Geometry Create(vector<Geometry> rings) {
		return MultiPartGeometry::Create(GeometryType::POLYGON, GeometryType::LINESTRING, std::move(rings));
	}

	static Geometry CreateRing(vector<VertexXY> vertices) {
		return LineString::Create(std::move(vertices));
	}
};

struct MultiPoint : public MultiPartGeometry {
	static Geometry Create(vector<Geometry> points) {
		return MultiPartGeometry::Create(GeometryType::MULTIPOINT, GeometryType::POINT, std::move(points));
	}
};

struct MultiLineString : public MultiPartGeometry {
	static Geometry Create(vector<Geometry> line_strings) {
		return MultiPartGeometry::Create(GeometryType::MULTILINESTRING, GeometryType::LINESTRING,
		                                 std::move(line_strings));
	}
};

struct MultiPolygon : public MultiPartGeometry {
	static Geometry Create(vector<Geometry> polygons) {
		return MultiPartGeometry::Create(GeometryType::MULTIPOLYGON, GeometryType::POLYGON, std::move(polygons));
	}
};

} // namespace core

} // namespace geowkb
