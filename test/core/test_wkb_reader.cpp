#include "geowkb/core/geometry/wkb_reader.hpp"
#include "wkb_test_util.hpp"

#include <gtest/gtest.h>

namespace geowkb {

namespace core {

using test::Coords;
using test::HexToBlob;
using test::LineStringWKB;
using test::MultiLineStringWKB;
using test::MultiPointWKB;
using test::MultiPolygonWKB;
using test::PointWKB;
using test::PolygonWKB;
using test::UnitSquare;
using test::WKBWriter;

//------------------------------------------------------------------------------
// Geometries
//------------------------------------------------------------------------------
TEST(WKBReaderTest, ReadsPoint) {
	WKBReader reader;
	auto geom = reader.Read(HexToBlob("01 01000000 000000000000F03F 0000000000000840"));

	ASSERT_EQ(geom.GetType(), GeometryType::POINT);
	EXPECT_EQ(Point::GetVertex(geom), VertexXY(1, 3));
	EXPECT_EQ(geom.ToString(), "POINT (1 3)");
}

TEST(WKBReaderTest, ReadsLineString) {
	WKBReader reader;
	auto geom = reader.Read(LineStringWKB(Coords {{0, 0}, {1.5, -2}, {3, 4}}));

	ASSERT_EQ(geom.GetType(), GeometryType::LINESTRING);
	ASSERT_EQ(geom.Count(), 3u);
	EXPECT_EQ(SinglePartGeometry::GetVertex(geom, 1), VertexXY(1.5, -2));
	EXPECT_EQ(geom.ToString(), "LINESTRING (0 0, 1.5 -2, 3 4)");
}

TEST(WKBReaderTest, ReadsEmptyLineString) {
	WKBReader reader;
	auto geom = reader.Read(HexToBlob("01 02000000 00000000"));

	ASSERT_EQ(geom.GetType(), GeometryType::LINESTRING);
	EXPECT_TRUE(Geometry::IsEmpty(geom));
	EXPECT_EQ(geom.ToString(), "LINESTRING EMPTY");
}

TEST(WKBReaderTest, ReadsPolygonWithHole) {
	WKBReader reader;
	Coords shell {{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}};
	Coords hole {{2, 2}, {4, 2}, {4, 4}, {2, 2}};
	auto geom = reader.Read(PolygonWKB({shell, hole}));

	ASSERT_EQ(geom.GetType(), GeometryType::POLYGON);
	ASSERT_EQ(MultiPartGeometry::PartCount(geom), 2u);
	EXPECT_EQ(geom[0].Count(), 5u);
	EXPECT_EQ(geom[1].Count(), 4u);
	EXPECT_EQ(SinglePartGeometry::GetVertex(geom[1], 2), VertexXY(4, 4));
	EXPECT_EQ(Geometry::VertexCount(geom), 9u);
	EXPECT_TRUE(SinglePartGeometry::IsClosed(MultiPartGeometry::Part(geom, 1)));
	EXPECT_NE(SinglePartGeometry::GetVertex(geom[1], 0), SinglePartGeometry::GetVertex(geom[1], 1));
}

TEST(WKBReaderTest, ReadsMultiPoint) {
	WKBReader reader;
	auto geom = reader.Read(HexToBlob("01 04000000 01000000 01 01000000 0000000000000040 0000000000000840"));

	ASSERT_EQ(geom.GetType(), GeometryType::MULTIPOINT);
	ASSERT_EQ(geom.Count(), 1u);
	EXPECT_EQ(Point::GetVertex(geom[0]), VertexXY(2, 3));
	EXPECT_EQ(geom.ToString(), "MULTIPOINT ((2 3))");
}

TEST(WKBReaderTest, ReadsMultiLineString) {
	WKBReader reader;
	auto geom = reader.Read(MultiLineStringWKB({Coords {{0, 0}, {1, 1}}, Coords {{2, 2}, {3, 3}, {4, 4}}}));

	ASSERT_EQ(geom.GetType(), GeometryType::MULTILINESTRING);
	ASSERT_EQ(geom.Count(), 2u);
	EXPECT_EQ(geom[0].GetType(), GeometryType::LINESTRING);
	EXPECT_EQ(geom[1].Count(), 3u);
	EXPECT_EQ(geom.ToString(), "MULTILINESTRING ((0 0, 1 1), (2 2, 3 3, 4 4))");
}

TEST(WKBReaderTest, ReadsMultiPolygon) {
	WKBReader reader;
	Coords triangle {{5, 5}, {6, 5}, {6, 6}, {5, 5}};
	auto geom = reader.Read(MultiPolygonWKB({{UnitSquare()}, {triangle}}));

	ASSERT_EQ(geom.GetType(), GeometryType::MULTIPOLYGON);
	ASSERT_EQ(geom.Count(), 2u);
	EXPECT_EQ(geom[0].GetType(), GeometryType::POLYGON);
	EXPECT_EQ(geom[1][0].Count(), 4u);
}

TEST(WKBReaderTest, ReadsEmptyCollections) {
	WKBReader reader;

	EXPECT_TRUE(Geometry::IsEmpty(reader.Read(HexToBlob("01 03000000 00000000"))));
	EXPECT_TRUE(Geometry::IsEmpty(reader.Read(HexToBlob("01 04000000 00000000"))));
	EXPECT_TRUE(Geometry::IsEmpty(reader.Read(HexToBlob("01 06000000 00000000"))));
}

TEST(WKBReaderTest, ReadingIsPure) {
	WKBReader reader;
	auto blob = MultiPolygonWKB({{UnitSquare()}});
	auto copy = blob;

	auto first = reader.Read(blob);
	auto second = reader.Read(blob);
	EXPECT_EQ(first, second);
	EXPECT_NE(first, reader.Read(MultiPolygonWKB({{UnitSquare()}, {UnitSquare()}})));
	EXPECT_EQ(blob, copy);
}

TEST(WKBReaderTest, ReadsFromRawPointer) {
	WKBReader reader;
	auto blob = PointWKB(-1, 2.5);
	auto geom = reader.Read(const_data_ptr_cast(blob.data()), blob.size());
	EXPECT_EQ(Point::GetVertex(geom), VertexXY(-1, 2.5));
}

//------------------------------------------------------------------------------
// Errors
//------------------------------------------------------------------------------
TEST(WKBReaderTest, RejectsBigEndian) {
	WKBReader reader;
	EXPECT_THROW(reader.Read(HexToBlob("00 00000001 3FF0000000000000 4008000000000000")),
	             UnsupportedByteOrderException);
	EXPECT_THROW(reader.Read(WKBWriter().Header(1, 2).Vertex(1, 1).Blob()), UnsupportedByteOrderException);
}

TEST(WKBReaderTest, RejectsBigEndianNestedGeometry) {
	WKBReader reader;
	auto blob = WKBWriter().Header(4).UInt32(1).Header(1, 0).Vertex(1, 1).Blob();
	EXPECT_THROW(reader.Read(blob), UnsupportedByteOrderException);
}

TEST(WKBReaderTest, RejectsGeometryCollection) {
	WKBReader reader;
	auto blob = WKBWriter().Header(7).UInt32(0).Blob();
	try {
		reader.Read(blob);
		FAIL() << "expected an exception";
	} catch (UnsupportedGeometryTypeException &ex) {
		EXPECT_EQ(ex.GetErrorType(), WKBErrorType::UNSUPPORTED_GEOMETRY_TYPE);
		EXPECT_FALSE(ex.GetElementIndex().IsValid());
	}
}

TEST(WKBReaderTest, RejectsUnknownTypeCodes) {
	WKBReader reader;
	EXPECT_THROW(reader.Read(WKBWriter().Header(0).Vertex(1, 1).Blob()), UnknownGeometryTypeException);
	EXPECT_THROW(reader.Read(WKBWriter().Header(8).Vertex(1, 1).Blob()), UnknownGeometryTypeException);
	EXPECT_THROW(reader.Read(WKBWriter().Header(42).Vertex(1, 1).Blob()), UnknownGeometryTypeException);
}

TEST(WKBReaderTest, RejectsDimensionalVariants) {
	WKBReader reader;
	// ISO Point Z and the EWKB flagged Point Z
	EXPECT_THROW(reader.Read(WKBWriter().Header(1001).Vertex(1, 1).Double(1).Blob()), UnknownGeometryTypeException);
	EXPECT_THROW(reader.Read(WKBWriter().Header(0x80000001).Vertex(1, 1).Double(1).Blob()),
	             UnknownGeometryTypeException);
}

TEST(WKBReaderTest, RejectsNestedTypeMismatch) {
	WKBReader reader;
	auto line_in_multi_point = WKBWriter().Header(4).UInt32(1).Append(LineStringWKB(Coords {{0, 0}, {1, 1}})).Blob();
	EXPECT_THROW(reader.Read(line_in_multi_point), NestedTypeMismatchException);

	auto point_in_multi_polygon = WKBWriter().Header(6).UInt32(1).Append(PointWKB(1, 1)).Append(PointWKB(1, 1)).Blob();
	EXPECT_THROW(reader.Read(point_in_multi_polygon), NestedTypeMismatchException);

	auto unknown_in_multi_line = WKBWriter().Header(5).UInt32(1).Header(99).UInt32(0).Blob();
	EXPECT_THROW(reader.Read(unknown_in_multi_line), NestedTypeMismatchException);
}

TEST(WKBReaderTest, RejectsNestedGeometryCollection) {
	WKBReader reader;
	auto blob = WKBWriter().Header(4).UInt32(1).Header(7).UInt32(0).Blob();
	EXPECT_THROW(reader.Read(blob), UnsupportedGeometryTypeException);
}

TEST(WKBReaderTest, NestedHeaderIsCheckedBeforeItsBody) {
	WKBReader reader;
	// An empty linestring is smaller than any point, the header still decides the error
	EXPECT_THROW(reader.Read(HexToBlob("01 04000000 01000000 01 02000000 00000000")), NestedTypeMismatchException);
	// Headers without any body after them
	EXPECT_THROW(reader.Read(HexToBlob("01 05000000 01000000 01 63000000")), NestedTypeMismatchException);
	EXPECT_THROW(reader.Read(HexToBlob("01 06000000 01000000 01 07000000")), UnsupportedGeometryTypeException);
	EXPECT_THROW(reader.Read(HexToBlob("01 04000000 01000000 00 00000001")), UnsupportedByteOrderException);
	// A matching header with a missing body is truncated
	EXPECT_THROW(reader.Read(HexToBlob("01 04000000 01000000 01 01000000")), TruncatedInputException);
}

TEST(WKBReaderTest, RejectsTruncatedInput) {
	WKBReader reader;
	EXPECT_THROW(reader.Read(string()), TruncatedInputException);
	EXPECT_THROW(reader.Read(HexToBlob("01 010000")), TruncatedInputException);

	auto point = PointWKB(1, 3);
	EXPECT_THROW(reader.Read(point.substr(0, point.size() - 1)), TruncatedInputException);

	auto polygon = PolygonWKB({UnitSquare()});
	EXPECT_THROW(reader.Read(polygon.substr(0, 20)), TruncatedInputException);
}

TEST(WKBReaderTest, RejectsImpossibleCounts) {
	WKBReader reader;
	// Counts the remaining bytes cannot hold end in a truncated read, without reserving memory for them
	EXPECT_THROW(reader.Read(WKBWriter().Header(2).UInt32(0xFFFFFFFF).Blob()), TruncatedInputException);
	EXPECT_THROW(reader.Read(WKBWriter().Header(4).UInt32(0x7FFFFFFF).Append(PointWKB(0, 0)).Blob()),
	             TruncatedInputException);
	EXPECT_THROW(reader.Read(WKBWriter().Header(3).UInt32(1000).UInt32(0).Blob()), TruncatedInputException);
}

TEST(WKBReaderTest, ErrorTypesMapToExceptionTypes) {
	EXPECT_EQ(WKBException::GetExceptionType(WKBErrorType::TRUNCATED_INPUT), ExceptionType::SERIALIZATION);
	EXPECT_EQ(WKBException::GetExceptionType(WKBErrorType::UNSUPPORTED_BYTE_ORDER), ExceptionType::NOT_IMPLEMENTED);
	EXPECT_EQ(WKBException::GetExceptionType(WKBErrorType::UNSUPPORTED_GEOMETRY_TYPE),
	          ExceptionType::NOT_IMPLEMENTED);
	EXPECT_EQ(WKBException::GetExceptionType(WKBErrorType::MIXED_GEOMETRY_TYPE), ExceptionType::INVALID_INPUT);
	EXPECT_EQ(WKBException::ErrorTypeToString(WKBErrorType::NESTED_TYPE_MISMATCH), "Nested Type Mismatch");
}

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------
TEST(WKBReaderTest, TrailingBytesAreIgnoredByDefault) {
	WKBReader reader;
	auto blob = WKBWriter().Append(PointWKB(1, 2)).Byte(0xFF).Blob();
	EXPECT_EQ(Point::GetVertex(reader.Read(blob)), VertexXY(1, 2));
}

TEST(WKBReaderTest, TrailingBytesCanBeRejected) {
	WKBReaderOptions options;
	options.reject_trailing_bytes = true;
	WKBReader reader(options);

	auto blob = WKBWriter().Append(PointWKB(1, 2)).Byte(0xFF).Blob();
	EXPECT_THROW(reader.Read(blob), InvalidWKBInputException);
	EXPECT_NO_THROW(reader.Read(PointWKB(1, 2)));
}

TEST(WKBReaderTest, GeometryIsNotValidatedByDefault) {
	WKBReader reader;
	Coords open_ring {{0, 0}, {1, 0}, {1, 1}};

	auto polygon = reader.Read(PolygonWKB({open_ring}));
	EXPECT_EQ(polygon[0].Count(), 3u);
	auto line_string = reader.Read(LineStringWKB(Coords {{7, 7}}));
	EXPECT_EQ(line_string.Count(), 1u);
}

TEST(WKBReaderTest, ValidationRejectsDegenerateGeometries) {
	WKBReaderOptions options;
	options.validate_geometry = true;
	WKBReader reader(options);

	EXPECT_THROW(reader.Read(PolygonWKB({Coords {{0, 0}, {1, 0}, {0, 0}}})), InvalidGeometryException);
	EXPECT_THROW(reader.Read(PolygonWKB({Coords {{0, 0}, {1, 0}, {1, 1}, {0, 1}}})), InvalidGeometryException);
	EXPECT_THROW(reader.Read(LineStringWKB(Coords {{7, 7}})), InvalidGeometryException);
	EXPECT_THROW(reader.Read(MultiLineStringWKB({Coords {{7, 7}}})), InvalidGeometryException);

	EXPECT_NO_THROW(reader.Read(PolygonWKB({UnitSquare()})));
	EXPECT_NO_THROW(reader.Read(LineStringWKB(Coords {})));
}

TEST(WKBReaderOptionsTest, FromNamedParameters) {
	named_parameter_map_t params;
	params["validate_geometry"] = Value::BOOLEAN(true);
	params["REJECT_TRAILING_BYTES"] = Value::BOOLEAN(true);

	auto options = WKBReaderOptions::FromNamedParameters(params);
	EXPECT_TRUE(options.validate_geometry);
	EXPECT_TRUE(options.reject_trailing_bytes);

	auto defaults = WKBReaderOptions::FromNamedParameters(named_parameter_map_t());
	EXPECT_FALSE(defaults.validate_geometry);
	EXPECT_FALSE(defaults.reject_trailing_bytes);
}

TEST(WKBReaderOptionsTest, RejectsBadParameters) {
	named_parameter_map_t unknown;
	unknown["strict"] = Value::BOOLEAN(true);
	EXPECT_THROW(WKBReaderOptions::FromNamedParameters(unknown), InvalidWKBInputException);

	named_parameter_map_t wrong_type;
	wrong_type["validate_geometry"] = Value("yes");
	EXPECT_THROW(WKBReaderOptions::FromNamedParameters(wrong_type), InvalidWKBInputException);
}

} // namespace core

} // namespace geowkb
