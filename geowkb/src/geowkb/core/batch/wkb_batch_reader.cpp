#include "geowkb/common.hpp"
#include "geowkb/core/batch/wkb_batch_reader.hpp"
#include "geowkb/core/exception.hpp"

namespace geowkb {

namespace core {

//------------------------------------------------------------------------------
// Aggregation
//------------------------------------------------------------------------------
struct AggregateOp {
	// Points are merged into a single table, the ids only live on the batch itself
	static void Case(Geometry::Tags::Point, const Geometry &geom, DecodedBatch &batch, const string &) {
		batch.points.push_back(Point::GetVertex(geom));
	}

	// Unlike every other type, multi-points stay split up per element
	static void Case(Geometry::Tags::MultiPoint, const Geometry &geom, DecodedBatch &batch, const string &id) {
		PointSet point_set;
		point_set.id = id;
		point_set.points.reserve(geom.Count());
		for (const auto &point : geom) {
			point_set.points.push_back(Point::GetVertex(point));
		}
		batch.point_sets.push_back(std::move(point_set));
	}

	static void Case(Geometry::Tags::LineString, const Geometry &geom, DecodedBatch &batch, const string &id) {
		LinePath path;
		path.id = id;
		path.lines.push_back(SinglePartGeometry::Vertices(geom));
		batch.lines.push_back(std::move(path));
	}

	static void Case(Geometry::Tags::MultiLineString, const Geometry &geom, DecodedBatch &batch, const string &id) {
		LinePath path;
		path.id = id;
		path.lines.reserve(geom.Count());
		for (const auto &line_string : geom) {
			path.lines.push_back(SinglePartGeometry::Vertices(line_string));
		}
		batch.lines.push_back(std::move(path));
	}

	static void Case(Geometry::Tags::Polygon, const Geometry &geom, DecodedBatch &batch, const string &id) {
		RingGroup group;
		group.id = id;
		group.rings.reserve(geom.Count());
		for (const auto &ring : geom) {
			group.rings.push_back(SinglePartGeometry::Vertices(ring));
		}
		batch.polygons.push_back(std::move(group));
	}

	// The rings of all member polygons end up in one group, in order
	static void Case(Geometry::Tags::MultiPolygon, const Geometry &geom, DecodedBatch &batch, const string &id) {
		RingGroup group;
		group.id = id;
		for (const auto &polygon : geom) {
			for (const auto &ring : polygon) {
				group.rings.push_back(SinglePartGeometry::Vertices(ring));
			}
		}
		batch.polygons.push_back(std::move(group));
	}
};

vector<string> WKBBatchReader::DefaultIds(idx_t count) {
	vector<string> ids;
	ids.reserve(count);
	for (idx_t i = 0; i < count; i++) {
		ids.push_back(std::to_string(i + 1));
	}
	return ids;
}

void WKBBatchReader::CheckHomogeneous(const DecodedBatch &batch) {
	D_ASSERT(!batch.geometries.empty());
	auto expected_type = batch.geometries[0].GetType();
	for (idx_t i = 1; i < batch.geometries.size(); i++) {
		auto actual_type = batch.geometries[i].GetType();
		if (actual_type != expected_type) {
			MixedGeometryTypeException error(
			    "Elements of wkb cannot have different geometry types, element 1 (id '%s') is %s but this element is %s",
			    batch.ids[0], GeometryTypes::ToString(expected_type), GeometryTypes::ToString(actual_type));
			WKBException::ThrowForElement(error, i, batch.ids[i]);
		}
	}
}

void WKBBatchReader::Aggregate(DecodedBatch &batch) {
	batch.geometry_type = batch.geometries[0].GetType();
	batch.shape = DecodedBatch::GetShape(batch.geometry_type);
	for (idx_t i = 0; i < batch.geometries.size(); i++) {
		Geometry::Match<AggregateOp>(batch.geometries[i], batch, batch.ids[i]);
	}
}

//------------------------------------------------------------------------------
// Typed input
//------------------------------------------------------------------------------
DecodedBatch WKBBatchReader::Read(const vector<string> &buffers, const vector<string> &ids, const string &crs) const {
	if (buffers.empty()) {
		throw InvalidWKBInputException("wkb must have length 1 or greater");
	}
	if (!ids.empty() && ids.size() != buffers.size()) {
		throw InvalidWKBInputException("wkb and id must have same length, got %d buffers and %d ids", buffers.size(),
		                               ids.size());
	}

	DecodedBatch batch;
	batch.crs = crs;
	batch.ids = ids.empty() ? DefaultIds(buffers.size()) : ids;
	batch.geometries.reserve(buffers.size());

	// Every buffer is decoded before the batch as a whole is checked
	for (idx_t i = 0; i < buffers.size(); i++) {
		try {
			batch.geometries.push_back(reader.Read(buffers[i]));
		} catch (WKBException &ex) {
			WKBException::ThrowForElement(ex, i, batch.ids[i]);
		}
	}

	CheckHomogeneous(batch);
	Aggregate(batch);
	return batch;
}

DecodedBatch WKBBatchReader::ReadSingle(const string &buffer, const string &id, const string &crs) const {
	return Read(vector<string> {buffer}, vector<string> {id}, crs);
}

//------------------------------------------------------------------------------
// Loosely typed input
//------------------------------------------------------------------------------
vector<string> WKBBatchReader::ReadBuffers(const Value &wkb, const Value &id) {
	if (wkb.IsNull()) {
		throw InvalidWKBInputException("wkb must be a BLOB or a LIST of BLOBs, got NULL");
	}
	vector<string> buffers;
	switch (wkb.type().id()) {
	case LogicalTypeId::BLOB: {
		// A lone buffer is only accepted together with at most one id
		if (!id.IsNull() && id.type().id() == LogicalTypeId::LIST && ListValue::GetChildren(id).size() != 1) {
			throw InvalidWKBInputException("wkb must be a LIST of BLOBs when more than one id is given");
		}
		buffers.push_back(StringValue::Get(wkb));
		break;
	}
	case LogicalTypeId::LIST: {
		for (auto &child : ListValue::GetChildren(wkb)) {
			if (child.IsNull() || child.type().id() != LogicalTypeId::BLOB) {
				throw InvalidWKBInputException("Each element of wkb must be a BLOB");
			}
			buffers.push_back(StringValue::Get(child));
		}
		break;
	}
	default:
		throw InvalidWKBInputException("wkb must be a BLOB or a LIST of BLOBs, got %s", wkb.type().ToString());
	}
	return buffers;
}

vector<string> WKBBatchReader::ReadIds(const Value &id) {
	vector<string> ids;
	if (id.IsNull()) {
		return ids;
	}
	switch (id.type().id()) {
	case LogicalTypeId::VARCHAR:
		ids.push_back(StringValue::Get(id));
		break;
	case LogicalTypeId::LIST: {
		for (auto &child : ListValue::GetChildren(id)) {
			if (child.IsNull() || child.type().id() != LogicalTypeId::VARCHAR) {
				throw InvalidWKBInputException("Each element of id must be a VARCHAR");
			}
			ids.push_back(StringValue::Get(child));
		}
		break;
	}
	default:
		throw InvalidWKBInputException("id must be a VARCHAR or a LIST of VARCHARs, got %s", id.type().ToString());
	}
	return ids;
}

string WKBBatchReader::ReadCRS(const Value &crs) {
	if (crs.IsNull()) {
		return DecodedBatch::UNKNOWN_CRS;
	}
	switch (crs.type().id()) {
	case LogicalTypeId::VARCHAR:
		return StringValue::Get(crs);
	case LogicalTypeId::LIST: {
		auto &children = ListValue::GetChildren(crs);
		if (children.size() != 1) {
			throw InvalidWKBInputException("crs must have length 1, got %d", children.size());
		}
		if (children[0].IsNull()) {
			return DecodedBatch::UNKNOWN_CRS;
		}
		if (children[0].type().id() != LogicalTypeId::VARCHAR) {
			throw InvalidWKBInputException("crs must be a VARCHAR, got %s", children[0].type().ToString());
		}
		return StringValue::Get(children[0]);
	}
	default:
		throw InvalidWKBInputException("crs must be a VARCHAR, got %s", crs.type().ToString());
	}
}

DecodedBatch WKBBatchReader::ReadValue(const Value &wkb, const Value &id, const Value &crs) const {
	auto buffers = ReadBuffers(wkb, id);
	auto ids = ReadIds(id);
	// An explicitly given, but empty, id list is a length mismatch rather than a request for default ids
	if (!id.IsNull() && ids.size() != buffers.size()) {
		throw InvalidWKBInputException("wkb and id must have same length, got %d buffers and %d ids", buffers.size(),
		                               ids.size());
	}
	return Read(buffers, ids, ReadCRS(crs));
}

} // namespace core

} // namespace geowkb
