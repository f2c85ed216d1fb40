#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/batch/decoded_batch.hpp"
#include "geowkb/core/geometry/wkb_reader.hpp"

namespace geowkb {

namespace core {

// Decodes a batch of WKB buffers that must all share one geometry type, and folds the results into the
// shape the container builder expects (see BatchShape).
class WKBBatchReader {
private:
	WKBReader reader;

	static vector<string> DefaultIds(idx_t count);
	static void CheckHomogeneous(const DecodedBatch &batch);
	static void Aggregate(DecodedBatch &batch);

	static vector<string> ReadBuffers(const Value &wkb, const Value &id);
	static vector<string> ReadIds(const Value &id);
	static string ReadCRS(const Value &crs);

public:
	WKBBatchReader() = default;
	explicit WKBBatchReader(WKBReaderOptions options) : reader(options) {
	}

	const WKBReader &GetReader() const {
		return reader;
	}

	//! Decode "buffers". When "ids" is empty the elements are named "1", "2", ... in input order.
	DecodedBatch Read(const vector<string> &buffers, const vector<string> &ids = vector<string>(),
	                  const string &crs = DecodedBatch::UNKNOWN_CRS) const;

	//! Decode a single buffer as a batch of one
	DecodedBatch ReadSingle(const string &buffer, const string &id = "1",
	                        const string &crs = DecodedBatch::UNKNOWN_CRS) const;

	//! Decode loosely typed input: "wkb" is a BLOB or a LIST of BLOBs, "id" is NULL, a VARCHAR or a LIST of
	//! VARCHARs and "crs" is NULL or a VARCHAR.
	DecodedBatch ReadValue(const Value &wkb, const Value &id, const Value &crs) const;
};

} // namespace core

} // namespace geowkb
