#pragma once

#include "duckdb/common/assert.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/named_parameter_map.hpp"
#include "duckdb/common/optional_idx.hpp"
#include "duckdb/common/printer.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/typedefs.hpp"
#include "duckdb/common/types/value.hpp"
#include "duckdb/common/vector.hpp"

#include <cstring>

namespace geowkb {

using duckdb::idx_t;
using duckdb::data_t;
using duckdb::data_ptr_t;
using duckdb::const_data_ptr_t;
using duckdb::const_data_ptr_cast;
using duckdb::MinValue;

using duckdb::string;
using duckdb::vector;
using duckdb::optional_idx;

using duckdb::Exception;
using duckdb::ExceptionType;
using duckdb::InternalException;

using duckdb::BooleanValue;
using duckdb::ListValue;
using duckdb::LogicalType;
using duckdb::LogicalTypeId;
using duckdb::StringValue;
using duckdb::Value;
using duckdb::named_parameter_map_t;

using duckdb::Printer;
using duckdb::StringUtil;

} // namespace geowkb
