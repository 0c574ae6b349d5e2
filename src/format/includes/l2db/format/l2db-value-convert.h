#pragma once

#include "l2db/format/l2db-type-tag.h"
#include "l2db/format/l2db-value.h"

namespace l2db {

/**
 * Coerce a value to the alternative stored under `target`
 *
 * Numeric conversions are range-checked (floats truncate toward zero and
 * must be finite), text converts to numbers and booleans only when the whole
 * string parses, and any value converts to raw as its encoded bytes.
 *
 * @throws L2dbTypeConversionError for unsupported pairs or out-of-range
 * values; INV is never a valid target
 */
Value
convert_value(const Value& value, TypeTag target);

}  // namespace l2db
