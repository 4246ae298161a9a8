#pragma once

#include "duckdb/common/types/hugeint.hpp"
#include "duckdb/common/types/uhugeint.hpp"
#include "duckdb/common/types/value.hpp"
#include "tds_numeric/tds_types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace tds_numeric {
namespace encoding {

//===----------------------------------------------------------------------===//
// TdsDecimal - SQL Server DECIMAL/NUMERIC value in wire layout
//===----------------------------------------------------------------------===//
//
// Value = (positive ? 1 : -1) * magnitude / 10^scale
// magnitude is an unsigned 128-bit integer stored as 4 x uint32_t, least
// significant word first. Instances are immutable; every conversion returns
// a new value. Zero with positive == false compares equal to zero through
// all numeric accessors.

class TdsDecimal {
public:
	using Words = std::array<uint32_t, DECIMAL_WORD_COUNT>;

	// Zero, scale 0, default precision tag
	TdsDecimal();

	// Direct construction from wire fields (used by the row decoder)
	TdsDecimal(bool positive, uint8_t precision, uint8_t scale, const Words &integer);

	//===--------------------------------------------------------------------===//
	// Converting constructors
	//===--------------------------------------------------------------------===//

	// Convert a double. With AUTO_SCALE the smallest scale in [0, 38] that makes
	// the value an exact integer is chosen (38 if none does). An explicit scale
	// is honored exactly and the scaled value is truncated toward zero.
	// Throws InvalidInputException for NaN/Inf, OutOfRangeException when the
	// value or the requested scale is out of range.
	static TdsDecimal FromDouble(double value, uint8_t scale = AUTO_SCALE);

	// Convert a signed 64-bit integer.
	// INT64_MIN cannot be negated: it is stored as magnitude 2^63, negative,
	// and its scale is always 0 whatever scale was requested.
	static TdsDecimal FromInt64(int64_t value, uint8_t scale);

	// Parse decimal text ("-1234.56"). The digit count after the last '.'
	// becomes the scale.
	// Throws ConversionException on malformed text, OutOfRangeException when the
	// scale exceeds 255 or the magnitude needs more than 16 bytes.
	static TdsDecimal FromString(const std::string &text);

	// Convert a DuckDB value as the bulk-row writer receives it
	static TdsDecimal FromValue(const duckdb::Value &value, uint8_t scale = AUTO_SCALE);

	//===--------------------------------------------------------------------===//
	// Accessors
	//===--------------------------------------------------------------------===//

	bool IsPositive() const {
		return positive;
	}
	uint8_t GetPrecision() const {
		return precision;
	}
	uint8_t GetScale() const {
		return scale;
	}
	uint32_t GetWord(size_t idx) const {
		return integer[idx];
	}
	const Words &GetWords() const {
		return integer;
	}
	bool IsZero() const;

	// Approximate value; exact while the magnitude fits in 53 bits
	double ToDouble() const;

	// Unsigned magnitude (words reassembled as one 128-bit integer)
	duckdb::uhugeint_t GetMagnitude() const;

	// Signed unscaled value. Throws OutOfRangeException when it does not fit
	// in hugeint_t (magnitude above 2^127 - 1, except exactly -2^127).
	duckdb::hugeint_t ToHugeint() const;

	// Minimal big-endian bytes of the magnitude, no sign; empty for zero
	std::vector<uint8_t> UnscaledBytes() const;

	// Decimal text with the point placed 'scale' digits from the right
	std::string ToString() const;

	// Same value with exactly 'new_scale' fractional digits (extra digits are
	// truncated toward zero). Precision resets to the default tag.
	TdsDecimal Rescale(uint8_t new_scale) const;

private:
	Words integer;  // Little-endian word order
	bool positive;
	uint8_t precision;
	uint8_t scale;
};

}  // namespace encoding
}  // namespace tds_numeric
