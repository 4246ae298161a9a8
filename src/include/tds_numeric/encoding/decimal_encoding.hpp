#pragma once

#include "tds_numeric/encoding/tds_decimal.hpp"
#include <cstdint>
#include <vector>

namespace tds_numeric {
namespace encoding {

//===----------------------------------------------------------------------===//
// DecimalEncoding - SQL Server DECIMAL/NUMERIC row data (DECIMALNTYPE 0x6A)
//===----------------------------------------------------------------------===//

class DecimalEncoding {
public:
	// Decode DECIMAL/NUMERIC row data (length prefix already consumed)
	// TDS format: sign (1 byte) + magnitude (little-endian integer, 4/8/12/16 bytes)
	// sign: 0 = negative, 1 = positive
	// precision and scale come from COLMETADATA and are kept as-is
	static TdsDecimal DecodeDecimal(const uint8_t *data, size_t length, uint8_t precision, uint8_t scale);

	// Append DECIMAL/NUMERIC row data: length (1 byte) + sign (1 byte) + magnitude
	// The magnitude is padded to the mantissa size implied by precision.
	// Throws OutOfRangeException if the magnitude does not fit, InvalidInputException
	// for a precision outside [1, 38].
	static void EncodeDecimal(std::vector<uint8_t> &buffer, const TdsDecimal &value, uint8_t precision);

	// Get decimal byte size (sign byte included) based on precision
	static uint8_t GetDecimalByteSize(uint8_t precision);

	// DECIMALN and NUMERICN share this row layout
	static bool IsDecimalType(uint8_t tds_type);
};

}  // namespace encoding
}  // namespace tds_numeric
