#pragma once

#include <cstddef>
#include <cstdint>

namespace tds_numeric {

//===----------------------------------------------------------------------===//
// SQL Server Data Type IDs (TDS wire format)
//===----------------------------------------------------------------------===//

// Decimal/Numeric types (1 byte length, 1 byte precision, 1 byte scale in COLMETADATA)
constexpr uint8_t TDS_TYPE_DECIMAL = 0x6A;
constexpr uint8_t TDS_TYPE_NUMERIC = 0x6C;

//===----------------------------------------------------------------------===//
// Decimal Limits
//===----------------------------------------------------------------------===//

// Precision tag written by every converting constructor (not a digit count)
constexpr uint8_t DEFAULT_DECIMAL_PRECISION = 20;

// SQL Server DECIMAL(38, s) is the widest column type
constexpr uint8_t MAX_DECIMAL_PRECISION = 38;

// Last index of the power-of-ten scale table
constexpr uint8_t MAX_TABLE_SCALE = 38;

// Scale is carried in one byte
constexpr int MAX_TEXT_SCALE = 255;

// Sentinel requesting the smallest scale that makes a double an exact integer
constexpr uint8_t AUTO_SCALE = 100;

// Magnitude is an unsigned 128-bit integer: 4 x 32-bit words
constexpr size_t DECIMAL_WORD_COUNT = 4;
constexpr size_t DECIMAL_MAGNITUDE_BYTES = 16;

// Largest absolute double accepted by FromDouble
constexpr double MAX_DECIMAL_DOUBLE = 3.402823669209385e+38;

}  // namespace tds_numeric
