#include "tds_numeric/encoding/decimal_encoding.hpp"

#include "duckdb/common/exception.hpp"

namespace tds_numeric {
namespace encoding {

TdsDecimal DecimalEncoding::DecodeDecimal(const uint8_t *data, size_t length, uint8_t precision, uint8_t scale) {
	// Zero length is NULL and never reaches the decoder
	if (length == 0 || length > DECIMAL_MAGNITUDE_BYTES + 1) {
		throw duckdb::InvalidInputException("Invalid DECIMAL length: %llu", static_cast<uint64_t>(length));
	}

	// First byte is sign: 0 = negative, 1 = positive
	bool positive = data[0] != 0;

	// Remaining bytes are magnitude (little-endian)
	TdsDecimal::Words words = {{0, 0, 0, 0}};
	for (size_t i = 1; i < length; i++) {
		size_t pos = i - 1;
		words[pos / 4] |= static_cast<uint32_t>(data[i]) << (pos % 4 * 8);
	}

	return TdsDecimal(positive, precision, scale, words);
}

void DecimalEncoding::EncodeDecimal(std::vector<uint8_t> &buffer, const TdsDecimal &value, uint8_t precision) {
	if (precision == 0 || precision > MAX_DECIMAL_PRECISION) {
		throw duckdb::InvalidInputException("Invalid DECIMAL precision: %d", static_cast<int>(precision));
	}

	// Determine the byte size based on precision
	uint8_t byte_size = GetDecimalByteSize(precision);
	uint8_t mantissa_size = byte_size - 1;

	std::vector<uint8_t> unscaled = value.UnscaledBytes();
	if (unscaled.size() > mantissa_size) {
		throw duckdb::OutOfRangeException("DECIMAL value %s does not fit in precision %d", value.ToString(),
		                                  static_cast<int>(precision));
	}

	buffer.push_back(byte_size);

	// Write sign byte: 0x00 = negative, 0x01 = non-negative
	buffer.push_back(value.IsPositive() || value.IsZero() ? 0x01 : 0x00);

	// Write mantissa as little-endian
	for (uint8_t i = 0; i < mantissa_size; i++) {
		buffer.push_back(static_cast<uint8_t>((value.GetWord(i / 4) >> (i % 4 * 8)) & 0xFF));
	}
}

uint8_t DecimalEncoding::GetDecimalByteSize(uint8_t precision) {
	if (precision <= 9) {
		return 5;  // 1 sign + 4 mantissa
	} else if (precision <= 19) {
		return 9;  // 1 sign + 8 mantissa
	} else if (precision <= 28) {
		return 13;  // 1 sign + 12 mantissa
	} else {
		return 17;  // 1 sign + 16 mantissa
	}
}

bool DecimalEncoding::IsDecimalType(uint8_t tds_type) {
	return tds_type == TDS_TYPE_DECIMAL || tds_type == TDS_TYPE_NUMERIC;
}

}  // namespace encoding
}  // namespace tds_numeric
