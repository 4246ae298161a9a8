#include "tds_numeric/encoding/tds_decimal.hpp"
#include "tds_numeric/encoding/decimal_scale.hpp"

#include "duckdb/common/exception.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

// Debug logging controlled by TDS_NUMERIC_DEBUG environment variable
static int GetDecimalDebugLevel() {
	static const int level = [] {
		const char *env = std::getenv("TDS_NUMERIC_DEBUG");
		return env ? std::atoi(env) : 0;
	}();
	return level;
}

#define TDS_DECIMAL_DEBUG(fmt, ...)                                    \
	do {                                                               \
		if (GetDecimalDebugLevel() >= 1) {                             \
			fprintf(stderr, "[TDS DECIMAL] " fmt "\n", ##__VA_ARGS__); \
		}                                                              \
	} while (0)

namespace tds_numeric {
namespace encoding {

using duckdb::ConversionException;
using duckdb::hugeint_t;
using duckdb::InvalidInputException;
using duckdb::OutOfRangeException;
using duckdb::uhugeint_t;

// 2^32, the radix of one magnitude word
static constexpr double WORD_BASE = 4294967296.0;

// 2^128, first double that no longer fits in four words
static constexpr double MAGNITUDE_LIMIT = 340282366920938463463374607431768211456.0;

static TdsDecimal::Words WordsFromMagnitude(const uhugeint_t &magnitude) {
	TdsDecimal::Words words = {{static_cast<uint32_t>(magnitude.lower), static_cast<uint32_t>(magnitude.lower >> 32),
	                            static_cast<uint32_t>(magnitude.upper), static_cast<uint32_t>(magnitude.upper >> 32)}};
	return words;
}

//===----------------------------------------------------------------------===//
// Construction
//===----------------------------------------------------------------------===//

TdsDecimal::TdsDecimal() : integer {{0, 0, 0, 0}}, positive(true), precision(DEFAULT_DECIMAL_PRECISION), scale(0) {
}

TdsDecimal::TdsDecimal(bool positive, uint8_t precision, uint8_t scale, const Words &integer)
    : integer(integer), positive(positive), precision(precision), scale(scale) {
}

//===----------------------------------------------------------------------===//
// Float Conversion
//===----------------------------------------------------------------------===//

TdsDecimal TdsDecimal::FromDouble(double value, uint8_t scale) {
	if (std::isnan(value)) {
		throw InvalidInputException("Cannot convert NaN to DECIMAL");
	}
	if (std::isinf(value)) {
		throw InvalidInputException("Cannot convert Infinity to DECIMAL");
	}

	bool positive = value >= 0;
	double abs_value = std::fabs(value);
	if (abs_value > MAX_DECIMAL_DOUBLE) {
		TDS_DECIMAL_DEBUG("FromDouble: %g exceeds maximum magnitude", value);
		throw OutOfRangeException("Double value %g is out of range for DECIMAL", value);
	}

	uint8_t result_scale;
	double scaled;
	if (scale == AUTO_SCALE) {
		// Smallest scale that leaves no fractional part, saturating at the table end
		result_scale = MAX_TABLE_SCALE;
		scaled = abs_value * SCALE_TABLE[MAX_TABLE_SCALE];
		bool exact = false;
		for (uint8_t s = 0; s <= MAX_TABLE_SCALE; s++) {
			double candidate = abs_value * SCALE_TABLE[s];
			double whole;
			if (std::modf(candidate, &whole) == 0) {
				result_scale = s;
				scaled = candidate;
				exact = true;
				break;
			}
		}
		if (!exact) {
			TDS_DECIMAL_DEBUG("FromDouble: no exact scale for %.17g, truncating at scale %d", value,
			                  static_cast<int>(MAX_TABLE_SCALE));
		}
	} else {
		if (scale > MAX_TABLE_SCALE) {
			throw OutOfRangeException("DECIMAL scale %d exceeds maximum of %d for double conversion",
			                          static_cast<int>(scale), static_cast<int>(MAX_TABLE_SCALE));
		}
		result_scale = scale;
		scaled = abs_value * SCALE_TABLE[scale];
	}

	scaled = std::trunc(scaled);
	if (scaled >= MAGNITUDE_LIMIT) {
		TDS_DECIMAL_DEBUG("FromDouble: %g at scale %d overflows 128 bits", value, static_cast<int>(result_scale));
		throw OutOfRangeException("Double value %g at scale %d exceeds the DECIMAL magnitude range", value,
		                          static_cast<int>(result_scale));
	}

	// Split into base-2^32 digits; every step is exact on an integral double
	Words words;
	for (size_t i = 0; i < DECIMAL_WORD_COUNT; i++) {
		double mod = std::fmod(scaled, WORD_BASE);
		scaled = (scaled - mod) / WORD_BASE;
		words[i] = static_cast<uint32_t>(mod);
	}
	return TdsDecimal(positive, DEFAULT_DECIMAL_PRECISION, result_scale, words);
}

double TdsDecimal::ToDouble() const {
	double val = 0;
	for (size_t i = DECIMAL_WORD_COUNT; i-- > 0;) {
		val *= WORD_BASE;
		val += static_cast<double>(integer[i]);
	}
	if (!positive && val != 0) {
		val = -val;
	}

	// Scales past the table only come from text or wire input
	uint8_t remaining = scale;
	while (remaining > MAX_TABLE_SCALE) {
		val /= SCALE_TABLE[MAX_TABLE_SCALE];
		remaining -= MAX_TABLE_SCALE;
	}
	if (remaining != 0) {
		val /= SCALE_TABLE[remaining];
	}
	return val;
}

//===----------------------------------------------------------------------===//
// Integer Conversion
//===----------------------------------------------------------------------===//

TdsDecimal TdsDecimal::FromInt64(int64_t value, uint8_t scale) {
	if (value == std::numeric_limits<int64_t>::min()) {
		// -INT64_MIN overflows: store 2^63 directly. Scale is always 0 here.
		if (scale != 0) {
			TDS_DECIMAL_DEBUG("FromInt64: INT64_MIN requested with scale %d, using scale 0", static_cast<int>(scale));
		}
		Words words = {{0, 0x80000000u, 0, 0}};
		return TdsDecimal(false, DEFAULT_DECIMAL_PRECISION, 0, words);
	}

	bool positive = value >= 0;
	uint64_t magnitude = positive ? static_cast<uint64_t>(value) : static_cast<uint64_t>(-value);
	Words words = {{static_cast<uint32_t>(magnitude), static_cast<uint32_t>(magnitude >> 32), 0, 0}};
	return TdsDecimal(positive, DEFAULT_DECIMAL_PRECISION, scale, words);
}

//===----------------------------------------------------------------------===//
// Text Conversion
//===----------------------------------------------------------------------===//

TdsDecimal TdsDecimal::FromString(const std::string &text) {
	std::string unscaled;
	size_t text_scale = 0;

	auto point = text.rfind('.');
	if (point == std::string::npos) {
		unscaled = text;
	} else {
		text_scale = text.size() - point - 1;
		unscaled = text.substr(0, point) + text.substr(point + 1);
	}
	if (text_scale > static_cast<size_t>(MAX_TEXT_SCALE)) {
		throw OutOfRangeException("Could not convert string '%s' to DECIMAL: scale exceeds %d", text, MAX_TEXT_SCALE);
	}

	size_t pos = 0;
	bool negative = false;
	if (!unscaled.empty() && (unscaled[0] == '-' || unscaled[0] == '+')) {
		negative = unscaled[0] == '-';
		pos = 1;
	}
	if (pos == unscaled.size()) {
		throw ConversionException("Could not convert string '%s' to DECIMAL", text);
	}
	for (size_t i = pos; i < unscaled.size(); i++) {
		if (unscaled[i] < '0' || unscaled[i] > '9') {
			throw ConversionException("Could not convert string '%s' to DECIMAL", text);
		}
	}

	const uhugeint_t max_magnitude(std::numeric_limits<uint64_t>::max(), std::numeric_limits<uint64_t>::max());
	const uhugeint_t ten(static_cast<uint64_t>(10));
	uhugeint_t magnitude(static_cast<uint64_t>(0));
	for (size_t i = pos; i < unscaled.size(); i++) {
		uhugeint_t digit(static_cast<uint64_t>(unscaled[i] - '0'));
		if (magnitude > (max_magnitude - digit) / ten) {
			TDS_DECIMAL_DEBUG("FromString: \"%s\" needs more than %d magnitude bytes", text.c_str(),
			                  static_cast<int>(DECIMAL_MAGNITUDE_BYTES));
			throw OutOfRangeException("Could not convert string '%s' to DECIMAL: magnitude exceeds 128 bits", text);
		}
		magnitude = magnitude * ten + digit;
	}

	bool positive = !negative || magnitude == uhugeint_t(static_cast<uint64_t>(0));
	return TdsDecimal(positive, DEFAULT_DECIMAL_PRECISION, static_cast<uint8_t>(text_scale),
	                  WordsFromMagnitude(magnitude));
}

TdsDecimal TdsDecimal::FromValue(const duckdb::Value &value, uint8_t scale) {
	using duckdb::LogicalTypeId;

	if (value.IsNull()) {
		throw InvalidInputException("Cannot convert NULL to DECIMAL");
	}

	TdsDecimal result;
	switch (value.type().id()) {
	case LogicalTypeId::FLOAT:
	case LogicalTypeId::DOUBLE:
		return FromDouble(value.GetValue<double>(), scale);
	case LogicalTypeId::TINYINT:
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::UTINYINT:
	case LogicalTypeId::USMALLINT:
	case LogicalTypeId::UINTEGER:
		result = FromInt64(value.GetValue<int64_t>(), 0);
		break;
	// Wider than int64_t or already decimal: go through text to stay exact
	case LogicalTypeId::UBIGINT:
	case LogicalTypeId::HUGEINT:
	case LogicalTypeId::UHUGEINT:
	case LogicalTypeId::DECIMAL:
	case LogicalTypeId::VARCHAR:
		result = FromString(value.ToString());
		break;
	default:
		throw InvalidInputException("Cannot convert %s to DECIMAL", value.type().ToString());
	}
	return scale == AUTO_SCALE ? result : result.Rescale(scale);
}

TdsDecimal TdsDecimal::Rescale(uint8_t new_scale) const {
	std::string text = ToString();
	std::string whole = text;
	std::string fraction;
	auto point = text.find('.');
	if (point != std::string::npos) {
		whole = text.substr(0, point);
		fraction = text.substr(point + 1);
	}

	if (fraction.size() > static_cast<size_t>(new_scale)) {
		fraction.resize(new_scale);
	} else {
		fraction.append(new_scale - fraction.size(), '0');
	}
	return FromString(new_scale == 0 ? whole : whole + "." + fraction);
}

//===----------------------------------------------------------------------===//
// Formatting
//===----------------------------------------------------------------------===//

bool TdsDecimal::IsZero() const {
	return integer[0] == 0 && integer[1] == 0 && integer[2] == 0 && integer[3] == 0;
}

uhugeint_t TdsDecimal::GetMagnitude() const {
	uint64_t upper = static_cast<uint64_t>(integer[3]) << 32 | integer[2];
	uint64_t lower = static_cast<uint64_t>(integer[1]) << 32 | integer[0];
	return uhugeint_t(upper, lower);
}

hugeint_t TdsDecimal::ToHugeint() const {
	uhugeint_t magnitude = GetMagnitude();
	bool negative = !positive && !IsZero();

	if (magnitude.upper <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
		hugeint_t result(static_cast<int64_t>(magnitude.upper), magnitude.lower);
		return negative ? -result : result;
	}
	// -2^127 is the one magnitude above 2^127 - 1 that still fits
	if (negative && magnitude.upper == (static_cast<uint64_t>(1) << 63) && magnitude.lower == 0) {
		return hugeint_t(std::numeric_limits<int64_t>::min(), 0);
	}
	throw OutOfRangeException("DECIMAL value %s does not fit in HUGEINT", ToString());
}

std::vector<uint8_t> TdsDecimal::UnscaledBytes() const {
	std::vector<uint8_t> bytes;
	bool leading = true;
	for (size_t w = DECIMAL_WORD_COUNT; w-- > 0;) {
		for (int shift = 24; shift >= 0; shift -= 8) {
			uint8_t byte_val = static_cast<uint8_t>((integer[w] >> shift) & 0xFF);
			if (leading && byte_val == 0) {
				continue;
			}
			leading = false;
			bytes.push_back(byte_val);
		}
	}
	return bytes;
}

std::string TdsDecimal::ToString() const {
	std::string digits = duckdb::Uhugeint::ToString(GetMagnitude());

	std::string result;
	if (!positive && !IsZero()) {
		result += '-';
	}

	size_t digit_count = digits.size();
	if (digit_count <= scale) {
		// 5 at scale 3 -> 0.005
		result += "0.";
		result.append(scale - digit_count, '0');
		result += digits;
	} else {
		result.append(digits, 0, digit_count - scale);
		if (scale > 0) {
			result += '.';
			result.append(digits, digit_count - scale, std::string::npos);
		}
	}
	return result;
}

}  // namespace encoding
}  // namespace tds_numeric
