#pragma once

#include "tds_numeric/tds_types.hpp"

namespace tds_numeric {
namespace encoding {

//===----------------------------------------------------------------------===//
// Decimal Scale Table - powers of ten as doubles, indexed by scale
//===----------------------------------------------------------------------===//

constexpr size_t SCALE_TABLE_SIZE = MAX_TABLE_SCALE + 1;

// SCALE_TABLE[i] == 10^i for i in [0, 38]
constexpr double SCALE_TABLE[SCALE_TABLE_SIZE] = {
    1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,  1e10, 1e11, 1e12,
    1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22, 1e23, 1e24, 1e25,
    1e26, 1e27, 1e28, 1e29, 1e30, 1e31, 1e32, 1e33, 1e34, 1e35, 1e36, 1e37, 1e38};

static_assert(sizeof(SCALE_TABLE) / sizeof(SCALE_TABLE[0]) == 39, "scale table must cover 10^0 .. 10^38");

}  // namespace encoding
}  // namespace tds_numeric
