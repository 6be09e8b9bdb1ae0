#pragma once

#include "core/types.hpp"

#include <array>

namespace c4::gtest {

//! Column order filling the whole board without four in a row.
inline constexpr std::array<Id, ROWS * COLS> DRAW_SEQUENCE{5, 3, 2, 3, 1, 5, 3, 1, 0, 1, 4, 1, 2, 5, 0, 5, 6, 6, 2, 0, 6,
                                                           0, 4, 2, 3, 0, 3, 4, 2, 3, 2, 6, 1, 1, 5, 4, 6, 6, 0, 4, 4, 5};

} // namespace c4::gtest
