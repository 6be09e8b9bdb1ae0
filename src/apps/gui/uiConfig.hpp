#pragma once

#include <QColor>

namespace c4::gui {

constexpr unsigned CELL_SIZE_PX    = 80u; //!< Default and minimum edge length of one board cell.
constexpr unsigned DISC_OUTLINE_PX = 2u;  //!< Gap between cell border and disc.

inline const QColor COLOR_BOARD{0x0a, 0x4e, 0xa1}; //!< Blue board background.
inline const QColor COLOR_EMPTY{Qt::white};         //!< Empty hole.
inline const QColor COLOR_ONE{0xf5, 0xd2, 0x0c};    //!< Player One disc (yellow).
inline const QColor COLOR_TWO{0xd6, 0x28, 0x28};    //!< Player Two disc (red).

} // namespace c4::gui
