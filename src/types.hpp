#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/CarriedState/Viewport).
 * Principle: carry simple state; no business logic here.
 */
#include <cstddef>

enum class Mode { Insert, Normal, Command };
inline constexpr size_t kModeCount = 3;

struct Cursor { int row = 0; int col = 0; };

/* cursor snapshot taken when a key is pressed; replay uses it instead of the live cursor */
struct CarriedState { int row = 0; int col = 0; };

struct Viewport { int top_line = 0; };

inline bool operator==(const Cursor& a, const Cursor& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const Cursor& a, const Cursor& b) { return !(a == b); }
