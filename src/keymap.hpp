#pragma once
/*
 * KeyTable
 *
 * Purpose: (mode, key) -> handler lookup as a fixed mode x byte array.
 * Unbound slots are empty and dispatch() treats them as a no-op.
 */
#include <array>
#include <functional>
#include "types.hpp"

namespace keys {
inline constexpr int CTRL_C = 'C' - 64;
inline constexpr int CTRL_X = 'X' - 64;
inline constexpr int CTRL_Z = 'Z' - 64;
inline constexpr int BS = 8;
inline constexpr int NL = '\n';
inline constexpr int ESC = 27;
inline constexpr int DEL = 127;

inline bool is_text(int ch) { return (ch >= 32 && ch <= 126) || (ch >= 128 && ch <= 255); }
}

class KeyTable {
public:
  using Handler = std::function<void()>;
  static constexpr int kKeyCount = 256;

  void bind(Mode mode, int key, Handler h);
  bool bound(Mode mode, int key) const;
  // runs the handler and returns true; false for unbound or out-of-range keys
  bool dispatch(Mode mode, int key) const;

private:
  static size_t index(Mode mode) { return static_cast<size_t>(mode); }
  std::array<std::array<Handler, kKeyCount>, kModeCount> table_;
};
