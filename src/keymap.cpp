#include "keymap.hpp"

static_assert(static_cast<size_t>(Mode::Command) + 1 == kModeCount, "KeyTable needs a row per Mode");

void KeyTable::bind(Mode mode, int key, Handler h) {
  if (key < 0 || key >= kKeyCount) return;
  table_[index(mode)][static_cast<size_t>(key)] = std::move(h);
}

bool KeyTable::bound(Mode mode, int key) const {
  if (key < 0 || key >= kKeyCount) return false;
  return static_cast<bool>(table_[index(mode)][static_cast<size_t>(key)]);
}

bool KeyTable::dispatch(Mode mode, int key) const {
  if (!bound(mode, key)) return false;
  table_[index(mode)][static_cast<size_t>(key)]();
  return true;
}
