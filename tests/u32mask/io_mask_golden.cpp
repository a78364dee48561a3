#include <cassert>

#include "arcreg.hpp"

// tests/u32mask/io_mask_golden.cpp
//
// 32-channel I/O mask, one word, channel i at bit position i of the word.

int main() {
  arc::io_mask m;
  m.set_enabled(0, true);
  assert(m.to_u32s() == arc::word_vector{0x00000001u});
  m.set_enabled(31, true);
  assert(m.to_u32s() == arc::word_vector{0x80000001u});
  m.set_enabled(4, true);
  assert(m.to_u32s() == arc::word_vector{0x80000011u});
  m.set_enabled(0, false);
  assert(m.to_u32s() == arc::word_vector{0x80000010u});

  constexpr arc::io_mask c = [] {
    arc::io_mask t;
    t.set_enabled(7, true);
    return t;
  }();
  static_assert(c.words()[0] == 0x80u);
  return 0;
}
