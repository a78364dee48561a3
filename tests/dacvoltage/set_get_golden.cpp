#include <cassert>
#include <cstdint>
#include <utility>

#include "arcreg.hpp"

// tests/dacvoltage/set_get_golden.cpp
//
// One word per channel: Vhigh in bits 16..31, Vlow in bits 0..15. Every
// channel starts at 0x8000/0x8000 (zero volts).

int main() {
  arc::dac_voltage v;
  assert(v.size() == 4);
  assert(v.to_u32s() == arc::word_vector(4, 0x80008000u));

  v.set_high(3, 0xA0A0u);
  assert(v.to_u32s()[3] == 0xA0A08000u);
  assert(v.get_low(3) == 0x8000u);
  assert(v.get_high(3) == 0xA0A0u);

  v.set(1, 0x8534u);
  assert(v.to_u32s()[1] == 0x85348534u);

  v.set_low(2, 0x0001u);
  assert(v.to_u32s()[2] == 0x80000001u);
  v.set_low(2, 0xFFFEu); // overwrite, not OR
  assert(v.to_u32s()[2] == 0x8000FFFEu);
  v.set_low(2, 0x0000u);
  assert(v.get(2) == std::make_pair(std::uint16_t{0x0000}, std::uint16_t{0x8000}));

  // Channel 0 untouched throughout.
  assert(v.to_u32s()[0] == 0x80008000u);

  // Full code range, no clamping.
  v.set_high(0, 0xFFFFu);
  v.set_low(0, 0x0000u);
  assert(v.to_u32s()[0] == 0xFFFF0000u);

  arc::dac_voltage wide(64);
  assert(wide.size() == 64 && wide.word_count() == 64);
  wide.set(63, 0x1234u);
  const arc::dac_voltage back = arc::dac_voltage::from_u32s(wide.to_u32s());
  assert(back == wide);
  assert(back.get(63) == std::make_pair(std::uint16_t{0x1234}, std::uint16_t{0x1234}));
  return 0;
}
