#include <cassert>
#include <cstddef>
#include <cstdint>

#include "arcreg.hpp"

// tests/dacmask/half_mapping_exhaustive.cpp
//
// Channel c maps to half flag 1 << (c / 4). Setting or unsetting a channel
// never touches any other half.

int main() {
  for (std::size_t c = 0; c < arc::dac_channels; ++c) {
    const std::uint32_t want = 1u << (c / 4);
    assert(static_cast<std::uint32_t>(arc::dac_mask::half_of(c)) == want);

    arc::dac_mask m;
    m.set_channel(c);
    assert(m.as_u32() == want);

    arc::dac_mask full;
    full.set_all();
    full.unset_channel(c);
    assert(full.as_u32() == (0xFFFFu & ~want));
  }

  static_assert(arc::dac_mask::half_of(0) == arc::dac_flag::ch00_03);
  static_assert(arc::dac_mask::half_of(63) == arc::dac_flag::ch60_63);

  // Cluster flags are the union of their two halves.
  static_assert((arc::dac_flag::ch00_03 | arc::dac_flag::ch04_07) == arc::dac_mask(arc::dac_flag::dac0));
  static_assert((arc::dac_flag::ch56_59 | arc::dac_flag::ch60_63) == arc::dac_mask(arc::dac_flag::dac7));

  return 0;
}
