#include <cstddef>

#include "arcreg.hpp"

// tests/layout/source_conf_layout_golden.cpp
//
// Offsets are counted from the MSB of word 0. The source register puts the
// digipot at bits [0,10), reserves [10,28) and the state nibble at [28,32).
// The voltage word puts Vhigh first so it ends up in the upper half.

using S = arc::source_conf::layout;
static_assert(S::field_count == 3);
static_assert(S::total_bits == 32 && S::total_words == 1);
static_assert(S::offsets_bits[0] == 0 && S::sizes_bits[0] == 10);
static_assert(S::offsets_bits[1] == 10 && S::sizes_bits[1] == 18);
static_assert(S::offsets_bits[2] == 28 && S::sizes_bits[2] == 4);
static_assert(S::index_of<"digipot"> == 0);
static_assert(S::index_of<"cursource"> == 2);
static_assert(S::field_t<1>::kind == arc::field_kind::pad);

using V = arc::dac_voltage::voltage_word;
static_assert(V::offsets_bits[0] == 0 && V::names[0] == "vhigh");
static_assert(V::offsets_bits[1] == 16 && V::names[1] == "vlow");

using Wide = arc::word_layout<
  arc::u32<"a">,
  arc::ubits<5, "b">
>;
static_assert(Wide::total_bits == 37);
static_assert(Wide::total_words == 2);

using Empty = arc::word_layout<>;
static_assert(Empty::total_words == 0 && Empty::field_count == 0);

int main() { return 0; }
