#include <array>
#include <cassert>
#include <cstdint>

#include "arcreg.hpp"

// tests/api/index_access_mirrors_name_access.cpp
//
// get_i<I>/set_i<I> address the same bits as get<"name">/set<"name">, with I
// counted over all fields including pads.

using L = arc::word_layout<
  arc::u4<"a">,
  arc::pad_bits<4>,
  arc::u8<"b">,
  arc::u16<"c">
>;

static_assert(L::index_of<"a"> == 0);
static_assert(L::index_of<"b"> == 2);
static_assert(L::index_of<"c"> == 3);
static_assert(L::has<"c"> && !L::has<"d">);

int main() {
  std::array<std::uint32_t, 1> buf{};
  auto v = arc::make_view<L>(buf.data(), buf.size());

  v.set_i<0>(0xAu);
  v.set<"b">(0xBCu);
  v.set_i<3>(0xDEF0u);
  assert(buf[0] == 0xA0BCDEF0u);

  assert(v.get<"a">() == v.get_i<0>());
  assert(v.get_i<2>() == 0xBCu);
  assert(v.get<"c">() == 0xDEF0u);

  // Values wider than the field are cut to the field width.
  v.set<"a">(0x1Fu);
  assert(v.get<"a">() == 0xFu);
  assert(buf[0] == 0xF0BCDEF0u);

  // Enum and bool values go in as their numeric value.
  v.set<"a">(true);
  assert(v.get<"a">() == 1u);
  v.set<"b">(arc::channel_state::hi_speed);
  assert(v.get<"b">() == 6u);
  return 0;
}
