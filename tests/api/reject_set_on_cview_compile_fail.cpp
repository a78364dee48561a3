#include <array>
#include <cstdint>

#include "arcreg.hpp"

// tests/api/reject_set_on_cview_compile_fail.cpp
//
// word_cview is read-only. get compiles, set is rejected.
//
// This is a compile-fail test: it will NOT compile.

using L = arc::word_layout<
  arc::u16<"hi">,
  arc::u16<"lo">
>;

int main() {
  const std::array<std::uint32_t, 1> buf{0x12345678u};
  auto v = arc::make_view<L>(buf.data(), buf.size());
  (void)v.get<"hi">();
  v.set<"lo">(0u); // expected: "attempting to set on const view"
  return 0;
}
