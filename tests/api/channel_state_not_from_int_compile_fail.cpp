#include "arcreg.hpp"

// tests/api/channel_state_not_from_int_compile_fail.cpp
//
// Channel states are a scoped enum. A raw integer cannot be passed where a
// state is expected; callers go through channel_state_from_bits, which checks.
//
// This is a compile-fail test: it will NOT compile.

int main() {
  arc::channel_conf c(4);
  c.set(0, 4); // expected: no conversion from int to channel_state
  return 0;
}
