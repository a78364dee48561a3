#include <cassert>
#include <iomanip>
#include <sstream>
#include <string>

#include "arcreg.hpp"

// tests/dbg/dump_format.cpp
//
// Debug dumps print one "[index] 0x%08x" line per word and leave the stream's
// formatting state as they found it. print_states names each channel and
// shows "-" for slots that hold no valid state.

int main() {
  {
    std::ostringstream os;
    arc::channel_conf c(64);
    c.set_all(arc::channel_state::volt_arb);
    arc::dbg::dump(os, c);
    assert(os.str() ==
      "  [0] 0x92492492\n"
      "  [1] 0x49249249\n"
      "  [2] 0x24924924\n"
      "  [3] 0x92492492\n"
      "  [4] 0x49249249\n"
      "  [5] 0x24924924\n");
  }
  {
    std::ostringstream os;
    os << std::dec << std::setfill('*');
    arc::dbg::dump(os, arc::empty_reg{});
    os << 255 << std::setw(4) << 1;
    assert(os.str() == "  [0] 0x00000000\n255***1");
  }
  {
    std::ostringstream os;
    arc::dbg::dump(os, arc::opcode::update_channel);
    assert(os.str() == "  [0] 0x00000040\n");
  }
  {
    std::ostringstream os;
    arc::channel_conf c(3);
    c.set(0, arc::channel_state::open);
    c.set(2, arc::channel_state::hi_speed);
    arc::dbg::print_states(os, c);
    assert(os.str() == "  ch00 Open\n  ch01 -\n  ch02 HiSpeed\n");
  }
  {
    std::ostringstream os;
    os << arc::opcode::set_dac << ' ' << arc::channel_state::cap_gnd << ' '
       << arc::current_source_state::voltage_arb;
    assert(os.str() == "SetDAC CapGND VoltageArb");
  }
  return 0;
}
