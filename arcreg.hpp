#pragma once
/*
  arcreg.hpp - single-header, bit-exact register encoding for the instrument's 32-bit command words.

  Goal: Describe every register the instrument accepts as a C++ value type whose
  serialized form is an ordered sequence of 32-bit words, packed most-significant-bit
  first, exactly as the FPGA expects them. Registers are always well-formed: setters
  clamp where the hardware defines a safe range and reject (fail fast) everything the
  hardware cannot represent. Transport, instruction assembly and calibration live
  elsewhere; this header only produces words.

  C++20 required (class NTTP for field names, concepts, std::span).

  SPDX-License-Identifier: MIT
*/
#if __cplusplus < 202002L
#  error "arcreg requires C++20"
#endif
#ifndef ARCREG_HPP_INCLUDED
#define ARCREG_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <type_traits>
#include <utility>
#include <array>
#include <tuple>
#include <vector>
#include <span>
#include <string_view>
#include <initializer_list>
#include <iterator>
#include <concepts>
#include <ostream>
#include <iomanip>

#if defined(_MSC_VER)
  #include <intrin.h>
  #define ARC_FORCEINLINE __forceinline
  #define ARC_NOINLINE __declspec(noinline)
#elif defined(__GNUC__) || defined(__clang__)
  #define ARC_FORCEINLINE __attribute__((always_inline)) inline
  #define ARC_NOINLINE __attribute__((noinline))
#else
  #define ARC_FORCEINLINE inline
  #define ARC_NOINLINE
#endif
#if defined(__clang__)
  #define ARC_UNROLL _Pragma("unroll")
#elif defined(__GNUC__)
  #define ARC_UNROLL _Pragma("GCC unroll 16")
#else
  #define ARC_UNROLL
#endif

#ifndef ARC_ASSERT
  #include <cassert>
  #define ARC_ASSERT(x) assert(x)
#endif

// How register contracts (channel index in range, raw flag bits valid) are enforced.
// Decoding a value outside a closed tag set always traps, whatever this says.
#ifndef ARC_CONTRACT_POLICY
  #define ARC_CONTRACT_POLICY ::arc::contract_policy::trap
#endif

namespace arc {

   // fixed_string (NTTP names)

  template <std::size_t N>
  struct fixed_string {
    char v[N]{};
    constexpr fixed_string(char const (&s)[N]) noexcept {
      for (std::size_t i = 0; i < N; ++i) v[i] = s[i];
    }
    constexpr char const* c_str() const noexcept { return v; }
    static constexpr std::size_t size() noexcept { return N; } // includes '\0'
    constexpr std::size_t len() const noexcept { return N ? (N - 1) : 0; }
    constexpr std::string_view view() const noexcept { return std::string_view(v, len()); }
  };

  template <std::size_t N1, std::size_t N2>
  constexpr bool operator==(fixed_string<N1> const& a, fixed_string<N2> const& b) noexcept {
    return a.view() == b.view();
  }


  // instrument-wide constants

  using word_vector = std::vector<std::uint32_t>;

  inline constexpr std::size_t word_bits = 32;
  inline constexpr std::size_t npos = static_cast<std::size_t>(-1);

  inline constexpr std::size_t dac_channels = 64;          // output channels addressable by a dac_mask
  inline constexpr std::size_t dac_channels_per_half = 4;  // channels sharing one dac_mask flag
  inline constexpr std::size_t dac_voltage_default_channels = 4; // one half

  inline constexpr std::uint16_t digipot_max = 0x300;
  inline constexpr std::uint16_t digipot_default = 0x1CD;  // roughly 11 kOhm
  inline constexpr std::uint16_t dac_zero_code = 0x8000;   // 0.0 V on a bipolar DAC

  inline constexpr std::uint32_t empty_word = 0x00000000u;
  inline constexpr std::uint32_t terminate_word = 0x80008000u;

  enum class contract_policy : std::uint8_t {
    unchecked = 0, // no checks; violating a contract is undefined behaviour
    assert_   = 1, // ARC_ASSERT on violation
    trap      = 2  // compiler trap on violation, independent of NDEBUG
  };


  // internal utilities

  namespace detail {

    [[noreturn]] ARC_NOINLINE inline void trap_now() noexcept {
    #if defined(_MSC_VER)
      __fastfail(0);
    #elif defined(__GNUC__) || defined(__clang__)
      __builtin_trap();
    #else
      std::abort();
    #endif
    }

    template <contract_policy P>
    ARC_FORCEINLINE constexpr bool enforce(bool ok) noexcept {
      if constexpr (P == contract_policy::unchecked) {
        return ok;
      } else if constexpr (P == contract_policy::assert_) {
        ARC_ASSERT(ok);
        return ok;
      } else {
        if (!ok) trap_now();
        return ok;
      }
    }

    ARC_FORCEINLINE constexpr bool require(bool ok) noexcept {
      return enforce<ARC_CONTRACT_POLICY>(ok);
    }

    ARC_FORCEINLINE constexpr std::uint32_t mask32(std::size_t bits) noexcept {
      return (bits >= 32) ? 0xFFFFFFFFu : ((1u << bits) - 1u);
    }

    ARC_FORCEINLINE constexpr std::size_t words_for_bits(std::size_t bits) noexcept {
      return (bits + (word_bits - 1u)) / word_bits;
    }

    // Bit numbering: bit 0 is the MSB of word 0, bit 31 its LSB, bit 32 the MSB of word 1.
    // A field of up to 32 bits touches at most two adjacent words.
    template <std::size_t BitOffset, std::size_t BitCount>
    struct bit_window {
      static constexpr std::size_t word = BitOffset / word_bits;
      static constexpr std::size_t shift = BitOffset % word_bits; // from the MSB
      static constexpr std::size_t need_words = (shift + BitCount + (word_bits - 1u)) / word_bits;
      static_assert(BitCount >= 1 && BitCount <= 32);
      static_assert(need_words == 1 || need_words == 2);
    };

    ARC_FORCEINLINE constexpr std::uint32_t load_bits_msb0(std::uint32_t const* words,
                                                          std::size_t offset,
                                                          std::size_t count) noexcept {
      const std::size_t w = offset / word_bits;
      const std::size_t s = offset % word_bits;
      if (s + count <= word_bits) {
        return (words[w] >> (word_bits - s - count)) & mask32(count);
      }
      // tail of word w followed by the head of word w+1
      const std::uint64_t pair = (static_cast<std::uint64_t>(words[w]) << 32) | words[w + 1];
      return static_cast<std::uint32_t>(pair >> (64u - s - count)) & mask32(count);
    }

    ARC_FORCEINLINE constexpr void store_bits_msb0(std::uint32_t* words,
                                                   std::size_t offset,
                                                   std::size_t count,
                                                   std::uint32_t value) noexcept {
      const std::size_t w = offset / word_bits;
      const std::size_t s = offset % word_bits;
      value &= mask32(count);
      if (s + count <= word_bits) {
        const std::size_t sh = word_bits - s - count;
        const std::uint32_t m = mask32(count) << sh;
        words[w] = (words[w] & ~m) | (value << sh);
        return;
      }
      const std::size_t sh = 64u - s - count;
      const std::uint64_t m = static_cast<std::uint64_t>(mask32(count)) << sh;
      std::uint64_t pair = (static_cast<std::uint64_t>(words[w]) << 32) | words[w + 1];
      pair = (pair & ~m) | (static_cast<std::uint64_t>(value) << sh);
      words[w]     = static_cast<std::uint32_t>(pair >> 32);
      words[w + 1] = static_cast<std::uint32_t>(pair);
    }

    template <std::size_t BitOffset, std::size_t BitCount>
    ARC_FORCEINLINE constexpr std::uint32_t read_bits(std::uint32_t const* words) noexcept {
      using W = bit_window<BitOffset, BitCount>;
      if constexpr (W::need_words == 1) {
        return (words[W::word] >> (word_bits - W::shift - BitCount)) & mask32(BitCount);
      } else {
        return load_bits_msb0(words, BitOffset, BitCount);
      }
    }

    template <std::size_t BitOffset, std::size_t BitCount>
    ARC_FORCEINLINE constexpr void write_bits(std::uint32_t* words, std::uint32_t value) noexcept {
      using W = bit_window<BitOffset, BitCount>;
      if constexpr (W::need_words == 1) {
        constexpr std::size_t sh = word_bits - W::shift - BitCount;
        constexpr std::uint32_t m = mask32(BitCount) << sh;
        words[W::word] = (words[W::word] & ~m) | ((value & mask32(BitCount)) << sh);
      } else {
        store_bits_msb0(words, BitOffset, BitCount, value);
      }
    }

    template <typename T>
    ARC_FORCEINLINE constexpr std::uint32_t to_u32(T v) noexcept {
      if constexpr (std::is_same_v<T, bool>) return v ? 1u : 0u;
      else if constexpr (std::is_enum_v<T>) return static_cast<std::uint32_t>(static_cast<std::underlying_type_t<T>>(v));
      else return static_cast<std::uint32_t>(v);
    }

    template <typename...>
    struct type_list {};

    template <std::size_t N>
    consteval std::size_t find_name(std::array<std::string_view, N> const& names, std::string_view name) {
      if (name.empty()) return npos;
      for (std::size_t i = 0; i < N; ++i) {
        if (names[i] == name) return i;
      }
      return npos;
    }

    template <std::size_t N>
    consteval bool all_unique_names(std::array<std::string_view, N> const& names) {
      for (std::size_t i = 0; i < N; ++i) {
        if (names[i].empty()) continue;
        for (std::size_t j = i + 1; j < N; ++j) {
          if (names[i] == names[j]) return false;
        }
      }
      return true;
    }
  } // namespace detail


  // Field definitions


  enum class field_kind : std::uint8_t { int_bits, pad };

  template <fixed_string Name, std::size_t Bits>
  struct uint_field {
    static constexpr field_kind kind = field_kind::int_bits;
    static constexpr bool has_name = true;
    static constexpr auto name = Name;
    static constexpr std::size_t bits = Bits;

    static_assert(Bits >= 1 && Bits <= 32, "uint_field Bits must be 1..32");
    static_assert(Name.len() > 0, "uint_field needs a name");
  };

  template <std::size_t Bits>
  struct pad_bits {
    static constexpr field_kind kind = field_kind::pad;
    static constexpr bool has_name = false;
    static constexpr auto name = fixed_string<1>{""};
    static constexpr std::size_t bits = Bits;
    static_assert(Bits >= 1, "pad_bits Bits must be >= 1");
  };

  template <fixed_string Name> using u1  = uint_field<Name, 1>;
  template <fixed_string Name> using u2  = uint_field<Name, 2>;
  template <fixed_string Name> using u3  = uint_field<Name, 3>;
  template <fixed_string Name> using u4  = uint_field<Name, 4>;
  template <fixed_string Name> using u8  = uint_field<Name, 8>;
  template <fixed_string Name> using u16 = uint_field<Name, 16>;
  template <fixed_string Name> using u32 = uint_field<Name, 32>;

  template <std::size_t Bits, fixed_string Name> using ubits = uint_field<Name, Bits>;


  // word_layout<...> definition

  // Fields are laid out back to back from bit 0 (MSB of word 0). A field may
  // cross a word boundary; total_words rounds the layout up to whole words.
  template <typename... Fields>
  struct word_layout {
    static constexpr std::size_t field_count = sizeof...(Fields);

    static constexpr std::size_t total_bits = (std::size_t{0} + ... + Fields::bits);
    static constexpr std::size_t total_words = detail::words_for_bits(total_bits);

    using fields = detail::type_list<Fields...>;

    static constexpr auto offsets_bits = []() consteval {
      std::array<std::size_t, field_count> offs{};
      std::size_t acc = 0;
      std::size_t i = 0;
      ((offs[i++] = acc, acc += Fields::bits), ...);
      return offs;
    }();

    static constexpr std::array<std::size_t, field_count> sizes_bits{Fields::bits...};
    static constexpr std::array<std::string_view, field_count> names{Fields::name.view()...};

    static_assert(detail::all_unique_names(names), "duplicate field name in word_layout");

    template <std::size_t I>
    using field_t = std::tuple_element_t<I, std::tuple<Fields...>>;

    template <fixed_string Name>
    static constexpr std::size_t index_of = detail::find_name(names, Name.view());

    template <fixed_string Name>
    static constexpr bool has = (index_of<Name> != npos);
  };


  // word view

  namespace detail {
    template <bool Mutable>
    using word_ptr_t = std::conditional_t<Mutable, std::uint32_t*, std::uint32_t const*>;

    template <typename Layout, std::size_t I>
    inline constexpr std::size_t field_bit_offset_v = Layout::offsets_bits[I];

    template <typename Layout, std::size_t I>
    ARC_FORCEINLINE constexpr std::uint32_t get_impl(std::uint32_t const* base) noexcept {
      using F = typename Layout::template field_t<I>;
      static_assert(F::kind != field_kind::pad, "cannot get a pad field");
      return read_bits<field_bit_offset_v<Layout, I>, F::bits>(base);
    }

    template <typename Layout, bool Mutable, std::size_t I, typename V>
    ARC_FORCEINLINE constexpr void set_impl(word_ptr_t<Mutable> base, V&& v) noexcept {
      static_assert(Mutable, "attempting to set on const view");
      using F = typename Layout::template field_t<I>;
      static_assert(F::kind != field_kind::pad, "cannot set a pad field");
      write_bits<field_bit_offset_v<Layout, I>, F::bits>(base, to_u32(std::forward<V>(v)));
    }

    template <typename Layout, bool Mutable>
    class view_base {
      word_ptr_t<Mutable> base_{};
    public:
      using layout_type = Layout;
      using pointer = word_ptr_t<Mutable>;

      ARC_FORCEINLINE constexpr view_base() noexcept = default;
      ARC_FORCEINLINE constexpr explicit view_base(pointer p) noexcept : base_(p) {}

      ARC_FORCEINLINE constexpr pointer data() const noexcept { return base_; }
      static constexpr std::size_t size_words() noexcept { return Layout::total_words; }
      static constexpr std::size_t size_bits() noexcept { return Layout::total_bits; }

      template <fixed_string Name>
      ARC_FORCEINLINE constexpr std::uint32_t get() const noexcept {
        constexpr std::size_t idx = Layout::template index_of<Name>;
        static_assert(idx != npos, "field name not found");
        return get_impl<Layout, idx>(base_);
      }

      template <fixed_string Name, typename V>
      ARC_FORCEINLINE constexpr void set(V&& v) const noexcept {
        constexpr std::size_t idx = Layout::template index_of<Name>;
        static_assert(idx != npos, "field name not found");
        set_impl<Layout, Mutable, idx>(base_, std::forward<V>(v));
      }

      template <std::size_t I>
      ARC_FORCEINLINE constexpr std::uint32_t get_i() const noexcept {
        static_assert(I < Layout::field_count);
        return get_impl<Layout, I>(base_);
      }

      template <std::size_t I, typename V>
      ARC_FORCEINLINE constexpr void set_i(V&& v) const noexcept {
        static_assert(I < Layout::field_count);
        set_impl<Layout, Mutable, I>(base_, std::forward<V>(v));
      }
    };

  } // namespace detail

  template <typename Layout>
  using word_view = detail::view_base<Layout, true>;

  template <typename Layout>
  using word_cview = detail::view_base<Layout, false>;


  // Safe construction helpers

  template <typename Layout>
  ARC_FORCEINLINE constexpr word_cview<Layout> make_view(std::uint32_t const* words, std::size_t n) noexcept {
    ARC_ASSERT(n >= Layout::total_words);
    return word_cview<Layout>(words);
  }

  template <typename Layout>
  ARC_FORCEINLINE constexpr word_view<Layout> make_view(std::uint32_t* words, std::size_t n) noexcept {
    ARC_ASSERT(n >= Layout::total_words);
    return word_view<Layout>(words);
  }


  // Opcodes

  // The first word of every instruction. Each tag is its own bit; there is no
  // "unknown" opcode and none can be decoded.
  enum class opcode : std::uint32_t {
    set_dac         = 0x00000001u, // set a DAC configuration
    update_dac      = 0x00000002u, // apply a configuration previously set with set_dac
    current_read    = 0x00000004u,
    voltage_read    = 0x00000008u,
    update_selector = 0x00000010u,
    update_logic    = 0x00000020u, // set logic levels
    update_channel  = 0x00000040u,
    clear           = 0x00000080u, // clear the instrument buffer
    hs_pulse_config = 0x00000100u,
    hs_pulse_start  = 0x00000200u,
    modify_channel  = 0x00000400u,
    set_dac_offset  = 0x00001000u
  };

  inline constexpr std::array<opcode, 12> all_opcodes{
    opcode::set_dac, opcode::update_dac, opcode::current_read, opcode::voltage_read,
    opcode::update_selector, opcode::update_logic, opcode::update_channel, opcode::clear,
    opcode::hs_pulse_config, opcode::hs_pulse_start, opcode::modify_channel, opcode::set_dac_offset
  };

  constexpr opcode opcode_from_u32(std::uint32_t word) noexcept {
    std::size_t i = 0;
    while (i < all_opcodes.size() && static_cast<std::uint32_t>(all_opcodes[i]) != word) ++i;
    if (i == all_opcodes.size()) detail::trap_now();
    return all_opcodes[i];
  }

  constexpr std::string_view to_string(opcode op) noexcept {
    switch (op) {
      case opcode::set_dac:         return "SetDAC";
      case opcode::update_dac:      return "UpdateDAC";
      case opcode::current_read:    return "CurrentRead";
      case opcode::voltage_read:    return "VoltageRead";
      case opcode::update_selector: return "UpdateSelector";
      case opcode::update_logic:    return "UpdateLogic";
      case opcode::update_channel:  return "UpdateChannel";
      case opcode::clear:           return "Clear";
      case opcode::hs_pulse_config: return "HSPulseConfig";
      case opcode::hs_pulse_start:  return "HSPulseStart";
      case opcode::modify_channel:  return "ModifyChannel";
      case opcode::set_dac_offset:  return "SetDACOffset";
    }
    return "?";
  }


  // Serializable-register contract

  // A register produces its wire words with to_u32s(). Opcodes are plain enums,
  // so the free function is the uniform entry point the assembler should use.
  template <typename R>
  concept has_u32s = requires(R const& r) {
    { r.to_u32s() } -> std::same_as<word_vector>;
  };

  template <has_u32s R>
  inline word_vector to_u32s(R const& r) {
    return r.to_u32s();
  }

  inline word_vector to_u32s(opcode op) {
    return word_vector{static_cast<std::uint32_t>(op)};
  }

  template <typename R>
  concept serializable = requires(R const& r) {
    { ::arc::to_u32s(r) } -> std::same_as<word_vector>;
  };


  // Empty / Terminate

  // Padding up to the fixed instruction length.
  struct empty_reg {
    static constexpr std::size_t word_count() noexcept { return 1; }
    constexpr std::uint32_t as_u32() const noexcept { return empty_word; }
    word_vector to_u32s() const { return word_vector{empty_word}; }
  };

  // Closes every instruction.
  struct terminate_reg {
    static constexpr std::size_t word_count() noexcept { return 1; }
    constexpr std::uint32_t as_u32() const noexcept { return terminate_word; }
    word_vector to_u32s() const { return word_vector{terminate_word}; }
  };


  // DAC selection mask

  // Output channels are driven by 8 DAC clusters of 8 channels each; every
  // cluster is addressed in two halves of 4. Bit h of the mask selects half h
  // (channels 4h..4h+3). Two auxiliary DACs sit above the 16 halves.
  enum class dac_flag : std::uint32_t {
    none    = 0u,
    ch00_03 = 1u << 0,  // DAC0, first half
    ch04_07 = 1u << 1,  // DAC0, second half
    ch08_11 = 1u << 2,
    ch12_15 = 1u << 3,
    ch16_19 = 1u << 4,
    ch20_23 = 1u << 5,
    ch24_27 = 1u << 6,
    ch28_31 = 1u << 7,
    ch32_35 = 1u << 8,
    ch36_39 = 1u << 9,
    ch40_43 = 1u << 10,
    ch44_47 = 1u << 11,
    ch48_51 = 1u << 12,
    ch52_55 = 1u << 13,
    ch56_59 = 1u << 14,
    ch60_63 = 1u << 15, // DAC7, second half
    aux0    = 1u << 16,
    aux1    = 1u << 17,
    dac0    = 0x00000003u,
    dac1    = 0x0000000Cu,
    dac2    = 0x00000030u,
    dac3    = 0x000000C0u,
    dac4    = 0x00000300u,
    dac5    = 0x00000C00u,
    dac6    = 0x00003000u,
    dac7    = 0x0000C000u,
    all     = 0x0000FFFFu  // every half, no aux
  };

  namespace detail {
    inline constexpr auto dac_channel_map = []() consteval {
      std::array<dac_flag, dac_channels> m{};
      for (std::size_t c = 0; c < dac_channels; ++c) {
        m[c] = static_cast<dac_flag>(1u << (c / dac_channels_per_half));
      }
      return m;
    }();
  } // namespace detail

  class dac_mask {
    std::uint32_t bits_{0};

    struct raw_tag {};
    constexpr dac_mask(raw_tag, std::uint32_t bits) noexcept : bits_(bits) {}

  public:
    static constexpr std::uint32_t valid_bits = 0x0003FFFFu;

    constexpr dac_mask() noexcept = default;
    constexpr dac_mask(dac_flag f) noexcept : bits_(static_cast<std::uint32_t>(f)) {}

    // Contract: no bits above aux1.
    static constexpr dac_mask from_bits(std::uint32_t raw) noexcept {
      detail::require((raw & ~valid_bits) == 0u);
      return dac_mask(raw_tag{}, raw & valid_bits);
    }

    static constexpr dac_mask from_bits_truncate(std::uint32_t raw) noexcept {
      return dac_mask(raw_tag{}, raw & valid_bits);
    }

    // The half flag that drives channel `chan`.
    static constexpr dac_flag half_of(std::size_t chan) noexcept {
      detail::require(chan < dac_channels);
      return detail::dac_channel_map[chan];
    }

    constexpr void set_channel(std::size_t chan) noexcept {
      bits_ |= static_cast<std::uint32_t>(half_of(chan));
    }

    constexpr void unset_channel(std::size_t chan) noexcept {
      bits_ &= ~static_cast<std::uint32_t>(half_of(chan));
    }

    constexpr void set_channels(std::span<std::size_t const> chans) noexcept {
      for (std::size_t c : chans) set_channel(c);
    }

    constexpr void set_channels(std::initializer_list<std::size_t> chans) noexcept {
      for (std::size_t c : chans) set_channel(c);
    }

    constexpr void unset_channels(std::span<std::size_t const> chans) noexcept {
      for (std::size_t c : chans) unset_channel(c);
    }

    constexpr void unset_channels(std::initializer_list<std::size_t> chans) noexcept {
      for (std::size_t c : chans) unset_channel(c);
    }

    constexpr void set_all() noexcept { set(dac_flag::all); }
    constexpr void unset_all() noexcept { unset(dac_flag::all); }

    // Back to dac_flag::none, aux flags included.
    constexpr void clear() noexcept { bits_ = 0u; }

    constexpr void set(dac_mask flags) noexcept { bits_ |= flags.bits_; }
    constexpr void unset(dac_mask flags) noexcept { bits_ &= ~flags.bits_; }

    constexpr bool contains(dac_mask flags) const noexcept { return (bits_ & flags.bits_) == flags.bits_; }
    constexpr bool intersects(dac_mask flags) const noexcept { return (bits_ & flags.bits_) != 0u; }
    constexpr bool is_empty() const noexcept { return bits_ == 0u; }

    constexpr std::uint32_t bits() const noexcept { return bits_; }
    constexpr std::uint32_t as_u32() const noexcept { return bits_; }

    static constexpr std::size_t word_count() noexcept { return 1; }
    word_vector to_u32s() const { return word_vector{bits_}; }

    constexpr dac_mask& operator|=(dac_mask o) noexcept { bits_ |= o.bits_; return *this; }
    constexpr dac_mask& operator&=(dac_mask o) noexcept { bits_ &= o.bits_; return *this; }

    friend constexpr dac_mask operator|(dac_mask a, dac_mask b) noexcept { return a |= b; }
    friend constexpr dac_mask operator&(dac_mask a, dac_mask b) noexcept { return a &= b; }
    friend constexpr dac_mask operator~(dac_mask a) noexcept { return dac_mask(raw_tag{}, ~a.bits_ & valid_bits); }

    friend constexpr bool operator==(dac_mask, dac_mask) noexcept = default;
  };

  constexpr dac_mask operator|(dac_flag a, dac_flag b) noexcept { return dac_mask(a) | dac_mask(b); }
  constexpr dac_mask operator&(dac_flag a, dac_flag b) noexcept { return dac_mask(a) & dac_mask(b); }


  // Channel configuration

  enum class channel_state : std::uint8_t {
    open      = 0b001, // not connected to anything
    close_gnd = 0b010, // tied to ground
    cap_gnd   = 0b011, // capacitor to ground
    volt_arb  = 0b100, // arbitrary voltage operation
    cur_arb   = 0b101, // arbitrary current operation
    hi_speed  = 0b110  // high-speed pulse channel
  };

  inline constexpr std::size_t channel_state_bits = 3;

  inline constexpr std::array<channel_state, 6> all_channel_states{
    channel_state::open, channel_state::close_gnd, channel_state::cap_gnd,
    channel_state::volt_arb, channel_state::cur_arb, channel_state::hi_speed
  };

  constexpr channel_state channel_state_from_bits(std::uint32_t code) noexcept {
    std::size_t i = 0;
    while (i < all_channel_states.size() && static_cast<std::uint32_t>(all_channel_states[i]) != code) ++i;
    if (i == all_channel_states.size()) detail::trap_now();
    return all_channel_states[i];
  }

  // Validated wire code of a state; a value forged with static_cast traps here.
  constexpr std::uint32_t channel_state_bits_of(channel_state s) noexcept {
    return static_cast<std::uint32_t>(channel_state_from_bits(static_cast<std::uint32_t>(s)));
  }

  // MSB first: {false, true, false} is close_gnd.
  constexpr std::array<bool, channel_state_bits> channel_state_to_bools(channel_state s) noexcept {
    const std::uint32_t code = channel_state_bits_of(s);
    return {((code >> 2) & 1u) != 0u, ((code >> 1) & 1u) != 0u, (code & 1u) != 0u};
  }

  constexpr channel_state channel_state_from_bools(std::array<bool, channel_state_bits> const& b) noexcept {
    return channel_state_from_bits((detail::to_u32(b[0]) << 2) | (detail::to_u32(b[1]) << 1) | detail::to_u32(b[2]));
  }

  constexpr std::string_view to_string(channel_state s) noexcept {
    switch (s) {
      case channel_state::open:      return "Open";
      case channel_state::close_gnd: return "CloseGND";
      case channel_state::cap_gnd:   return "CapGND";
      case channel_state::volt_arb:  return "VoltArb";
      case channel_state::cur_arb:   return "CurArb";
      case channel_state::hi_speed:  return "HiSpeed";
    }
    return "?";
  }

  // N channels x 3 bits, packed MSB first into ceil(3N/32) words. Channel i owns
  // bits [3i, 3i+3); codes crossing a word boundary are split across both words,
  // which is what the instrument expects. A new register is all zero: every
  // channel is unconfigured and reading it back traps until it has been set.
  class channel_conf {
    std::size_t channels_{0};
    word_vector words_;

  public:
    class const_iterator {
      channel_conf const* reg_{nullptr};
      std::size_t idx_{0};

    public:
      using iterator_concept = std::forward_iterator_tag;
      using iterator_category = std::input_iterator_tag;
      using value_type = channel_state;
      using difference_type = std::ptrdiff_t;
      using reference = channel_state;
      using pointer = void;

      constexpr const_iterator() noexcept = default;
      constexpr const_iterator(channel_conf const* reg, std::size_t idx) noexcept : reg_(reg), idx_(idx) {}

      channel_state operator*() const noexcept { return reg_->get(idx_); }
      constexpr std::size_t index() const noexcept { return idx_; }

      constexpr const_iterator& operator++() noexcept { ++idx_; return *this; }
      constexpr const_iterator operator++(int) noexcept { const_iterator t = *this; ++idx_; return t; }

      friend constexpr bool operator==(const_iterator const& a, const_iterator const& b) noexcept {
        return a.reg_ == b.reg_ && a.idx_ == b.idx_;
      }
    };

    channel_conf() : channel_conf(dac_channels) {}

    explicit channel_conf(std::size_t channels)
      : channels_(channels), words_(detail::words_for_bits(channels * channel_state_bits), 0u) {}

    // Rebuild a register from serialized words. Bits past 3*channels are dropped.
    static channel_conf from_u32s(std::span<std::uint32_t const> words, std::size_t channels) {
      channel_conf c(channels);
      detail::require(words.size() >= c.words_.size());
      for (std::size_t i = 0; i < c.words_.size(); ++i) c.words_[i] = words[i];
      const std::size_t used = channels * channel_state_bits;
      const std::size_t tail = c.words_.size() * word_bits - used;
      if (tail != 0u) c.words_.back() &= ~detail::mask32(tail);
      return c;
    }

    void set(std::size_t idx, channel_state state) noexcept {
      detail::require(idx < channels_);
      detail::store_bits_msb0(words_.data(), idx * channel_state_bits, channel_state_bits, channel_state_bits_of(state));
    }

    void set_all(channel_state state) noexcept {
      const std::uint32_t code = channel_state_bits_of(state);
      for (std::size_t i = 0; i < channels_; ++i) {
        detail::store_bits_msb0(words_.data(), i * channel_state_bits, channel_state_bits, code);
      }
    }

    channel_state get(std::size_t idx) const noexcept {
      return channel_state_from_bits(raw_code(idx));
    }

    // The 3-bit slot as stored, 0 for a channel that was never set.
    std::uint32_t raw_code(std::size_t idx) const noexcept {
      detail::require(idx < channels_);
      return detail::load_bits_msb0(words_.data(), idx * channel_state_bits, channel_state_bits);
    }

    std::size_t size() const noexcept { return channels_; }
    std::size_t word_count() const noexcept { return words_.size(); }
    std::span<std::uint32_t const> words() const noexcept { return words_; }
    word_vector to_u32s() const { return words_; }

    const_iterator begin() const noexcept { return const_iterator(this, 0); }
    const_iterator end() const noexcept { return const_iterator(this, channels_); }

    friend bool operator==(channel_conf const&, channel_conf const&) = default;
  };


  // Source configuration

  enum class current_source_state : std::uint8_t {
    maintain    = 0b00, // keep the current state (default)
    open        = 0b01, // disconnect the current source
    voltage_arb = 0b10,
    hi_speed    = 0b11
  };

  inline constexpr std::array<current_source_state, 4> all_current_source_states{
    current_source_state::maintain, current_source_state::open,
    current_source_state::voltage_arb, current_source_state::hi_speed
  };

  constexpr current_source_state current_source_state_from_bits(std::uint32_t code) noexcept {
    std::size_t i = 0;
    while (i < all_current_source_states.size() && static_cast<std::uint32_t>(all_current_source_states[i]) != code) ++i;
    if (i == all_current_source_states.size()) detail::trap_now();
    return all_current_source_states[i];
  }

  constexpr std::string_view to_string(current_source_state s) noexcept {
    switch (s) {
      case current_source_state::maintain:    return "Maintain";
      case current_source_state::open:        return "Open";
      case current_source_state::voltage_arb: return "VoltageArb";
      case current_source_state::hi_speed:    return "HiSpeed";
    }
    return "?";
  }

  // Output digipot and current-source state sharing one word. Usually followed
  // by a channel_conf in the same instruction.
  class source_conf {
  public:
    using layout = word_layout<
      ubits<10, "digipot">,
      pad_bits<18>,
      u4<"cursource">
    >;
    static_assert(layout::total_words == 1);

  private:
    std::uint32_t word_{0};

    constexpr word_view<layout> view() noexcept { return word_view<layout>(&word_); }
    constexpr word_cview<layout> view() const noexcept { return word_cview<layout>(&word_); }

  public:
    constexpr source_conf() noexcept { set_digipot(digipot_default); }

    // Digipot goes through the clamp, the state must be a valid tag.
    static constexpr source_conf from_u32(std::uint32_t word) noexcept {
      source_conf c;
      word_cview<layout> in(&word);
      c.set_digipot(static_cast<std::uint16_t>(in.get<"digipot">()));
      c.set_cursource_state(current_source_state_from_bits(in.get<"cursource">()));
      return c;
    }

    // Values above digipot_max are clamped to keep the instrument safe.
    constexpr void set_digipot(std::uint16_t val) noexcept {
      view().set<"digipot">(val > digipot_max ? digipot_max : val);
    }

    constexpr std::uint16_t get_digipot() const noexcept {
      return static_cast<std::uint16_t>(view().get<"digipot">());
    }

    constexpr void set_cursource_state(current_source_state s) noexcept {
      view().set<"cursource">(current_source_state_from_bits(detail::to_u32(s)));
    }

    constexpr current_source_state get_cursource_state() const noexcept {
      return current_source_state_from_bits(view().get<"cursource">());
    }

    constexpr std::uint32_t as_u32() const noexcept { return word_; }
    static constexpr std::size_t word_count() noexcept { return layout::total_words; }
    std::span<std::uint32_t const, 1> words() const noexcept { return std::span<std::uint32_t const, 1>(&word_, 1); }
    word_vector to_u32s() const { return word_vector{word_}; }

    friend constexpr bool operator==(source_conf const&, source_conf const&) noexcept = default;
  };


  // DAC voltages

  // One word per channel, Vhigh in the upper half and Vlow in the lower half.
  // 0x0000 is the most negative code, 0xFFFF the most positive and 0x8000 is
  // zero volts. Converting volts to codes happens upstream.
  class dac_voltage {
  public:
    using voltage_word = word_layout<
      u16<"vhigh">,
      u16<"vlow">
    >;
    static_assert(voltage_word::total_words == 1);

  private:
    word_vector values_;

    word_view<voltage_word> channel(std::size_t idx) noexcept {
      detail::require(idx < values_.size());
      return word_view<voltage_word>(values_.data() + idx);
    }

    word_cview<voltage_word> channel(std::size_t idx) const noexcept {
      detail::require(idx < values_.size());
      return word_cview<voltage_word>(values_.data() + idx);
    }

  public:
    // Four channels, one half of a DAC cluster.
    dac_voltage() : dac_voltage(dac_voltage_default_channels) {}

    explicit dac_voltage(std::size_t channels)
      : values_(channels, (std::uint32_t{dac_zero_code} << 16) | dac_zero_code) {}

    static dac_voltage from_u32s(std::span<std::uint32_t const> words) {
      dac_voltage v(words.size());
      for (std::size_t i = 0; i < words.size(); ++i) v.values_[i] = words[i];
      return v;
    }

    void set_high(std::size_t idx, std::uint16_t code) noexcept { channel(idx).set<"vhigh">(code); }
    std::uint16_t get_high(std::size_t idx) const noexcept { return static_cast<std::uint16_t>(channel(idx).get<"vhigh">()); }

    void set_low(std::size_t idx, std::uint16_t code) noexcept { channel(idx).set<"vlow">(code); }
    std::uint16_t get_low(std::size_t idx) const noexcept { return static_cast<std::uint16_t>(channel(idx).get<"vlow">()); }

    // Same code on both outputs, the usual measurement setup.
    void set(std::size_t idx, std::uint16_t code) noexcept {
      auto v = channel(idx);
      v.set<"vhigh">(code);
      v.set<"vlow">(code);
    }

    // (Vlow, Vhigh)
    std::pair<std::uint16_t, std::uint16_t> get(std::size_t idx) const noexcept {
      return {get_low(idx), get_high(idx)};
    }

    std::size_t size() const noexcept { return values_.size(); }
    std::size_t word_count() const noexcept { return values_.size(); }
    std::span<std::uint32_t const> words() const noexcept { return values_; }
    word_vector to_u32s() const { return values_; }

    friend bool operator==(dac_voltage const&, dac_voltage const&) = default;
  };


  // Boolean channel masks

  // Words x 32 enable flags. Channel i lives at bit (size() - 1 - i): channel 0
  // is the LSB of the last word and the highest channel the MSB of the first.
  // This is the reverse of channel_conf's ordering and matches the hardware.
  template <std::size_t Words>
  class u32_mask {
    static_assert(Words >= 1 && Words <= 4, "u32_mask supports 1..4 words");

    std::array<std::uint32_t, Words> words_{};

    static constexpr std::size_t bit_of(std::size_t idx) noexcept { return (Words * word_bits) - 1u - idx; }

  public:
    static constexpr std::size_t channels = Words * word_bits;

    constexpr u32_mask() noexcept = default;

    static constexpr u32_mask from_u32s(std::span<std::uint32_t const, Words> words) noexcept {
      u32_mask m;
      ARC_UNROLL
      for (std::size_t i = 0; i < Words; ++i) m.words_[i] = words[i];
      return m;
    }

    constexpr void set_enabled(std::size_t idx, bool status) noexcept {
      detail::require(idx < channels);
      detail::store_bits_msb0(words_.data(), bit_of(idx), 1, detail::to_u32(status));
    }

    constexpr bool get_enabled(std::size_t idx) const noexcept {
      detail::require(idx < channels);
      return detail::load_bits_msb0(words_.data(), bit_of(idx), 1) != 0u;
    }

    constexpr void set_enabled_all(bool status) noexcept {
      for (std::uint32_t& w : words_) w = status ? 0xFFFFFFFFu : 0u;
    }

    constexpr void toggle(std::size_t idx) noexcept {
      set_enabled(idx, !get_enabled(idx));
    }

    static constexpr std::size_t size() noexcept { return channels; }
    static constexpr std::size_t word_count() noexcept { return Words; }
    constexpr std::span<std::uint32_t const, Words> words() const noexcept { return words_; }
    word_vector to_u32s() const { return word_vector(words_.begin(), words_.end()); }

    friend constexpr bool operator==(u32_mask const&, u32_mask const&) noexcept = default;
  };

  // Channels a current or voltage read applies to.
  using adc_mask = u32_mask<2>;

  // I/O channels touched by an I/O update.
  using io_mask = u32_mask<1>;


  // stream output

  inline std::ostream& operator<<(std::ostream& os, opcode op) { return os << to_string(op); }
  inline std::ostream& operator<<(std::ostream& os, channel_state s) { return os << to_string(s); }
  inline std::ostream& operator<<(std::ostream& os, current_source_state s) { return os << to_string(s); }

  // Register dumps for debugging an instruction by hand.
  namespace dbg {

    inline void print_word(std::ostream& os, std::uint32_t w) {
      const auto flags = os.flags();
      const auto fill = os.fill();
      os << "0x" << std::hex << std::setw(8) << std::setfill('0') << w;
      os.flags(flags);
      os.fill(fill);
    }

    inline void print_words(std::ostream& os, std::span<std::uint32_t const> words) {
      for (std::size_t i = 0; i < words.size(); ++i) {
        os << "  [" << i << "] ";
        print_word(os, words[i]);
        os << '\n';
      }
    }

    template <serializable R>
    inline void dump(std::ostream& os, R const& r) {
      const word_vector w = ::arc::to_u32s(r);
      print_words(os, w);
    }

    // Unset or corrupt slots print as "-" instead of trapping.
    inline void print_states(std::ostream& os, channel_conf const& c) {
      for (std::size_t i = 0; i < c.size(); ++i) {
        const std::uint32_t code = c.raw_code(i);
        os << "  ch" << std::setw(2) << std::setfill('0') << i << std::setfill(' ') << ' ';
        if (code >= 1u && code <= 6u) os << to_string(static_cast<channel_state>(code));
        else os << '-';
        os << '\n';
      }
    }

  } // namespace dbg

} // namespace arc

#endif // ARCREG_HPP_INCLUDED
