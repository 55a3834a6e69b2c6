#pragma once
#include <intx/intx.hpp>
#include <stdexcept>
#include <string>

// Full-width on-chain quantity. Balances read from a node can exceed 64 bits
// (18-decimal tokens pass 2^64 at ~18.4 whole units).
using Uint256 = intx::uint256;

namespace AmountMath {
  inline Uint256 CheckedAdd(const Uint256& a, const Uint256& b) {
    Uint256 r = a + b;
    if (r < a) throw std::overflow_error("amount overflow");
    return r;
  }

  // Base-10 rendering; JSON numbers cannot carry 256 bits.
  inline std::string ToDecimal(const Uint256& v) { return intx::to_string(v); }
}
