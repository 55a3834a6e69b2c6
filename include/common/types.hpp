#pragma once
#include <string>
#include <stdexcept>
#include <limits>

// Token amounts in base units for strategy accounting. On-chain reads use Uint256
// (common/uint256.hpp).
using Amount = unsigned long long;
// 0x-prefixed hex account/contract address.
using Address = std::string;

namespace AmountMath {
  inline Amount SaturatingSub(Amount a, Amount b) { return a > b ? a - b : 0ULL; }

  inline Amount CheckedAdd(Amount a, Amount b) {
    if (a > std::numeric_limits<Amount>::max() - b) throw std::overflow_error("amount overflow");
    return a + b;
  }

  // floor(a * b / d) with a 128-bit intermediate
  inline Amount MulDivDown(Amount a, Amount b, Amount d) {
    if (d == 0) throw std::domain_error("division by zero");
    unsigned __int128 r = static_cast<unsigned __int128>(a) * b / d;
    if (r > std::numeric_limits<Amount>::max()) throw std::overflow_error("amount overflow");
    return static_cast<Amount>(r);
  }

  inline Amount MulDivUp(Amount a, Amount b, Amount d) {
    if (d == 0) throw std::domain_error("division by zero");
    unsigned __int128 p = static_cast<unsigned __int128>(a) * b;
    unsigned __int128 r = p / d + (p % d != 0 ? 1 : 0);
    if (r > std::numeric_limits<Amount>::max()) throw std::overflow_error("amount overflow");
    return static_cast<Amount>(r);
  }
}
