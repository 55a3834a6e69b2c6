#pragma once
#include <string>
#include <vector>
#include "common/uint256.hpp"

// Static-type ABI helpers for eth_call: 32-byte words, no dynamic types.
namespace Abi {
  // 64 hex chars, left-padded. Throws std::invalid_argument if not a 20-byte hex address.
  std::string EncodeAddress(const std::string& address);
  std::string EncodeUint(unsigned long long value);
  // selector (0x + 8 hex) followed by the concatenated words
  std::string EncodeCall(const std::string& selector, const std::vector<std::string>& words);

  // Number of complete 32-byte words in a 0x-prefixed return blob
  size_t WordCount(const std::string& return_hex);
  // Word at `index` as a full uint256. Throws std::out_of_range if the word is
  // missing, std::invalid_argument on non-hex data.
  Uint256 DecodeUint256(const std::string& return_hex, size_t index = 0);
  // Narrow form for timestamps, durations and small enums. Throws std::out_of_range
  // if the word is missing or does not fit in 64 bits.
  unsigned long long DecodeUint(const std::string& return_hex, size_t index = 0);
  // Low 20 bytes of the word at `index`, 0x-prefixed lowercase
  std::string DecodeAddress(const std::string& return_hex, size_t index = 0);
}
