#pragma once
#include <string>

namespace Crypto {
  // Returns 0x-prefixed lowercase hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
  // First four bytes of keccak256(signature) as 0x-prefixed hex, e.g. "0x70a08231" for balanceOf(address)
  std::string FunctionSelector(const std::string& signature);
}
