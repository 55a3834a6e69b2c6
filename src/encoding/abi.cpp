#include "encoding/abi.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

namespace Abi {
  static const size_t kWordHex = 64;

  static std::string Pad32(const std::string& no0x) {
    if (no0x.size() >= kWordHex) return no0x.substr(no0x.size() - kWordHex);
    return std::string(kWordHex - no0x.size(), '0') + no0x;
  }

  static std::string WordAt(const std::string& return_hex, size_t index) {
    std::string body = Strip0x(return_hex);
    if ((index + 1) * kWordHex > body.size()) {
      throw std::out_of_range("abi word " + std::to_string(index) + " missing in return data");
    }
    return body.substr(index * kWordHex, kWordHex);
  }

  std::string EncodeAddress(const std::string& address) {
    if (!IsHexAddress(address)) throw std::invalid_argument("not an address: " + address);
    return Pad32(ToLowerHex(Strip0x(address)));
  }

  std::string EncodeUint(unsigned long long value) {
    static const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) { out[static_cast<size_t>(i)] = hex[value & 0xF]; value >>= 4; }
    return Pad32(out);
  }

  std::string EncodeCall(const std::string& selector, const std::vector<std::string>& words) {
    std::string out = Ensure0x(Strip0x(selector));
    for (const auto& w : words) out += w;
    return out;
  }

  size_t WordCount(const std::string& return_hex) {
    return Strip0x(return_hex).size() / kWordHex;
  }

  Uint256 DecodeUint256(const std::string& return_hex, size_t index) {
    return intx::from_string<Uint256>("0x" + WordAt(return_hex, index));
  }

  unsigned long long DecodeUint(const std::string& return_hex, size_t index) {
    std::string w = WordAt(return_hex, index);
    for (size_t i = 0; i < kWordHex - 16; ++i) {
      if (w[i] != '0') throw std::out_of_range("abi word exceeds 64 bits");
    }
    return std::stoull(w.substr(kWordHex - 16), nullptr, 16);
  }

  std::string DecodeAddress(const std::string& return_hex, size_t index) {
    std::string w = WordAt(return_hex, index);
    return "0x" + ToLowerHex(w.substr(kWordHex - 40));
  }
}
