#include "protocols/erc20.hpp"
#include "node_connection/rpc_client.hpp"
#include "encoding/abi.hpp"
#include "crypto/keccak.hpp"
#include <stdexcept>
#include <string>

namespace ERC20 {
  int Decimals(RpcClient& rpc, const std::string& token, const std::optional<std::string>& block) {
    static const std::string sel = Crypto::FunctionSelector("decimals()");
    auto res = rpc.EthCall(token, Abi::EncodeCall(sel, {}), block);
    unsigned long long d = Abi::DecodeUint(res);
    if (d > 255) throw std::out_of_range("decimals() out of uint8 range: " + std::to_string(d));
    return static_cast<int>(d);
  }

  Uint256 BalanceOf(RpcClient& rpc, const std::string& token, const std::string& owner,
                    const std::optional<std::string>& block) {
    static const std::string sel = Crypto::FunctionSelector("balanceOf(address)");
    auto res = rpc.EthCall(token, Abi::EncodeCall(sel, {Abi::EncodeAddress(owner)}), block);
    return Abi::DecodeUint256(res);
  }
}
