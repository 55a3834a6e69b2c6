#pragma once
#include <optional>
#include <string>
#include "common/types.hpp"
#include "common/uint256.hpp"

class RpcClient;

// Ledger of the held (wrapped) asset as seen by the strategy account.
class TokenLedger {
public:
  virtual ~TokenLedger() = default;
  virtual Address TokenAddress() const = 0;
  virtual Amount BalanceOf(const Address& holder) const = 0;
  // Moves `amount` from the bound caller to `to`; throws ProtocolError on insufficient balance
  virtual void Transfer(const Address& to, Amount amount) = 0;
};

// eth_call reads at `block` (default "latest"); throw on RPC or decode failure.
namespace ERC20 {
  int Decimals(RpcClient& rpc, const std::string& token,
               const std::optional<std::string>& block = std::nullopt);
  Uint256 BalanceOf(RpcClient& rpc, const std::string& token, const std::string& owner,
                    const std::optional<std::string>& block = std::nullopt);
}
