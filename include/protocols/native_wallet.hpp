#pragma once
#include "common/types.hpp"

// Native coin held by the strategy's own account.
class NativeWallet {
public:
  virtual ~NativeWallet() = default;
  virtual Amount Balance() const = 0;
  // false when the recipient refuses the transfer; nothing moves in that case
  virtual bool Send(const Address& to, Amount amount) = 0;
};
