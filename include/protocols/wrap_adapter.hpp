#pragma once
#include "common/types.hpp"

// Converts between the staking asset (underlying) and the held, wrapped form.
class WrapAdapter {
public:
  virtual ~WrapAdapter() = default;
  // Pulls `amount` underlying from `from`, credits wrapped to `to`
  virtual void Wrap(const Address& from, const Address& to, Amount amount) = 0;
  // Burns `amount` wrapped from the caller, credits underlying to `to`
  virtual void Unwrap(const Address& to, Amount amount) = 0;
  virtual Address UnderlyingAsset() const = 0;
};
