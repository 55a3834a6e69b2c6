#pragma once
#include <string>
#include "common/types.hpp"

// External authorization oracle. Held by the strategy as a non-owning handle.
class ClusterRegistry {
public:
  virtual ~ClusterRegistry() = default;
  virtual Address RegistryAddress() const = 0;
  virtual bool HasRole(const Address& account, const std::string& role_id) const = 0;
};

namespace Roles {
  // keccak256("PAUSER_ROLE")
  const std::string& Pauser();
  // keccak256("COOLDOWN_ADMIN_ROLE")
  const std::string& CooldownAdmin();
}
