#include "auth/cluster_registry.hpp"
#include "crypto/keccak.hpp"

namespace Roles {
  const std::string& Pauser() {
    static const std::string id = Crypto::Keccak256Raw("PAUSER_ROLE");
    return id;
  }

  const std::string& CooldownAdmin() {
    static const std::string id = Crypto::Keccak256Raw("COOLDOWN_ADMIN_ROLE");
    return id;
  }
}
