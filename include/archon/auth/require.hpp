#pragma once

#include "archon/auth/token_manager.hpp"
#include "archon/config/schema.hpp"

#include <ostream>
#include <string>

namespace archon::auth {

/// Token for a command that cannot run without a session. A quick local check
/// picks the user-facing message; `TokenManager::resolve` stays authoritative.
/// Progress notices ("Session expired, refreshing...") go to `notices`.
[[nodiscard]] AuthResult<std::string> require_auth(TokenManager &manager,
                                                   const config::Profile &profile,
                                                   std::ostream &notices);

} // namespace archon::auth
