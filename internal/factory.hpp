#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/session/store.hpp"

namespace cookiesession::factory {

/*
  Composition root: turns the runtime config into a ready Store.

  Absent fields fall back to cookie name "session", ttl 24h,
  http_only true, secure false. The secret has no default.
*/

session::StoreOptions ToStoreOptions(const cookiesession::runtime::config::SessionConfig& config);

// Throws util::InvalidConfig when the options are unusable.
std::shared_ptr<const session::Store> BuildStore(const cookiesession::runtime::config::RuntimeConfig& config,
                                                 session::StoreDependencies deps = {});

} // namespace cookiesession::factory
