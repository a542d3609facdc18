#include "factory.hpp"

#include <chrono>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cookiesession::factory {

namespace {

constexpr const char*          kDefaultCookieName = "session";
constexpr std::chrono::seconds kDefaultTtl        = std::chrono::hours(24);

} // namespace

session::StoreOptions ToStoreOptions(const cookiesession::runtime::config::SessionConfig& config) {
  session::StoreOptions options;

  options.cookie_name = config.cookie_name().empty() ? kDefaultCookieName : config.cookie_name();
  options.secret      = config.secret();

  if (config.has_ttl()) {
    if (config.ttl().seconds() <= 0) {
      throw util::InvalidConfig("session.ttl must be at least one second");
    }
    // sub-second remainder is dropped, Max-Age is whole seconds anyway
    options.ttl = std::chrono::seconds(config.ttl().seconds());
  } else {
    options.ttl = kDefaultTtl;
  }

  options.http_only = config.has_http_only() ? config.http_only() : true;
  options.secure    = config.secure();

  return options;
}

std::shared_ptr<const session::Store> BuildStore(const cookiesession::runtime::config::RuntimeConfig& config,
                                                 session::StoreDependencies deps) {
  auto options = ToStoreOptions(config.session());
  auto store   = std::make_shared<session::Store>(options, std::move(deps));

  COOKIESESSION_LOG_INFO("Session store ready", {observability::StringField("cookie", store->Name()),
                                                 observability::IntField("ttl_seconds", store->Ttl().count()),
                                                 observability::BoolField("http_only", store->HttpOnly()),
                                                 observability::BoolField("secure", store->Secure())});
  return store;
}

} // namespace cookiesession::factory
