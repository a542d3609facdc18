#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/http/message.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/store.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

using cookiesession::session::Session;
using cookiesession::session::Store;

static void Usage() {
  std::cout << "Usage:\n"
            << "  cookiesessionctl <config.yaml> mint [--uid <uuid>] [--real-uid <uuid>] [--state <text>]\n"
            << "  cookiesessionctl <config.yaml> inspect <cookie-value>\n"
            << "  cookiesessionctl <config.yaml> clear\n";
}

static void PrintSetCookies(const cookiesession::http::Response& response) {
  for (const auto& header : response.SetCookieHeaders()) {
    std::cout << "Set-Cookie: " << header << "\n";
  }
}

static int Mint(const Store& store, const std::vector<std::string>& args) {
  Session session = store.NewSession();

  for (size_t i = 0; i < args.size(); ++i) {
    const auto& flag = args[i];
    if (i + 1 >= args.size()) {
      std::cerr << "missing value for " << flag << "\n";
      return 1;
    }
    const auto& value = args[++i];

    if (flag == "--uid" || flag == "--real-uid") {
      cookiesession::util::UUID id{};
      try {
        id = cookiesession::util::FromString(value);
      } catch (const std::invalid_argument& e) {
        std::cerr << "invalid " << flag << ": " << e.what() << "\n";
        return 1;
      }
      (flag == "--uid" ? session.uid : session.real_uid) = id;
    } else if (flag == "--state") {
      session.state = value;
    } else {
      std::cerr << "unknown flag: " << flag << "\n";
      return 1;
    }
  }

  cookiesession::http::Response response;
  const auto                    result = store.Save(response, session);
  if (!result) {
    COOKIESESSION_LOG_ERROR("Failed to save session",
                            {cookiesession::observability::StringField("reason", ToString(result.code)),
                             cookiesession::observability::StringField("error", result.message)});
    return 2;
  }

  std::cout << "sid: " << cookiesession::util::ToString(session.sid) << "\n";
  PrintSetCookies(response);
  return 0;
}

static int Inspect(const Store& store, const std::string& cookie_value) {
  cookiesession::http::Request request;
  request.AddCookie(store.Name(), cookie_value);

  const auto session = store.Get(request);

  std::cout << "valid: " << (session.valid ? "true" : "false") << "\n";
  if (session.valid) {
    std::cout << "time: " << cookiesession::util::ToUnixSeconds(session.time) << " ("
              << cookiesession::util::ToHttpDate(session.time) << ")\n";
  }
  std::cout << "sid: " << cookiesession::util::ToString(session.sid) << "\n"
            << "uid: " << cookiesession::util::ToString(session.uid) << "\n"
            << "real_uid: " << cookiesession::util::ToString(session.real_uid) << "\n"
            << "state: " << session.state << "\n";

  // Exit status mirrors trust so scripts can branch on it.
  return session.valid ? 0 : 3;
}

static int Clear(const Store& store) {
  cookiesession::http::Response response;
  store.Clear(response);
  PrintSetCookies(response);
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              command     = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = cookiesession::config::ConfigLoader::LoadFromYaml(config_path);
    cookiesession::observability::InitializeLogging(config);

    auto store = cookiesession::factory::BuildStore(config);

    int rc = 1;
    if (command == "mint") {
      rc = Mint(*store, args);
    } else if (command == "inspect" && args.size() == 1) {
      rc = Inspect(*store, args[0]);
    } else if (command == "clear" && args.empty()) {
      rc = Clear(*store);
    } else {
      Usage();
    }

    cookiesession::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    COOKIESESSION_LOG_ERROR("Fatal error", {cookiesession::observability::StringField("error", e.what())});
    cookiesession::observability::ShutdownLogging();
    return 2;
  }
}
