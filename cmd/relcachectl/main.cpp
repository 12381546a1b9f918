#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/counter.hpp"
#include "internal/cache/registry.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using namespace relcache;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFailure  = 2;
constexpr int kExitNotFound = 3;

void Usage() {
  std::cout << "Usage:\n"
            << "  relcachectl --config <file.yaml> get <key>\n"
            << "  relcachectl --config <file.yaml> set <key> <value> [ttl_ms]\n"
            << "  relcachectl --config <file.yaml> del <key...>\n"
            << "  relcachectl --config <file.yaml> exists <key...>\n"
            << "  relcachectl --config <file.yaml> expire <key> <ttl_ms>\n"
            << "  relcachectl --config <file.yaml> incr <key>\n"
            << "  relcachectl --config <file.yaml> incrby <key> <delta>\n"
            << "  relcachectl --config <file.yaml> hset <key> <field> <value> [<field> <value>...]\n"
            << "  relcachectl --config <file.yaml> hgetall <key>\n"
            << "  relcachectl --config <file.yaml> hscan <key> <cursor> [match] [count]\n"
            << "  relcachectl --config <file.yaml> publish <channel> <message>\n"
            << "  relcachectl --config <file.yaml> subscribe <channel> [max_messages]\n"
            << "  relcachectl --config <file.yaml> reap\n";
}

std::optional<std::int64_t> ParseArg(const std::string& value, const char* what) {
  auto parsed = cache::ParseInt64(value);
  if (!parsed) std::cerr << "invalid " << what << ": " << value << "\n";
  return parsed;
}

// Prints the captured error, if any, and maps it to an exit code.
int Report(const cache::Cmder& cmd) {
  if (!cmd.Failed()) return kExitOk;

  std::cerr << cmd.ErrMessage() << "\n";
  return cmd.IsNotFound() ? kExitNotFound : kExitFailure;
}

int RunCommand(factory::Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  auto& commands = *app.commands;

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (args.size() != 1) return kExitUsage;

    auto result = commands.Get(args[0]);
    if (int rc = Report(result); rc != kExitOk) return rc;

    std::cout << result.Val() << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "set") {
    if (args.size() < 2 || args.size() > 3) return kExitUsage;

    std::chrono::milliseconds ttl{0};
    if (args.size() == 3) {
      auto parsed = ParseArg(args[2], "ttl_ms");
      if (!parsed) return kExitUsage;
      ttl = std::chrono::milliseconds(*parsed);
    }

    auto result = commands.Set(args[0], args[1], ttl);
    if (int rc = Report(result); rc != kExitOk) return rc;

    std::cout << result.Val() << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "del" || cmd == "exists") {
    if (args.empty()) return kExitUsage;

    auto result = cmd == "del" ? commands.Del(args) : commands.Exists(args);
    if (int rc = Report(result); rc != kExitOk) return rc;

    std::cout << result.Val() << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "expire") {
    if (args.size() != 2) return kExitUsage;

    auto parsed = ParseArg(args[1], "ttl_ms");
    if (!parsed) return kExitUsage;

    auto result = commands.Expire(args[0], std::chrono::milliseconds(*parsed));
    if (int rc = Report(result); rc != kExitOk) return rc;

    std::cout << (result.Val() ? 1 : 0) << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "incr" || cmd == "incrby") {
    if (cmd == "incr" && args.size() != 1) return kExitUsage;
    if (cmd == "incrby" && args.size() != 2) return kExitUsage;

    std::int64_t delta = 1;
    if (cmd == "incrby") {
      auto parsed = ParseArg(args[1], "delta");
      if (!parsed) return kExitUsage;
      delta = *parsed;
    }

    auto result = commands.IncrBy(args[0], delta);
    if (int rc = Report(result); rc != kExitOk) return rc;

    std::cout << result.Val() << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "hset") {
    if (args.size() < 3) return kExitUsage;

    std::vector<std::string> pairs(args.begin() + 1, args.end());
    auto                     result = commands.HSet(args[0], pairs);
    if (int rc = Report(result); rc != kExitOk) return rc;

    std::cout << result.Val() << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "hgetall") {
    if (args.size() != 1) return kExitUsage;

    auto result = commands.HGetAll(args[0]);
    if (int rc = Report(result); rc != kExitOk) return rc;

    for (const auto& [field, value] : result.Val()) {
      std::cout << field << "=" << value << "\n";
    }
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "hscan") {
    if (args.size() < 2 || args.size() > 4) return kExitUsage;

    auto cursor = ParseArg(args[1], "cursor");
    if (!cursor || *cursor < 0) return kExitUsage;

    std::string  match = args.size() >= 3 ? args[2] : "";
    std::int64_t count = 0;
    if (args.size() == 4) {
      auto parsed = ParseArg(args[3], "count");
      if (!parsed) return kExitUsage;
      count = *parsed;
    }

    auto page = app.client->ScanMapStream(args[0], static_cast<std::uint64_t>(*cursor), match, count);
    for (std::size_t i = 0; i + 1 < page.items.size(); i += 2) {
      std::cout << page.items[i] << "=" << page.items[i + 1] << "\n";
    }
    std::cout << "cursor=" << page.cursor << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (args.size() != 2) return kExitUsage;

    app.client->Publish(args[0], args[1]);
    std::cout << "published\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "subscribe") {
    if (args.empty() || args.size() > 2) return kExitUsage;

    std::int64_t max_messages = -1;
    if (args.size() == 2) {
      auto parsed = ParseArg(args[1], "max_messages");
      if (!parsed) return kExitUsage;
      max_messages = *parsed;
    }

    auto subscription = app.client->Subscribe(args[0]);
    for (std::int64_t received = 0; max_messages < 0 || received < max_messages;) {
      auto message = subscription->Receive(std::chrono::seconds(1));
      if (!message) continue;
      std::cout << *message << std::endl;
      ++received;
    }
    subscription->Detach();
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "reap") {
    if (!args.empty()) return kExitUsage;

    auto stats = app.reaper->RunOnce();
    std::cout << "entries=" << stats.expired_entries << "\n";
    std::cout << "messages=" << stats.expired_messages << "\n";
    return kExitOk;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  std::string              config_path = argv[2];
  std::string              cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);

  int rc = kExitFailure;
  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config, /*use_stderr=*/true);

    auto app = factory::Build(config, /*start_reaper=*/false);

    rc = RunCommand(app, cmd, args);
    if (rc == kExitUsage) Usage();

    cache::Close();
  } catch (const util::NotFound& e) {
    std::cerr << e.what() << "\n";
    rc = kExitNotFound;
  } catch (const util::ValidationError& e) {
    std::cerr << e.what() << "\n";
    rc = kExitUsage;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    rc = kExitFailure;
  }

  observability::ShutdownLogging();
  return rc;
}
