#include "cmdable_adapter.hpp"

#include "internal/util/errors.hpp"

namespace relcache::cache {

namespace {

// Runs fn(cmd) and captures anything it throws into cmd.
template <typename CmdT, typename Fn>
CmdT Capture(const char* name, Fn&& fn) {
  CmdT cmd(name);
  try {
    fn(cmd);
  } catch (const std::exception&) {
    cmd.SetErr(std::current_exception());
  }
  return cmd;
}

template <typename CmdT>
CmdT Unsupported(const char* name, const char* what) {
  CmdT cmd(name);
  cmd.SetErr(std::make_exception_ptr(util::NotFound(std::string(name) + ": " + what + " not supported")));
  return cmd;
}

} // namespace

CmdableAdapter::CmdableAdapter(std::shared_ptr<Client> client, int counter_max_attempts)
    : client_(std::move(client)), counter_max_attempts_(counter_max_attempts) {
}

StatusCmd CmdableAdapter::Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  return Capture<StatusCmd>("set", [&](StatusCmd& cmd) {
    client_->Set(key, std::string_view(value), ttl);
    cmd.SetVal("OK");
  });
}

StringCmd CmdableAdapter::Get(const std::string& key) {
  return Capture<StringCmd>("get", [&](StringCmd& cmd) { cmd.SetVal(client_->GetString(key)); });
}

IntCmd CmdableAdapter::Incr(const std::string& key) {
  return Capture<IntCmd>("incr",
                         [&](IntCmd& cmd) { cmd.SetVal(cache::Incr(*client_, key, counter_max_attempts_)); });
}

IntCmd CmdableAdapter::IncrBy(const std::string& key, std::int64_t delta) {
  return Capture<IntCmd>(
      "incrby", [&](IntCmd& cmd) { cmd.SetVal(cache::IncrBy(*client_, key, delta, counter_max_attempts_)); });
}

IntCmd CmdableAdapter::HSet(const std::string& key, const std::vector<std::string>& values) {
  return Capture<IntCmd>("hset", [&](IntCmd& cmd) {
    if (values.size() < 2 || values.size() % 2 != 0) {
      throw util::ValidationError("hset: expected field/value pairs, got " + std::to_string(values.size()) +
                                  " arguments");
    }

    client_->Transaction([&](Context& ctx) {
      for (std::size_t i = 0; i + 1 < values.size(); i += 2) {
        ctx.Get().SetMapField(key, values[i], values[i + 1]);
      }
    });
    cmd.SetVal(static_cast<std::int64_t>(values.size() / 2));
  });
}

MapStringStringCmd CmdableAdapter::HGetAll(const std::string& key) {
  return Capture<MapStringStringCmd>("hgetall", [&](MapStringStringCmd& cmd) { cmd.SetVal(client_->GetMap(key)); });
}

IntCmd CmdableAdapter::Del(const std::vector<std::string>& keys) {
  return Capture<IntCmd>("del", [&](IntCmd& cmd) {
    std::int64_t total = 0;
    if (!keys.empty()) {
      client_->Transaction([&](Context& ctx) {
        for (const auto& key : keys) {
          total += ctx.Get().Delete(key);
        }
      });
    }
    cmd.SetVal(total);
  });
}

IntCmd CmdableAdapter::Exists(const std::vector<std::string>& keys) {
  return Capture<IntCmd>("exists", [&](IntCmd& cmd) {
    std::int64_t total = 0;
    if (!keys.empty()) {
      // per key, so a repeated key counts once per occurrence
      client_->Transaction([&](Context& ctx) {
        for (const auto& key : keys) {
          total += ctx.Get().Count({key});
        }
      });
    }
    cmd.SetVal(total);
  });
}

BoolCmd CmdableAdapter::Expire(const std::string& key, std::chrono::milliseconds ttl) {
  return Capture<BoolCmd>("expire", [&](BoolCmd& cmd) { cmd.SetVal(client_->Expire(key, ttl)); });
}

// ------------------------------------------------------------------
// Lists
// ------------------------------------------------------------------

StringCmd CmdableAdapter::LIndex(const std::string&, std::int64_t) {
  return Unsupported<StringCmd>("lindex", "list operations");
}

IntCmd CmdableAdapter::LPush(const std::string&, const std::vector<std::string>&) {
  return Unsupported<IntCmd>("lpush", "list operations");
}

IntCmd CmdableAdapter::RPush(const std::string&, const std::vector<std::string>&) {
  return Unsupported<IntCmd>("rpush", "list operations");
}

StatusCmd CmdableAdapter::LSet(const std::string&, std::int64_t, const std::string&) {
  return Unsupported<StatusCmd>("lset", "list operations");
}

StringCmd CmdableAdapter::LPop(const std::string&) {
  return Unsupported<StringCmd>("lpop", "list operations");
}

StringSliceCmd CmdableAdapter::LRange(const std::string&, std::int64_t, std::int64_t) {
  return Unsupported<StringSliceCmd>("lrange", "list operations");
}

std::unique_ptr<Pipeliner> CmdableAdapter::Pipeline() {
  return std::make_unique<PipelinerAdapter>();
}

// ------------------------------------------------------------------
// Pipeline
// ------------------------------------------------------------------

template <typename CmdT>
CmdT PipelinerAdapter::Queue(const char* name) {
  auto cmd = Unsupported<CmdT>(name, "pipelines");
  queued_.push_back(std::make_shared<CmdT>(cmd));
  return cmd;
}

StatusCmd PipelinerAdapter::Set(const std::string&, const std::string&, std::chrono::milliseconds) {
  return Queue<StatusCmd>("set");
}

StringCmd PipelinerAdapter::Get(const std::string&) {
  return Queue<StringCmd>("get");
}

IntCmd PipelinerAdapter::IncrBy(const std::string&, std::int64_t) {
  return Queue<IntCmd>("incrby");
}

IntCmd PipelinerAdapter::Del(const std::vector<std::string>&) {
  return Queue<IntCmd>("del");
}

BoolCmd PipelinerAdapter::Expire(const std::string&, std::chrono::milliseconds) {
  return Queue<BoolCmd>("expire");
}

CmderSliceCmd PipelinerAdapter::Exec() {
  auto cmd = Unsupported<CmderSliceCmd>("exec", "pipelines");
  cmd.SetVal(std::move(queued_));
  queued_.clear();
  return cmd;
}

} // namespace relcache::cache
