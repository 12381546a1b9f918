#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/cmdable_adapter.hpp"
#include "internal/cache/store_client.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using relcache::cache::Client;
using relcache::cache::CmdableAdapter;
using relcache::cache::Context;
using relcache::cache::kNoExpiry;
using relcache::cache::ScanPage;
using relcache::cache::StoreClient;
using relcache::cache::Subscription;
using relcache::db::memory::MemoryRepository;
using namespace std::chrono_literals;

/*
  Forwards to an inner client but fails Delete/Count on one key, so
  fan-out commands can be checked for all-or-nothing behavior.
*/
class FailingClient final : public Client {
 public:
  FailingClient(Client& inner, std::string fail_key) : inner_(inner), fail_key_(std::move(fail_key)) {
  }

  using Client::Set;

  void Set(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) override {
    inner_.Set(key, value, ttl);
  }
  std::vector<std::uint8_t> GetBytes(const std::string& key) override {
    return inner_.GetBytes(key);
  }
  std::string GetString(const std::string& key) override {
    return inner_.GetString(key);
  }
  std::int64_t Delete(const std::string& key) override {
    MaybeFail(key);
    return inner_.Delete(key);
  }
  std::int64_t Count(const std::vector<std::string>& keys) override {
    for (const auto& key : keys) MaybeFail(key);
    return inner_.Count(keys);
  }
  void SetMapField(const std::string& key, const std::string& field, const std::string& value) override {
    MaybeFail(field);
    inner_.SetMapField(key, field, value);
  }
  std::string GetMapField(const std::string& key, const std::string& field) override {
    return inner_.GetMapField(key, field);
  }
  void DeleteMapField(const std::string& key, const std::string& field) override {
    inner_.DeleteMapField(key, field);
  }
  std::map<std::string, std::string> GetMap(const std::string& key) override {
    return inner_.GetMap(key);
  }
  ScanPage ScanMapStream(const std::string& key, std::uint64_t cursor, const std::string& match,
                         std::int64_t count) override {
    return inner_.ScanMapStream(key, cursor, match, count);
  }
  bool SetNX(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) override {
    return inner_.SetNX(key, value, ttl);
  }
  bool Expire(const std::string& key, std::chrono::milliseconds ttl) override {
    return inner_.Expire(key, ttl);
  }
  void Transaction(const std::function<void(Context&)>& fn) override {
    inner_.Transaction([&](Context& ctx) {
      FailingClient bound(ctx.Get(), fail_key_);
      FailingContext wrapped(ctx, bound);
      fn(wrapped);
    });
  }
  void Publish(const std::string& channel, const std::string& message) override {
    inner_.Publish(channel, message);
  }
  std::unique_ptr<Subscription> Subscribe(const std::string& channel) override {
    return inner_.Subscribe(channel);
  }
  void Close() override {
    inner_.Close();
  }

 private:
  class FailingContext final : public Context {
   public:
    FailingContext(Context& inner, Client& client) : inner_(inner), client_(client) {
    }
    Client& Get() override {
      return client_;
    }
    void LockKey(const std::string& key) override {
      inner_.LockKey(key);
    }

   private:
    Context& inner_;
    Client&  client_;
  };

  void MaybeFail(const std::string& key) const {
    if (key == fail_key_) {
      throw relcache::util::StoreError(relcache::db::ErrorCode::IOError, "injected failure on " + key);
    }
  }

  Client&     inner_;
  std::string fail_key_;
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<StoreClient>      client = std::make_shared<StoreClient>(repo);
  CmdableAdapter                    commands{client};
};

void TestStringCommands() {
  Fixture f;

  auto set = f.commands.Set("k", "v", kNoExpiry);
  assert(!set.Failed());
  assert(set.Name() == "set");
  assert(set.Result() == "OK");

  auto get = f.commands.Get("k");
  assert(get.Result() == "v");
  assert(get.Bytes() == std::vector<std::uint8_t>({'v'}));

  auto missing = f.commands.Get("missing");
  assert(missing.Failed());
  assert(missing.IsNotFound());
  assert(!missing.ErrMessage().empty());

  assert(f.commands.Incr("n").Result() == 1);
  assert(f.commands.IncrBy("n", 9).Result() == 10);
  assert(f.commands.Get("n").Int64() == 10);

  bool threw = false;
  try {
    (void)f.commands.Get("k").Int64();
  } catch (const relcache::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  auto bad_ttl = f.commands.Set("k", "v", -3ms);
  assert(bad_ttl.Failed());
  assert(!bad_ttl.IsNotFound());
}

void TestHashCommands() {
  Fixture f;

  auto hset = f.commands.HSet("h", {"a", "1", "b", "2"});
  assert(hset.Result() == 2);

  auto all = f.commands.HGetAll("h");
  assert(all.Result().size() == 2);
  assert(all.Result().at("a") == "1");

  auto odd = f.commands.HSet("h", {"a", "1", "b"});
  assert(odd.Failed());
  bool is_validation = false;
  try {
    odd.ThrowIfError();
  } catch (const relcache::util::ValidationError&) {
    is_validation = true;
  }
  assert(is_validation);
  assert(f.commands.HSet("h", {}).Failed());

  assert(f.commands.HGetAll("empty").IsNotFound());
}

void TestDelAndExists() {
  Fixture f;
  assert(f.commands.Set("a", "1", kNoExpiry).Result() == "OK");
  assert(f.commands.Set("b", "2", kNoExpiry).Result() == "OK");

  assert(f.commands.Exists({"a", "b", "c"}).Result() == 2);
  assert(f.commands.Exists({"a", "a", "a"}).Result() == 3);
  assert(f.commands.Exists({}).Result() == 0);

  assert(f.commands.Del({"a", "c"}).Result() == 1);
  assert(f.commands.Del({"a"}).Result() == 0);
  assert(f.commands.Del({}).Result() == 0);
  assert(f.commands.Exists({"a", "b"}).Result() == 1);
}

void TestExpireCommand() {
  Fixture f;
  assert(f.commands.Set("e", "1", kNoExpiry).Result() == "OK");
  assert(f.commands.Expire("e", 1h).Result());
  assert(!f.commands.Expire("absent", 1h).Result());
  assert(f.commands.Expire("e", -1s).Failed());
}

void TestFanOutIsAllOrNothing() {
  auto        repo = std::make_shared<MemoryRepository>();
  StoreClient store(repo);
  store.Set("a", std::string_view("1"), kNoExpiry);
  store.Set("b", std::string_view("2"), kNoExpiry);

  std::shared_ptr<Client> failing = std::make_shared<FailingClient>(store, "b");
  CmdableAdapter          commands(failing);

  auto del = commands.Del({"a", "b"});
  assert(del.Failed());
  assert(!del.IsNotFound());
  // "a" was deleted before "b" failed and must be back
  assert(store.GetString("a") == "1");
  assert(store.GetString("b") == "2");

  assert(commands.Exists({"a", "b"}).Failed());

  auto hset = commands.HSet("h", {"x", "1", "b", "2"});
  assert(hset.Failed());
  bool missing = false;
  try {
    (void)store.GetMap("h");
  } catch (const relcache::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestListCommandsUnsupported() {
  Fixture f;

  assert(f.commands.LIndex("l", 0).IsNotFound());
  assert(f.commands.LPush("l", {"a"}).IsNotFound());
  assert(f.commands.RPush("l", {"a"}).IsNotFound());
  assert(f.commands.LSet("l", 0, "a").IsNotFound());
  assert(f.commands.LPop("l").IsNotFound());
  assert(f.commands.LRange("l", 0, -1).IsNotFound());
}

void TestPipelineUnsupported() {
  Fixture f;

  auto pipe = f.commands.Pipeline();
  assert(pipe->Set("k", "v", kNoExpiry).IsNotFound());
  assert(pipe->Get("k").IsNotFound());
  assert(pipe->IncrBy("n", 1).IsNotFound());
  assert(pipe->Len() == 3);

  auto exec = pipe->Exec();
  assert(exec.IsNotFound());
  assert(exec.Val().size() == 3);
  assert(exec.Val()[0]->Name() == "set");
  assert(pipe->Len() == 0);

  // nothing queued was applied
  assert(f.commands.Get("k").IsNotFound());

  (void)pipe->Del({"k"});
  pipe->Discard();
  assert(pipe->Len() == 0);
}

} // namespace

int main() {
  TestStringCommands();
  TestHashCommands();
  TestDelAndExists();
  TestExpireCommand();
  TestFanOutIsAllOrNothing();
  TestListCommandsUnsupported();
  TestPipelineUnsupported();

  std::cout << "relcache_unit_cmdable_adapter: pass\n";
  return 0;
}
