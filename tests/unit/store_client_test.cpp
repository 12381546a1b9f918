#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/store_client.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if RELCACHE_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using relcache::cache::Context;
using relcache::cache::kKeepTtl;
using relcache::cache::kNoExpiry;
using relcache::cache::StoreClient;
using relcache::db::Repository;
using relcache::db::memory::MemoryRepository;
using namespace std::chrono_literals;

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

std::shared_ptr<Repository> MakeSqliteRepository(const std::string& name) {
#if RELCACHE_DB_SQLITE
  const auto dir = std::filesystem::temp_directory_path() / "relcache_store_client_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / (name + ".db")).string();
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");

  relcache::db::sqlite::SqliteOptions options;
  {
    relcache::db::sqlite::SqliteDB bootstrap(path, options);
    relcache::db::sql::RunMigrations(bootstrap, relcache::db::sql::SqliteSchema());
  }
  auto pool = std::make_shared<relcache::db::sqlite::SqlitePool>(path, options, 4);
  return std::make_shared<relcache::db::sqlite::SqliteRepository>(pool);
#else
  (void)name;
  return nullptr;
#endif
}

void VerifySetGetAndOverwrite(StoreClient& client) {
  client.Set("greeting", std::string_view("hello"), kNoExpiry);
  assert(client.GetString("greeting") == "hello");

  client.Set("greeting", std::string_view("world"), kNoExpiry);
  assert(client.GetString("greeting") == "world");

  const std::vector<std::uint8_t> raw{0x00, 0xff, 0x10, 0x00};
  client.Set("binary", raw, kNoExpiry);
  assert(client.GetBytes("binary") == raw);

  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetString("missing"); }));
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetBytes("missing"); }));
}

void VerifyExpiryHidesEntries(StoreClient& client) {
  client.Set("short", std::string_view("v"), 40ms);
  assert(client.GetString("short") == "v");
  assert(client.Count({"short"}) == 1);

  std::this_thread::sleep_for(120ms);

  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetString("short"); }));
  assert(client.Count({"short"}) == 0);
  assert(!client.Expire("short", 10s));
}

void VerifyNegativeTtlRejected(StoreClient& client) {
  assert(Throws<relcache::util::ValidationError>([&] { client.Set("neg", std::string_view("v"), -5ms); }));
  assert(Throws<relcache::util::ValidationError>([&] { (void)client.SetNX("neg", std::string_view("v"), -1ms); }));
  assert(Throws<relcache::util::ValidationError>([&] { (void)client.Expire("neg", -1ms); }));
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetString("neg"); }));
}

void VerifyKeepTtl(StoreClient& client) {
  client.Set("kept", std::string_view("1"), 60ms);
  client.Set("kept", std::string_view("2"), kKeepTtl);
  assert(client.GetString("kept") == "2");

  std::this_thread::sleep_for(150ms);
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetString("kept"); }));

  // expired holder: treated as new, so it never expires
  client.Set("kept", std::string_view("3"), kKeepTtl);
  std::this_thread::sleep_for(80ms);
  assert(client.GetString("kept") == "3");
}

void VerifySetNX(StoreClient& client) {
  assert(client.SetNX("lock", std::string_view("owner-a"), kNoExpiry));
  assert(!client.SetNX("lock", std::string_view("owner-b"), kNoExpiry));
  assert(client.GetString("lock") == "owner-a");

  assert(client.SetNX("lease", std::string_view("first"), 40ms));
  std::this_thread::sleep_for(120ms);
  assert(client.SetNX("lease", std::string_view("second"), kNoExpiry));
  assert(client.GetString("lease") == "second");
}

void VerifyExpire(StoreClient& client) {
  client.Set("session", std::string_view("s"), kNoExpiry);
  assert(client.Expire("session", 40ms));
  std::this_thread::sleep_for(120ms);
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetString("session"); }));

  assert(!client.Expire("never-set", 1s));

  client.Set("persist", std::string_view("p"), 40ms);
  assert(client.Expire("persist", kNoExpiry));
  std::this_thread::sleep_for(120ms);
  assert(client.GetString("persist") == "p");
}

void VerifyDeleteAndCount(StoreClient& client) {
  client.Set("a", std::string_view("1"), kNoExpiry);
  client.Set("b", std::string_view("2"), kNoExpiry);

  assert(client.Count({"a", "b", "c"}) == 2);
  assert(client.Count({"a", "a"}) == 1);
  assert(client.Count({}) >= 2);

  assert(client.Delete("a") == 1);
  assert(client.Delete("a") == 0);
  assert(client.Count({"a", "b"}) == 1);
}

void VerifyMapFields(StoreClient& client) {
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetMap("profile"); }));
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetMapField("profile", "name"); }));

  client.SetMapField("profile", "name", "ada");
  client.SetMapField("profile", "lang", "c++");
  client.SetMapField("profile", "name", "grace");

  assert(client.GetMapField("profile", "name") == "grace");

  auto map = client.GetMap("profile");
  assert(map.size() == 2);
  assert(map["lang"] == "c++");
  assert(map["name"] == "grace");

  client.DeleteMapField("profile", "name");
  client.DeleteMapField("profile", "absent");
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetMapField("profile", "name"); }));

  client.DeleteMapField("profile", "lang");
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetMap("profile"); }));
}

void VerifyScanMapStream(StoreClient& client) {
  for (int i = 0; i < 25; ++i) {
    client.SetMapField("scan", "field_" + std::to_string(100 + i), std::to_string(i));
  }
  client.SetMapField("scan", "other", "x");

  std::set<std::string> seen;
  std::uint64_t         cursor = 0;
  int                   pages  = 0;
  do {
    auto page = client.ScanMapStream("scan", cursor, "", 7);
    assert(page.items.size() % 2 == 0);
    for (std::size_t i = 0; i < page.items.size(); i += 2) {
      assert(seen.insert(page.items[i]).second);
    }
    cursor = page.cursor;
    ++pages;
  } while (cursor != 0);
  assert(seen.size() == 26);
  assert(pages == 4);

  auto matched = client.ScanMapStream("scan", 0, "field_11?", 100);
  assert(matched.items.size() == 20);
  assert(matched.cursor == 0);
  assert(matched.items[0] == "field_110");
  assert(matched.items[1] == "10");

  auto defaults = client.ScanMapStream("scan", 0, "", 0);
  assert(defaults.items.size() == 20);
  assert(defaults.cursor == 10);

  // LIKE metacharacters in the glob are literal
  client.SetMapField("scan", "100%_done", "y");
  auto literal = client.ScanMapStream("scan", 0, "100%_*", 10);
  assert(literal.items.size() == 2);
  assert(literal.items[0] == "100%_done");

  auto empty = client.ScanMapStream("no-such-map", 0, "*", 10);
  assert(empty.items.empty());
  assert(empty.cursor == 0);
}

void VerifyTransactionCommitAndRollback(StoreClient& client) {
  client.Transaction([](Context& ctx) {
    ctx.Get().Set("tx-a", std::string_view("1"), kNoExpiry);
    ctx.Get().SetMapField("tx-map", "f", "v");
    assert(ctx.Get().GetString("tx-a") == "1");
  });
  assert(client.GetString("tx-a") == "1");
  assert(client.GetMapField("tx-map", "f") == "v");

  bool threw = false;
  try {
    client.Transaction([](Context& ctx) {
      ctx.Get().Set("tx-a", std::string_view("2"), kNoExpiry);
      ctx.Get().Set("tx-b", std::string_view("2"), kNoExpiry);
      throw std::runtime_error("abort");
    });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "abort";
  }
  assert(threw);
  assert(client.GetString("tx-a") == "1");
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetString("tx-b"); }));

  // nested transaction joins the outer one
  threw = false;
  try {
    client.Transaction([](Context& ctx) {
      ctx.Get().Transaction([](Context& inner) { inner.Get().Set("tx-c", std::string_view("3"), kNoExpiry); });
      throw std::logic_error("outer");
    });
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(Throws<relcache::util::NotFound>([&] { (void)client.GetString("tx-c"); }));
}

void VerifyCloseIsIdempotent(StoreClient& client) {
  client.Close();
  client.Close();
}

void RunSuite(const std::shared_ptr<Repository>& repository) {
  StoreClient client(repository);
  VerifySetGetAndOverwrite(client);
  VerifyExpiryHidesEntries(client);
  VerifyNegativeTtlRejected(client);
  VerifyKeepTtl(client);
  VerifySetNX(client);
  VerifyExpire(client);
  VerifyDeleteAndCount(client);
  VerifyMapFields(client);
  VerifyScanMapStream(client);
  VerifyTransactionCommitAndRollback(client);
  VerifyCloseIsIdempotent(client);
}

void TestGlobToLike() {
  assert(!StoreClient::GlobToLike("").has_value());
  assert(*StoreClient::GlobToLike("*") == "%");
  assert(*StoreClient::GlobToLike("user:?:*") == "user:_:%");
  assert(*StoreClient::GlobToLike("50%_off\\") == "50\\%\\_off\\\\");
}

void TestExpireAt() {
  const std::int64_t now = 1'700'000'000'000;
  assert(StoreClient::ExpireAt(now, kNoExpiry) == relcache::db::model::kNeverExpireMs);
  assert(StoreClient::ExpireAt(now, 1500ms) == now + 1500);
  assert(StoreClient::ExpireAt(now, std::chrono::milliseconds(relcache::db::model::kNeverExpireMs)) ==
         relcache::db::model::kNeverExpireMs);
}

} // namespace

int main() {
  TestGlobToLike();
  TestExpireAt();

  RunSuite(std::make_shared<MemoryRepository>());

#if RELCACHE_DB_SQLITE
  RunSuite(MakeSqliteRepository("suite"));
#endif

  std::cout << "relcache_unit_store_client: pass\n";
  return 0;
}
