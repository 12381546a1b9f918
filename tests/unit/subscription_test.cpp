#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/cache/store_client.hpp"
#include "internal/cache/subscription.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using relcache::cache::Context;
using relcache::cache::PollingSubscription;
using relcache::cache::StoreClient;
using relcache::cache::SubscriptionOptions;
using relcache::db::memory::MemoryRepository;
using namespace std::chrono_literals;

SubscriptionOptions FastOptions() {
  SubscriptionOptions options;
  options.poll_interval = 10ms;
  options.batch_size    = 2;
  options.buffer_size   = 4;
  return options;
}

std::optional<relcache::db::model::SubscriptionRecord> ReadCursor(MemoryRepository& repo, const std::string& channel,
                                                                  const std::string& subscriber) {
  auto tx  = repo.Begin();
  auto sub = repo.GetSubscription(*tx, channel, subscriber);
  tx->Commit();
  return sub;
}

void TestPublishedBeforeSubscribeIsDelivered() {
  auto        repo = std::make_shared<MemoryRepository>();
  StoreClient client(repo, FastOptions());

  client.Publish("events", "m1");
  client.Publish("events", "m2");
  client.Publish("other", "ignored");

  auto sub = client.Subscribe("events");
  assert(sub->Channel() == "events");

  assert(sub->Receive(2s) == std::optional<std::string>("m1"));
  assert(sub->Receive(2s) == std::optional<std::string>("m2"));
  assert(!sub->Receive(50ms).has_value());

  client.Publish("events", "m3");
  assert(sub->Receive(2s) == std::optional<std::string>("m3"));

  sub->Detach();
}

void TestOrderAcrossBatches() {
  auto        repo = std::make_shared<MemoryRepository>();
  StoreClient client(repo, FastOptions());

  auto sub = client.Subscribe("ordered");
  for (int i = 0; i < 20; ++i) {
    client.Publish("ordered", "msg-" + std::to_string(i));
  }

  for (int i = 0; i < 20; ++i) {
    auto msg = sub->Receive(2s);
    assert(msg.has_value());
    assert(*msg == "msg-" + std::to_string(i));
  }
}

void TestCursorPersistedAndRemovedOnDetach() {
  auto repo = std::make_shared<MemoryRepository>();

  {
    StoreClient client(repo, FastOptions());
    client.Publish("cursor", "a");
  }

  PollingSubscription sub(repo, "cursor", FastOptions());
  assert(sub.SubscriberId().rfind("sub_", 0) == 0);
  assert(sub.SubscriberId().size() == 40);
  assert(sub.SubscriberId()[12] == '-');

  auto registered = ReadCursor(*repo, "cursor", sub.SubscriberId());
  assert(registered.has_value());

  assert(sub.Receive(2s) == std::optional<std::string>("a"));

  // cursor is persisted after the push; give the poller a tick to finish
  std::optional<relcache::db::model::SubscriptionRecord> cursor;
  for (int i = 0; i < 100; ++i) {
    cursor = ReadCursor(*repo, "cursor", sub.SubscriberId());
    if (cursor && cursor->last_message_id >= 1) break;
    std::this_thread::sleep_for(10ms);
  }
  assert(cursor.has_value());
  assert(cursor->last_message_id == 1);

  sub.Detach();
  sub.Detach();
  assert(!ReadCursor(*repo, "cursor", sub.SubscriberId()).has_value());
  assert(!sub.Receive(10ms).has_value());
}

void TestIndependentSubscribersEachReceive() {
  auto        repo = std::make_shared<MemoryRepository>();
  StoreClient client(repo, FastOptions());

  auto first  = client.Subscribe("fanout");
  auto second = client.Subscribe("fanout");

  client.Publish("fanout", "hello");

  assert(first->Receive(2s) == std::optional<std::string>("hello"));
  assert(second->Receive(2s) == std::optional<std::string>("hello"));
}

void TestSubscribeInsideTransactionRejected() {
  auto        repo = std::make_shared<MemoryRepository>();
  StoreClient client(repo, FastOptions());

  bool threw = false;
  client.Transaction([&](Context& ctx) {
    try {
      (void)ctx.Get().Subscribe("events");
    } catch (const relcache::util::ValidationError&) {
      threw = true;
    }
  });
  assert(threw);
}

void TestPublishInsideTransactionIsAtomic() {
  auto        repo = std::make_shared<MemoryRepository>();
  StoreClient client(repo, FastOptions());
  auto        sub = client.Subscribe("tx");

  bool aborted = false;
  try {
    client.Transaction([](Context& ctx) {
      ctx.Get().Publish("tx", "rolled-back");
      throw std::runtime_error("abort");
    });
  } catch (const std::runtime_error&) {
    aborted = true;
  }
  assert(aborted);

  client.Transaction([](Context& ctx) { ctx.Get().Publish("tx", "committed"); });

  assert(sub->Receive(2s) == std::optional<std::string>("committed"));
  assert(!sub->Receive(50ms).has_value());
}

} // namespace

int main() {
  TestPublishedBeforeSubscribeIsDelivered();
  TestOrderAcrossBatches();
  TestCursorPersistedAndRemovedOnDetach();
  TestIndependentSubscribersEachReceive();
  TestSubscribeInsideTransactionRejected();
  TestPublishInsideTransactionIsAtomic();

  std::cout << "relcache_unit_subscription: pass\n";
  return 0;
}
