#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace relcache::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryRepository::LikeMatch(const std::string& pattern, const std::string& text) {
  // iterative matcher with single '%' backtrack point
  std::size_t p = 0, t = 0;
  std::size_t star_p = std::string::npos, star_t = 0;

  while (t < text.size()) {
    if (p < pattern.size()) {
      char c = pattern[p];
      if (c == '%') {
        star_p = p++;
        star_t = t;
        continue;
      }
      if (c == '_') {
        ++p;
        ++t;
        continue;
      }
      if (c == '\\' && p + 1 < pattern.size()) {
        if (pattern[p + 1] == text[t]) {
          p += 2;
          ++t;
          continue;
        }
      } else if (c == text[t]) {
        ++p;
        ++t;
        continue;
      }
    }
    if (star_p == std::string::npos) return false;
    p = star_p + 1;
    t = ++star_t;
  }

  while (p < pattern.size() && pattern[p] == '%') ++p;
  return p == pattern.size();
}

Result MemoryRepository::LockKey(Transaction&, const std::string&) {
  // the writer lock already serializes transactions
  return Result::Ok();
}

// ------------------------------------------------------------------
// Scalar entries
// ------------------------------------------------------------------

Result MemoryRepository::UpsertEntry(Transaction& t, const model::CacheEntryRecord& r, bool keep_live_expiry) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(r.key);
  if (it == s.entries.end()) {
    auto row          = r;
    row.id            = s.next_entry_id++;
    row.created_at_ms = r.updated_at_ms;
    s.entries.emplace(r.key, std::move(row));
    return Result::Ok(1);
  }

  auto& row = it->second;
  row.value = r.value;
  if (!(keep_live_expiry && row.IsLive(r.updated_at_ms))) {
    row.expire_at_ms = r.expire_at_ms;
  }
  row.updated_at_ms = r.updated_at_ms;
  return Result::Ok(1);
}

Result MemoryRepository::InsertEntryIfAbsent(Transaction& t, const model::CacheEntryRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(r.key);
  if (it != s.entries.end() && it->second.IsLive(r.updated_at_ms)) {
    return Result::Ok(0);
  }

  auto row          = r;
  row.id            = it != s.entries.end() ? it->second.id : s.next_entry_id++;
  row.created_at_ms = r.updated_at_ms;
  s.entries[r.key]  = std::move(row);
  return Result::Ok(1);
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetLiveEntry(Transaction& t, const std::string& key,
                                                                      std::int64_t now_ms) {
  const auto& s  = TX(t).View();
  auto        it = s.entries.find(key);
  if (it == s.entries.end() || !it->second.IsLive(now_ms)) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteEntry(Transaction& t, const std::string& key) {
  return Result::Ok(TX(t).Mutable().entries.erase(key));
}

std::uint64_t MemoryRepository::CountLiveEntries(Transaction& t, const std::vector<std::string>& keys,
                                                 std::int64_t now_ms) {
  const auto& s = TX(t).View();

  if (keys.empty()) {
    return static_cast<std::uint64_t>(std::count_if(s.entries.begin(), s.entries.end(), [now_ms](const auto& kv) {
      return kv.second.IsLive(now_ms);
    }));
  }

  // IN (...) semantics: duplicate keys count once
  std::vector<std::string> unique_keys = keys;
  std::sort(unique_keys.begin(), unique_keys.end());
  unique_keys.erase(std::unique(unique_keys.begin(), unique_keys.end()), unique_keys.end());

  std::uint64_t n = 0;
  for (const auto& key : unique_keys) {
    auto it = s.entries.find(key);
    if (it != s.entries.end() && it->second.IsLive(now_ms)) ++n;
  }
  return n;
}

Result MemoryRepository::UpdateEntryExpiry(Transaction& t, const std::string& key, std::int64_t expire_at_ms,
                                           std::int64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(key);
  if (it == s.entries.end() || !it->second.IsLive(now_ms)) return Result::Ok(0);

  it->second.expire_at_ms  = expire_at_ms;
  it->second.updated_at_ms = now_ms;
  return Result::Ok(1);
}

Result MemoryRepository::DeleteExpiredEntries(Transaction& t, std::int64_t now_ms) {
  auto&         s = TX(t).Mutable();
  std::uint64_t n = 0;
  for (auto it = s.entries.begin(); it != s.entries.end();) {
    if (!it->second.IsLive(now_ms)) {
      it = s.entries.erase(it);
      ++n;
    } else {
      ++it;
    }
  }
  return Result::Ok(n);
}

// ------------------------------------------------------------------
// Map fields
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMapField(Transaction& t, const model::MapFieldRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.map_fields.find({r.key, r.field});
  if (it == s.map_fields.end()) {
    auto row          = r;
    row.created_at_ms = r.updated_at_ms;
    s.map_fields.emplace(FieldKey{r.key, r.field}, std::move(row));
  } else {
    it->second.value         = r.value;
    it->second.updated_at_ms = r.updated_at_ms;
  }
  return Result::Ok(1);
}

std::optional<model::MapFieldRecord> MemoryRepository::GetMapField(Transaction& t, const std::string& key,
                                                                   const std::string& field) {
  const auto& s  = TX(t).View();
  auto        it = s.map_fields.find({key, field});
  if (it == s.map_fields.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteMapField(Transaction& t, const std::string& key, const std::string& field) {
  return Result::Ok(TX(t).Mutable().map_fields.erase({key, field}));
}

std::vector<model::MapFieldRecord> MemoryRepository::ListMapFields(Transaction& t, const std::string& key) {
  const auto&                        s = TX(t).View();
  std::vector<model::MapFieldRecord> out;
  for (auto it = s.map_fields.lower_bound({key, ""}); it != s.map_fields.end() && it->first.first == key; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<model::MapFieldRecord> MemoryRepository::ScanMapFields(Transaction& t, const std::string& key,
                                                                   const std::optional<std::string>& like_pattern,
                                                                   std::uint64_t offset, std::uint64_t limit) {
  const auto&                        s = TX(t).View();
  std::vector<model::MapFieldRecord> out;
  std::uint64_t                      skipped = 0;

  for (auto it = s.map_fields.lower_bound({key, ""}); it != s.map_fields.end() && it->first.first == key; ++it) {
    if (out.size() >= limit) break;
    if (like_pattern && !LikeMatch(*like_pattern, it->first.second)) continue;
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result MemoryRepository::AppendMessage(Transaction& t, model::MessageRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_message_id++;
  s.messages.push_back(r);
  return Result::Ok(1);
}

std::vector<model::MessageRecord> MemoryRepository::ReadMessages(Transaction& t, const std::string& channel,
                                                                 std::int64_t after_id, std::uint64_t limit) {
  const auto& s = TX(t).View();

  auto it = std::upper_bound(s.messages.begin(), s.messages.end(), after_id,
                             [](std::int64_t id, const model::MessageRecord& m) { return id < m.id; });

  std::vector<model::MessageRecord> out;
  for (; it != s.messages.end() && out.size() < limit; ++it) {
    if (it->channel == channel) out.push_back(*it);
  }
  return out;
}

Result MemoryRepository::DeleteMessagesOlderThan(Transaction& t, std::int64_t created_before_ms) {
  auto& msgs   = TX(t).Mutable().messages;
  auto  before = msgs.size();
  msgs.erase(std::remove_if(msgs.begin(), msgs.end(),
                            [created_before_ms](const model::MessageRecord& m) {
                              return m.created_at_ms < created_before_ms;
                            }),
             msgs.end());
  return Result::Ok(before - msgs.size());
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.subscriptions.find({r.channel, r.subscriber});
  if (it == s.subscriptions.end()) {
    auto row          = r;
    row.created_at_ms = r.updated_at_ms;
    s.subscriptions.emplace(FieldKey{r.channel, r.subscriber}, std::move(row));
  } else {
    it->second.last_message_id = r.last_message_id;
    it->second.updated_at_ms   = r.updated_at_ms;
  }
  return Result::Ok(1);
}

std::optional<model::SubscriptionRecord> MemoryRepository::GetSubscription(Transaction& t, const std::string& channel,
                                                                           const std::string& subscriber) {
  const auto& s  = TX(t).View();
  auto        it = s.subscriptions.find({channel, subscriber});
  if (it == s.subscriptions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSubscriptionCursor(Transaction& t, const std::string& channel,
                                                  const std::string& subscriber, std::int64_t last_message_id,
                                                  std::int64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.subscriptions.find({channel, subscriber});
  if (it == s.subscriptions.end()) return Result::Ok(0);

  it->second.last_message_id = last_message_id;
  it->second.updated_at_ms   = now_ms;
  return Result::Ok(1);
}

Result MemoryRepository::DeleteSubscription(Transaction& t, const std::string& channel, const std::string& subscriber) {
  return Result::Ok(TX(t).Mutable().subscriptions.erase({channel, subscriber}));
}

}
