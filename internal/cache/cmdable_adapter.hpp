#pragma once

#include <memory>

#include "internal/cache/client.hpp"
#include "internal/cache/cmdable.hpp"
#include "internal/cache/counter.hpp"

namespace relcache::cache {

/*
  Cmdable over any Client.

  Del, Exists and HSet fan out inside one Client::Transaction, so a
  failure on any element leaves nothing applied. List commands and
  pipelines are unsupported and fail with util::NotFound.
*/
class CmdableAdapter final : public Cmdable {
 public:
  explicit CmdableAdapter(std::shared_ptr<Client> client, int counter_max_attempts = kDefaultCounterAttempts);

  StatusCmd Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  StringCmd Get(const std::string& key) override;
  IntCmd    Incr(const std::string& key) override;
  IntCmd    IncrBy(const std::string& key, std::int64_t delta) override;

  IntCmd             HSet(const std::string& key, const std::vector<std::string>& values) override;
  MapStringStringCmd HGetAll(const std::string& key) override;

  IntCmd  Del(const std::vector<std::string>& keys) override;
  IntCmd  Exists(const std::vector<std::string>& keys) override;
  BoolCmd Expire(const std::string& key, std::chrono::milliseconds ttl) override;

  StringCmd      LIndex(const std::string& key, std::int64_t index) override;
  IntCmd         LPush(const std::string& key, const std::vector<std::string>& values) override;
  IntCmd         RPush(const std::string& key, const std::vector<std::string>& values) override;
  StatusCmd      LSet(const std::string& key, std::int64_t index, const std::string& value) override;
  StringCmd      LPop(const std::string& key) override;
  StringSliceCmd LRange(const std::string& key, std::int64_t start, std::int64_t stop) override;

  std::unique_ptr<Pipeliner> Pipeline() override;

 private:
  std::shared_ptr<Client> client_;
  int                     counter_max_attempts_;
};

/*
  Pipelines are not supported: every queued command and Exec()
  fail with util::NotFound.
*/
class PipelinerAdapter final : public Pipeliner {
 public:
  StatusCmd Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  StringCmd Get(const std::string& key) override;
  IntCmd    IncrBy(const std::string& key, std::int64_t delta) override;
  IntCmd    Del(const std::vector<std::string>& keys) override;
  BoolCmd   Expire(const std::string& key, std::chrono::milliseconds ttl) override;

  std::size_t Len() const override {
    return queued_.size();
  }
  void Discard() override {
    queued_.clear();
  }

  CmderSliceCmd Exec() override;

 private:
  template <typename CmdT>
  CmdT Queue(const char* name);

  std::vector<std::shared_ptr<Cmder>> queued_;
};

} // namespace relcache::cache
