#include "commands.hpp"

#include "internal/cache/counter.hpp"
#include "internal/util/errors.hpp"

namespace relcache::cache {

std::string Cmder::ErrMessage() const {
  if (!err_) return {};
  try {
    std::rethrow_exception(err_);
  } catch (const std::exception& e) {
    return e.what();
  }
}

bool Cmder::IsNotFound() const {
  if (!err_) return false;
  try {
    std::rethrow_exception(err_);
  } catch (const util::NotFound&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

std::int64_t StringCmd::Int64() const {
  const auto& raw    = Result();
  auto        parsed = ParseInt64(raw);
  if (!parsed) throw util::ValidationError(Name() + ": value is not an integer");
  return *parsed;
}

std::vector<std::uint8_t> StringCmd::Bytes() const {
  const auto& raw = Result();
  return std::vector<std::uint8_t>(raw.begin(), raw.end());
}

} // namespace relcache::cache
