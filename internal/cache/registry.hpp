#pragma once

#include <memory>

#include "internal/cache/client.hpp"

namespace relcache::cache {

/*
  Process-wide slot for the selected backend.

  Set once by the composition root. GetClient()/Close() throw
  util::NotInitialized while nothing is registered.
*/

void SetClient(std::shared_ptr<Client> client);

std::shared_ptr<Client> GetClient();

// Closes and unregisters the current client.
void Close();

} // namespace relcache::cache
