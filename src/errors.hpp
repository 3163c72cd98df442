#pragma once
#include <stdexcept>

namespace codex
{

  // backend I/O failure or an undecodable record; never retried by the registry
  struct StorageUnavailable : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // malformed node/edge or a disallowed lifecycle transition, raised before any write
  struct ValidationError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // collaborator (concept extraction service) failure
  struct ExternalServiceError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

} // namespace codex
