#pragma once

#include <stdexcept>
#include <string>

namespace respool {

// Base for errors raised by the pool itself, never by a factory or closer
class PoolError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// acquire() on a pool that has been shut down
class ClosedError : public PoolError {
  public:
    ClosedError() : PoolError("pool is closed") {}
};

// release()/close() called with a null resource, or a factory that produced one
class NilResourceError : public PoolError {
  public:
    NilResourceError() : PoolError("resource is nil, rejecting") {}
    explicit NilResourceError(const std::string& what) : PoolError(what) {}
};

} // namespace respool
