#include "lru/errors.h"

namespace lru {

Error::Error(const std::string& what) : std::runtime_error(what) {}

InvalidCapacity::InvalidCapacity(long long requested)
    : Error("invalid capacity " + std::to_string(requested) + ": capacity must be >= 1"),
      requested_(requested) {}

KeyNotFound::KeyNotFound(const std::string& operation)
    : Error(operation + ": key not found") {}

EmptyStore::EmptyStore(const std::string& accessor)
    : Error(accessor + ": store is empty") {}

} // namespace lru
