#pragma once
#ifndef LRU_ERRORS_H
#define LRU_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lru {

/**
 * Base class for every failure raised by LruStore.
 * Failures are synchronous and never leave a store partially mutated.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what);
};

/**
 * Raised by construction or resize when the requested capacity is below 1.
 */
class InvalidCapacity : public Error {
public:
    /**
     * @param requested The rejected capacity, as the caller passed it
     */
    explicit InvalidCapacity(long long requested);

    /**
     * @return the capacity that was rejected
     */
    long long requested() const noexcept { return requested_; }

private:
    long long requested_;
};

/**
 * Raised by get, peek, erase and pop when the key is absent.
 */
class KeyNotFound : public Error {
public:
    /**
     * @param operation Name of the store operation that failed (e.g. "peek")
     */
    explicit KeyNotFound(const std::string& operation);
};

/**
 * Raised by the recency accessors when the store holds no entries.
 */
class EmptyStore : public Error {
public:
    /**
     * @param accessor Name of the accessor that failed (e.g. "least_recently_used")
     */
    explicit EmptyStore(const std::string& accessor);
};

} // namespace lru

#endif // LRU_ERRORS_H
