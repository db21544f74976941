#pragma once
#ifndef LRU_STORE_SHELL_H
#define LRU_STORE_SHELL_H

#include "lru/lru_store.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <sstream>
#include <string>

namespace lru {

/**
 * Line-oriented command interpreter around a string store.
 *
 * Each call to execute() runs one command ("put k v", "get k", "dump", ...)
 * and returns a JSON response. Store failures come back as
 * {"error": message, "code": "not_found" | "empty" | "invalid_capacity" | "bad_request"}.
 */
class StoreShell {
public:
    using Store = LruStore<std::string, std::string>;
    using LogHook = std::function<void(const std::string&)>;

    /**
     * Constructor
     * @param store Shared pointer to the store to operate on
     * @param log   Receives one line per executed command; may be empty
     */
    explicit StoreShell(std::shared_ptr<Store> store, LogHook log = nullptr);

    /**
     * Run one command line.
     * @param line Command and arguments, whitespace separated
     * @return JSON response for the command
     */
    nlohmann::json execute(const std::string& line);

    /**
     * @return Number of get/peek commands that found their key
     */
    size_t hits() const;

    /**
     * @return Number of get/peek commands whose key was absent
     */
    size_t misses() const;

private:
    nlohmann::json dispatch(const std::string& command, std::istringstream& args);

    /**
     * Log a command with its outcome ("ok" or an error code)
     */
    void logCommand(const std::string& command, const std::string& status);

    std::shared_ptr<Store> store_;
    LogHook log_;

    // Metrics
    size_t hits_ = 0;       ///< Successful get/peek
    size_t misses_ = 0;     ///< get/peek on a missing key
};

/**
 * Parse a whole token as a capacity. Range checks are left to the store.
 * @throws std::invalid_argument if the token is not entirely an integer
 * @throws std::out_of_range if it does not fit in a long long
 */
StoreShell::Store::capacity_type parse_capacity(const std::string& token);

/**
 * @return true if the first word of line is "quit"; nothing else may follow it
 */
bool is_quit_command(const std::string& line);

} // namespace lru

#endif // LRU_STORE_SHELL_H
