#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace triplog::ports {

class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CacheWrite {
    std::string value;
    std::chrono::milliseconds ttl{0};
};

// Shared expiring key-value store. Every operation may throw CacheError.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    // Receives the live value (nullopt when absent or expired). Returning
    // nullopt leaves the entry as it was.
    using Mutator = std::function<std::optional<CacheWrite>(const std::optional<std::string>& current)>;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual size_t removeByPrefix(const std::string& prefix) = 0;

    // Atomic read-modify-write of one key. Returns the value stored afterwards.
    virtual std::optional<std::string> compute(const std::string& key, const Mutator& mutator) = 0;
};

} // namespace triplog::ports
