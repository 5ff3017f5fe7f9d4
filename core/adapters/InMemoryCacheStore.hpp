#pragma once

#include "../ports/ICacheStore.hpp"
#include "../IClock.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace triplog::adapters {

// Process-local cache with per-entry expiry read from the injected clock.
class InMemoryCacheStore : public ports::ICacheStore {
public:
    explicit InMemoryCacheStore(std::shared_ptr<IClock> clock);
    ~InMemoryCacheStore() override = default;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    void remove(const std::string& key) override;
    size_t removeByPrefix(const std::string& prefix) override;
    std::optional<std::string> compute(const std::string& key, const Mutator& mutator) override;

    size_t size() const;
    void clear();

    // Makes every subsequent operation throw CacheError.
    void setFailing(bool failing) { failing_ = failing; }

private:
    struct Entry {
        std::string value;
        TimePoint expiresAt;
    };

    void throwIfFailing() const;
    bool isLive(const Entry& entry) const;

    std::shared_ptr<IClock> clock_;
    std::map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
    std::atomic<bool> failing_{false};
};

} // namespace triplog::adapters
