#include "InMemoryCacheStore.hpp"

namespace triplog::adapters {

InMemoryCacheStore::InMemoryCacheStore(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
}

std::optional<std::string> InMemoryCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfFailing();

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (!isLive(it->second)) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void InMemoryCacheStore::set(const std::string& key, const std::string& value,
                             std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfFailing();
    entries_[key] = Entry{value, clock_->now() + ttl};
}

void InMemoryCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfFailing();
    entries_.erase(key);
}

size_t InMemoryCacheStore::removeByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfFailing();

    size_t removed = 0;
    auto it = entries_.lower_bound(prefix);
    while (it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = entries_.erase(it);
        ++removed;
    }
    return removed;
}

std::optional<std::string> InMemoryCacheStore::compute(const std::string& key, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfFailing();

    std::optional<std::string> current;
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (isLive(it->second)) {
            current = it->second.value;
        } else {
            entries_.erase(it);
        }
    }

    auto write = mutator(current);
    if (!write) return current;

    entries_[key] = Entry{write->value, clock_->now() + write->ttl};
    return write->value;
}

size_t InMemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void InMemoryCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void InMemoryCacheStore::throwIfFailing() const {
    if (failing_) {
        throw ports::CacheError("cache store unavailable");
    }
}

bool InMemoryCacheStore::isLive(const Entry& entry) const {
    return clock_->now() < entry.expiresAt;
}

} // namespace triplog::adapters
