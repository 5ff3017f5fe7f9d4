#include "GeocodeResolver.hpp"
#include "../Geo.hpp"
#include "../Log.hpp"
#include <algorithm>
#include <future>
#include <nlohmann/json.hpp>

namespace triplog::domain {

GeocodeResolver::GeocodeResolver(std::shared_ptr<ports::IGeocodingClient> client,
                                 std::shared_ptr<ports::ICacheStore> cache,
                                 std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                 std::shared_ptr<IClock> clock,
                                 GeocodingConfig config)
    : client_(std::move(client)),
      cache_(std::move(cache)),
      policyEngine_(std::move(policyEngine)),
      clock_(std::move(clock)),
      config_(std::move(config)) {
}

std::string GeocodeResolver::cacheKey(double lat, double lon) const {
    return "geocode:" + Geo::formatFixed(lat, config_.cacheDecimals) + "_" +
           Geo::formatFixed(lon, config_.cacheDecimals);
}

std::optional<GeocodeResult> GeocodeResolver::readCache(const std::string& key) {
    std::optional<std::string> cached;
    try {
        cached = cache_->get(key);
    } catch (const std::exception& e) {
        Log::warn("Geocode", "Cache read failed for " + key + ": " + e.what());
    }
    if (!cached) return std::nullopt;

    auto entry = nlohmann::json::parse(*cached, nullptr, false);
    if (!entry.is_discarded() && entry.is_object()) {
        GeocodeResult result;
        result.fromCache = true;
        if (entry.value("zeroResults", false)) {
            result.noAddress = true;
            result.error = kNoAddressMessage;
            return result;
        }
        std::string address = entry.value("address", "");
        if (!address.empty()) {
            result.address = address;
            return result;
        }
    }
    Log::warn("Geocode", "Discarding unreadable cache entry " + key);
    return std::nullopt;
}

GeocodeResult GeocodeResolver::resolve(double lat, double lon) {
    const std::string key = cacheKey(lat, lon);
    if (auto cached = readCache(key)) {
        return *cached;
    }

    // Single flight per bucket: concurrent misses share the first lookup.
    std::promise<GeocodeResult> promise;
    {
        std::unique_lock<std::mutex> lock(inFlightMutex_);
        auto it = inFlight_.find(key);
        if (it != inFlight_.end()) {
            std::shared_future<GeocodeResult> pending = it->second;
            lock.unlock();

            GeocodeResult shared = pending.get();
            shared.fromCache = true;
            shared.attempts = 0;
            return shared;
        }
        inFlight_.emplace(key, promise.get_future().share());
    }

    GeocodeResult result;
    try {
        result = lookupAndCache(key, lat, lon);
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        inFlight_.erase(key);
        throw;
    }

    promise.set_value(result);
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    inFlight_.erase(key);
    return result;
}

GeocodeResult GeocodeResolver::lookupAndCache(const std::string& key, double lat, double lon) {
    // A lookup that finished between the first read and the claim has filled the cache.
    if (auto cached = readCache(key)) {
        return *cached;
    }

    GeocodeResult result = callWithRetry(lat, lon);

    if (result.ok()) {
        storeInCache(key, nlohmann::json{{"address", *result.address},
                                         {"cachedAt", toEpochMillis(clock_->now())}}.dump());
    } else if (result.noAddress) {
        storeInCache(key, nlohmann::json{{"zeroResults", true},
                                         {"cachedAt", toEpochMillis(clock_->now())}}.dump());
    }
    return result;
}

GeocodeResult GeocodeResolver::callWithRetry(double lat, double lon) {
    const auto& retryPolicy = policyEngine_->getRetryPolicy();
    GeocodeResult result;

    for (int attempt = 1;; ++attempt) {
        result.attempts = attempt;

        ports::GeocodeResponse response;
        try {
            externalCalls_.fetch_add(1);
            response = client_->reverseGeocode(lat, lon);
        } catch (const std::exception& e) {
            response.status = ports::GeocodeStatus::TransportError;
            response.message = e.what();
        }

        switch (response.status) {
            case ports::GeocodeStatus::Ok:
                if (!response.address.empty()) {
                    result.address = response.address;
                    result.error.reset();
                    return result;
                }
                result.noAddress = true;
                result.error = kNoAddressMessage;
                return result;

            case ports::GeocodeStatus::ZeroResults:
                result.noAddress = true;
                result.error = kNoAddressMessage;
                return result;

            case ports::GeocodeStatus::Rejected:
                result.error = response.message.empty() ? "Geocoding API error" : response.message;
                return result;

            case ports::GeocodeStatus::RateLimited:
            case ports::GeocodeStatus::TransportError:
                break;
        }

        if (!retryPolicy.shouldRetry(attempt)) {
            if (response.status == ports::GeocodeStatus::RateLimited) {
                result.error = "Geocoding API rate limit exceeded";
            } else {
                result.error = "Geocoding failed: " + response.message;
            }
            Log::warn("Geocode", "Giving up on " + Geo::fallbackAddress(lat, lon) + " after " +
                      std::to_string(attempt) + " attempts: " + *result.error);
            return result;
        }

        auto delay = retryPolicy.getBackoffDelay(attempt);
        Log::debug("Geocode", "Attempt " + std::to_string(attempt) + " failed (" + response.message +
                   "), retrying in " + std::to_string(delay.count()) + "ms");
        clock_->sleepFor(delay);
    }
}

void GeocodeResolver::storeInCache(const std::string& key, const std::string& payload) {
    try {
        cache_->set(key, payload, std::chrono::duration_cast<std::chrono::milliseconds>(config_.cacheTtl));
    } catch (const std::exception& e) {
        Log::warn("Geocode", "Cache write failed for " + key + ": " + e.what());
    }
}

BackfillResult GeocodeResolver::backfill(const std::vector<TrackingPoint>& input,
                                         ports::ITrackingRepository* repository) {
    BackfillResult out;
    out.points = input;
    auto& points = out.points;
    auto& summary = out.summary;

    const size_t callsBefore = externalCalls_.load();
    const double duplicateKm = config_.duplicateDistanceMeters / 1000.0;
    const double radiusKm = config_.groupRadiusMeters / 1000.0;

    // Pass 1: separate near-duplicates from points that need their own lookup.
    std::vector<size_t> candidates;
    struct Follower {
        size_t index;
        size_t anchor;
    };
    std::vector<Follower> followers;
    std::optional<size_t> anchor;

    for (size_t i = 0; i < points.size(); ++i) {
        const auto& point = points[i];
        if (point.isDeleted()) continue;

        if (point.hasAddress()) {
            ++summary.alreadyResolved;
            anchor = i;
            continue;
        }
        ++summary.candidates;

        if (anchor) {
            const auto& prev = points[*anchor];
            double km = Geo::distanceKm(prev.lat, prev.lon, point.lat, point.lon);
            auto gap = point.capturedAt > prev.capturedAt ? point.capturedAt - prev.capturedAt
                                                          : prev.capturedAt - point.capturedAt;
            if (km < duplicateKm || gap < config_.duplicateInterval) {
                if (km <= radiusKm) {
                    followers.push_back({i, *anchor});
                } else {
                    ++summary.deferredPoints;
                }
                continue;
            }
        }

        candidates.push_back(i);
        anchor = i;
    }

    // Pass 2: greedy spatial grouping around the first unassigned candidate.
    std::vector<Group> groups;
    std::vector<std::optional<size_t>> groupOf(points.size());
    for (size_t c = 0; c < candidates.size(); ++c) {
        size_t idx = candidates[c];
        if (groupOf[idx]) continue;

        Group group;
        group.representative = idx;
        group.members.push_back(idx);
        groupOf[idx] = groups.size();

        for (size_t d = c + 1; d < candidates.size(); ++d) {
            size_t other = candidates[d];
            if (groupOf[other]) continue;
            if (Geo::distanceKm(points[idx].lat, points[idx].lon, points[other].lat, points[other].lon) <= radiusKm) {
                group.members.push_back(other);
                groupOf[other] = groups.size();
            }
        }
        groups.push_back(std::move(group));
    }

    // Near-duplicates of an already addressed point copy its address directly.
    for (const auto& follower : followers) {
        if (groupOf[follower.anchor]) {
            groups[*groupOf[follower.anchor]].members.push_back(follower.index);
        } else {
            GeocodeResult copied;
            copied.address = points[follower.anchor].address;
            copied.fromCache = true;
            applyResult(points, follower.index, copied, repository, summary);
        }
    }
    summary.groups = groups.size();

    // Pass 3: throttled batches under the circuit breaker.
    const auto& throttle = policyEngine_->getThrottlePolicy();
    const size_t batchSize = throttle.getBatchSize();
    const int maxFailures = throttle.getMaxConsecutiveFailures();
    int consecutiveFailures = 0;

    size_t next = 0;
    while (next < groups.size() && !summary.circuitOpen) {
        const size_t batchEnd = std::min(next + batchSize, groups.size());

        // Never keep more groups in flight than failures the breaker still tolerates.
        while (next < batchEnd && !summary.circuitOpen) {
            size_t budget = static_cast<size_t>(std::max(maxFailures - consecutiveFailures, 1));
            size_t waveEnd = std::min(batchEnd, next + budget);

            std::vector<std::future<GeocodeResult>> inFlight;
            for (size_t g = next; g < waveEnd; ++g) {
                const auto& rep = points[groups[g].representative];
                double lat = rep.lat;
                double lon = rep.lon;
                inFlight.push_back(std::async(std::launch::async, [this, lat, lon]() {
                    return resolve(lat, lon);
                }));
            }

            for (size_t g = next; g < waveEnd; ++g) {
                auto& group = groups[g];
                try {
                    group.result = inFlight[g - next].get();
                } catch (const std::exception& e) {
                    group.result = GeocodeResult{};
                    group.result.error = std::string("Geocoding failed: ") + e.what();
                }
                group.attempted = true;

                if (group.result.ok() || group.result.noAddress) {
                    consecutiveFailures = 0;
                    if (group.result.ok()) ++summary.groupsResolved;
                    else ++summary.groupsFailed;
                } else {
                    ++consecutiveFailures;
                    ++summary.groupsFailed;
                    if (consecutiveFailures >= maxFailures) {
                        summary.circuitOpen = true;
                        Log::warn("Geocode", "Circuit breaker opened after " + std::to_string(consecutiveFailures) +
                                  " consecutive failures, skipping remaining groups");
                    }
                }

                for (size_t member : group.members) {
                    applyResult(points, member, group.result, repository, summary);
                }
            }
            next = waveEnd;
        }

        if (next < groups.size() && !summary.circuitOpen) {
            clock_->sleepFor(throttle.getBatchPause());
        }
    }

    for (size_t g = next; g < groups.size(); ++g) {
        ++summary.groupsSkipped;
        for (size_t member : groups[g].members) {
            ++summary.skippedPoints;
            summary.skippedPointIds.push_back(points[member].id);
        }
    }

    summary.externalCalls = externalCalls_.load() - callsBefore;

    if (summary.candidates > 0) {
        Log::info("Geocode", "Backfill: " + std::to_string(summary.candidates) + " unresolved, " +
                  std::to_string(summary.groups) + " groups, " +
                  std::to_string(summary.resolvedPoints) + " resolved, " +
                  std::to_string(summary.failedPoints) + " failed, " +
                  std::to_string(summary.skippedPoints) + " skipped");
    }
    return out;
}

void GeocodeResolver::applyResult(std::vector<TrackingPoint>& points, size_t index, const GeocodeResult& result,
                                  ports::ITrackingRepository* repository, BackfillSummary& summary) {
    auto& point = points[index];
    if (point.hasAddress()) return;

    if (result.ok()) {
        point.address = result.address;
        point.addressError.reset();
    } else {
        point.addressError = result.error;
    }

    if (repository && point.id != 0) {
        try {
            if (!repository->updateAddress(point.id, point.address, point.addressError)) {
                // Addressed by a concurrent run, or gone: keep what the store holds.
                auto stored = repository->get(point.id);
                if (stored && stored->hasAddress()) {
                    point.address = stored->address;
                    point.addressError.reset();
                    ++summary.alreadyResolved;
                } else {
                    ++summary.skippedPoints;
                    summary.skippedPointIds.push_back(point.id);
                }
                Log::debug("Geocode", "Point " + std::to_string(point.id) + " was not updated by this run");
                return;
            }
        } catch (const std::exception& e) {
            Log::error("Geocode", "Failed to persist address for point " + std::to_string(point.id) + ": " + e.what());
            if (result.ok()) {
                point.address.reset();
                point.addressError = std::string("Failed to persist address: ") + e.what();
            }
            ++summary.failedPoints;
            summary.failedPointIds.push_back(point.id);
            return;
        }
    }

    if (result.ok()) {
        ++summary.resolvedPoints;
        summary.resolvedPointIds.push_back(point.id);
    } else {
        ++summary.failedPoints;
        summary.failedPointIds.push_back(point.id);
    }
}

} // namespace triplog::domain
