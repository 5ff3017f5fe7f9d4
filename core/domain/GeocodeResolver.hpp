#pragma once

#include "../ports/ICacheStore.hpp"
#include "../ports/IGeocodingClient.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/ITrackingRepository.hpp"
#include "../Analytics.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include "../TrackingPoint.hpp"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace triplog::domain {

struct GeocodeResult {
    std::optional<std::string> address;
    std::optional<std::string> error;
    bool fromCache = false;
    // Zero-results: a definitive answer rather than a service failure.
    bool noAddress = false;
    int attempts = 0;

    bool ok() const { return address.has_value(); }
};

struct BackfillResult {
    std::vector<TrackingPoint> points;
    BackfillSummary summary;
};

// Coordinates to address through a rounding cache, with grouped and
// throttled batch backfill guarded by a consecutive-failure breaker.
class GeocodeResolver {
public:
    GeocodeResolver(std::shared_ptr<ports::IGeocodingClient> client,
                    std::shared_ptr<ports::ICacheStore> cache,
                    std::shared_ptr<ports::IPolicyEngine> policyEngine,
                    std::shared_ptr<IClock> clock,
                    GeocodingConfig config = {});

    GeocodeResult resolve(double lat, double lon);

    // Resolves every unaddressed, live point of an ordered sequence and
    // persists the outcome per point when a repository is given. Returns the
    // sequence with addresses applied.
    BackfillResult backfill(const std::vector<TrackingPoint>& points,
                            ports::ITrackingRepository* repository = nullptr);

    std::string cacheKey(double lat, double lon) const;

    static constexpr const char* kNoAddressMessage = "No address found for these coordinates";

private:
    struct Group {
        size_t representative = 0;
        std::vector<size_t> members;
        GeocodeResult result;
        bool attempted = false;
    };

    std::optional<GeocodeResult> readCache(const std::string& key);
    GeocodeResult lookupAndCache(const std::string& key, double lat, double lon);
    GeocodeResult callWithRetry(double lat, double lon);
    void storeInCache(const std::string& key, const std::string& payload);
    void applyResult(std::vector<TrackingPoint>& points, size_t index, const GeocodeResult& result,
                     ports::ITrackingRepository* repository, BackfillSummary& summary);

    std::shared_ptr<ports::IGeocodingClient> client_;
    std::shared_ptr<ports::ICacheStore> cache_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<IClock> clock_;
    GeocodingConfig config_;

    std::atomic<size_t> externalCalls_{0};

    // Lookups in progress per cache key; later callers wait on the first.
    std::mutex inFlightMutex_;
    std::map<std::string, std::shared_future<GeocodeResult>> inFlight_;
};

} // namespace triplog::domain
