// =================================================================
// include/Switchyard/UsageMeter.hpp
// =================================================================
// Per-request accounting and process-wide cost/margin aggregates.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include "Switchyard/RouterConfig.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <array>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace Switchyard {

/**
 * @brief Accounting artifact for one completed request
 */
struct UsageRecord {
    std::string request_id;
    CustomerTier tier = CustomerTier::BASIC;
    std::string backend_id;                    ///< Empty when no backend served the request
    std::chrono::milliseconds latency{0};
    double cost = 0.0;                         ///< Serving backend's cost per request
    double price = 0.0;                        ///< Revenue for the tier (0 on failure)
    double margin = 0.0;                       ///< price - cost
    bool success = false;
    size_t attempts = 0;                       ///< Length of the attempt sequence
    std::chrono::system_clock::time_point recorded_at;
};

/**
 * @brief External destination for usage records
 */
class UsageSink {
public:
    virtual ~UsageSink() = default;

    /**
     * @brief Persist a batch of records
     * @throws std::exception on failure; the batch stays pending
     */
    virtual void write(const std::vector<UsageRecord>& records) = 0;
};

/**
 * @brief Traffic served by one backend
 */
struct BackendUsage {
    uint64_t served = 0;           ///< Requests this backend answered
    uint64_t calls = 0;            ///< Real calls issued to it
    uint64_t failed_calls = 0;     ///< Calls that timed out or were rejected
    double share = 0.0;            ///< served / successful requests
    double avg_latency_ms = 0.0;   ///< Mean end-to-end latency of served requests
};

/**
 * @brief Accounting totals for one tier
 */
struct TierUsage {
    uint64_t requests = 0;
    uint64_t successes = 0;
    double revenue = 0.0;
    double cost = 0.0;
    double margin = 0.0;
};

/**
 * @brief Point-in-time view of the aggregates
 */
struct UsageReport {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    double total_cost = 0.0;
    double total_revenue = 0.0;
    double total_margin = 0.0;
    uint64_t dropped_records = 0;
    std::map<std::string, BackendUsage> backends;
    std::map<CustomerTier, TierUsage> tiers;

    nlohmann::json toJson() const;

    /**
     * @brief Render as an aligned text table
     */
    std::string toText() const;
};

/**
 * @brief Usage metering shared by every request thread
 *
 * Aggregates are lock-free atomics over a key set fixed at construction;
 * money is accumulated in integer micro-dollars. Only the bounded pending
 * buffer takes a lock. Recording never throws: write failures are logged
 * as MeteringWriteFailed and the response path continues.
 */
class UsageMeter {
public:
    /**
     * @brief Constructor
     * @param config Tier prices, backend costs and metering limits
     * @param sink Optional destination for flushed records
     */
    explicit UsageMeter(const RouterConfig& config, std::shared_ptr<UsageSink> sink = nullptr);

    /**
     * @brief Record a completed request
     * @param request The request
     * @param decision Routing decision (backend and attempt sequence)
     * @param latency End-to-end latency
     * @param success Whether a backend served the request
     * @return The record that was produced
     */
    UsageRecord record(const Request& request, const RoutingDecision& decision,
                       std::chrono::milliseconds latency, bool success);

    /**
     * @brief Hand pending records to the sink
     * @return True if the buffer was drained (or there was nothing to write)
     */
    bool flush();

    /**
     * @brief Build a report from the current aggregates
     */
    UsageReport report() const;

    std::vector<UsageRecord> getPendingRecords() const;
    size_t getPendingCount() const;

    double priceFor(CustomerTier tier) const;
    double costFor(const std::string& backend_id) const;

    static int64_t toMicros(double dollars);
    static double fromMicros(int64_t micros);

private:
    struct TierCounters {
        std::atomic<uint64_t> requests{0};
        std::atomic<uint64_t> successes{0};
        std::atomic<int64_t> revenue_micros{0};
        std::atomic<int64_t> cost_micros{0};
    };

    struct BackendCounters {
        std::atomic<uint64_t> served{0};
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> failed_calls{0};
        std::atomic<uint64_t> latency_ms_total{0};
    };

    MeteringConfig m_config;
    std::map<CustomerTier, double> m_prices;
    std::unordered_map<std::string, double> m_costs;
    std::vector<std::string> m_backend_order;
    std::shared_ptr<UsageSink> m_sink;

    std::atomic<uint64_t> m_total_requests{0};
    std::atomic<uint64_t> m_successful_requests{0};
    std::atomic<int64_t> m_total_cost_micros{0};
    std::atomic<int64_t> m_total_revenue_micros{0};
    std::atomic<uint64_t> m_dropped_records{0};
    std::array<TierCounters, 3> m_tier_counters;
    std::unordered_map<std::string, std::unique_ptr<BackendCounters>> m_backend_counters;

    mutable std::mutex m_pending_mutex;
    std::vector<UsageRecord> m_pending;

    void updateAggregates(const UsageRecord& record, const RoutingDecision& decision);

    /**
     * @throws RoutingError(METERING_WRITE_FAILED) when the buffer is full
     */
    void appendPending(const UsageRecord& record);

    static size_t tierIndex(CustomerTier tier);
};

} // namespace Switchyard
