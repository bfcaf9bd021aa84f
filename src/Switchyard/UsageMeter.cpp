// =================================================================
// src/Switchyard/UsageMeter.cpp
// =================================================================
// Implementation of usage metering and the performance report.

#include "Switchyard/UsageMeter.hpp"
#include "Switchyard/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace Switchyard {

UsageMeter::UsageMeter(const RouterConfig& config, std::shared_ptr<UsageSink> sink)
    : m_config(config.metering), m_sink(std::move(sink)) {
    for (const auto& [tier, rule] : config.tiers) {
        m_prices[tier] = rule.price;
    }

    for (const auto& backend : config.backends) {
        m_costs[backend.id] = backend.local ? 0.0 : backend.cost_per_request;
        m_backend_order.push_back(backend.id);
        m_backend_counters[backend.id] = std::make_unique<BackendCounters>();
    }
}

UsageRecord UsageMeter::record(const Request& request, const RoutingDecision& decision,
                               std::chrono::milliseconds latency, bool success) {
    UsageRecord usage;
    usage.request_id = request.id;
    usage.tier = request.tier;
    usage.backend_id = success ? decision.backend_id : "";
    usage.latency = latency;
    usage.success = success;
    usage.attempts = decision.attempts.size();
    usage.recorded_at = std::chrono::system_clock::now();

    if (success) {
        usage.cost = costFor(decision.backend_id);
        usage.price = priceFor(request.tier);
        usage.margin = usage.price - usage.cost;

        if (usage.margin < 0.0) {
            std::ostringstream context;
            context << std::fixed << std::setprecision(4)
                    << "Tier: " << RoutingTypeUtils::tierToString(request.tier)
                    << ", Price: " << usage.price << ", Cost: " << usage.cost;
            Logger::getInstance().error("UsageMeter",
                "Negative margin on " + decision.backend_id + ", pricing is misconfigured", context.str());
        }
    }

    updateAggregates(usage, decision);

    try {
        appendPending(usage);
    } catch (const RoutingError& e) {
        m_dropped_records++;
        Logger::getInstance().warning("UsageMeter",
            RoutingTypeUtils::errorKindToString(e.kind()) + ": " + e.what(), usage.request_id);
    } catch (const std::exception& e) {
        m_dropped_records++;
        Logger::getInstance().warning("UsageMeter",
            RoutingTypeUtils::errorKindToString(ErrorKind::METERING_WRITE_FAILED) + ": " + e.what(),
            usage.request_id);
    }

    Logger::getInstance().logUsageRecord(usage);
    return usage;
}

bool UsageMeter::flush() {
    if (!m_sink) {
        return getPendingCount() == 0;
    }

    std::vector<UsageRecord> batch;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        batch.swap(m_pending);
    }

    if (batch.empty()) {
        return true;
    }

    try {
        m_sink->write(batch);
        Logger::getInstance().debug("UsageMeter", "Flushed " + std::to_string(batch.size()) + " records");
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().warning("UsageMeter",
            RoutingTypeUtils::errorKindToString(ErrorKind::METERING_WRITE_FAILED) + ": " + e.what(),
            std::to_string(batch.size()) + " records kept pending");

        // Put the batch back in front of anything recorded meanwhile, within the bound
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        batch.insert(batch.end(), m_pending.begin(), m_pending.end());
        if (batch.size() > m_config.max_pending_records) {
            size_t excess = batch.size() - m_config.max_pending_records;
            m_dropped_records += excess;
            batch.erase(batch.begin(), batch.begin() + static_cast<std::ptrdiff_t>(excess));
        }
        m_pending.swap(batch);
        return false;
    }
}

UsageReport UsageMeter::report() const {
    UsageReport report;
    report.total_requests = m_total_requests.load();
    report.successful_requests = m_successful_requests.load();
    report.failed_requests = report.total_requests - std::min(report.total_requests, report.successful_requests);
    report.total_cost = fromMicros(m_total_cost_micros.load());
    report.total_revenue = fromMicros(m_total_revenue_micros.load());
    report.total_margin = report.total_revenue - report.total_cost;
    report.dropped_records = m_dropped_records.load();

    for (CustomerTier tier : RoutingTypeUtils::getAllTiers()) {
        const TierCounters& counters = m_tier_counters[tierIndex(tier)];
        TierUsage usage;
        usage.requests = counters.requests.load();
        usage.successes = counters.successes.load();
        usage.revenue = fromMicros(counters.revenue_micros.load());
        usage.cost = fromMicros(counters.cost_micros.load());
        usage.margin = usage.revenue - usage.cost;
        report.tiers[tier] = usage;
    }

    for (const auto& id : m_backend_order) {
        const BackendCounters& counters = *m_backend_counters.at(id);
        BackendUsage usage;
        usage.served = counters.served.load();
        usage.calls = counters.calls.load();
        usage.failed_calls = counters.failed_calls.load();
        if (report.successful_requests > 0) {
            usage.share = static_cast<double>(usage.served) / static_cast<double>(report.successful_requests);
        }
        if (usage.served > 0) {
            usage.avg_latency_ms = static_cast<double>(counters.latency_ms_total.load()) /
                                   static_cast<double>(usage.served);
        }
        report.backends[id] = usage;
    }

    return report;
}

std::vector<UsageRecord> UsageMeter::getPendingRecords() const {
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    return m_pending;
}

size_t UsageMeter::getPendingCount() const {
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    return m_pending.size();
}

double UsageMeter::priceFor(CustomerTier tier) const {
    auto it = m_prices.find(tier);
    return it != m_prices.end() ? it->second : 0.0;
}

double UsageMeter::costFor(const std::string& backend_id) const {
    auto it = m_costs.find(backend_id);
    return it != m_costs.end() ? it->second : 0.0;
}

int64_t UsageMeter::toMicros(double dollars) {
    return static_cast<int64_t>(std::llround(dollars * 1000000.0));
}

double UsageMeter::fromMicros(int64_t micros) {
    return static_cast<double>(micros) / 1000000.0;
}

void UsageMeter::updateAggregates(const UsageRecord& record, const RoutingDecision& decision) {
    TierCounters& tier = m_tier_counters[tierIndex(record.tier)];

    m_total_requests.fetch_add(1, std::memory_order_relaxed);
    tier.requests.fetch_add(1, std::memory_order_relaxed);

    for (const auto& attempt : decision.attempts) {
        auto it = m_backend_counters.find(attempt.backend_id);
        if (it == m_backend_counters.end() || attempt.outcome == AttemptOutcome::SKIPPED_OPEN) {
            continue;
        }
        it->second->calls.fetch_add(1, std::memory_order_relaxed);
        if (attempt.outcome == AttemptOutcome::TIMEOUT || attempt.outcome == AttemptOutcome::REJECTED) {
            it->second->failed_calls.fetch_add(1, std::memory_order_relaxed);
        }
    }

    if (!record.success) {
        return;
    }

    int64_t cost = toMicros(record.cost);
    int64_t revenue = toMicros(record.price);

    m_successful_requests.fetch_add(1, std::memory_order_relaxed);
    m_total_cost_micros.fetch_add(cost, std::memory_order_relaxed);
    m_total_revenue_micros.fetch_add(revenue, std::memory_order_relaxed);
    tier.successes.fetch_add(1, std::memory_order_relaxed);
    tier.cost_micros.fetch_add(cost, std::memory_order_relaxed);
    tier.revenue_micros.fetch_add(revenue, std::memory_order_relaxed);

    auto it = m_backend_counters.find(record.backend_id);
    if (it != m_backend_counters.end()) {
        it->second->served.fetch_add(1, std::memory_order_relaxed);
        it->second->latency_ms_total.fetch_add(static_cast<uint64_t>(std::max<long long>(0, record.latency.count())),
                                               std::memory_order_relaxed);
    }
}

void UsageMeter::appendPending(const UsageRecord& record) {
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    if (m_pending.size() >= m_config.max_pending_records) {
        throw RoutingError(ErrorKind::METERING_WRITE_FAILED,
                           "Pending buffer full (" + std::to_string(m_pending.size()) + " records)");
    }
    m_pending.push_back(record);
}

size_t UsageMeter::tierIndex(CustomerTier tier) {
    switch (tier) {
        case CustomerTier::BASIC: return 0;
        case CustomerTier::PREMIUM: return 1;
        case CustomerTier::ENTERPRISE: return 2;
    }
    return 0;
}

nlohmann::json UsageReport::toJson() const {
    nlohmann::json json;
    json["total_requests"] = total_requests;
    json["successful_requests"] = successful_requests;
    json["failed_requests"] = failed_requests;
    json["total_cost"] = total_cost;
    json["total_revenue"] = total_revenue;
    json["total_margin"] = total_margin;
    json["dropped_records"] = dropped_records;

    json["backends"] = nlohmann::json::object();
    for (const auto& [id, usage] : backends) {
        json["backends"][id] = {
            {"served", usage.served},
            {"calls", usage.calls},
            {"failed_calls", usage.failed_calls},
            {"share", usage.share},
            {"avg_latency_ms", usage.avg_latency_ms}
        };
    }

    json["tiers"] = nlohmann::json::object();
    for (const auto& [tier, usage] : tiers) {
        json["tiers"][RoutingTypeUtils::tierToString(tier)] = {
            {"requests", usage.requests},
            {"successes", usage.successes},
            {"revenue", usage.revenue},
            {"cost", usage.cost},
            {"margin", usage.margin}
        };
    }

    return json;
}

std::string UsageReport::toText() const {
    std::ostringstream out;
    out << std::fixed;

    out << "Requests: " << total_requests << " (" << successful_requests << " ok, "
        << failed_requests << " failed)\n";
    out << std::setprecision(4);
    out << "Revenue: $" << total_revenue << "  Cost: $" << total_cost
        << "  Margin: $" << total_margin << "\n\n";

    out << std::left << std::setw(20) << "BACKEND" << std::right
        << std::setw(8) << "SERVED" << std::setw(8) << "SHARE"
        << std::setw(8) << "CALLS" << std::setw(8) << "FAILED"
        << std::setw(14) << "AVG LATENCY" << "\n";
    for (const auto& [id, usage] : backends) {
        out << std::left << std::setw(20) << id << std::right
            << std::setw(8) << usage.served
            << std::setw(7) << std::setprecision(1) << usage.share * 100.0 << "%"
            << std::setw(8) << usage.calls
            << std::setw(8) << usage.failed_calls
            << std::setw(12) << std::setprecision(0) << usage.avg_latency_ms << "ms\n";
    }

    out << "\n" << std::left << std::setw(20) << "TIER" << std::right
        << std::setw(8) << "REQS" << std::setw(8) << "OK"
        << std::setw(12) << "REVENUE" << std::setw(12) << "COST" << std::setw(12) << "MARGIN" << "\n";
    out << std::setprecision(4);
    for (const auto& [tier, usage] : tiers) {
        out << std::left << std::setw(20) << RoutingTypeUtils::tierToString(tier) << std::right
            << std::setw(8) << usage.requests
            << std::setw(8) << usage.successes
            << std::setw(12) << usage.revenue
            << std::setw(12) << usage.cost
            << std::setw(12) << usage.margin << "\n";
    }

    return out.str();
}

} // namespace Switchyard
