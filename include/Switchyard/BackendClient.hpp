// =================================================================
// include/Switchyard/BackendClient.hpp
// =================================================================
// Abstract interface for a callable model backend.

#pragma once

#include "Switchyard/CancellationToken.hpp"
#include <string>
#include <memory>
#include <chrono>
#include <functional>

namespace Switchyard {

struct BackendConfig;

/**
 * @brief Result of one generation call
 */
struct BackendReply {
    bool ok = false;                        ///< Backend produced text
    bool timed_out = false;                 ///< Call exceeded its timeout
    bool cancelled = false;                 ///< Call aborted by the caller
    std::string text;                       ///< Generated text when ok
    std::string error;                      ///< Failure description otherwise
    std::chrono::milliseconds latency{0};   ///< Wall time of the call
};

/**
 * @brief Transport-independent backend interface
 *
 * Implementations report failures through BackendReply rather than by
 * throwing, and must honor both the timeout and the cancellation token.
 */
class BackendClient {
public:
    virtual ~BackendClient() = default;

    /**
     * @brief Generate a completion
     * @param prompt Prompt text
     * @param timeout Upper bound on the call
     * @param cancel Optional caller cancellation token
     * @return Outcome of the call
     */
    virtual BackendReply generate(const std::string& prompt,
                                  std::chrono::milliseconds timeout,
                                  const std::shared_ptr<CancellationToken>& cancel) = 0;

    /**
     * @brief Lightweight liveness call
     * @param timeout Upper bound on the probe
     * @return True if the backend is reachable and serves its model
     */
    virtual bool probe(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Model label reported to callers
     */
    virtual std::string getModelName() const = 0;

    /**
     * @brief Human-readable endpoint descriptor
     */
    virtual std::string getEndpoint() const = 0;
};

/**
 * @brief Creates a client for a configured backend
 */
using BackendFactory = std::function<std::shared_ptr<BackendClient>(const BackendConfig&)>;

} // namespace Switchyard
