// =================================================================
// include/Switchyard/CancellationToken.hpp
// =================================================================
// Caller-initiated cancellation shared with in-flight backend calls.

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <cstddef>

namespace Switchyard {

/**
 * @brief Cancellation flag with abort callbacks
 *
 * Backend adapters register a callback that aborts their in-flight call.
 * Callbacks run under the token's lock, so once removeCallback() returns
 * the callback is guaranteed not to be running.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Mark the token cancelled and run every registered callback once
     */
    void cancel();

    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * @brief Register an abort callback
     * @param callback Invoked on cancel(); invoked immediately if already cancelled
     * @return Handle for removeCallback()
     */
    size_t onCancel(std::function<void()> callback);

    /**
     * @brief Unregister a callback, waiting for it if it is running
     * @param handle Value returned by onCancel()
     */
    void removeCallback(size_t handle);

private:
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::map<size_t, std::function<void()>> m_callbacks;
    size_t m_next_handle = 0;
};

} // namespace Switchyard
