// =================================================================
// src/Switchyard/CancellationToken.cpp
// =================================================================

#include "Switchyard/CancellationToken.hpp"

namespace Switchyard {

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled.exchange(true)) {
        return;
    }

    for (auto& entry : m_callbacks) {
        if (entry.second) {
            entry.second();
        }
    }
    m_callbacks.clear();
}

size_t CancellationToken::onCancel(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t handle = m_next_handle++;

    if (m_cancelled.load()) {
        if (callback) {
            callback();
        }
        return handle;
    }

    m_callbacks[handle] = std::move(callback);
    return handle;
}

void CancellationToken::removeCallback(size_t handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.erase(handle);
}

} // namespace Switchyard
