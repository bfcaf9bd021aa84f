// =================================================================
// tests/FakeBackend.hpp
// =================================================================
// Scripted backend client and manual clock shared by the unit tests.

#pragma once

#include "Switchyard/BackendClient.hpp"
#include "Switchyard/RouterConfig.hpp"
#include "Switchyard/Logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace SwitchyardTest {

/**
 * @brief Monotonic clock advanced by hand
 */
class ManualClock {
public:
    ManualClock() : m_now(Switchyard::Clock::now()) {}

    Switchyard::Clock::time_point now() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += delta;
    }

    std::function<Switchyard::Clock::time_point()> source() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex m_mutex;
    Switchyard::Clock::time_point m_now;
};

/**
 * @brief Backend whose behavior is set by the test
 */
class FakeBackend : public Switchyard::BackendClient {
public:
    enum class Mode {
        SUCCEED,
        TIMEOUT,
        REJECT,
        THROW,
        BLOCK_UNTIL_CANCELLED
    };

    explicit FakeBackend(const std::string& model_name, Mode mode = Mode::SUCCEED)
        : m_model_name(model_name), m_mode(mode) {}

    Switchyard::BackendReply generate(const std::string& prompt,
                                      std::chrono::milliseconds timeout,
                                      const std::shared_ptr<Switchyard::CancellationToken>& cancel) override {
        m_calls++;
        if (m_delay.load() > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(m_delay.load()));
        }

        Switchyard::BackendReply reply;
        reply.latency = std::chrono::milliseconds(m_delay.load());

        switch (m_mode.load()) {
            case Mode::SUCCEED:
                reply.ok = true;
                reply.text = m_model_name + " answered: " + prompt.substr(0, 16);
                break;
            case Mode::TIMEOUT:
                reply.timed_out = true;
                reply.latency = timeout;
                reply.error = "timed out";
                break;
            case Mode::REJECT:
                reply.error = "HTTP 500";
                break;
            case Mode::THROW:
                throw std::runtime_error("transport exploded");
            case Mode::BLOCK_UNTIL_CANCELLED:
                waitForCancel(cancel);
                reply.cancelled = true;
                reply.error = "Cancelled by caller";
                break;
        }
        return reply;
    }

    bool probe(std::chrono::milliseconds) override {
        m_probes++;
        return m_probe_healthy.load();
    }

    std::string getModelName() const override { return m_model_name; }
    std::string getEndpoint() const override { return "fake://" + m_model_name; }

    void setMode(Mode mode) { m_mode.store(mode); }
    void setProbeHealthy(bool healthy) { m_probe_healthy.store(healthy); }
    void setDelay(int delay_ms) { m_delay.store(delay_ms); }

    size_t calls() const { return m_calls.load(); }
    size_t probes() const { return m_probes.load(); }
    bool isBlocked() const { return m_blocked.load(); }

private:
    std::string m_model_name;
    std::atomic<Mode> m_mode;
    std::atomic<bool> m_probe_healthy{true};
    std::atomic<int> m_delay{0};
    std::atomic<size_t> m_calls{0};
    std::atomic<size_t> m_probes{0};
    std::atomic<bool> m_blocked{false};

    std::mutex m_block_mutex;
    std::condition_variable m_block_cv;

    void waitForCancel(const std::shared_ptr<Switchyard::CancellationToken>& cancel) {
        if (!cancel) {
            return;
        }

        bool released = false;
        size_t handle = cancel->onCancel([this, &released]() {
            std::lock_guard<std::mutex> lock(m_block_mutex);
            released = true;
            m_block_cv.notify_all();
        });

        m_blocked.store(true);
        {
            std::unique_lock<std::mutex> lock(m_block_mutex);
            m_block_cv.wait_for(lock, std::chrono::seconds(10), [&released]() { return released; });
        }
        cancel->removeCallback(handle);
        m_blocked.store(false);
    }
};

inline Switchyard::BackendConfig makeBackendConfig(const std::string& id, Switchyard::BackendClass backend_class,
                                                   double cost = 0.0) {
    Switchyard::BackendConfig config;
    config.id = id;
    config.backend_class = backend_class;
    config.type = "fake";
    config.model = id + "-model";
    config.cost_per_request = cost;
    config.local = cost == 0.0;
    return config;
}

/**
 * @brief Keep test output readable: errors only on the console, no files
 */
inline void quietLogging() {
    Switchyard::LoggerConfig logging;
    logging.console_level = Switchyard::LogLevel::ERROR;
    logging.file_enabled = false;
    Switchyard::Logger::getInstance().initialize(logging);
}

} // namespace SwitchyardTest
