// =================================================================
// src/Switchyard/OllamaBackend.cpp
// =================================================================
// Ollama API interaction for generation calls and liveness probes.

#include "Switchyard/OllamaBackend.hpp"
#include "Switchyard/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <sstream>
#include <thread>

namespace Switchyard {

namespace {

// Releases the cancel callback before the client it captures goes away
class AbortRegistration {
public:
    AbortRegistration(const std::shared_ptr<CancellationToken>& token, std::function<void()> abort)
        : m_token(token) {
        if (m_token) {
            m_handle = m_token->onCancel(std::move(abort));
        }
    }

    ~AbortRegistration() {
        if (m_token) {
            m_token->removeCallback(m_handle);
        }
    }

    AbortRegistration(const AbortRegistration&) = delete;
    AbortRegistration& operator=(const AbortRegistration&) = delete;

private:
    std::shared_ptr<CancellationToken> m_token;
    size_t m_handle = 0;
};

// Stops the call once the whole attempt outlives its timeout; httplib only
// bounds each connect, read and write phase separately
class DeadlineWatchdog {
public:
    DeadlineWatchdog(std::chrono::milliseconds timeout, std::function<void()> expire)
        : m_thread([this, timeout, expire]() {
              std::unique_lock<std::mutex> lock(m_mutex);
              if (!m_cv.wait_for(lock, timeout, [this]() { return m_disarmed; })) {
                  m_fired.store(true);
                  expire();
              }
          }) {
    }

    ~DeadlineWatchdog() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_disarmed = true;
        }
        m_cv.notify_all();
        m_thread.join();
    }

    DeadlineWatchdog(const DeadlineWatchdog&) = delete;
    DeadlineWatchdog& operator=(const DeadlineWatchdog&) = delete;

    bool fired() const { return m_fired.load(); }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_disarmed = false;
    std::atomic<bool> m_fired{false};
    std::thread m_thread;
};

} // anonymous namespace

OllamaBackend::OllamaBackend(const BackendConfig& config)
    : m_server_url(config.server_url), m_model_name(config.model) {
    Logger::getInstance().debug("OllamaBackend", "Configured Ollama client for " + config.id,
                                m_server_url + ", model " + m_model_name);
}

BackendReply OllamaBackend::generate(const std::string& prompt,
                                     std::chrono::milliseconds timeout,
                                     const std::shared_ptr<CancellationToken>& cancel) {
    BackendReply reply;
    auto start_time = std::chrono::steady_clock::now();

    if (cancel && cancel->isCancelled()) {
        reply.cancelled = true;
        reply.error = "Cancelled before dispatch";
        return reply;
    }

    // The httplib constructor handles URL parsing automatically.
    httplib::Client client(m_server_url);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    // Declared after the client so both are released first
    AbortRegistration registration(cancel, [&client]() { client.stop(); });
    DeadlineWatchdog watchdog(timeout, [&client]() { client.stop(); });
    auto res = client.Post("/api/generate", buildGeneratePayload(m_model_name, prompt), "application/json");

    auto end_time = std::chrono::steady_clock::now();
    reply.latency = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    if (cancel && cancel->isCancelled()) {
        reply.cancelled = true;
        reply.error = "Cancelled by caller";
        return reply;
    }

    if (!res) {
        if (watchdog.fired() || reply.latency >= timeout) {
            reply.timed_out = true;
            reply.error = "Timed out after " + std::to_string(reply.latency.count()) + "ms";
        } else {
            reply.error = "Failed to connect to Ollama server at " + m_server_url + ": " +
                          httplib::to_string(res.error());
        }
        return reply;
    }

    if (res->status != 200) {
        reply.error = "Ollama server returned error status: " + std::to_string(res->status);
        if (!res->body.empty()) {
            reply.error += " - " + res->body.substr(0, 200);
        }
        return reply;
    }

    std::string error;
    if (!parseGenerateBody(res->body, reply.text, error)) {
        reply.error = error.empty() ? "Empty response from model" : error;
        reply.text.clear();
        return reply;
    }

    reply.ok = true;
    return reply;
}

bool OllamaBackend::probe(std::chrono::milliseconds timeout) {
    try {
        httplib::Client client(m_server_url);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);

        auto res = client.Get("/api/tags");
        if (!res) {
            Logger::getInstance().debug("OllamaBackend", "Cannot connect to Ollama server", m_server_url);
            return false;
        }

        if (res->status != 200) {
            Logger::getInstance().debug("OllamaBackend",
                "Ollama server returned error: " + std::to_string(res->status), m_server_url);
            return false;
        }

        if (!tagsListModel(res->body, m_model_name)) {
            Logger::getInstance().debug("OllamaBackend",
                "Model '" + m_model_name + "' not found on server", m_server_url);
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().debug("OllamaBackend", "Health check failed: " + std::string(e.what()));
        return false;
    }
}

std::string OllamaBackend::buildGeneratePayload(const std::string& model, const std::string& prompt) {
    nlohmann::json request_body = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false}
    };
    return request_body.dump();
}

bool OllamaBackend::parseGenerateBody(const std::string& body, std::string& text, std::string& error) {
    // Ollama returns one object, or newline-delimited objects when streaming
    std::istringstream response_stream(body);
    std::string line;
    bool parsed_any = false;

    while (std::getline(response_stream, line)) {
        if (line.empty()) continue;

        try {
            auto json_chunk = nlohmann::json::parse(line);
            parsed_any = true;

            if (json_chunk.contains("error") && json_chunk["error"].is_string()) {
                error = json_chunk["error"].get<std::string>();
                return false;
            }
            if (json_chunk.contains("response") && json_chunk["response"].is_string()) {
                text += json_chunk["response"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            error = std::string("Malformed response: ") + e.what();
            return false;
        }
    }

    if (!parsed_any) {
        error = "Empty response body";
        return false;
    }

    return !text.empty();
}

bool OllamaBackend::tagsListModel(const std::string& body, const std::string& model) {
    try {
        auto json_response = nlohmann::json::parse(body);
        if (!json_response.contains("models") || !json_response["models"].is_array()) {
            return false;
        }

        for (const auto& entry : json_response["models"]) {
            for (const char* key : {"name", "model"}) {
                if (entry.contains(key) && entry[key].is_string() && entry[key].get<std::string>() == model) {
                    return true;
                }
            }
        }
    } catch (const nlohmann::json::exception&) {
        return false;
    }

    return false;
}

} // namespace Switchyard
