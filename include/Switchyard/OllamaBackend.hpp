// =================================================================
// include/Switchyard/OllamaBackend.hpp
// =================================================================
// Backend client for models served by an Ollama server.

#pragma once

#include "Switchyard/BackendClient.hpp"
#include "Switchyard/RouterConfig.hpp"
#include <string>

namespace Switchyard {

class OllamaBackend : public BackendClient {
public:
    /**
     * @brief Constructs the Ollama client.
     * @param config Backend entry; server_url and model are used
     */
    explicit OllamaBackend(const BackendConfig& config);

    BackendReply generate(const std::string& prompt,
                          std::chrono::milliseconds timeout,
                          const std::shared_ptr<CancellationToken>& cancel) override;
    bool probe(std::chrono::milliseconds timeout) override;
    std::string getModelName() const override { return m_model_name; }
    std::string getEndpoint() const override { return m_server_url; }

    /**
     * @brief Build the JSON body of a POST /api/generate call
     */
    static std::string buildGeneratePayload(const std::string& model, const std::string& prompt);

    /**
     * @brief Extract generated text from a /api/generate response body
     *
     * Accepts a single JSON object or newline-delimited streamed chunks.
     * @param body Response body
     * @param text Receives the concatenated "response" fields
     * @param error Receives the server's error message, if any
     * @return True if text was produced and no error was reported
     */
    static bool parseGenerateBody(const std::string& body, std::string& text, std::string& error);

    /**
     * @brief Check a /api/tags response for a model
     * @param body Response body
     * @param model Model name to look for
     */
    static bool tagsListModel(const std::string& body, const std::string& model);

private:
    std::string m_server_url;
    std::string m_model_name;
};

} // namespace Switchyard
