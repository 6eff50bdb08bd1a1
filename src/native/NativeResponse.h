#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include "mcp/Completion.h"

class NativeResponse {
public:
    explicit NativeResponse(Completion done, nlohmann::json initial);
    virtual ~NativeResponse() = default;

    bool send();
    // Replaces the accumulated result
    bool send(nlohmann::json result);

    bool isSent() const { return done.isDone(); }

protected:
    struct State {
        std::mutex mtx;
        nlohmann::json result;
    };
    Completion done;
    std::shared_ptr<State> state;

    void append(const char* key, nlohmann::json item);
    static std::string detailsText(const nlohmann::json& details);
};

class ToolResponse : public NativeResponse {
public:
    explicit ToolResponse(Completion done);

    ToolResponse& text(const std::string& text);
    ToolResponse& image(const std::string& data, const std::string& mimeType);
    ToolResponse& audio(const std::string& data, const std::string& mimeType);

    // Sends {isError: true, content: [message, "Details: ..."]}
    bool error(const std::string& message, const nlohmann::json& details = nullptr);
};

class ResourceResponse : public NativeResponse {
public:
    ResourceResponse(Completion done, std::string uri, std::optional<std::string> uriTemplate = std::nullopt);

    ResourceResponse& text(const std::string& text, const std::string& mimeType = "text/plain");
    ResourceResponse& blob(const std::string& data, const std::string& mimeType = "application/octet-stream");

    bool error(const std::string& message, const nlohmann::json& details = nullptr);

    const std::string& getUri() const { return uri; }

private:
    std::string uri;
    std::optional<std::string> uriTemplate;
};

class PromptResponse : public NativeResponse {
public:
    explicit PromptResponse(Completion done);

    PromptResponse& user();
    PromptResponse& assistant();
    PromptResponse& system();

    // Each append becomes one message with the current role
    PromptResponse& text(const std::string& text);
    PromptResponse& image(const std::string& data, const std::string& mimeType);
    PromptResponse& audio(const std::string& data, const std::string& mimeType);
    PromptResponse& resource(const nlohmann::json& resource);

    bool error(const std::string& message, const nlohmann::json& details = nullptr);

private:
    std::shared_ptr<std::string> role;
    PromptResponse& appendMessage(nlohmann::json content);
};
