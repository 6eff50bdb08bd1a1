#include "native/NativeResponse.h"

NativeResponse::NativeResponse(Completion done, nlohmann::json initial)
    : done(std::move(done)), state(std::make_shared<State>()) {
    state->result = std::move(initial);
}

bool NativeResponse::send() {
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        snapshot = state->result;
    }
    return done.succeed(std::move(snapshot));
}

bool NativeResponse::send(nlohmann::json result) {
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->result = result;
    }
    return done.succeed(std::move(result));
}

void NativeResponse::append(const char* key, nlohmann::json item) {
    std::lock_guard<std::mutex> lock(state->mtx);
    state->result[key].push_back(std::move(item));
}

std::string NativeResponse::detailsText(const nlohmann::json& details) {
    return details.is_string() ? details.get<std::string>() : details.dump(2);
}

// ---------------------------------------------------------------------------

ToolResponse::ToolResponse(Completion done)
    : NativeResponse(std::move(done), {{"content", nlohmann::json::array()}}) {}

ToolResponse& ToolResponse::text(const std::string& text) {
    append("content", {{"type", "text"}, {"text", text}});
    return *this;
}

ToolResponse& ToolResponse::image(const std::string& data, const std::string& mimeType) {
    append("content", {{"type", "image"}, {"data", data}, {"mimeType", mimeType}});
    return *this;
}

ToolResponse& ToolResponse::audio(const std::string& data, const std::string& mimeType) {
    append("content", {{"type", "audio"}, {"data", data}, {"mimeType", mimeType}});
    return *this;
}

bool ToolResponse::error(const std::string& message, const nlohmann::json& details) {
    nlohmann::json content = nlohmann::json::array();
    content.push_back({{"type", "text"}, {"text", message}});
    if (!details.is_null()) {
        content.push_back({{"type", "text"}, {"text", "Details: " + detailsText(details)}});
    }
    return send({{"isError", true}, {"content", content}});
}

// ---------------------------------------------------------------------------

ResourceResponse::ResourceResponse(Completion done, std::string uri, std::optional<std::string> uriTemplate)
    : NativeResponse(std::move(done), {{"contents", nlohmann::json::array()}}),
      uri(std::move(uri)), uriTemplate(std::move(uriTemplate)) {}

ResourceResponse& ResourceResponse::text(const std::string& text, const std::string& mimeType) {
    append("contents", {{"uri", uri}, {"text", text}, {"mimeType", mimeType}});
    return *this;
}

ResourceResponse& ResourceResponse::blob(const std::string& data, const std::string& mimeType) {
    append("contents", {{"uri", uri}, {"blob", data}, {"mimeType", mimeType}});
    return *this;
}

bool ResourceResponse::error(const std::string& message, const nlohmann::json& details) {
    std::string text = message;
    if (!details.is_null()) text += "\nDetails: " + detailsText(details);
    nlohmann::json contents = nlohmann::json::array();
    contents.push_back({{"uri", uri}, {"text", text}, {"mimeType", "text/plain"}});
    return send({{"isError", true}, {"contents", contents}});
}

// ---------------------------------------------------------------------------

PromptResponse::PromptResponse(Completion done)
    : NativeResponse(std::move(done), {{"messages", nlohmann::json::array()}}),
      role(std::make_shared<std::string>("user")) {}

PromptResponse& PromptResponse::user() {
    std::lock_guard<std::mutex> lock(state->mtx);
    *role = "user";
    return *this;
}

PromptResponse& PromptResponse::assistant() {
    std::lock_guard<std::mutex> lock(state->mtx);
    *role = "assistant";
    return *this;
}

PromptResponse& PromptResponse::system() {
    std::lock_guard<std::mutex> lock(state->mtx);
    *role = "system";
    return *this;
}

PromptResponse& PromptResponse::appendMessage(nlohmann::json content) {
    std::lock_guard<std::mutex> lock(state->mtx);
    state->result["messages"].push_back({{"role", *role}, {"content", std::move(content)}});
    return *this;
}

PromptResponse& PromptResponse::text(const std::string& text) {
    return appendMessage({{"type", "text"}, {"text", text}});
}

PromptResponse& PromptResponse::image(const std::string& data, const std::string& mimeType) {
    return appendMessage({{"type", "image"}, {"data", data}, {"mimeType", mimeType}});
}

PromptResponse& PromptResponse::audio(const std::string& data, const std::string& mimeType) {
    return appendMessage({{"type", "audio"}, {"data", data}, {"mimeType", mimeType}});
}

PromptResponse& PromptResponse::resource(const nlohmann::json& resource) {
    return appendMessage({{"type", "resource"}, {"resource", resource}});
}

bool PromptResponse::error(const std::string& message, const nlohmann::json& details) {
    std::string text = message;
    if (!details.is_null()) text += "\nDetails: " + detailsText(details);
    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "assistant"}, {"content", {{"type", "text"}, {"text", text}}}});
    return send({{"isError", true}, {"messages", messages}});
}
