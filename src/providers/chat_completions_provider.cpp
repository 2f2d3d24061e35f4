#include "providers/chat_completions_provider.hpp"

#include <cstdlib>
#include <utility>

#include "httplib.h"

#include "utils/logging.hpp"

namespace tfbot::providers {
namespace {

constexpr const char* kTag = "llm";
constexpr int kTimeoutSeconds = 60;

LLMResponse Failure(const std::string& reason) {
    LLMResponse response{};
    response.content = "LLM request failed: " + reason;
    response.finish_reason = "error";
    return response;
}

// First HTTP proxy named in the environment, as host and port.
bool ProxyFromEnv(std::string& host, int& port) {
    for (const char* name : {"HTTPS_PROXY", "https_proxy", "HTTP_PROXY", "http_proxy"}) {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            continue;
        }
        const auto proxy = ParseEndpoint(value);
        if (proxy.host.empty()) {
            continue;
        }
        host = proxy.host;
        port = proxy.port;
        return true;
    }
    return false;
}

std::string Redact(const std::string& key) {
    return key.size() <= 8 ? "****" : key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

}  // namespace

std::string Endpoint::Origin() const {
    return std::string(https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

Endpoint ParseEndpoint(const std::string& base_url) {
    Endpoint endpoint{};
    std::string rest = base_url;
    if (rest.rfind("http://", 0) == 0) {
        endpoint.https = false;
        endpoint.port = 80;
        rest.erase(0, 7);
    } else if (rest.rfind("https://", 0) == 0) {
        rest.erase(0, 8);
    }

    const auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.path_prefix = rest.substr(slash);
        while (!endpoint.path_prefix.empty() && endpoint.path_prefix.back() == '/') {
            endpoint.path_prefix.pop_back();
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        try {
            endpoint.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            utils::LogWarn(kTag, "ignoring bad port in " + base_url);
        }
        authority.resize(colon);
    }
    endpoint.host = authority;
    return endpoint;
}

nlohmann::json BuildChatRequest(const std::vector<Message>& messages,
                                const std::string& model,
                                int max_tokens,
                                double temperature) {
    auto turns = nlohmann::json::array();
    for (const auto& message : messages) {
        turns.push_back({{"role", message.role}, {"content", message.content}});
    }
    return {
        {"model", model},
        {"messages", turns},
        {"max_tokens", max_tokens},
        {"temperature", temperature},
    };
}

LLMResponse ParseChatResponse(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Failure("response is not JSON");
    }
    if (json.contains("error")) {
        const auto& error = json["error"];
        const auto text = error.is_object() && error.contains("message") && error["message"].is_string()
            ? error["message"].get<std::string>()
            : error.dump();
        return Failure(text);
    }
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        return Failure("response has no choices");
    }

    LLMResponse response{};
    const auto& choice = json["choices"][0];
    if (choice.contains("message") && choice["message"].contains("content")
        && choice["message"]["content"].is_string()) {
        response.content = choice["message"]["content"].get<std::string>();
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        response.finish_reason = choice["finish_reason"].get<std::string>();
    }
    if (json.contains("usage") && json["usage"].is_object()) {
        for (const auto& [key, value] : json["usage"].items()) {
            if (value.is_number_integer()) {
                response.usage[key] = value.get<int>();
            }
        }
    }
    return response;
}

ChatCompletionsProvider::ChatCompletionsProvider(ProviderSettings settings)
    : settings_(std::move(settings))
    , endpoint_(ParseEndpoint(settings_.api_base)) {}

LLMResponse ChatCompletionsProvider::Chat(const std::vector<Message>& messages,
                                          const std::string& model,
                                          int max_tokens,
                                          double temperature) {
    const auto& chosen = model.empty() ? settings_.model : model;
    const auto path = endpoint_.path_prefix + "/chat/completions";

    httplib::Client client(endpoint_.Origin());
    client.set_connection_timeout(kTimeoutSeconds);
    client.set_read_timeout(kTimeoutSeconds);
    if (settings_.use_proxy_for_llm) {
        std::string proxy_host;
        int proxy_port = 0;
        if (ProxyFromEnv(proxy_host, proxy_port)) {
            client.set_proxy(proxy_host, proxy_port);
        }
    }

    httplib::Headers headers;
    if (!settings_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + settings_.api_key);
    }
    if (!settings_.http_referer.empty()) {
        headers.emplace("HTTP-Referer", settings_.http_referer);
    }
    if (!settings_.x_title.empty()) {
        headers.emplace("X-Title", settings_.x_title);
    }

    utils::LogDebug(kTag, "POST " + endpoint_.Origin() + path + " model=" + chosen
        + " key=" + Redact(settings_.api_key));

    const auto body = BuildChatRequest(messages, chosen, max_tokens, temperature).dump();
    const auto result = client.Post(path, headers, body, "application/json");
    if (!result) {
        const auto reason = httplib::to_string(result.error());
        utils::LogError(kTag, "request to " + endpoint_.host + " failed: " + reason);
        return Failure(reason);
    }
    if (result->status >= 400) {
        utils::LogError(kTag, "HTTP " + std::to_string(result->status) + " from "
            + endpoint_.host + ": " + result->body);
        return Failure("HTTP " + std::to_string(result->status));
    }
    return ParseChatResponse(result->body);
}

}  // namespace tfbot::providers
