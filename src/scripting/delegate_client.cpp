// delegate_client.cpp - OpenAI-compatible chat completion client behind llm_query
#include "rlmkit/scripting/delegate_client.h"
#include "rlmkit/core/errors.h"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

using json = nlohmann::json;

namespace {

// Parse URL into host, port, and base path
struct ParsedUrl {
    std::string host;
    int port;
    std::string base_path;
    bool is_https;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl result;
    result.port = 80;
    result.is_https = false;

    std::string work = url;
    if (work.substr(0, 8) == "https://") {
        result.port = 443;
        result.is_https = true;
        work = work.substr(8);
    } else if (work.substr(0, 7) == "http://") {
        work = work.substr(7);
    }

    size_t path_pos = work.find('/');
    if (path_pos != std::string::npos) {
        result.base_path = work.substr(path_pos);  // e.g. "/v1"
        work = work.substr(0, path_pos);
    }
    while (!result.base_path.empty() && result.base_path.back() == '/') {
        result.base_path.pop_back();
    }

    size_t port_pos = work.find(':');
    if (port_pos != std::string::npos) {
        result.host = work.substr(0, port_pos);
        try {
            result.port = std::stoi(work.substr(port_pos + 1));
        } catch (const std::exception&) {
            throw rlmkit::DelegateError("Invalid port in delegate URL: " + url);
        }
    } else {
        result.host = work;
    }

    if (result.host.empty()) {
        throw rlmkit::DelegateError("Invalid delegate URL: " + url);
    }
    return result;
}

template <typename Client>
httplib::Result PostJson(Client& client, const std::string& endpoint,
                         const httplib::Headers& headers, const std::string& body,
                         int timeout_seconds) {
    client.set_connection_timeout(10);
    client.set_read_timeout(timeout_seconds);
    client.set_write_timeout(timeout_seconds);
    return client.Post(endpoint, headers, body, "application/json");
}

} // anonymous namespace

namespace rlmkit::scripting {

OpenAIDelegateClient::OpenAIDelegateClient(std::string model_id, std::string base_url,
                                           std::string api_key_env, int timeout_seconds)
    : model_id_(std::move(model_id)),
      base_url_(std::move(base_url)),
      api_key_env_(std::move(api_key_env)),
      timeout_seconds_(timeout_seconds) {
    spdlog::info("Delegate model {} via {}", model_id_, base_url_);
}

std::string OpenAIDelegateClient::StripProviderPrefix(const std::string& model_id) {
    size_t colon = model_id.find(':');
    if (colon == std::string::npos) {
        return model_id;
    }
    return model_id.substr(colon + 1);
}

std::string OpenAIDelegateClient::Complete(const std::string& prompt) {
    auto parsed = ParseUrl(base_url_);
    std::string endpoint = parsed.base_path + "/chat/completions";

    httplib::Headers headers;
    const char* api_key = std::getenv(api_key_env_.c_str());
    if (api_key != nullptr && api_key[0] != '\0') {
        headers.emplace("Authorization", std::string("Bearer ") + api_key);
    } else {
        spdlog::debug("{} is not set; calling delegate without credentials", api_key_env_);
    }

    json body;
    body["model"] = StripProviderPrefix(model_id_);
    body["messages"] = json::array({
        {{"role", "user"}, {"content", prompt}}
    });
    std::string payload = body.dump(-1, ' ', false, json::error_handler_t::replace);

    spdlog::debug("Delegate request to {}:{}{} ({} chars)", parsed.host, parsed.port, endpoint, prompt.size());

    httplib::Result res;
    if (parsed.is_https) {
        httplib::SSLClient client(parsed.host, parsed.port);
        res = PostJson(client, endpoint, headers, payload, timeout_seconds_);
    } else {
        httplib::Client client(parsed.host, parsed.port);
        res = PostJson(client, endpoint, headers, payload, timeout_seconds_);
    }

    if (!res) {
        throw DelegateError("Network error: " + httplib::to_string(res.error()));
    }

    json response;
    try {
        response = json::parse(res->body);
    } catch (const json::exception& e) {
        throw DelegateError("Invalid JSON response (status " + std::to_string(res->status) + "): " + e.what());
    }

    if (res->status != 200) {
        std::string message = "status " + std::to_string(res->status);
        if (response.contains("error") && response["error"].is_object()) {
            message += ": " + response["error"].value("message", std::string("unknown error"));
        }
        throw DelegateError("Delegate request failed with " + message);
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        return "";
    }
    const auto& message = response["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        return "";
    }
    return message["content"].get<std::string>();
}

std::shared_ptr<DelegateClient> CreateDelegateClient(const core::ExecutionConfig& config) {
    if (!config.HasDelegate()) {
        return nullptr;
    }
    return std::make_shared<OpenAIDelegateClient>(*config.delegate_model_id,
                                                  config.delegate_base_url,
                                                  config.delegate_api_key_env,
                                                  config.delegate_timeout_seconds);
}

} // namespace rlmkit::scripting
