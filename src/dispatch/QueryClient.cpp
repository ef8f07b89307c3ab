/**
 * QueryClient.cpp - HTTP client for the query router
 *
 * Uses cpp-httplib for the request and nlohmann/json for the body.
 */

#include "hark/dispatch/QueryClient.hpp"

#include <iostream>
#include <stdexcept>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hark::dispatch {

struct QueryClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string base_url;

    Impl(const std::string& url, int timeout_ms) : base_url(url) {
        client = std::make_unique<httplib::Client>(url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    }
};

QueryClient::QueryClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(base_url, timeout_ms)) {
}

QueryClient::~QueryClient() = default;

bool QueryClient::isHealthy() {
    auto res = impl_->client->Get("/status");
    return res && res->status == 200;
}

std::string QueryClient::processMessage(const std::string& text) {
    auto res = impl_->client->Post(
        "/process-message",
        buildRequestBody(text),
        "application/json"
    );

    if (!res) {
        throw std::runtime_error("request to " + impl_->base_url + " failed: "
                                 + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("router returned HTTP " + std::to_string(res->status));
    }

    return parseResponseBody(res->body);
}

CommandHandler QueryClient::handler() {
    return [this](const std::string& text) {
        std::cout << "[QueryClient] Sending: " << text << std::endl;
        return processMessage(text);
    };
}

std::string QueryClient::buildRequestBody(const std::string& text) {
    json req_json = {
        {"message", text}
    };
    return req_json.dump();
}

std::string QueryClient::parseResponseBody(const std::string& body) {
    json res_json = json::parse(body, nullptr, false);
    if (res_json.is_discarded()) {
        throw std::runtime_error("router reply is not JSON");
    }

    auto it = res_json.find("response");
    if (it == res_json.end() || !it->is_string()) {
        throw std::runtime_error("router reply has no \"response\" string");
    }
    return it->get<std::string>();
}

} // namespace hark::dispatch
