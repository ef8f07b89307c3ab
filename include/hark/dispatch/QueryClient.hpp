/**
 * QueryClient.hpp - HTTP client for the assistant's query router
 */

#pragma once

#include "hark/dispatch/DispatchBridge.hpp"

#include <memory>
#include <string>

namespace hark::dispatch {

/**
 * POST {"message": text} to <base_url>/process-message and return the
 * "response" field of the reply.
 */
class QueryClient {
public:
    explicit QueryClient(const std::string& base_url, int timeout_ms = 30000);
    ~QueryClient();

    QueryClient(const QueryClient&) = delete;
    QueryClient& operator=(const QueryClient&) = delete;

    /** GET /status */
    bool isHealthy();

    /**
     * @throws std::runtime_error on transport failure, non-200 status or a
     *         reply without a "response" string
     */
    std::string processMessage(const std::string& text);

    /** Handler bound to this client, for DispatchBridge. The client must outlive it. */
    CommandHandler handler();

    static std::string buildRequestBody(const std::string& text);
    static std::string parseResponseBody(const std::string& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hark::dispatch
