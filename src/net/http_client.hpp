#pragma once

/// @file http_client.hpp
/// @brief Minimal blocking HTTP/1.1 client with a single overall deadline (Boost.Beast).

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace transitscan::net
{
    struct HttpEndpoint
    {
        std::string host;
        u16         port = 80;
        std::string target = "/";
    };

    struct HttpResponse
    {
        u32         status = 0;
        std::string body;

        [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
    };

    /// @brief Static utility class for one-shot HTTP requests.
    class HttpClient
    {
    public:
        HttpClient() = delete;

        /// @brief POST a JSON body and wait for the response.
        ///
        /// Resolve, connect, write and read share one deadline. Any failure
        /// (including the deadline) is logged and yields std::nullopt; there is
        /// no retry.
        [[nodiscard]] static std::optional<HttpResponse> post_json(const HttpEndpoint& endpoint,
                                                                   const std::string& body,
                                                                   std::chrono::milliseconds timeout);
    };

} // namespace transitscan::net
