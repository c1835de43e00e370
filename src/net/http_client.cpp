/// @file http_client.cpp
/// @brief HttpClient implementation over Boost.Beast.

#include "net/http_client.hpp"

#include "core/logger.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <utility>

namespace transitscan::net
{

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

std::optional<HttpResponse> HttpClient::post_json(const HttpEndpoint& endpoint,
                                                  const std::string& body,
                                                  std::chrono::milliseconds timeout)
{
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{http::verb::post, endpoint.target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, "transitscan");
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    bool completed = false;
    beast::error_code failure;
    const char* failed_stage = nullptr;

    auto fail = [&](const beast::error_code& ec, const char* stage)
    {
        failure      = ec;
        failed_stage = stage;
    };

    // Chain: resolve -> connect -> write -> read, all bounded by one deadline
    resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
        [&](const beast::error_code& ec, const tcp::resolver::results_type& results)
        {
            if (ec)
            {
                return fail(ec, "resolve");
            }
            stream.expires_after(timeout);
            stream.async_connect(results,
                [&](const beast::error_code& ec, const tcp::endpoint&)
                {
                    if (ec)
                    {
                        return fail(ec, "connect");
                    }
                    http::async_write(stream, req,
                        [&](const beast::error_code& ec, std::size_t)
                        {
                            if (ec)
                            {
                                return fail(ec, "write");
                            }
                            http::async_read(stream, buffer, res,
                                [&](const beast::error_code& ec, std::size_t)
                                {
                                    if (ec)
                                    {
                                        return fail(ec, "read");
                                    }
                                    completed = true;
                                });
                        });
                });
        });

    ioc.run_for(timeout);

    if (failed_stage)
    {
        TSC_CORE_WARN("HttpClient: {} {}:{}{} failed: {}", failed_stage, endpoint.host, endpoint.port,
                      endpoint.target, failure.message());
        return std::nullopt;
    }
    if (!completed)
    {
        TSC_CORE_WARN("HttpClient: {}:{}{} timed out after {} ms", endpoint.host, endpoint.port,
                      endpoint.target, timeout.count());
        return std::nullopt;
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected)
    {
        TSC_CORE_DEBUG("HttpClient: Shutdown: {}", ec.message());
    }

    HttpResponse response;
    response.status = static_cast<u32>(res.result_int());
    response.body   = std::move(res.body());
    TSC_CORE_DEBUG("HttpClient: POST {} -> {} ({} bytes)", endpoint.target, response.status,
                   response.body.size());
    return response;
}

} // namespace transitscan::net
