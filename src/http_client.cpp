#include "ccprobe/format.hpp"
#include "ccprobe/remote.hpp"
#include "ccprobe/utils.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace ccprobe::literals;

namespace ccprobe {

    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    namespace detail {

        using http_request = http::request<http::string_body>;
        using http_response = http::response<http::string_body>;

        class transport_error : public std::runtime_error {
          public:
            transport_error(std::string_view step, const beast::error_code& ec)
                    : std::runtime_error{"Network error: {} failed: {}"_format(step, ec.message())},
                      timed_out_{ec == beast::error::timeout} {}

            bool timed_out() const { return timed_out_; }

          private:
            bool timed_out_;
        };

        // Runs one async operation to completion so tcp_stream deadlines apply to blocking steps.
        template <typename Initiate>
        static void run_step(net::io_context& ioc, std::string_view step, Initiate&& initiate) {
            beast::error_code result{};
            bool done = false;
            initiate([&](beast::error_code ec, auto&&...) {
                result = ec;
                done = true;
            });
            ioc.restart();
            ioc.run();
            if (!done) {
                throw transport_error{step, net::error::operation_aborted};
            }
            if (result) {
                throw transport_error{step, result};
            }
        }

        template <typename Stream>
        static http_response exchange(
                net::io_context& ioc, Stream& stream, const http_request& req, std::chrono::milliseconds budget) {
            beast::get_lowest_layer(stream).expires_after(budget);
            run_step(ioc, "write"sv, [&](auto&& handler) {
                http::async_write(stream, req, std::forward<decltype(handler)>(handler));
            });

            beast::flat_buffer buffer{};
            http_response res{};
            beast::get_lowest_layer(stream).expires_after(budget);
            run_step(ioc, "read"sv, [&](auto&& handler) {
                http::async_read(stream, buffer, res, std::forward<decltype(handler)>(handler));
            });
            return res;
        }

        static http_response post_plain(
                const http_endpoint& ep, const http_request& req, std::chrono::milliseconds budget) {
            net::io_context ioc{};
            tcp::resolver resolver{ioc};
            beast::tcp_stream stream{ioc};

            tcp::resolver::results_type endpoints{};
            run_step(ioc, "resolve"sv, [&](auto&& handler) {
                resolver.async_resolve(ep.host, ep.port, [&endpoints, h = std::move(handler)](
                                                                 beast::error_code ec, tcp::resolver::results_type r) mutable {
                    endpoints = std::move(r);
                    h(ec);
                });
            });

            stream.expires_after(budget);
            run_step(ioc, "connect"sv, [&](auto&& handler) {
                stream.async_connect(endpoints, std::forward<decltype(handler)>(handler));
            });

            auto res = exchange(ioc, stream, req, budget);

            beast::error_code ec{};
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return res;
        }

        static http_response post_tls(const http_endpoint& ep, const http_request& req, std::chrono::milliseconds budget) {
            net::io_context ioc{};
            ssl::context ctx{ssl::context::tls_client};
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            tcp::resolver resolver{ioc};
            beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};

            if (!SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str())) {
                throw transport_error{
                        "sni"sv, beast::error_code{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()}};
            }
            stream.set_verify_callback(ssl::host_name_verification{ep.host});

            tcp::resolver::results_type endpoints{};
            run_step(ioc, "resolve"sv, [&](auto&& handler) {
                resolver.async_resolve(ep.host, ep.port, [&endpoints, h = std::move(handler)](
                                                                 beast::error_code ec, tcp::resolver::results_type r) mutable {
                    endpoints = std::move(r);
                    h(ec);
                });
            });

            beast::get_lowest_layer(stream).expires_after(budget);
            run_step(ioc, "connect"sv, [&](auto&& handler) {
                beast::get_lowest_layer(stream).async_connect(endpoints, std::forward<decltype(handler)>(handler));
            });

            beast::get_lowest_layer(stream).expires_after(budget);
            run_step(ioc, "handshake"sv, [&](auto&& handler) {
                stream.async_handshake(ssl::stream_base::client, std::forward<decltype(handler)>(handler));
            });

            auto res = exchange(ioc, stream, req, budget);

            // servers commonly drop the connection without close_notify; the response is already complete
            beast::error_code ec{};
            beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
            return res;
        }

    }  // namespace detail

    outcome<http_endpoint> parse_endpoint(std::string_view url) {
        http_endpoint ep{};
        if (url.starts_with("https://"sv)) {
            ep.tls = true;
            url.remove_prefix(8U);
        }
        else if (url.starts_with("http://"sv)) {
            ep.tls = false;
            url.remove_prefix(7U);
        }
        else {
            return fail(failure_kind::config, "unsupported API URL '{}': expected http:// or https://"_format(url));
        }

        auto slash = url.find('/');
        auto authority = url.substr(0U, slash);
        ep.base_target = slash == std::string_view::npos ? std::string{} : std::string{url.substr(slash)};
        while (!ep.base_target.empty() && ep.base_target.back() == '/') {
            ep.base_target.pop_back();
        }

        if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            auto port = authority.substr(colon + 1U);
            if (!utils::parse_arithmetic<uint16_t>(port)) {
                return fail(failure_kind::config, "invalid port '{}' in API URL"_format(port));
            }
            ep.port = std::string{port};
            authority = authority.substr(0U, colon);
        }
        else {
            ep.port = ep.tls ? "443" : "80";
        }

        if (authority.empty()) {
            return fail(failure_kind::config, std::string{"API URL has no host"});
        }
        ep.host = std::string{authority};
        return ep;
    }

    godbolt_client::godbolt_client(http_endpoint endpoint, int timeout_ms)
            : endpoint_{std::move(endpoint)}, timeout_ms_{timeout_ms} {}

    outcome<remote_response> godbolt_client::submit(const remote_request& request) {
        auto body = encode_request(request);
        if (!body) {
            return std::unexpected{std::move(body.error())};
        }

        detail::http_request req{http::verb::post, "{}/{}/compile"_format(endpoint_.base_target, request.compiler), 11};
        req.set(http::field::host, endpoint_.host);
        req.set(http::field::user_agent, "ccprobe/" BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.body() = std::move(*body);
        req.prepare_payload();

        debug_log("POST ", endpoint_.host, req.target(), " (", to_string(request.kind()), ")");

        detail::http_response res{};
        auto budget = std::chrono::milliseconds{timeout_ms_};
        try {
            res = endpoint_.tls ? detail::post_tls(endpoint_, req, budget) : detail::post_plain(endpoint_, req, budget);
        } catch (const detail::transport_error& e) {
            if (e.timed_out()) {
                return fail(failure_kind::transport, "Network error: request timed out after {} ms"_format(timeout_ms_));
            }
            return fail(failure_kind::transport, e.what());
        } catch (const boost::system::system_error& e) {
            return fail(failure_kind::transport, "Network error: {}"_format(e.what()));
        }

        auto status = static_cast<int>(res.result_int());
        if (status < 200 || status >= 300) {
            return fail_http(status, "HTTP {}: {}"_format(status, std::string_view{res.reason()}));
        }
        return decode_response(std::move(res.body()));
    }

}  // namespace ccprobe
