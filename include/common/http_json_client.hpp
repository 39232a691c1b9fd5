/*
 * File: include/common/http_json_client.hpp
 * Project: Book Inventory
 * Purpose: Blocking JSON-over-HTTP helpers for the client and the tests
 * Notes:
 *  - One connection per call, closed afterwards
 *  - Non-JSON response bodies come back as a discarded json value
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <string>


struct JsonReply {
unsigned status = 0;
std::string content_type;
std::string raw;
nlohmann::json body;
};


// throws boost::system::system_error on connect/read/write failure
inline JsonReply http_json_call(const std::string& host, const std::string& port,
                                boost::beast::http::verb method, const std::string& target,
                                const nlohmann::json* payload)
{
namespace http = boost::beast::http;

boost::asio::io_context ioc;
boost::asio::ip::tcp::resolver resolver{ioc};
boost::beast::tcp_stream stream{ioc};
stream.connect(resolver.resolve(host, port));

http::request<http::string_body> req{method, target, 11};
req.set(http::field::host, host);
req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
req.set(http::field::accept, "application/json");
if (payload) {
    req.set(http::field::content_type, "application/json");
    req.body() = payload->dump();
}
req.prepare_payload();
http::write(stream, req);

boost::beast::flat_buffer buf;
http::response<http::string_body> res;
http::read(stream, buf, res);

JsonReply out;
out.status = res.result_int();
out.content_type = std::string(res[http::field::content_type]);
out.raw = res.body();
out.body = nlohmann::json::parse(out.raw, nullptr, false);

boost::beast::error_code ec;
stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
// not_connected happens when the peer already closed
if (ec && ec != boost::beast::errc::not_connected)
    throw boost::system::system_error(ec);
return out;
}

inline JsonReply post_json(const std::string& host, const std::string& port,
                           const std::string& target, const nlohmann::json& payload)
{
return http_json_call(host, port, boost::beast::http::verb::post, target, &payload);
}

inline JsonReply get_json(const std::string& host, const std::string& port, const std::string& target)
{
return http_json_call(host, port, boost::beast::http::verb::get, target, nullptr);
}
