//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "request_context.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/url/parse.hpp>

#include <string_view>

#include "api/api_types.hpp"
#include "error.hpp"

using namespace lobbychat;
namespace http = boost::beast::http;
namespace beast = boost::beast;

static constexpr std::string_view server_header = "lobbychat";

std::string_view lobbychat::get_bearer_token(const http::fields& headers)
{
    constexpr std::string_view scheme = "Bearer ";

    auto it = headers.find(http::field::authorization);
    if (it == headers.end())
        return {};
    std::string_view value = it->value();

    // The scheme is case-insensitive
    if (value.size() <= scheme.size() || !beast::iequals(value.substr(0, scheme.size()), scheme))
        return {};
    value.remove_prefix(scheme.size());

    // Tolerate extra spaces between scheme and token
    auto first = value.find_first_not_of(' ');
    return first == std::string_view::npos ? std::string_view() : value.substr(first);
}

response_builder::response_builder(unsigned version, bool keep_alive) : keep_alive_(keep_alive)
{
    header_.version(version);
    header_.set(http::field::server, server_header);
}

response_builder::response_type response_builder::json_response_impl(std::string serialized_json)
{
    set_content_type("application/json");
    http::response<http::string_body> res{move_header(), std::move(serialized_json)};
    res.keep_alive(keep_alive_);
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::plaintext_response(http::status status, std::string content)
{
    header_.result(status);
    set_content_type("text/plain");
    http::response<http::string_body> res{move_header(), std::move(content)};
    res.keep_alive(keep_alive_);
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::json_error(
    http::status status,
    api_error_id error_id,
    std::string_view error_message
)
{
    header_.result(status);
    return json_response(api_error{error_id, error_message});
}

response_builder::response_type response_builder::internal_server_error(error_code ec, std::string_view what)
{
    // Log the error
    log_error(ec, "Returning internal server error", what);

    // Intentionally don't expose any error information
    return json_error(
        http::status::internal_server_error,
        api_error_id::internal_error,
        "An unexpected server error occurred"
    );
}

error_code request_context::parse_request_target()
{
    auto url_result = boost::urls::parse_origin_form(request_.target());
    if (url_result.has_error())
        return url_result.error();
    target_ = url_result.value();
    return error_code();
}

std::optional<std::string> request_context::query_param(std::string_view name) const
{
    auto params = request_target().params();
    auto it = params.find(name);
    if (it == params.end() || !(*it).has_value)
        return std::nullopt;
    return std::string((*it).value);
}

bool request_context::is_json_content_type() const
{
    // Validate content-type, ignoring parameters like charset
    auto it = request_.find(http::field::content_type);
    if (it == request_.end())
        return false;
    std::string_view value = it->value();
    return value.substr(0, value.find(';')) == "application/json";
}
