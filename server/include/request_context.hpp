//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_REQUEST_CONTEXT_HPP
#define LOBBYCHAT_SERVER_INCLUDE_REQUEST_CONTEXT_HPP

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/url/url_view.hpp>

#include <cassert>
#include <optional>
#include <string>
#include <string_view>

#include "api/api_types.hpp"
#include "error.hpp"

namespace lobbychat {

// Extracts the token from an "Authorization: Bearer <token>" header.
// Returns an empty view if the header is missing or uses another scheme
std::string_view get_bearer_token(const boost::beast::http::fields& headers);

class response_builder
{
public:
    // The type of the HTTP responses. We use the type-erased message_generator class
    // to provide a uniform interface, regardless of the body type.
    using response_type = boost::beast::http::message_generator;

    // Sets the content-type of the response
    response_builder& set_content_type(std::string_view value)
    {
        assert(!used_);
        header_.set(boost::beast::http::field::content_type, value);
        return *this;
    }

    // Sends a 200 response with a JSON body. The type T must have a to_json() const
    // member function returning a string that performs the JSON serialization.
    template <class T>
    response_type json_response(const T& value)
    {
        return json_response_impl(value.to_json());
    }

    // Returns a "method not allowed" response with a simple plaintext body.
    response_type method_not_allowed()
    {
        return plaintext_response(boost::beast::http::status::method_not_allowed, "Method not allowed");
    }

    // Returns a "bad request" response with a simple plaintext body.
    response_type bad_request_text(std::string why)
    {
        return plaintext_response(boost::beast::http::status::bad_request, std::move(why));
    }

    // Returns a "not found" response with a simple plaintext body.
    response_type not_found_text()
    {
        return plaintext_response(boost::beast::http::status::not_found, "Not found");
    }

    // Returns an error response, with a JSON body describing what happened.
    // See the api_error struct for the JSON schema of this response.
    response_type json_error(
        boost::beast::http::status status,
        api_error_id error_id,
        std::string_view error_message
    );

    // Returns a bad request error response, with the JSON body described above.
    response_type bad_request_json(api_error_id error_id, std::string_view error_message)
    {
        return json_error(boost::beast::http::status::bad_request, error_id, error_message);
    }

    // Same, with a generic error ID.
    // Used for validation errors that don't need to be handled by the client.
    response_type bad_request_json(std::string_view error_message)
    {
        return bad_request_json(api_error_id::bad_request, error_message);
    }

    // A 401 response. Doesn't disclose why the credential was rejected
    response_type unauthorized_json()
    {
        return json_error(boost::beast::http::status::unauthorized, api_error_id::unauthorized, "Unauthorized");
    }

    // Returns an internal server error response. Error information is logged
    // but not sent in the response.
    response_type internal_server_error(error_code ec, std::string_view what);

private:
    using header_type = boost::beast::http::response_header<boost::beast::http::fields>;

    bool keep_alive_;
    header_type header_;
    bool used_{};

    response_builder(unsigned version, bool keep_alive);
    response_type plaintext_response(boost::beast::http::status status, std::string content);
    response_type json_response_impl(std::string serialized_json);

    header_type move_header()
    {
        assert(!used_);
        used_ = true;
        return std::move(header_);
    }

    friend class request_context;
};

class request_context
{
public:
    // The Boost.Beast request type
    using request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Constructor
    request_context(request_type&& req)
        : request_(std::move(req)), response_(request_.version(), request_.keep_alive())
    {
    }

    // Parses the HTTP request target line into a URL. Returns an error_code on
    // failure. This should be called prior to invoking any API handler functions.
    error_code parse_request_target();

    // Returns the request target as a URL. parse_request_target must have been
    // called and succeeded.
    const boost::urls::url_view& request_target() const
    {
        assert(target_.has_value());
        return *target_;
    }

    // Returns the HTTP method of the request.
    boost::beast::http::verb request_method() const noexcept { return request_.method(); }

    // Returns the (percent-decoded) value of a query parameter, if present.
    // parse_request_target must have been called and succeeded.
    std::optional<std::string> query_param(std::string_view name) const;

    // The bearer token sent with the request, or an empty view
    std::string_view bearer_token() const { return get_bearer_token(request_); }

    // Attempts to parse the request body as JSON, and converts the result
    // to type T. T must have a static member function with signature
    // result<T> from_json(std::string_view).
    // The request content-type is validated before attempting the parse.
    template <class T>
    result<T> parse_json_body() const
    {
        // Validate content-type
        if (!is_json_content_type())
            LOBBYCHAT_RETURN_ERROR(errc::invalid_content_type)

        // Parse the json
        return T::from_json(request_.body());
    }

    // Returns a response_builder object
    response_builder& response() noexcept { return response_; }

private:
    request_type request_;
    response_builder response_;
    std::optional<boost::urls::url_view> target_;

    bool is_json_content_type() const;
};

}  // namespace lobbychat

#endif
