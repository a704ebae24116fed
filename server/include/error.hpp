//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_ERROR_HPP
#define LOBBYCHAT_SERVER_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <string>
#include <string_view>
#include <utility>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio, Beast, MySQL and Redis.

namespace lobbychat {

using error_code = boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application.
// The first block maps 1:1 to the error kinds we report to clients.
enum class errc
{
    unauthorized = 1,     // missing credential, or the credential didn't resolve to an identity
    malformed_command,    // a client frame isn't valid JSON or doesn't match any known command
    invalid_message,      // message body is empty, whitespace-only or too long
    blocked,              // a DM between a pair with an active block
    rate_limited,         // the connection's inbound budget is exhausted
    slow_consumer,        // the connection's outbound queue overflowed
    persistence_failure,  // the history store or the block registry failed
    not_joined,           // channel message to a room the connection hasn't joined
    invalid_target,       // an action that targets the acting user itself

    redis_parse_error,     // Data retrieved from Redis didn't match the format we expected
    redis_command_failed,  // A Redis command failed execution (e.g. we provided the wrong number of args)
    duplicate_connection,  // attempt to register a connection id twice
    invalid_cursor,        // a pagination cursor couldn't be parsed
    not_found,             // couldn't retrieve a certain resource, it doesn't exist
    uncaught_exception,    // an API handler threw an unexpected exception
    invalid_content_type,  // an endpoint received an unsupported Content-Type
    invalid_config,        // a configuration value couldn't be parsed
};

// The error category for errc
const boost::system::error_category& get_lobbychat_category() noexcept;

// Allows constructing error_code from errc
inline boost::system::error_code make_error_code(errc v) noexcept
{
    return boost::system::error_code(static_cast<int>(v), get_lobbychat_category());
}

// The error kind string we send to clients in error frames
// (e.g. "RateLimited"). Errors that aren't client-facing map to "InternalError".
std::string_view error_kind(error_code ec) noexcept;

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");

// Logs an informational message to stdout
void log_info(std::string_view what);

}  // namespace lobbychat

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<lobbychat::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define LOBBYCHAT_RETURN_ERROR(e)                                                 \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Same, but for co_return
#define LOBBYCHAT_CO_RETURN_ERROR(e)                                                 \
    {                                                                                \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                          \
        co_return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

#endif
