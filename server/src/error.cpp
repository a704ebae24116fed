//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>

#include <iostream>
#include <string_view>

namespace lobbychat {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    unauthorized,
    malformed_command,
    invalid_message,
    blocked,
    rate_limited,
    slow_consumer,
    persistence_failure,
    not_joined,
    invalid_target,
    redis_parse_error,
    redis_command_failed,
    duplicate_connection,
    invalid_cursor,
    not_found,
    uncaught_exception,
    invalid_content_type,
    invalid_config
)

}  // namespace lobbychat

namespace {

static const char* to_string(lobbychat::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown lobbychat error>");
}

// Custom category for lobbychat::errc. Exposed by get_lobbychat_category
class lobbychat_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "lobbychat"; }
    std::string message(int ev) const final override { return to_string(static_cast<lobbychat::errc>(ev)); }
};

static lobbychat_category cat;

}  // namespace

const boost::system::error_category& lobbychat::get_lobbychat_category() noexcept { return cat; }

std::string_view lobbychat::error_kind(error_code ec) noexcept
{
    if (ec.category() != get_lobbychat_category())
        return "InternalError";

    switch (static_cast<errc>(ec.value()))
    {
    case errc::unauthorized: return "Unauthorized";
    case errc::malformed_command: return "MalformedCommand";
    case errc::invalid_message: return "InvalidMessage";
    case errc::blocked: return "Blocked";
    case errc::rate_limited: return "RateLimited";
    case errc::slow_consumer: return "SlowConsumer";
    case errc::persistence_failure: return "PersistenceFailure";
    case errc::not_joined: return "NotJoined";
    case errc::invalid_target: return "InvalidTarget";
    default: return "InternalError";
    }
}

void lobbychat::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}

void lobbychat::log_info(std::string_view what) { std::cout << what << std::endl; }
