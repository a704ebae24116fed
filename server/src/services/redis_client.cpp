//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/redis_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/redis/adapter/result.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>

#include <optional>
#include <string>
#include <utility>

#include "error.hpp"

using namespace lobbychat;
namespace asio = boost::asio;
namespace redis = boost::redis;

namespace {

class redis_client_impl final : public redis_client
{
    redis::connection conn_;
    std::string host_;

public:
    redis_client_impl(asio::any_io_executor ex, std::string host) : conn_(std::move(ex)), host_(std::move(host))
    {
    }

    void start_run() final override
    {
        redis::config cfg;
        cfg.addr.host = host_;
        cfg.health_check_interval = std::chrono::seconds::zero();  // Disable health checks for now
        conn_.async_run(cfg, {}, asio::detached);
    }

    void cancel() final override { conn_.cancel(); }

    asio::awaitable<result<std::string>> get_string_key(std::string_view key) final override
    {
        // Compose the request
        redis::request req;
        req.push("GET", key);

        // Execute it
        redis::response<std::optional<std::string>> res;
        error_code ec;
        co_await conn_.async_exec(req, res, asio::redirect_error(ec));
        if (ec)
            co_return ec;

        // Check for errors
        auto& result = std::get<0>(res);
        if (result.has_error())
        {
            log_error(errc::redis_command_failed, "Redis GET failed", result.error().diagnostic);
            LOBBYCHAT_CO_RETURN_ERROR(errc::redis_command_failed)
        }

        // Check whether the key was present
        auto& opt = result.value();
        if (!opt.has_value())
            LOBBYCHAT_CO_RETURN_ERROR(errc::not_found)
        co_return std::move(*opt);
    }
};

}  // namespace

std::unique_ptr<redis_client> lobbychat::create_redis_client(asio::any_io_executor ex, std::string host)
{
    return std::unique_ptr<redis_client>{new redis_client_impl(std::move(ex), std::move(host))};
}
