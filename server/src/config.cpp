//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

#include "error.hpp"

using namespace lobbychat;

namespace {

template <class T>
bool parse_number(std::string_view from, T& to)
{
    auto res = std::from_chars(from.data(), from.data() + from.size(), to);
    return res.ec == std::errc() && res.ptr == from.data() + from.size();
}

class config_loader
{
    const env_lookup& getenv_;
    error_code ec_;

    void fail(const char* name)
    {
        static constexpr auto loc = BOOST_CURRENT_LOCATION;
        ec_ = error_code(error_code(errc::invalid_config), &loc);
        log_error(ec_, "Error loading configuration", name);
    }

public:
    explicit config_loader(const env_lookup& getenv) : getenv_(getenv) {}

    error_code error() const noexcept { return ec_; }

    void read_string(const char* name, std::string& to)
    {
        const char* value = getenv_(name);
        if (value)
            to = value;
    }

    void read_size(const char* name, std::size_t& to)
    {
        const char* value = getenv_(name);
        if (!value)
            return;
        std::size_t n{};
        if (!parse_number(value, n) || n == 0u)
            fail(name);
        else
            to = n;
    }

    void read_positive_double(const char* name, double& to)
    {
        const char* value = getenv_(name);
        if (!value)
            return;
        double n{};
        if (!parse_number(value, n) || !(n > 0.0))
            fail(name);
        else
            to = n;
    }

    // A bucket holding less than a token never admits anything
    void read_capacity(const char* name, double& to)
    {
        const char* value = getenv_(name);
        if (!value)
            return;
        double n{};
        if (!parse_number(value, n) || !(n >= 1.0))
            fail(name);
        else
            to = n;
    }
};

}  // namespace

result<server_config> lobbychat::load_config(boost::span<const char* const> args, const env_lookup& getenv)
{
    server_config res;

    // Command line: <address> <port>
    if (args.size() != 3u)
        LOBBYCHAT_RETURN_ERROR(errc::invalid_config)
    res.listen_address = args[1];
    if (!parse_number(std::string_view(args[2]), res.listen_port))
    {
        log_error(errc::invalid_config, "Error loading configuration", "invalid port");
        LOBBYCHAT_RETURN_ERROR(errc::invalid_config)
    }

    config_loader loader(getenv);

    // Storage
    std::string storage;
    loader.read_string("LOBBYCHAT_STORAGE", storage);
    if (storage == "memory")
        res.storage = storage_backend::memory;
    else if (!storage.empty() && storage != "mysql")
    {
        log_error(errc::invalid_config, "Error loading configuration", "LOBBYCHAT_STORAGE");
        LOBBYCHAT_RETURN_ERROR(errc::invalid_config)
    }

    // Backing services
    loader.read_string("MYSQL_HOST", res.mysql.hostname);
    loader.read_string("MYSQL_USERNAME", res.mysql.username);
    loader.read_string("MYSQL_PASSWORD", res.mysql.password);
    loader.read_string("MYSQL_DATABASE", res.mysql.database);
    loader.read_string("REDIS_HOST", res.redis_host);

    // Limits
    loader.read_capacity("LOBBYCHAT_RATE_CAPACITY", res.limits.chat.capacity);
    loader.read_positive_double("LOBBYCHAT_RATE_REFILL", res.limits.chat.refill_per_second);
    loader.read_capacity("LOBBYCHAT_MODERATION_CAPACITY", res.limits.moderation.capacity);
    loader.read_positive_double("LOBBYCHAT_MODERATION_REFILL", res.limits.moderation.refill_per_second);
    loader.read_size("LOBBYCHAT_OUTBOUND_DEPTH", res.limits.outbound_depth);
    loader.read_size("LOBBYCHAT_MAX_MALFORMED", res.limits.max_malformed);

    loader.read_string("LOBBYCHAT_NOTIFY_SECRET", res.notify_secret);

    if (loader.error())
        return loader.error();
    return res;
}

result<server_config> lobbychat::load_config(boost::span<const char* const> args)
{
    return load_config(args, [](const char* name) -> const char* { return std::getenv(name); });
}
