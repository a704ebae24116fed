//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "core/connection.hpp"

#include <boost/asio/as_tuple.hpp>

using namespace lobbychat;
namespace asio = boost::asio;

asio::awaitable<error_code> connection::wait_ready()
{
    auto [ec] = co_await ready_.async_receive(asio::as_tuple);
    co_return ec;
}
