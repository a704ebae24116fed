//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_TEST_TEST_UTILS_HPP
#define LOBBYCHAT_SERVER_TEST_TEST_UTILS_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "core/connection.hpp"
#include "error.hpp"
#include "services/identity_verifier.hpp"

namespace lobbychat {
namespace test {

inline constexpr auto rethrow_on_error = [](std::exception_ptr ptr) {
    if (ptr)
        std::rethrow_exception(ptr);
};

// Spawns a coroutine and runs it until completion.
// fn must be a callable returning boost::asio::awaitable<void>
template <class Fn>
void run_coroutine(Fn fn)
{
    boost::asio::io_context ctx;
    boost::asio::co_spawn(ctx, std::move(fn), rethrow_on_error);
    ctx.run();
}

// Runs op on ctx until there is no more work to do
inline void run_on(boost::asio::io_context& ctx, boost::asio::awaitable<void> op)
{
    boost::asio::co_spawn(ctx, std::move(op), rethrow_on_error);
    ctx.run();
    ctx.restart();
}

// Accepts tokens like "token-alice", resolving them to "alice"
class fake_identity_verifier final : public identity_verifier
{
public:
    static constexpr std::string_view prefix = "token-";

    static std::string token_for(std::string_view user) { return std::string(prefix) + std::string(user); }

    boost::asio::awaitable<result<user_identity>> verify(std::string_view token) override
    {
        if (!token.starts_with(prefix) || token.size() == prefix.size())
            co_return error_code(errc::unauthorized);
        co_return user_identity(token.substr(prefix.size()));
    }
};

// Pops all the frames queued to conn, parsing them as JSON objects
inline std::vector<boost::json::object> drain(connection& conn)
{
    std::vector<boost::json::object> res;
    while (auto frame = conn.next_frame())
        res.push_back(boost::json::parse(*frame->payload).as_object());
    return res;
}

// Frames in frames with the given type
inline std::vector<boost::json::object> of_type(const std::vector<boost::json::object>& frames, std::string_view type)
{
    std::vector<boost::json::object> res;
    for (const auto& frame : frames)
    {
        if (frame.at("type").as_string() == type)
            res.push_back(frame);
    }
    return res;
}

}  // namespace test
}  // namespace lobbychat

#endif
