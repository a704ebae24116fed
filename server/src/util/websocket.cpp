//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/websocket.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <cassert>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using namespace lobbychat;

struct websocket::impl
{
    // The actual websocket
    beast::websocket::stream<beast::tcp_stream> ws;

    // The upgrade HTTP request
    websocket::upgrade_request_type upgrade_request;

    // Buffer to read data from the client
    beast::flat_buffer read_buffer;

    // Make sure that we don't issue two reads or two writes concurrently
    bool reading{false};
    bool writing{false};

    impl(
        asio::ip::tcp::socket&& sock,
        websocket::upgrade_request_type&& upgrade_req,
        beast::flat_buffer&& buff
    )
        : ws(std::move(sock)), upgrade_request(std::move(upgrade_req)), read_buffer(std::move(buff))
    {
    }

    // Sets and clears a flag using RAII
    struct flag_guard_deleter
    {
        void operator()(bool* flag) const noexcept { *flag = false; }
    };
    using flag_guard = std::unique_ptr<bool, flag_guard_deleter>;
    static flag_guard set_flag(bool& flag) noexcept
    {
        assert(!flag);
        flag = true;
        return flag_guard(&flag);
    }
};

static std::string_view buffer_to_sv(asio::const_buffer buff) noexcept
{
    return std::string_view(static_cast<const char*>(buff.data()), buff.size());
}

websocket::websocket(asio::ip::tcp::socket sock, upgrade_request_type&& req, beast::flat_buffer buff)
    : impl_(new impl(std::move(sock), std::move(req), std::move(buff)))
{
}

websocket::websocket(websocket&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

websocket& websocket::operator=(websocket&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

websocket::~websocket() {}

const websocket::upgrade_request_type& websocket::upgrade_request() const noexcept
{
    return impl_->upgrade_request;
}

asio::awaitable<error_code> websocket::accept(std::size_t max_message_size)
{
    // Set suggested timeout settings for the websocket. This includes keep-alive pings,
    // so dead peers are eventually detected
    impl_->ws.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::server));
    impl_->ws.read_message_max(max_message_size);

    // Set a decorator to change the Server of the handshake
    impl_->ws.set_option(beast::websocket::stream_base::decorator([](beast::websocket::response_type& res) {
        res.set(beast::http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " lobbychat");
    }));

    // Accept the websocket handshake
    auto [ec] = co_await impl_->ws.async_accept(impl_->upgrade_request, asio::as_tuple);
    co_return ec;
}

asio::awaitable<result<std::string_view>> websocket::read()
{
    error_code ec;

    // Perform the read
    {
        auto guard = impl::set_flag(impl_->reading);
        impl_->read_buffer.clear();
        co_await impl_->ws.async_read(impl_->read_buffer, asio::redirect_error(ec));
    }

    // Check the result
    if (ec)
        co_return ec;

    // Convert it to a string_view (no copy is performed)
    co_return buffer_to_sv(impl_->read_buffer.data());
}

asio::awaitable<error_code> websocket::write(std::string_view buff, asio::cancellation_slot slot)
{
    auto guard = impl::set_flag(impl_->writing);
    impl_->ws.text(true);
    error_code ec;
    co_await impl_->ws.async_write(
        asio::buffer(buff),
        asio::bind_cancellation_slot(slot, asio::redirect_error(asio::use_awaitable, ec))
    );
    co_return ec;
}

asio::awaitable<error_code> websocket::close(unsigned close_code, std::string_view reason)
{
    auto guard = impl::set_flag(impl_->writing);
    beast::websocket::close_reason why(static_cast<std::uint16_t>(close_code), reason);
    error_code ec;
    co_await impl_->ws.async_close(why, asio::redirect_error(ec));
    co_return ec;
}

void websocket::shutdown() { beast::get_lowest_layer(impl_->ws).close(); }
