//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP
#define LOBBYCHAT_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <cstddef>
#include <memory>
#include <string_view>

namespace lobbychat {

// A server-side websocket, already upgraded from an HTTP connection.
// Supports a single reader and a single writer running concurrently.
// Writes are not serialized: the caller must ensure that only one
// coroutine issues writes (this includes close()).
class websocket
{
    // pimpl idiom, to avoid including heavyweight Beast headers
    struct impl;
    std::unique_ptr<impl> impl_;

public:
    using upgrade_request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Constructors, assignments, destructor
    websocket(
        boost::asio::ip::tcp::socket sock,
        upgrade_request_type&& upgrade_request,
        boost::beast::flat_buffer buffer
    );
    websocket(const websocket&) = delete;
    websocket(websocket&&) noexcept;
    websocket& operator=(const websocket&) = delete;
    websocket& operator=(websocket&&) noexcept;
    ~websocket();

    // Returns the upgrade HTTP request
    const upgrade_request_type& upgrade_request() const noexcept;

    // Runs the websocket handshake. Must be called before any other operation.
    // Incoming messages bigger than max_message_size are rejected.
    boost::asio::awaitable<boost::system::error_code> accept(std::size_t max_message_size);

    // Reads a message from the client. The returned view is valid until the next
    // read is performed. Only a single read should be outstanding at each time.
    boost::asio::awaitable<boost::system::result<std::string_view>> read();

    // Writes a message to the client. Only a single write should be outstanding at each time.
    // Emitting a terminal cancellation on slot aborts the write, leaving the websocket unusable.
    boost::asio::awaitable<boost::system::error_code> write(
        std::string_view buff,
        boost::asio::cancellation_slot slot = {}
    );

    // Closes the websocket, sending close_code and reason to the client.
    // Counts as a write.
    boost::asio::awaitable<boost::system::error_code> close(unsigned close_code, std::string_view reason = "");

    // Closes the underlying socket without a closing handshake.
    // Outstanding operations complete with an error.
    void shutdown();
};

}  // namespace lobbychat

#endif
