//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_APPLICATION_HPP
#define LOBBYCHAT_SERVER_INCLUDE_APPLICATION_HPP

#include <boost/asio/ip/tcp.hpp>

#include <memory>

#include "config.hpp"
#include "error.hpp"

namespace lobbychat {

class identity_verifier;

// Owns the event loop and everything running on it.
// Used by main() and by the integration tests.
class application
{
    struct impl;
    std::unique_ptr<impl> impl_;

public:
    // If verifier is null, tokens are verified against Redis
    explicit application(server_config config, std::unique_ptr<identity_verifier> verifier = nullptr);
    application(const application&) = delete;
    application(application&&) noexcept;
    application& operator=(const application&) = delete;
    application& operator=(application&&) noexcept;
    ~application();

    // Binds the listening socket and launches background tasks.
    // Doesn't run the event loop.
    error_code setup();

    // The endpoint the server is listening on. setup() must have succeeded
    boost::asio::ip::tcp::endpoint local_endpoint() const;

    // Runs the event loop until stop() is called or,
    // if handle_signals is true, SIGINT or SIGTERM are received
    void run_until_completion(bool handle_signals);

    // Requests the server to stop. Safe to call from any thread
    void stop();
};

}  // namespace lobbychat

#endif
