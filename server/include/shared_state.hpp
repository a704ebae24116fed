//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef LOBBYCHAT_SERVER_INCLUDE_SHARED_STATE_HPP
#define LOBBYCHAT_SERVER_INCLUDE_SHARED_STATE_HPP

#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "config.hpp"

namespace lobbychat {

class redis_client;
class mysql_client;
class identity_verifier;
class history_store;
class block_registry;
class session_registry;
class router;
class notification_relay;

// State shared by all sessions. Singleton services live here
class shared_state
{
    // Declaration order matters: services are destroyed after the ones referencing them
    struct
    {
        server_config config_;
        std::unique_ptr<redis_client> redis_;  // null if a verifier was supplied
        std::unique_ptr<mysql_client> mysql_;  // null in memory storage mode
        std::unique_ptr<identity_verifier> verifier_;
        std::unique_ptr<history_store> history_;
        std::unique_ptr<block_registry> blocks_;
        std::unique_ptr<session_registry> sessions_;
        std::unique_ptr<router> router_;
        std::unique_ptr<notification_relay> notifications_;
    } impl_;

public:
    // If verifier is null, tokens are verified against Redis
    shared_state(
        server_config config,
        boost::asio::any_io_executor ex,
        std::unique_ptr<identity_verifier> verifier = nullptr
    );
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) = delete;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) = delete;
    ~shared_state();

    const server_config& config() const noexcept { return impl_.config_; }
    redis_client* redis() noexcept { return impl_.redis_.get(); }
    mysql_client* mysql() noexcept { return impl_.mysql_.get(); }
    identity_verifier& verifier() noexcept { return *impl_.verifier_; }
    history_store& history() noexcept { return *impl_.history_; }
    block_registry& blocks() noexcept { return *impl_.blocks_; }
    session_registry& sessions() noexcept { return *impl_.sessions_; }
    lobbychat::router& chat_router() noexcept { return *impl_.router_; }
    notification_relay& notifications() noexcept { return *impl_.notifications_; }
};

}  // namespace lobbychat

#endif
