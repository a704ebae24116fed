//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "core/notification_relay.hpp"
#include "core/router.hpp"
#include "core/session_registry.hpp"
#include "services/block_registry.hpp"
#include "services/history_store.hpp"
#include "services/identity_verifier.hpp"
#include "services/mysql_client.hpp"
#include "services/redis_client.hpp"

using namespace lobbychat;

shared_state::shared_state(
    server_config config,
    boost::asio::any_io_executor ex,
    std::unique_ptr<identity_verifier> verifier
)
{
    impl_.config_ = std::move(config);

    // Identity verification
    if (verifier)
    {
        impl_.verifier_ = std::move(verifier);
    }
    else
    {
        impl_.redis_ = create_redis_client(ex, impl_.config_.redis_host);
        impl_.verifier_ = create_redis_identity_verifier(*impl_.redis_);
    }

    // Persistence
    if (impl_.config_.storage == storage_backend::mysql)
    {
        impl_.mysql_ = create_mysql_client(ex, impl_.config_.mysql);
        impl_.history_ = impl_.mysql_->create_history_store();
        impl_.blocks_ = impl_.mysql_->create_block_registry();
    }
    else
    {
        impl_.history_ = create_memory_history_store();
        impl_.blocks_ = create_memory_block_registry();
    }

    // Routing core
    impl_.sessions_ = std::make_unique<session_registry>();
    impl_.router_ = std::make_unique<router>(
        ex,
        *impl_.sessions_,
        *impl_.blocks_,
        *impl_.history_,
        *impl_.verifier_,
        impl_.config_.limits
    );
    impl_.notifications_ = std::make_unique<notification_relay>(*impl_.sessions_);
}

shared_state::~shared_state() {}
