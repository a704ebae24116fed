//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/mysql_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/static_results.hpp>
#include <boost/mysql/with_params.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"
#include "services/block_registry.hpp"
#include "services/history_store.hpp"

using namespace lobbychat;
namespace mysql = boost::mysql;
namespace asio = boost::asio;

namespace {

std::string get_message(const mysql::diagnostics& diag)
{
    return diag.client_message().empty() ? diag.server_message() : diag.client_message();
}

mysql::pool_params get_pool_params(const mysql_config& cfg)
{
    return {
        // The server address. We use the default port.
        .server_address = mysql::host_and_port{cfg.hostname},
        .username = cfg.username,
        .password = cfg.password,
        .database = cfg.database,
    };
}

// Schema. Statements are idempotent, so they can be run on every startup
constexpr const char* create_messages_table = R"SQL(
CREATE TABLE IF NOT EXISTS messages (
    id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
    sender_id VARCHAR(255) NOT NULL,
    recipient_id VARCHAR(255) NULL,
    room VARCHAR(64) NULL,
    body TEXT NOT NULL,
    created_at BIGINT NOT NULL,
    INDEX messages_room_idx (room, created_at, id),
    INDEX messages_dm_idx (sender_id, recipient_id, created_at, id),
    INDEX messages_recipient_idx (recipient_id, created_at, id),
    CHECK ((room IS NULL) <> (recipient_id IS NULL))
) ENGINE = InnoDB
)SQL";

constexpr const char* create_blocks_table = R"SQL(
CREATE TABLE IF NOT EXISTS blocks (
    blocker_id VARCHAR(255) NOT NULL,
    blocked_id VARCHAR(255) NOT NULL,
    PRIMARY KEY (blocker_id, blocked_id)
) ENGINE = InnoDB
)SQL";

// id, sender_id, room, recipient_id, body, created_at
using message_row = std::tuple<
    std::int64_t,
    std::string,
    std::optional<std::string>,
    std::optional<std::string>,
    std::string,
    std::int64_t>;

// We fetch limit + 1 rows. If we get the extra one, there are more messages
message_batch to_batch(std::vector<message_row>&& rows, std::size_t limit)
{
    message_batch res;
    res.has_more = rows.size() > limit;
    if (res.has_more)
        rows.resize(limit);
    res.messages.reserve(rows.size());
    for (auto& row : rows)
    {
        message msg;
        msg.id = std::get<0>(row);
        msg.sender_id = std::move(std::get<1>(row));
        if (std::get<2>(row))
            msg.destination = room_destination{std::move(*std::get<2>(row))};
        else
            msg.destination = dm_destination{std::move(std::get<3>(row)).value_or(std::string())};
        msg.body = std::move(std::get<4>(row));
        msg.created_at = parse_timestamp(std::get<5>(row));
        res.messages.push_back(std::move(msg));
    }
    return res;
}

// Without a cursor, every row qualifies
history_cursor cursor_or_max(std::optional<history_cursor> cursor) noexcept
{
    constexpr auto max = (std::numeric_limits<std::int64_t>::max)();
    return cursor.value_or(history_cursor{max, max});
}

class mysql_history_store final : public history_store
{
    mysql::connection_pool& pool_;

public:
    explicit mysql_history_store(mysql::connection_pool& pool) noexcept : pool_(pool) {}

    asio::awaitable<result<std::int64_t>> append(const message& msg) final override
    {
        error_code ec;
        mysql::diagnostics diag;
        mysql::results result;

        // Get a connection
        mysql::pooled_connection conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Error getting a MySQL connection", get_message(diag));
            co_return ec;
        }

        // Execute the insertion. Exactly one of room and recipient_id is set
        const std::string* room = msg.room();
        const std::string* recipient = msg.recipient_id();
        co_await conn->async_execute(
            mysql::with_params(
                "INSERT INTO messages (sender_id, room, recipient_id, body, created_at) "
                "VALUES ({}, {}, {}, {}, {})",
                msg.sender_id,
                room ? std::optional<std::string_view>(*room) : std::nullopt,
                recipient ? std::optional<std::string_view>(*recipient) : std::nullopt,
                msg.body,
                serialize_timestamp(msg.created_at)
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
        {
            log_error(ec, "Error inserting message", get_message(diag));
            co_return ec;
        }

        // MySQL reports last_insert_id as an uint64_t to be able to handle
        // any column type, but our id field is defined as BIGINT (int64).
        co_return static_cast<std::int64_t>(result.last_insert_id());
    }

    asio::awaitable<result<message_batch>> query_room(
        std::string_view room,
        std::size_t limit,
        std::optional<history_cursor> cursor
    ) final override
    {
        auto c = cursor_or_max(cursor);
        co_return co_await run_query(
            mysql::with_params(
                "SELECT id, sender_id, room, recipient_id, body, created_at FROM messages "
                "WHERE room = {} AND (created_at < {} OR (created_at = {} AND id < {})) "
                "ORDER BY created_at DESC, id DESC LIMIT {}",
                room,
                c.created_at,
                c.created_at,
                c.id,
                limit + 1u
            ),
            limit
        );
    }

    asio::awaitable<result<message_batch>> query_dm(
        std::string_view user_a,
        std::string_view user_b,
        std::size_t limit,
        std::optional<history_cursor> cursor
    ) final override
    {
        auto c = cursor_or_max(cursor);
        co_return co_await run_query(
            mysql::with_params(
                "SELECT id, sender_id, room, recipient_id, body, created_at FROM messages "
                "WHERE ((sender_id = {0} AND recipient_id = {1}) OR (sender_id = {1} AND recipient_id = {0})) "
                "AND (created_at < {2} OR (created_at = {2} AND id < {3})) "
                "ORDER BY created_at DESC, id DESC LIMIT {4}",
                user_a,
                user_b,
                c.created_at,
                c.id,
                limit + 1u
            ),
            limit
        );
    }

    asio::awaitable<result<std::vector<conversation_summary>>> list_conversations(
        std::string_view user,
        std::size_t limit
    ) final override
    {
        mysql::diagnostics diag;
        error_code ec;
        mysql::results result;

        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Error getting a MySQL connection", get_message(diag));
            co_return ec;
        }

        // Fold both directions into (peer, message), then keep the latest message per peer
        co_await conn->async_execute(
            mysql::with_params(
                "SELECT peer_id, MAX(created_at) AS last_at, MAX(id) AS last_id FROM ("
                "  SELECT recipient_id AS peer_id, created_at, id FROM messages "
                "  WHERE sender_id = {0} AND recipient_id IS NOT NULL "
                "  UNION ALL "
                "  SELECT sender_id AS peer_id, created_at, id FROM messages WHERE recipient_id = {0}"
                ") AS dms GROUP BY peer_id ORDER BY last_at DESC, last_id DESC LIMIT {1}",
                user,
                limit
            ),
            result,
            diag,
            asio::redirect_error(ec)
        );
        if (ec)
        {
            log_error(ec, "Error listing conversations", get_message(diag));
            co_return ec;
        }

        conn.return_without_reset();

        std::vector<conversation_summary> res;
        res.reserve(result.rows().size());
        for (auto row : result.rows())
            res.push_back({std::string(row.at(0).as_string()), parse_timestamp(row.at(1).as_int64())});
        co_return res;
    }

private:
    template <class Query>
    asio::awaitable<result<message_batch>> run_query(Query query, std::size_t limit)
    {
        mysql::diagnostics diag;
        error_code ec;

        // Get a connection
        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Error getting a MySQL connection", get_message(diag));
            co_return ec;
        }

        mysql::static_results<message_row> result;
        co_await conn->async_execute(std::move(query), result, diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Error querying message history", get_message(diag));
            co_return ec;
        }

        // We didn't do anything modifying the connection state, so we can
        // explicitly return it, indicating that no reset is required.
        conn.return_without_reset();

        std::vector<message_row> rows(result.rows().begin(), result.rows().end());
        co_return to_batch(std::move(rows), limit);
    }
};

class mysql_block_registry final : public block_registry
{
    mysql::connection_pool& pool_;

    template <class Query>
    asio::awaitable<result<mysql::results>> execute(Query query, std::string_view what)
    {
        mysql::diagnostics diag;
        error_code ec;
        mysql::results result;

        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Error getting a MySQL connection", get_message(diag));
            co_return ec;
        }

        co_await conn->async_execute(std::move(query), result, diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, what, get_message(diag));
            co_return ec;
        }

        conn.return_without_reset();
        co_return result;
    }

public:
    explicit mysql_block_registry(mysql::connection_pool& pool) noexcept : pool_(pool) {}

    asio::awaitable<result<bool>> is_blocked(std::string_view a, std::string_view b) final override
    {
        auto res = co_await execute(
            mysql::with_params(
                "SELECT 1 FROM blocks WHERE (blocker_id = {0} AND blocked_id = {1}) "
                "OR (blocker_id = {1} AND blocked_id = {0}) LIMIT 1",
                a,
                b
            ),
            "Error checking block"
        );
        if (res.has_error())
            co_return res.error();
        co_return !res->rows().empty();
    }

    asio::awaitable<error_code> add(std::string_view blocker, std::string_view blocked) final override
    {
        // IGNORE makes duplicates a no-op
        auto res = co_await execute(
            mysql::with_params("INSERT IGNORE INTO blocks (blocker_id, blocked_id) VALUES ({}, {})", blocker, blocked),
            "Error adding block"
        );
        co_return res.has_error() ? res.error() : error_code();
    }

    asio::awaitable<error_code> remove(std::string_view blocker, std::string_view blocked) final override
    {
        auto res = co_await execute(
            mysql::with_params("DELETE FROM blocks WHERE blocker_id = {} AND blocked_id = {}", blocker, blocked),
            "Error removing block"
        );
        co_return res.has_error() ? res.error() : error_code();
    }

    asio::awaitable<result<std::vector<user_identity>>> list_blocked(std::string_view blocker) final override
    {
        auto res = co_await execute(
            mysql::with_params("SELECT blocked_id FROM blocks WHERE blocker_id = {} ORDER BY blocked_id", blocker),
            "Error listing blocks"
        );
        if (res.has_error())
            co_return res.error();

        std::vector<user_identity> blocked;
        blocked.reserve(res->rows().size());
        for (auto row : res->rows())
            blocked.emplace_back(row.at(0).as_string());
        co_return blocked;
    }
};

class mysql_client_impl final : public mysql_client
{
    mysql::connection_pool pool_;

public:
    mysql_client_impl(asio::any_io_executor ex, const mysql_config& cfg) : pool_(std::move(ex), get_pool_params(cfg))
    {
    }

    void start_run() override final
    {
        asio::co_spawn(
            pool_.get_executor(),
            [pool = &pool_]() { return pool->async_run(asio::use_awaitable); },
            [](std::exception_ptr exc) {
                if (exc)
                    std::rethrow_exception(exc);
            }
        );
    }

    void cancel() override final { pool_.cancel(); }

    asio::awaitable<error_code> setup_db() override final
    {
        mysql::diagnostics diag;
        error_code ec;
        mysql::results result;

        auto conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Error getting a MySQL connection", get_message(diag));
            co_return ec;
        }

        for (std::string_view stmt : {create_messages_table, create_blocks_table})
        {
            co_await conn->async_execute(stmt, result, diag, asio::redirect_error(ec));
            if (ec)
            {
                log_error(ec, "Error creating the database schema", get_message(diag));
                co_return ec;
            }
        }

        co_return error_code();
    }

    std::unique_ptr<history_store> create_history_store() override final
    {
        return std::unique_ptr<history_store>{new mysql_history_store(pool_)};
    }

    std::unique_ptr<block_registry> create_block_registry() override final
    {
        return std::unique_ptr<block_registry>{new mysql_block_registry(pool_)};
    }
};

}  // namespace

std::unique_ptr<mysql_client> lobbychat::create_mysql_client(asio::any_io_executor ex, const mysql_config& cfg)
{
    return std::unique_ptr<mysql_client>{new mysql_client_impl(std::move(ex), cfg)};
}
