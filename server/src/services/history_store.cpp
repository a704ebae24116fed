//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/history_store.hpp"

#include <boost/asio/awaitable.hpp>

#include <charconv>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

using namespace lobbychat;
namespace asio = boost::asio;

std::string lobbychat::format_cursor(history_cursor c)
{
    return std::to_string(c.created_at) + '-' + std::to_string(c.id);
}

result<history_cursor> lobbychat::parse_cursor(std::string_view from)
{
    // Both components are non-negative integers. Anything else is rejected
    auto sep = from.find('-');
    if (sep == std::string_view::npos || sep == 0u || sep + 1u == from.size())
        LOBBYCHAT_RETURN_ERROR(errc::invalid_cursor)

    auto parse_part = [](std::string_view part, std::int64_t& to) {
        auto res = std::from_chars(part.data(), part.data() + part.size(), to);
        return res.ec == std::errc() && res.ptr == part.data() + part.size() && to >= 0;
    };

    history_cursor res{};
    if (!parse_part(from.substr(0, sep), res.created_at) || !parse_part(from.substr(sep + 1), res.id))
        LOBBYCHAT_RETURN_ERROR(errc::invalid_cursor)
    return res;
}

namespace {

class memory_history_store final : public history_store
{
    // Sorted by (created_at, id), so reads are a reverse walk from the cursor
    using key_type = std::pair<std::int64_t, std::int64_t>;
    std::map<key_type, message> messages_;
    std::int64_t last_id_{};

    message_batch query(
        std::size_t limit,
        std::optional<history_cursor> cursor,
        const std::function<bool(const message&)>& matches
    ) const
    {
        message_batch res;
        auto it = cursor ? messages_.lower_bound(key_type{cursor->created_at, cursor->id}) : messages_.end();
        while (it != messages_.begin())
        {
            --it;
            if (!matches(it->second))
                continue;
            if (res.messages.size() == limit)
            {
                res.has_more = true;
                break;
            }
            res.messages.push_back(it->second);
        }
        return res;
    }

public:
    asio::awaitable<result<std::int64_t>> append(const message& msg) final override
    {
        message stored = msg;
        stored.id = ++last_id_;
        messages_.emplace(key_type{serialize_timestamp(stored.created_at), stored.id}, stored);
        co_return stored.id;
    }

    asio::awaitable<result<message_batch>> query_room(
        std::string_view room,
        std::size_t limit,
        std::optional<history_cursor> cursor
    ) final override
    {
        co_return query(limit, cursor, [room](const message& msg) {
            return msg.room() && *msg.room() == room;
        });
    }

    asio::awaitable<result<message_batch>> query_dm(
        std::string_view user_a,
        std::string_view user_b,
        std::size_t limit,
        std::optional<history_cursor> cursor
    ) final override
    {
        co_return query(limit, cursor, [user_a, user_b](const message& msg) {
            const auto* to = msg.recipient_id();
            return to && ((msg.sender_id == user_a && *to == user_b) || (msg.sender_id == user_b && *to == user_a));
        });
    }

    asio::awaitable<result<std::vector<conversation_summary>>> list_conversations(
        std::string_view user,
        std::size_t limit
    ) final override
    {
        // Walking newest first, the first message seen for each peer is its latest one
        std::vector<conversation_summary> res;
        std::set<std::string_view> seen;
        for (auto it = messages_.rbegin(); it != messages_.rend() && res.size() < limit; ++it)
        {
            const message& msg = it->second;
            const auto* to = msg.recipient_id();
            if (!to)
                continue;
            const std::string* peer = msg.sender_id == user ? to : (*to == user ? &msg.sender_id : nullptr);
            if (peer && seen.insert(*peer).second)
                res.push_back({*peer, msg.created_at});
        }
        co_return res;
    }
};

}  // namespace

std::unique_ptr<history_store> lobbychat::create_memory_history_store()
{
    return std::unique_ptr<history_store>{new memory_history_store()};
}
