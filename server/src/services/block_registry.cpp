//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/block_registry.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace lobbychat;
namespace asio = boost::asio;

namespace {

class memory_block_registry final : public block_registry
{
    std::set<std::pair<std::string, std::string>> blocks_;

    bool contains(std::string_view blocker, std::string_view blocked) const
    {
        return blocks_.count({std::string(blocker), std::string(blocked)}) != 0u;
    }

public:
    asio::awaitable<result<bool>> is_blocked(std::string_view a, std::string_view b) final override
    {
        co_return contains(a, b) || contains(b, a);
    }

    asio::awaitable<error_code> add(std::string_view blocker, std::string_view blocked) final override
    {
        blocks_.emplace(std::string(blocker), std::string(blocked));
        co_return error_code();
    }

    asio::awaitable<error_code> remove(std::string_view blocker, std::string_view blocked) final override
    {
        blocks_.erase({std::string(blocker), std::string(blocked)});
        co_return error_code();
    }

    asio::awaitable<result<std::vector<user_identity>>> list_blocked(std::string_view blocker) final override
    {
        // Pairs are sorted by blocker first, so this is a contiguous range
        std::vector<user_identity> res;
        for (auto it = blocks_.lower_bound({std::string(blocker), std::string()});
             it != blocks_.end() && it->first == blocker;
             ++it)
        {
            res.push_back(it->second);
        }
        co_return res;
    }
};

}  // namespace

std::unique_ptr<block_registry> lobbychat::create_memory_block_registry()
{
    return std::unique_ptr<block_registry>{new memory_block_registry()};
}
