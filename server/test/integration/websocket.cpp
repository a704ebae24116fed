//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/beast/http/verb.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/test/unit_test.hpp>

#include <boost/system/system_error.hpp>

#include <string>
#include <string_view>

#include "client.hpp"

using namespace lobbychat::test;
namespace http = boost::beast::http;

namespace {

std::string history_target(std::string_view room) { return "/api/chat/history?room=" + std::string(room); }

}  // namespace

BOOST_AUTO_TEST_SUITE(integration)

//
// Authentication
//
BOOST_AUTO_TEST_CASE(auth_bearer_header)
{
    server_runner runner;
    auto ws = runner.connect_websocket("/ws/chat", "token-alice");

    auto frame = ws.read_json();
    BOOST_TEST(frame.at("type").as_string() == "welcome");
    BOOST_TEST(frame.at("userId").as_string() == "alice");
}

BOOST_AUTO_TEST_CASE(auth_query_param)
{
    server_runner runner;
    auto ws = runner.connect_websocket("/ws/chat?token=token-alice");

    auto frame = ws.read_json();
    BOOST_TEST(frame.at("type").as_string() == "welcome");
    BOOST_TEST(frame.at("userId").as_string() == "alice");
}

BOOST_AUTO_TEST_CASE(auth_first_frame)
{
    server_runner runner;
    auto ws = runner.connect_websocket();

    ws.write(R"({"type":"auth","token":"token-alice"})");

    auto frame = ws.read_json();
    BOOST_TEST(frame.at("type").as_string() == "welcome");
    BOOST_TEST(frame.at("userId").as_string() == "alice");
}

BOOST_AUTO_TEST_CASE(auth_invalid_token)
{
    server_runner runner;
    auto ws = runner.connect_websocket("/ws/chat", "not-a-token");

    // An error frame, then the connection is closed
    auto frame = ws.read_json();
    BOOST_TEST(frame.at("type").as_string() == "error");
    BOOST_TEST(frame.at("kind").as_string() == "Unauthorized");
    BOOST_TEST(ws.read_close_code() == 4001u);
}

BOOST_AUTO_TEST_CASE(upgrade_only_on_chat_path)
{
    server_runner runner;

    // Other targets decline the upgrade
    BOOST_CHECK_THROW(runner.connect_websocket("/ws/other", "token-alice"), boost::system::system_error);
    BOOST_CHECK_THROW(runner.connect_websocket("/api/chat/history", "token-alice"), boost::system::system_error);

    // The chat path is not a regular HTTP resource
    auto res = runner.http_request(http::verb::get, "/ws/chat", "token-alice");
    BOOST_TEST(res.status == 404u);

    // Equivalent spellings of the chat path are accepted
    auto ws = runner.connect_websocket("/ws/./chat", "token-alice");
    BOOST_TEST(ws.read_json().at("type").as_string() == "welcome");
}

BOOST_AUTO_TEST_CASE(command_before_auth)
{
    server_runner runner;
    auto ws = runner.connect_websocket();

    ws.write(R"({"type":"join","room":"lobby"})");

    auto frame = ws.read_json();
    BOOST_TEST(frame.at("kind").as_string() == "Unauthorized");
    BOOST_TEST(ws.read_close_code() == 4001u);
}

//
// Chat
//
BOOST_AUTO_TEST_CASE(room_conversation)
{
    server_runner runner;
    auto alice = runner.connect_as("alice");
    auto bob = runner.connect_as("bob");

    // Both join
    alice.write(R"({"type":"join","room":"lobby"})");
    auto joined = alice.read_json();
    BOOST_TEST(joined.at("type").as_string() == "joined");
    BOOST_TEST(joined.at("members") == (boost::json::array{"alice"}));

    bob.write(R"({"type":"join","room":"lobby"})");
    joined = bob.read_json();
    BOOST_TEST(joined.at("members") == (boost::json::array{"alice", "bob"}));

    auto presence = alice.read_json();
    BOOST_TEST(presence.at("type").as_string() == "presence");
    BOOST_TEST(presence.at("userId").as_string() == "bob");
    BOOST_TEST(presence.at("online").as_bool() == true);

    // alice talks
    alice.write(R"({"type":"channel","room":"lobby","body":"hello bob"})");
    for (auto* ws : {&alice, &bob})
    {
        auto msg = ws->read_until("message");
        BOOST_TEST(msg.at("from").as_string() == "alice");
        BOOST_TEST(msg.at("room").as_string() == "lobby");
        BOOST_TEST(msg.at("body").as_string() == "hello bob");
    }

    // History is available over HTTP
    auto res = runner.http_request(http::verb::get, history_target("lobby"), "token-bob");
    BOOST_TEST(res.status == 200u);
    auto body = boost::json::parse(res.body).as_object();
    BOOST_TEST_REQUIRE(body.at("messages").as_array().size() == 1u);
    BOOST_TEST(body.at("messages").as_array()[0].at("body").as_string() == "hello bob");
    BOOST_TEST(!body.contains("nextCursor"));

    // bob leaves. alice is told
    bob = runner.connect_as("carol");
    presence = alice.read_until("presence");
    BOOST_TEST(presence.at("userId").as_string() == "bob");
    BOOST_TEST(presence.at("online").as_bool() == false);
}

BOOST_AUTO_TEST_CASE(leave_room)
{
    server_runner runner;
    auto alice = runner.connect_as("alice");
    auto bob = runner.connect_as("bob");

    alice.write(R"({"type":"join","room":"lobby"})");
    alice.read_until("joined");
    bob.write(R"({"type":"join","room":"lobby"})");
    bob.read_until("joined");
    alice.read_until("presence");

    bob.write(R"({"type":"leave","room":"lobby"})");
    auto left = bob.read_json();
    BOOST_TEST(left.at("type").as_string() == "left");
    BOOST_TEST(left.at("room").as_string() == "lobby");

    auto presence = alice.read_json();
    BOOST_TEST(presence.at("type").as_string() == "presence");
    BOOST_TEST(presence.at("userId").as_string() == "bob");
    BOOST_TEST(presence.at("online").as_bool() == false);

    // bob can't post anymore
    bob.write(R"({"type":"channel","room":"lobby","body":"hi"})");
    BOOST_TEST(bob.read_json().at("kind").as_string() == "NotJoined");
}

BOOST_AUTO_TEST_CASE(dm_and_blocks)
{
    server_runner runner;
    auto alice = runner.connect_as("alice");
    auto bob = runner.connect_as("bob");

    // Direct message
    alice.write(R"({"type":"dm","to":"bob","body":"psst"})");
    auto msg = bob.read_json();
    BOOST_TEST(msg.at("type").as_string() == "message");
    BOOST_TEST(msg.at("from").as_string() == "alice");
    BOOST_TEST(msg.at("to").as_string() == "bob");
    BOOST_TEST(alice.read_json().at("body").as_string() == "psst");

    // bob blocks alice
    bob.write(R"({"type":"block","userId":"alice"})");
    auto ack = bob.read_json();
    BOOST_TEST(ack.at("type").as_string() == "blocked");
    BOOST_TEST(ack.at("userId").as_string() == "alice");

    // alice can't reach bob anymore
    alice.write(R"({"type":"dm","to":"bob","body":"hello?"})");
    auto err = alice.read_json();
    BOOST_TEST(err.at("type").as_string() == "error");
    BOOST_TEST(err.at("kind").as_string() == "Blocked");

    // The conversation is hidden
    auto res = runner.http_request(http::verb::get, "/api/chat/dm-history?peer=bob", "token-alice");
    BOOST_TEST(res.status == 200u);
    BOOST_TEST(boost::json::parse(res.body) == boost::json::parse(R"({"messages":[]})"));
    res = runner.http_request(http::verb::get, "/api/chat/conversations", "token-alice");
    BOOST_TEST(res.status == 200u);
    BOOST_TEST(boost::json::parse(res.body) == boost::json::parse(R"({"conversations":[]})"));

    // bob can list who he blocked. alice sees nothing
    res = runner.http_request(http::verb::get, "/api/chat/blocks", "token-bob");
    BOOST_TEST(res.status == 200u);
    BOOST_TEST(boost::json::parse(res.body) == boost::json::parse(R"({"blocked":["alice"]})"));
    res = runner.http_request(http::verb::get, "/api/chat/blocks", "token-alice");
    BOOST_TEST(res.status == 200u);
    BOOST_TEST(boost::json::parse(res.body) == boost::json::parse(R"({"blocked":[]})"));

    // Unblocking restores it
    bob.write(R"({"type":"unblock","userId":"alice"})");
    BOOST_TEST(bob.read_json().at("type").as_string() == "unblocked");
    res = runner.http_request(http::verb::get, "/api/chat/dm-history?peer=bob", "token-alice");
    BOOST_TEST(res.status == 200u);
    auto body = boost::json::parse(res.body).as_object();
    BOOST_TEST_REQUIRE(body.at("messages").as_array().size() == 1u);
    BOOST_TEST(body.at("messages").as_array()[0].at("body").as_string() == "psst");

    res = runner.http_request(http::verb::get, "/api/chat/conversations?limit=5", "token-alice");
    BOOST_TEST(res.status == 200u);
    body = boost::json::parse(res.body).as_object();
    BOOST_TEST_REQUIRE(body.at("conversations").as_array().size() == 1u);
    BOOST_TEST(body.at("conversations").as_array()[0].at("userId").as_string() == "bob");
    BOOST_TEST(body.at("conversations").as_array()[0].at("lastMessageAt").as_int64() > 0);
}

BOOST_AUTO_TEST_CASE(ping)
{
    server_runner runner;
    auto alice = runner.connect_as("alice");

    alice.write(R"({"type":"ping"})");
    auto pong = alice.read_json();
    BOOST_TEST(pong.at("type").as_string() == "pong");
    BOOST_TEST(pong.at("ts").as_int64() > 0);
}

BOOST_AUTO_TEST_CASE(stalled_reader_is_disconnected)
{
    lobbychat::connection_limits limits;
    limits.chat = {1e9, 1e9};
    limits.outbound_depth = 8;
    server_runner runner(limits);
    auto alice = runner.connect_as("alice");
    auto bob = runner.connect_as("bob");

    alice.write(R"({"type":"join","room":"lobby"})");
    alice.read_until("joined");
    bob.write(R"({"type":"join","room":"lobby"})");
    alice.read_until("presence");

    // bob never reads. Once the socket buffers fill, the server's writes to bob
    // block and his queue overflows. alice keeps reading her own messages
    const std::string frame = R"({"type":"channel","room":"lobby","body":")" + std::string(2000, 'x') + "\"}";
    bool bob_offline = false;
    for (int i = 0; i < 20000 && !bob_offline; ++i)
    {
        alice.write(frame);
        while (true)
        {
            auto res = alice.read_json();
            if (res.at("type").as_string() == "message")
                break;
            if (res.at("type").as_string() == "presence" && res.at("userId").as_string() == "bob")
            {
                BOOST_TEST(res.at("online").as_bool() == false);
                bob_offline = true;
            }
        }
    }
    BOOST_TEST_REQUIRE(bob_offline);

    // bob was dropped without a closing handshake
    auto ec = bob.read_until_error();
    BOOST_TEST(ec != boost::beast::websocket::error::closed);

    // alice is unaffected
    alice.write(R"({"type":"ping"})");
    BOOST_TEST(alice.read_until("pong").at("ts").as_int64() > 0);
}

BOOST_AUTO_TEST_CASE(malformed_commands_close)
{
    lobbychat::connection_limits limits;
    limits.max_malformed = 2;
    server_runner runner(limits);
    auto alice = runner.connect_as("alice");

    for (int i = 0; i < 3; ++i)
    {
        alice.write("this is not JSON");
        BOOST_TEST(alice.read_json().at("kind").as_string() == "MalformedCommand");
    }

    BOOST_TEST(alice.read_close_code() == static_cast<unsigned>(boost::beast::websocket::close_code::policy_error));
}

//
// Notifications
//
BOOST_AUTO_TEST_CASE(notify_invite)
{
    server_runner runner;
    auto bob = runner.connect_as("bob");

    auto res = runner.http_request(
        http::verb::post,
        "/api/internal/notify",
        notify_secret,
        R"({"userId":"bob","event":{"type":"invite","fromUserId":"alice","matchId":"m1"}})"
    );

    BOOST_TEST(res.status == 200u);
    BOOST_TEST(boost::json::parse(res.body) == boost::json::parse(R"({"delivered":1})"));
    auto frame = bob.read_json();
    BOOST_TEST(frame.at("type").as_string() == "invite");
    BOOST_TEST(frame.at("fromUserId").as_string() == "alice");
    BOOST_TEST(frame.at("matchId").as_string() == "m1");
}

BOOST_AUTO_TEST_CASE(notify_offline_user)
{
    server_runner runner;

    auto res = runner.http_request(
        http::verb::post,
        "/api/internal/notify",
        notify_secret,
        R"({"userId":"bob","event":{"type":"invite","fromUserId":"alice","matchId":"m1"}})"
    );

    BOOST_TEST(res.status == 200u);
    BOOST_TEST(boost::json::parse(res.body) == boost::json::parse(R"({"delivered":0})"));
}

BOOST_AUTO_TEST_CASE(notify_errors)
{
    server_runner runner;
    const char* body = R"({"userId":"bob","event":{"type":"invite","fromUserId":"alice","matchId":"m1"}})";

    // Wrong secrets, including ones that only differ in the last character or the length
    for (std::string_view secret : {"token-alice", "test-secreT", "test-secre", "test-secret-extra"})
    {
        BOOST_TEST_CONTEXT(secret)
        {
            auto res = runner.http_request(http::verb::post, "/api/internal/notify", secret, body);
            BOOST_TEST(res.status == 401u);
        }
    }
    auto res = runner.http_request(http::verb::post, "/api/internal/notify", "", body);
    BOOST_TEST(res.status == 401u);

    // Bad body
    res = runner.http_request(http::verb::post, "/api/internal/notify", notify_secret, R"({"userId":"bob"})");
    BOOST_TEST(res.status == 400u);
}

//
// HTTP errors
//
BOOST_AUTO_TEST_CASE(history_errors)
{
    server_runner runner;

    // No credentials
    auto res = runner.http_request(http::verb::get, history_target("lobby"));
    BOOST_TEST(res.status == 401u);

    // Invalid credentials
    res = runner.http_request(http::verb::get, history_target("lobby"), "bad");
    BOOST_TEST(res.status == 401u);

    // Missing room
    res = runner.http_request(http::verb::get, "/api/chat/history", "token-alice");
    BOOST_TEST(res.status == 400u);

    // Bad cursor
    res = runner.http_request(http::verb::get, history_target("lobby") + "&cursor=abc", "token-alice");
    BOOST_TEST(res.status == 400u);
    BOOST_TEST(boost::json::parse(res.body).at("id").as_string() == "INVALID_CURSOR");

    // Wrong method
    res = runner.http_request(http::verb::post, history_target("lobby"), "token-alice");
    BOOST_TEST(res.status == 405u);
    res = runner.http_request(http::verb::get, "/api/internal/notify", notify_secret);
    BOOST_TEST(res.status == 405u);

    // The other read endpoints require credentials, too
    res = runner.http_request(http::verb::get, "/api/chat/blocks");
    BOOST_TEST(res.status == 401u);
    res = runner.http_request(http::verb::get, "/api/chat/conversations", "bad");
    BOOST_TEST(res.status == 401u);
    res = runner.http_request(http::verb::get, "/api/chat/conversations?limit=abc", "token-alice");
    BOOST_TEST(res.status == 400u);

    // Unknown paths
    res = runner.http_request(http::verb::get, "/api/nothing", "token-alice");
    BOOST_TEST(res.status == 404u);
    res = runner.http_request(http::verb::get, "/index.html");
    BOOST_TEST(res.status == 404u);
}

BOOST_AUTO_TEST_SUITE_END()
