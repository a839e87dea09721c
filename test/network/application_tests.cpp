// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "application.hpp"
#include "test_helper.hpp"
#include "util/netaddress.hpp"

using namespace netsession;
using boost::asio::ip::make_address;

namespace {

app::AppConfig LoopbackAppConfig() {
    app::AppConfig config;
    config.server_config = test::LoopbackConfig();
    config.server_config.match_timeout_ms = 3000;
    return config;
}

} // namespace

TEST_CASE("Application: client pings an echo responder", "[app]") {
    app::Application responder(LoopbackAppConfig());
    REQUIRE(responder.initialize());
    REQUIRE(responder.start());
    REQUIRE(responder.is_running());
    REQUIRE_FALSE(responder.is_client());

    auto client_config = LoopbackAppConfig();
    client_config.ping_uri =
        "udp://" + util::EndpointKey(responder.server().local_endpoint());
    client_config.ping_payload = "hello";
    client_config.ping_count = 3;

    app::Application client(client_config);
    REQUIRE(client.initialize());
    REQUIRE(client.is_client());
    REQUIRE(client.start());

    REQUIRE(client.run_client() == 3);

    client.stop();
    REQUIRE_FALSE(client.is_running());
    responder.stop();
}

TEST_CASE("Application: responder without echo leaves requests unanswered", "[app]") {
    auto responder_config = LoopbackAppConfig();
    responder_config.echo = false;
    app::Application responder(responder_config);
    REQUIRE(responder.initialize());
    REQUIRE(responder.start());

    auto client_config = LoopbackAppConfig();
    client_config.ping_uri =
        "udp://" + util::EndpointKey(responder.server().local_endpoint());
    client_config.server_config.match_timeout_ms = 100;

    app::Application client(client_config);
    REQUIRE(client.initialize());
    REQUIRE(client.start());
    REQUIRE(client.run_client() == 0);

    // The responder still saw the client
    REQUIRE(test::WaitFor([&] { return responder.server().SessionCount() == 1; }));
}

TEST_CASE("Application: peer without a port is rejected", "[app]") {
    auto config = LoopbackAppConfig();
    config.ping_uri = "udp://127.0.0.1";

    app::Application client(config);
    REQUIRE_FALSE(client.initialize());
}
