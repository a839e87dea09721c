// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "test_helper.hpp"
#include "network/udp_server.hpp"
#include "util/time.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace netsession::network;
using namespace netsession::test;
using boost::asio::ip::make_address;
using boost::asio::ip::udp;
using namespace std::chrono_literals;

TEST_CASE("UdpServer: open, close and stop", "[network][udp]") {
    UdpServer server(LoopbackConfig());

    REQUIRE_FALSE(server.is_active());
    REQUIRE(server.Open());
    REQUIRE(server.is_active());
    REQUIRE(server.local_endpoint().port() != 0);
    REQUIRE(server.Open());  // Already open

    REQUIRE(server.Close());
    REQUIRE_FALSE(server.is_active());
    REQUIRE(server.Close());  // Idempotent

    // Reopens after close
    REQUIRE(server.Open());
    REQUIRE(server.is_active());

    server.Stop();
    REQUIRE_FALSE(server.is_active());
    REQUIRE_FALSE(server.Open());
    REQUIRE(server.CreateSession(udp::endpoint(make_address("127.0.0.1"), 9)) == nullptr);
}

TEST_CASE("UdpServer: bind failure reports false", "[network][udp]") {
    UdpServer first(LoopbackConfig());
    REQUIRE(first.Open());

    auto config = LoopbackConfig();
    config.local.set_port(first.local_endpoint().port());
    UdpServer second(config);

    REQUIRE_FALSE(second.Open());
    REQUIRE_FALSE(second.is_active());
    REQUIRE(second.CreateSession(udp::endpoint(make_address("127.0.0.1"), 9)) == nullptr);
}

TEST_CASE("UdpServer: one session per peer", "[network][udp][session]") {
    UdpServer server(LoopbackConfig());
    std::atomic<int> created{0};
    auto sub = server.notifications().SubscribeNewSession(
        [&](const UdpSessionPtr &) { created++; });

    udp::endpoint peer(make_address("127.0.0.1"), 40001);

    SECTION("Repeated lookups return the same session") {
        auto a = server.CreateSession(peer);
        auto b = server.CreateSession(peer);
        REQUIRE(a);
        REQUIRE(a == b);
        REQUIRE(a->is_open());
        REQUIRE(a->key() == "127.0.0.1:40001");
        REQUIRE(a->ToString() == "udp://127.0.0.1:40001");
        REQUIRE(server.GetSession("127.0.0.1:40001") == a);
        REQUIRE(server.FindSession(peer) == a);
        REQUIRE(server.SessionCount() == 1);

        auto other = server.CreateSession(udp::endpoint(make_address("127.0.0.1"), 40002));
        REQUIRE(other != a);
        REQUIRE(other->id() != a->id());
        REQUIRE(server.SessionCount() == 2);
        REQUIRE(server.GetSessions().size() == 2);

        REQUIRE(WaitFor([&] { return created.load() == 2; }));
    }

    SECTION("Concurrent creation for one peer yields one session") {
        constexpr int num_threads = 8;
        std::vector<UdpSessionPtr> results(num_threads);
        std::vector<std::thread> threads;
        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&, t]() { results[t] = server.CreateSession(peer); });
        }
        for (auto &thread : threads) {
            thread.join();
        }

        for (const auto &session : results) {
            REQUIRE(session);
            REQUIRE(session == results[0]);
        }
        REQUIRE(server.SessionCount() == 1);
        REQUIRE(WaitFor([&] { return created.load() == 1; }));
        std::this_thread::sleep_for(50ms);
        REQUIRE(created.load() == 1);
    }

    server.Stop();
}

TEST_CASE("UdpServer: request/response between two servers", "[network][udp][match]") {
    UdpServer responder(LoopbackConfig());
    REQUIRE(responder.Open());

    // Echo every unmatched datagram
    responder.set_receive_callback([](const UdpSessionPtr &session, const Packet &packet) {
        session->Send(packet);
    });

    auto config = LoopbackConfig();
    config.remote = NetUri(NetType::Udp, responder.local_endpoint());
    UdpServer client(config);

    auto future = client.SendMessageAsync(Packet::FromString("ping"), 3000);
    REQUIRE(WaitReady(future));
    auto outcome = future.get();
    REQUIRE(outcome.status == MatchStatus::Matched);
    REQUIRE(outcome.result.ToStr() == "ping");

    // Both ends now track one session for the other
    REQUIRE(client.SessionCount() == 1);
    REQUIRE(responder.SessionCount() == 1);
    REQUIRE(responder.FindSession(client.local_endpoint()));

    SECTION("Several requests in flight") {
        auto session = client.FindSession(responder.local_endpoint());
        REQUIRE(session);

        // Responses only match the request with the same payload
        session->set_match_predicate([](const Packet &request, const Packet &response) {
            return request == response;
        });

        std::vector<std::shared_future<MatchOutcome>> futures;
        for (int i = 0; i < 5; ++i) {
            futures.push_back(session->SendMessageAsync(
                Packet::FromString("req-" + std::to_string(i)), 3000));
        }
        for (int i = 0; i < 5; ++i) {
            REQUIRE(WaitReady(futures[i]));
            auto result = futures[i].get();
            REQUIRE(result.status == MatchStatus::Matched);
            REQUIRE(result.result.ToStr() == "req-" + std::to_string(i));
        }
    }

    client.Stop();
    responder.Stop();
}

TEST_CASE("UdpServer: unmatched datagrams reach session then server callbacks",
          "[network][udp][session]") {
    UdpServer sender(LoopbackConfig());
    UdpServer receiver(LoopbackConfig());
    REQUIRE(sender.Open());
    REQUIRE(receiver.Open());

    std::mutex m;
    std::vector<std::string> order;

    auto session = receiver.CreateSession(sender.local_endpoint());
    REQUIRE(session);
    session->set_receive_callback([&](const UdpSessionPtr &, const Packet &packet) {
        std::lock_guard<std::mutex> lock(m);
        order.push_back("session:" + packet.ToStr());
    });
    receiver.set_receive_callback([&](const UdpSessionPtr &s, const Packet &packet) {
        std::lock_guard<std::mutex> lock(m);
        order.push_back((s == session ? "server:" : "server?:") + packet.ToStr());
    });

    REQUIRE(sender.SendTo(Packet::FromString("hello"), receiver.local_endpoint()) == 5);

    REQUIRE(WaitFor([&] {
        std::lock_guard<std::mutex> lock(m);
        return order.size() == 2;
    }));
    {
        std::lock_guard<std::mutex> lock(m);
        REQUIRE(order[0] == "session:hello");
        REQUIRE(order[1] == "server:hello");
    }
    REQUIRE(receiver.SessionCount() == 1);

    sender.Stop();
    receiver.Stop();
}

TEST_CASE("UdpServer: first datagram from a peer creates its session",
          "[network][udp][session]") {
    UdpServer server(LoopbackConfig());
    REQUIRE(server.Open());

    std::atomic<int> created{0};
    auto sub = server.notifications().SubscribeNewSession(
        [&](const UdpSessionPtr &session) {
            if (session && session->is_open()) created++;
        });

    RawPeer peer;
    peer.SendTo("abc", server.local_endpoint());
    peer.SendTo("def", server.local_endpoint());

    REQUIRE(WaitFor([&] { return created.load() == 1 && server.SessionCount() == 1; }));
    auto session = server.FindSession(peer.endpoint());
    REQUIRE(session);
    REQUIRE(session->remote() == peer.endpoint());
    REQUIRE(server.ToString() == netsession::util::EndpointKey(server.local_endpoint()) + " [1]");

    server.Stop();
}

TEST_CASE("UdpServer: broadcast session receives from any address on its port",
          "[network][udp][broadcast]") {
    UdpServer server(LoopbackConfig());
    REQUIRE(server.Open());

    RawPeer peer;
    udp::endpoint broadcast(make_address("255.255.255.255"), peer.endpoint().port());

    auto session = server.CreateSession(broadcast);
    REQUIRE(session);
    REQUIRE(session->is_broadcast());

    std::atomic<int> received{0};
    session->set_receive_callback([&](const UdpSessionPtr &, const Packet &) { received++; });

    // Reply arrives from the device's own address, not from 255.255.255.255
    peer.SendTo("reply", server.local_endpoint());
    REQUIRE(WaitFor([&] { return received.load() == 1; }));
    REQUIRE(server.SessionCount() == 1);
    REQUIRE(server.FindSession(peer.endpoint()) == session);

    SECTION("Closing the broadcast session removes the port route") {
        REQUIRE(session->Close("done"));
        REQUIRE(server.FindSession(peer.endpoint()) == nullptr);
        REQUIRE(server.SessionCount() == 0);

        // Next datagram gets a regular session
        peer.SendTo("again", server.local_endpoint());
        REQUIRE(WaitFor([&] { return server.SessionCount() == 1; }));
        auto unicast = server.FindSession(peer.endpoint());
        REQUIRE(unicast);
        REQUIRE_FALSE(unicast->is_broadcast());
        REQUIRE(received.load() == 1);
    }

    server.Stop();
}

TEST_CASE("UdpServer: datagrams from the server's own socket are dropped",
          "[network][udp][loopback]") {
    SECTION("Filtered by default") {
        UdpServer server(LoopbackConfig());
        REQUIRE(server.Open());

        std::atomic<int> created{0};
        auto sub = server.notifications().SubscribeNewSession(
            [&](const UdpSessionPtr &) { created++; });

        REQUIRE(server.SendTo(Packet::FromString("self"), server.local_endpoint()) == 4);
        REQUIRE(WaitFor([&] { return server.filtered_count() == 1; }));
        REQUIRE(server.SessionCount() == 0);
        std::this_thread::sleep_for(50ms);
        REQUIRE(created.load() == 0);
        server.Stop();
    }

    SECTION("Accepted with loopback enabled") {
        auto config = LoopbackConfig();
        config.loopback = true;
        UdpServer server(config);
        REQUIRE(server.Open());

        REQUIRE(server.SendTo(Packet::FromString("self"), server.local_endpoint()) == 4);
        REQUIRE(WaitFor([&] { return server.SessionCount() == 1; }));
        REQUIRE(server.filtered_count() == 0);
        server.Stop();
    }
}

TEST_CASE("UdpServer: self reception when bound to any", "[network][udp][loopback]") {
    auto config = LoopbackConfig();
    config.local = NetUri(NetType::Udp, make_address("0.0.0.0"), 0);
    config.local_address_provider = [] {
        return std::vector<boost::asio::ip::address>{make_address("10.9.8.7")};
    };
    UdpServer server(config);
    REQUIRE(server.Open());
    uint16_t port = server.local_endpoint().port();

    REQUIRE(server.IsSelfReception(udp::endpoint(make_address("10.9.8.7"), port)));
    REQUIRE(server.IsSelfReception(udp::endpoint(make_address("127.0.0.1"), port)));
    REQUIRE(server.IsSelfReception(udp::endpoint(make_address("::ffff:10.9.8.7"), port)));
    REQUIRE_FALSE(server.IsSelfReception(udp::endpoint(make_address("10.9.8.6"), port)));
    REQUIRE_FALSE(server.IsSelfReception(
        udp::endpoint(make_address("10.9.8.7"), static_cast<uint16_t>(port + 1))));

    server.Stop();
}

TEST_CASE("UdpServer: close resolves pending requests as Cleared",
          "[network][udp][session]") {
    RawPeer silent;  // Never answers

    auto config = LoopbackConfig();
    config.remote = NetUri(NetType::Udp, silent.endpoint());
    UdpServer server(config);

    std::mutex m;
    std::string closed_reason;
    std::string closed_key;
    auto sub = server.notifications().SubscribeSessionClosed(
        [&](uint64_t, const std::string &key, const std::string &reason) {
            std::lock_guard<std::mutex> lock(m);
            closed_key = key;
            closed_reason = reason;
        });

    auto future = server.SendMessageAsync(Packet::FromString("req"), 10000);
    auto session = server.FindSession(silent.endpoint());
    REQUIRE(session);
    REQUIRE(session->match_queue()->count() == 1);

    REQUIRE(server.Close("maintenance"));
    REQUIRE(WaitReady(future));
    REQUIRE(future.get().status == MatchStatus::Cleared);

    REQUIRE(WaitFor([&] {
        std::lock_guard<std::mutex> lock(m);
        return !closed_reason.empty();
    }));
    {
        std::lock_guard<std::mutex> lock(m);
        REQUIRE(closed_reason == "maintenance");
        REQUIRE(closed_key == netsession::util::EndpointKey(silent.endpoint()));
    }

    // A closed session refuses further work
    REQUIRE_FALSE(session->is_open());
    REQUIRE_FALSE(session->Close("again"));
    REQUIRE(session->Send(Packet::FromString("x")) == -1);
    auto late = session->SendMessageAsync(Packet::FromString("late"), 1000);
    REQUIRE(WaitReady(late, 0ms));
    REQUIRE(late.get().status == MatchStatus::Cleared);
    REQUIRE(server.SessionCount() == 0);

    server.Stop();
}

TEST_CASE("UdpServer: request without a response expires", "[network][udp][match]") {
    RawPeer silent;

    auto config = LoopbackConfig();
    config.remote = NetUri(NetType::Udp, silent.endpoint());
    UdpServer server(config);

    auto future = server.SendMessageAsync(Packet::FromString("req"), 200);
    // Expiry runs on the 1 s sweep
    REQUIRE(WaitReady(future, 5s));
    REQUIRE(future.get().status == MatchStatus::Expired);

    server.Stop();
}

TEST_CASE("UdpServer: SendMessageAsync needs a remote", "[network][udp]") {
    UdpServer server(LoopbackConfig());
    REQUIRE_THROWS_AS(server.SendMessageAsync(Packet::FromString("x")), std::runtime_error);
}

TEST_CASE("UdpServer: unreachable peer closes its session",
          "[network][udp][session]") {
    auto config = LoopbackConfig();
    config.remote = NetUri(NetType::Udp, ClosedLoopbackEndpoint());
    config.connect_remote = true;
    UdpServer server(config);

    auto future = server.SendMessageAsync(Packet::FromString("req"), 10000);

    // ICMP port unreachable surfaces as a receive error on the connected socket
    REQUIRE(WaitReady(future, 5s));
    REQUIRE(future.get().status == MatchStatus::Cleared);
    REQUIRE(server.SessionCount() == 0);
    REQUIRE(server.is_active());  // The server itself stays up

    server.Stop();
}

TEST_CASE("UdpServer: idle sessions are disposed", "[network][udp][session]") {
    netsession::util::MockSteadyTimeScope time(0ms);

    auto config = LoopbackConfig();
    config.session_timeout = 30s;
    UdpServer server(config);

    std::mutex m;
    std::vector<std::string> reasons;
    auto sub = server.notifications().SubscribeSessionClosed(
        [&](uint64_t, const std::string &, const std::string &reason) {
            std::lock_guard<std::mutex> lock(m);
            reasons.push_back(reason);
        });

    auto idle = server.CreateSession(udp::endpoint(make_address("127.0.0.1"), 40010));
    REQUIRE(idle);

    time.Advance(20s);
    auto active = server.CreateSession(udp::endpoint(make_address("127.0.0.1"), 40011));
    REQUIRE(server.DisposeIdleSessions() == 0);

    time.Advance(15s);
    REQUIRE(server.DisposeIdleSessions() == 1);
    REQUIRE_FALSE(idle->is_open());
    REQUIRE(active->is_open());
    REQUIRE(server.SessionCount() == 1);

    REQUIRE(WaitFor([&] {
        std::lock_guard<std::mutex> lock(m);
        return reasons.size() == 1;
    }));
    {
        std::lock_guard<std::mutex> lock(m);
        REQUIRE(reasons[0] == "idle timeout");
    }

    server.Stop();
}

TEST_CASE("UdpServer: close racing session creation leaves no stray session",
          "[network][udp][session][concurrent]") {
    constexpr int rounds = 40;
    constexpr int sessions_per_round = 100;

    for (int round = 0; round < rounds; ++round) {
        UdpServer server(LoopbackConfig());
        REQUIRE(server.Open());

        std::vector<UdpSessionPtr> created;
        std::thread creator([&]() {
            for (int i = 0; i < sessions_per_round; ++i) {
                auto port = static_cast<uint16_t>(41000 + i);
                if (auto session = server.CreateSession(
                        udp::endpoint(make_address("127.0.0.1"), port))) {
                    created.push_back(session);
                }
            }
        });
        std::thread closer([&]() { server.Close("racing close"); });
        creator.join();
        closer.join();

        // The creator may reopen the server after the close; either way every
        // open session must be reachable through the registry
        if (!server.is_active()) {
            REQUIRE(server.SessionCount() == 0);
        }
        for (const auto &session : created) {
            if (session->is_open()) {
                REQUIRE(server.is_active());
                REQUIRE(server.GetSession(session->key()) == session);
            }
        }

        server.Stop();
        for (const auto &session : created) {
            REQUIRE_FALSE(session->is_open());
        }
    }
}

TEST_CASE("UdpServer: oversized datagrams grow the receive buffer up to the cap",
          "[network][udp]") {
    auto config = LoopbackConfig();
    config.buffer_size = 512;
    UdpServer server(config);
    REQUIRE(server.Open());
    REQUIRE(server.receive_buffer_size() == 512);

    server.InjectReceiveErrorForTest(boost::asio::error::message_size);
    REQUIRE(server.receive_buffer_size() == 1024);
    server.InjectReceiveErrorForTest(boost::asio::error::message_size);
    REQUIRE(server.receive_buffer_size() == 2048);

    // Doubling stops at the cap
    for (int i = 0; i < 16; ++i) {
        server.InjectReceiveErrorForTest(boost::asio::error::message_size);
    }
    REQUIRE(server.receive_buffer_size() == UdpServer::MAX_BUFFER_SIZE);
    server.InjectReceiveErrorForTest(boost::asio::error::message_size);
    REQUIRE(server.receive_buffer_size() == UdpServer::MAX_BUFFER_SIZE);

    // Other errors leave the buffer alone and never close the server
    server.InjectReceiveErrorForTest(boost::asio::error::host_unreachable);
    REQUIRE(server.receive_buffer_size() == UdpServer::MAX_BUFFER_SIZE);
    REQUIRE(server.is_active());

    // The receive cycle keeps running
    std::atomic<int> received{0};
    server.set_receive_callback([&](const UdpSessionPtr &, const Packet &packet) {
        if (packet.ToStr() == "still here") received++;
    });
    RawPeer peer;
    peer.SendTo("still here", server.local_endpoint());
    REQUIRE(WaitFor([&] { return received.load() == 1; }));

    server.Stop();
}

TEST_CASE("ClassifyReceiveError", "[network][udp]") {
    namespace error = boost::asio::error;

    REQUIRE(ClassifyReceiveError(error::message_size) == ReceiveErrorKind::MessageTooLarge);
    REQUIRE(ClassifyReceiveError(error::connection_reset) == ReceiveErrorKind::PeerReset);
    REQUIRE(ClassifyReceiveError(error::connection_refused) == ReceiveErrorKind::PeerReset);
    REQUIRE(ClassifyReceiveError(error::connection_aborted) == ReceiveErrorKind::PeerAborted);
    REQUIRE(ClassifyReceiveError(error::operation_aborted) == ReceiveErrorKind::Aborted);
    REQUIRE(ClassifyReceiveError(error::bad_descriptor) == ReceiveErrorKind::Aborted);
    REQUIRE(ClassifyReceiveError(error::host_unreachable) == ReceiveErrorKind::Other);

    REQUIRE(std::string(ReceiveErrorKindName(ReceiveErrorKind::PeerReset)) == "peer reset");
}
