#include <atomic>
#include <thread>
#include <gtest/gtest.h>
#include "reply_writer.hpp"
#include "test_util.hpp"

using namespace d4;
using d4test::FakeConn;
using d4test::make_address_v4;
using d4test::udp;

namespace {

const udp::endpoint bcast68(make_address_v4("255.255.255.255"), 68);

std::shared_ptr<const Packet> request_packet(MessageType t, bool broadcast)
{
    auto p = d4test::make_request_packet(t);
    p.set_broadcast(broadcast);
    return std::make_shared<Packet>(std::move(p));
}

Ack valid_ack(const Request &r)
{
    Ack a(r);
    a.set_your_address(make_address_v4("10.0.0.5"));
    a.set_server_id(make_address_v4("10.0.0.1"));
    a.set_lease_time(3600);
    return a;
}

Nak valid_nak(const Request &r)
{
    Nak n(r);
    n.set_server_id(make_address_v4("10.0.0.1"));
    return n;
}

class CountingWriter final : public ReplyWriter
{
public:
    boost::system::error_code write_reply(const Reply &) const override
    {
        ++writes;
        return {};
    }
    mutable std::atomic<int> writes{0};
};

}

TEST(ReplyWriter, UnspecifiedClientAddressBroadcasts)
{
    auto conn = std::make_shared<FakeConn>();
    for (bool flag: { false, true }) {
        auto rw = std::make_shared<UdpReplyWriter>(conn, udp::endpoint(make_address_v4("0.0.0.0"), 68), 3);
        Request r(request_packet(MessageType::Request, flag), 3, rw);
        EXPECT_FALSE(r.write_reply(valid_ack(r)));
    }
    auto sent = conn->sent();
    ASSERT_EQ(2u, sent.size());
    for (const auto &s: sent) {
        EXPECT_EQ(bcast68, s.dest);
        EXPECT_EQ(3, s.ifindex);
    }
}

TEST(ReplyWriter, BroadcastFlagOverridesUnicastAddress)
{
    auto conn = std::make_shared<FakeConn>();
    auto rw = std::make_shared<UdpReplyWriter>(conn, udp::endpoint(make_address_v4("10.0.0.5"), 68), 7);
    Request r(request_packet(MessageType::Request, true), 7, rw);
    EXPECT_FALSE(r.write_reply(valid_nak(r)));
    auto sent = conn->sent();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ(bcast68, sent[0].dest);
    EXPECT_EQ(7, sent[0].ifindex);
}

TEST(ReplyWriter, UnicastToKnownClient)
{
    auto conn = std::make_shared<FakeConn>();
    const udp::endpoint client(make_address_v4("10.0.0.5"), 1068);
    auto rw = std::make_shared<UdpReplyWriter>(conn, client, 2);
    Request r(request_packet(MessageType::Request, false), 2, rw);
    EXPECT_FALSE(r.write_reply(valid_ack(r)));
    auto sent = conn->sent();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ(client, sent[0].dest);
    EXPECT_EQ(2, sent[0].ifindex);

    auto p = Packet::from_bytes(sent[0].data.data(), sent[0].data.size());
    ASSERT_TRUE(p);
    EXPECT_EQ(OpCode::BootReply, p->op());
    EXPECT_EQ(MessageType::Ack, p->message_type());
    EXPECT_EQ("10.0.0.5", p->yiaddr().to_string());
}

TEST(ReplyWriter, InvalidReplyIsNeverSent)
{
    auto conn = std::make_shared<FakeConn>();
    auto rw = std::make_shared<UdpReplyWriter>(conn, udp::endpoint(make_address_v4("10.0.0.5"), 68), 2);
    Request r(request_packet(MessageType::Request, false), 2, rw);
    Ack a(r); // no yiaddr, server id or lease time
    EXPECT_EQ(make_error_code(reply_errc::missing_your_address), r.write_reply(a));
    EXPECT_TRUE(conn->sent().empty());
}

TEST(ReplyWriter, SendErrorIsReturned)
{
    auto conn = std::make_shared<FakeConn>();
    conn->fail_writes(boost::asio::error::network_unreachable);
    auto rw = std::make_shared<UdpReplyWriter>(conn, udp::endpoint(make_address_v4("10.0.0.5"), 68), 2);
    Request r(request_packet(MessageType::Request, false), 2, rw);
    EXPECT_EQ(boost::system::error_code(boost::asio::error::network_unreachable),
              r.write_reply(valid_nak(r)));
}

TEST(ReplyWriter, RequestDispatchesToItsWriter)
{
    auto rw = std::make_shared<CountingWriter>();
    Request r(request_packet(MessageType::Request, false), 1, rw);
    Ack a(r);
    Nak n(r);
    for (const Reply *rep: { static_cast<const Reply *>(&a), static_cast<const Reply *>(&n) }) {
        auto before = rw->writes.load();
        EXPECT_FALSE(r.write_reply(*rep));
        EXPECT_EQ(before + 1, rw->writes.load());
    }
}

TEST(ReplyWriter, MessageWithoutWriterFails)
{
    Request r(request_packet(MessageType::Request, false), 1, nullptr);
    EXPECT_TRUE(r.write_reply(valid_nak(r)));
}

TEST(ReplyWriter, ConcurrentRepliesFromManyThreads)
{
    auto conn = std::make_shared<FakeConn>();
    auto rw = std::make_shared<UdpReplyWriter>(conn, udp::endpoint(make_address_v4("10.0.0.5"), 68), 4);
    const Request r(request_packet(MessageType::Request, false), 4, rw);
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&r, &failures]() {
            // Each thread works from its own copy, sharing the writer.
            Request mine = r;
            for (int j = 0; j < 50; ++j) {
                if (mine.write_reply(valid_ack(mine))) ++failures;
            }
        });
    }
    for (auto &t: threads) t.join();
    EXPECT_EQ(0, failures.load());
    auto sent = conn->sent();
    ASSERT_EQ(400u, sent.size());
    for (const auto &s: sent)
        EXPECT_EQ(udp::endpoint(make_address_v4("10.0.0.5"), 68), s.dest);
}
