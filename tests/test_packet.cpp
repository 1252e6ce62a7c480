#include <string.h>
#include <gtest/gtest.h>
#include "packet.hpp"
#include "test_util.hpp"

using d4::Packet;
using d4::MessageType;

namespace {

// Hand-built DISCOVER: fixed header, cookie, then the given option bytes.
std::vector<uint8_t> raw_packet(const std::vector<uint8_t> &opts)
{
    std::vector<uint8_t> b(240, 0);
    b[0] = 1;    // BOOTREQUEST
    b[1] = 1;
    b[2] = 6;
    b[4] = 0xde; b[5] = 0xad; b[6] = 0xbe; b[7] = 0xef;
    b[10] = 0x80; // broadcast
    b[12] = 10; b[13] = 0; b[14] = 0; b[15] = 5; // ciaddr
    b[28] = 0xaa; b[29] = 0xbb; b[30] = 0xcc; b[31] = 0xdd; b[32] = 0xee; b[33] = 0xff;
    b[236] = 0x63; b[237] = 0x82; b[238] = 0x53; b[239] = 0x63;
    b.insert(b.end(), opts.begin(), opts.end());
    return b;
}

}

TEST(Packet, ParsesFixedHeaderAndOptions)
{
    auto b = raw_packet({ 53, 1, 1, 0, 0, 50, 4, 192, 168, 1, 20, 255 });
    auto p = Packet::from_bytes(b.data(), b.size());
    ASSERT_TRUE(p);
    EXPECT_EQ(d4::OpCode::BootRequest, p->op());
    EXPECT_EQ(0xdeadbeefu, p->xid());
    EXPECT_TRUE(p->broadcast());
    EXPECT_EQ(0x80, p->flags()[0]);
    EXPECT_EQ("10.0.0.5", p->ciaddr().to_string());
    EXPECT_TRUE(p->yiaddr().is_unspecified());
    EXPECT_EQ((std::vector<uint8_t>{ 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff }), p->chaddr());
    EXPECT_EQ(MessageType::Discover, p->message_type());
    auto req = p->option_address(d4::DCODE_REQIP);
    ASSERT_TRUE(req);
    EXPECT_EQ("192.168.1.20", req->to_string());
}

TEST(Packet, RejectsShortDatagram)
{
    auto b = raw_packet({ 53, 1, 1, 255 });
    EXPECT_FALSE(Packet::from_bytes(b.data(), 239));
    EXPECT_FALSE(Packet::from_bytes(b.data(), 0));
    EXPECT_FALSE(Packet::from_bytes(nullptr, 300));
}

TEST(Packet, RejectsBadCookie)
{
    auto b = raw_packet({ 53, 1, 1, 255 });
    b[239] = 0x64;
    EXPECT_FALSE(Packet::from_bytes(b.data(), b.size()));
}

TEST(Packet, RejectsOversizedHardwareLength)
{
    auto b = raw_packet({ 53, 1, 1, 255 });
    b[2] = 17;
    EXPECT_FALSE(Packet::from_bytes(b.data(), b.size()));
}

TEST(Packet, RejectsTruncatedOption)
{
    auto b = raw_packet({ 53, 1, 1, 12, 10, 'h', 'o', 's', 't' });
    EXPECT_FALSE(Packet::from_bytes(b.data(), b.size()));
    auto c = raw_packet({ 53, 1, 1, 12 });
    EXPECT_FALSE(Packet::from_bytes(c.data(), c.size()));
}

TEST(Packet, ToleratesMissingEnd)
{
    auto b = raw_packet({ 53, 1, 3 });
    auto p = Packet::from_bytes(b.data(), b.size());
    ASSERT_TRUE(p);
    EXPECT_EQ(MessageType::Request, p->message_type());
}

TEST(Packet, MissingOrMalformedMessageTypeIsNone)
{
    auto b = raw_packet({ 255 });
    auto p = Packet::from_bytes(b.data(), b.size());
    ASSERT_TRUE(p);
    EXPECT_EQ(MessageType::None, p->message_type());

    auto c = raw_packet({ 53, 2, 1, 1, 255 });
    auto q = Packet::from_bytes(c.data(), c.size());
    ASSERT_TRUE(q);
    EXPECT_EQ(MessageType::None, q->message_type());
}

TEST(Packet, ConcatenatesRepeatedOptions)
{
    auto b = raw_packet({ 53, 1, 1, 12, 2, 'a', 'b', 12, 2, 'c', 'd', 255 });
    auto p = Packet::from_bytes(b.data(), b.size());
    ASSERT_TRUE(p);
    auto h = p->option(d4::DCODE_HOSTNAME);
    ASSERT_TRUE(h);
    EXPECT_EQ(std::string("abcd"), std::string(h->begin(), h->end()));
}

TEST(Packet, HonorsOptionOverload)
{
    auto b = raw_packet({ 53, 1, 1, 52, 1, 3, 255 });
    // file (offset 108) carries a hostname, sname (offset 44) a lease time.
    const uint8_t file_opts[] = { 12, 3, 'p', 'c', '1', 255 };
    const uint8_t sname_opts[] = { 51, 4, 0, 0, 0x0e, 0x10, 255 };
    memcpy(&b[108], file_opts, sizeof file_opts);
    memcpy(&b[44], sname_opts, sizeof sname_opts);
    auto p = Packet::from_bytes(b.data(), b.size());
    ASSERT_TRUE(p);
    auto h = p->option(d4::DCODE_HOSTNAME);
    ASSERT_TRUE(h);
    EXPECT_EQ(std::string("pc1"), std::string(h->begin(), h->end()));
    EXPECT_EQ(3600u, p->option_u32(d4::DCODE_LEASET).value_or(0));
    EXPECT_TRUE(p->sname().empty());
    EXPECT_TRUE(p->file().empty());
    EXPECT_FALSE(p->has_option(d4::DCODE_OVERLOAD));
}

TEST(Packet, SerializesWithMessageTypeFirstAndMinimumSize)
{
    auto p = d4test::make_request_packet(MessageType::Inform, 42);
    p.set_option_u32(d4::DCODE_LEASET, 60);
    p.set_option(d4::DCODE_HOSTNAME, { 'x' });
    auto b = p.to_bytes();
    ASSERT_EQ(300u, b.size());
    EXPECT_EQ(53, b[240]);
    EXPECT_EQ(1, b[241]);
    EXPECT_EQ(8, b[242]);
    EXPECT_EQ(12, b[243]);  // ascending after the message type
    EXPECT_EQ(51, b[246]);
    EXPECT_EQ(255, b[252]);

    auto q = Packet::from_bytes(b.data(), b.size());
    ASSERT_TRUE(q);
    EXPECT_EQ(42u, q->xid());
    EXPECT_EQ(MessageType::Inform, q->message_type());
    EXPECT_EQ(60u, q->option_u32(d4::DCODE_LEASET).value_or(0));
}

TEST(Packet, SplitsLongOptionValues)
{
    auto p = d4test::make_request_packet(MessageType::Discover);
    p.set_option(d4::DCODE_VENDOR, std::vector<uint8_t>(300, 'v'));
    auto b = p.to_bytes();
    // msgtype (3) + 255-byte instance (257) + 45-byte instance (47) + END
    EXPECT_EQ(240u + 3 + 257 + 47 + 1, b.size());
    auto q = Packet::from_bytes(b.data(), b.size());
    ASSERT_TRUE(q);
    ASSERT_TRUE(q->option(d4::DCODE_VENDOR));
    EXPECT_EQ(300u, q->option(d4::DCODE_VENDOR)->size());
}

TEST(Packet, BroadcastFlagSetter)
{
    Packet p(d4::OpCode::BootRequest);
    EXPECT_FALSE(p.broadcast());
    p.set_broadcast(true);
    EXPECT_TRUE(p.broadcast());
    EXPECT_EQ(0x80, p.flags()[0]);
    p.set_broadcast(false);
    EXPECT_FALSE(p.broadcast());
}
