// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <string.h>
#include <arpa/inet.h>
#include "packet.hpp"

namespace ba = boost::asio;

namespace d4 {

static inline void encode32be(uint32_t v, uint8_t *d)
{
    d[0] = v >> 24;
    d[1] = (v >> 16) & 0xff;
    d[2] = (v >> 8) & 0xff;
    d[3] = v & 0xff;
}

static inline uint32_t decode32be(const uint8_t *s)
{
    return (static_cast<uint32_t>(s[0]) << 24)
         | (static_cast<uint32_t>(s[1]) << 16)
         | (static_cast<uint32_t>(s[2]) << 8)
         | static_cast<uint32_t>(s[3]);
}

// Header address fields are in network byte order.
static inline ba::ip::address_v4 nbo_to_addr(uint32_t v)
{
    return ba::ip::address_v4(ntohl(v));
}

static std::string field_str(const uint8_t *f, size_t len)
{
    const auto end = static_cast<const uint8_t *>(memchr(f, 0, len));
    return std::string(reinterpret_cast<const char *>(f), end ? static_cast<size_t>(end - f) : len);
}

Packet::Packet(OpCode op)
{
    memset(&hdr_, 0, sizeof hdr_);
    hdr_.op = static_cast<uint8_t>(op);
    hdr_.htype = 1;
    hdr_.hlen = 6;
    hdr_.cookie = htonl(DHCP_MAGIC);
}

std::optional<Packet> Packet::from_bytes(const uint8_t *buf, size_t len)
{
    if (!buf || len < sizeof(dhcp_header))
        return std::nullopt;
    Packet p;
    memcpy(&p.hdr_, buf, sizeof p.hdr_);
    if (ntohl(p.hdr_.cookie) != DHCP_MAGIC)
        return std::nullopt;
    if (p.hdr_.hlen > sizeof p.hdr_.chaddr)
        return std::nullopt;

    uint8_t overload = 0;
    if (!parse_options(buf + sizeof p.hdr_, len - sizeof p.hdr_, p.options_, &overload))
        return std::nullopt;
    // RFC 2131 4.1: file is parsed before sname.
    if (overload == OVERLOAD_FILE || overload == OVERLOAD_BOTH) {
        if (!parse_options(p.hdr_.file, sizeof p.hdr_.file, p.options_, nullptr))
            return std::nullopt;
        memset(p.hdr_.file, 0, sizeof p.hdr_.file);
    }
    if (overload == OVERLOAD_SNAME || overload == OVERLOAD_BOTH) {
        if (!parse_options(p.hdr_.sname, sizeof p.hdr_.sname, p.options_, nullptr))
            return std::nullopt;
        memset(p.hdr_.sname, 0, sizeof p.hdr_.sname);
    }
    return p;
}

uint32_t Packet::xid() const { return ntohl(hdr_.xid); }
uint16_t Packet::secs() const { return ntohs(hdr_.secs); }

std::array<uint8_t, 2> Packet::flags() const
{
    std::array<uint8_t, 2> r;
    memcpy(r.data(), &hdr_.flags, r.size());
    return r;
}

ba::ip::address_v4 Packet::ciaddr() const { return nbo_to_addr(hdr_.ciaddr); }
ba::ip::address_v4 Packet::yiaddr() const { return nbo_to_addr(hdr_.yiaddr); }
ba::ip::address_v4 Packet::siaddr() const { return nbo_to_addr(hdr_.siaddr); }
ba::ip::address_v4 Packet::giaddr() const { return nbo_to_addr(hdr_.giaddr); }

std::vector<uint8_t> Packet::chaddr() const
{
    return std::vector<uint8_t>(hdr_.chaddr, hdr_.chaddr + hdr_.hlen);
}

std::string Packet::sname() const { return field_str(hdr_.sname, sizeof hdr_.sname); }
std::string Packet::file() const { return field_str(hdr_.file, sizeof hdr_.file); }

MessageType Packet::message_type() const
{
    auto v = option(DCODE_MSGTYPE);
    if (!v || v->size() != 1) return MessageType::None;
    return static_cast<MessageType>((*v)[0]);
}

const std::vector<uint8_t> *Packet::option(uint8_t code) const
{
    auto i = options_.find(code);
    return i != options_.end() ? &i->second : nullptr;
}

std::optional<uint32_t> Packet::option_u32(uint8_t code) const
{
    auto v = option(code);
    if (!v || v->size() != 4) return std::nullopt;
    return decode32be(v->data());
}

std::optional<ba::ip::address_v4> Packet::option_address(uint8_t code) const
{
    auto v = option_u32(code);
    if (!v) return std::nullopt;
    return ba::ip::address_v4(*v);
}

void Packet::set_xid(uint32_t v) { hdr_.xid = htonl(v); }
void Packet::set_secs(uint16_t v) { hdr_.secs = htons(v); }

void Packet::set_flags(const std::array<uint8_t, 2> &v)
{
    memcpy(&hdr_.flags, v.data(), v.size());
}

void Packet::set_broadcast(bool v)
{
    auto f = flags();
    if (v) f[0] |= 0x80;
    else f[0] &= 0x7f;
    set_flags(f);
}

void Packet::set_ciaddr(const ba::ip::address_v4 &a) { hdr_.ciaddr = htonl(a.to_uint()); }
void Packet::set_yiaddr(const ba::ip::address_v4 &a) { hdr_.yiaddr = htonl(a.to_uint()); }
void Packet::set_siaddr(const ba::ip::address_v4 &a) { hdr_.siaddr = htonl(a.to_uint()); }
void Packet::set_giaddr(const ba::ip::address_v4 &a) { hdr_.giaddr = htonl(a.to_uint()); }

void Packet::set_chaddr(const uint8_t *hwaddr, size_t len)
{
    if (len > sizeof hdr_.chaddr) len = sizeof hdr_.chaddr;
    memset(hdr_.chaddr, 0, sizeof hdr_.chaddr);
    if (len) memcpy(hdr_.chaddr, hwaddr, len);
    hdr_.hlen = static_cast<uint8_t>(len);
}

void Packet::set_message_type(MessageType t)
{
    options_[DCODE_MSGTYPE] = { static_cast<uint8_t>(t) };
}

void Packet::set_option(uint8_t code, std::vector<uint8_t> value)
{
    options_[code] = std::move(value);
}

void Packet::set_option_u32(uint8_t code, uint32_t v)
{
    std::vector<uint8_t> b(4);
    encode32be(v, b.data());
    options_[code] = std::move(b);
}

void Packet::set_option_address(uint8_t code, const ba::ip::address_v4 &a)
{
    set_option_u32(code, a.to_uint());
}

std::vector<uint8_t> Packet::to_bytes() const
{
    std::vector<uint8_t> out(sizeof hdr_);
    memcpy(out.data(), &hdr_, sizeof hdr_);
    encode_options(options_, out);
    if (out.size() < DHCP_MIN_PACKET_SIZE)
        out.resize(DHCP_MIN_PACKET_SIZE, 0);
    return out;
}

}
