// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_PACKET_HPP_
#define D4SERVE_PACKET_HPP_

#include <stddef.h>
#include <stdint.h>
#include <array>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/ip/address_v4.hpp>
#include "dhcp.h"
#include "options.hpp"

namespace d4 {

// One DHCPv4 packet: the fixed BOOTP header plus decoded options.
class Packet
{
public:
    // A fresh packet with ethernet hardware type and the magic cookie set.
    explicit Packet(OpCode op);

    // Returns nullopt for anything that is not a well-formed DHCPv4 packet.
    [[nodiscard]] static std::optional<Packet> from_bytes(const uint8_t *buf, size_t len);

    OpCode op() const { return static_cast<OpCode>(hdr_.op); }
    uint8_t htype() const { return hdr_.htype; }
    uint8_t hlen() const { return hdr_.hlen; }
    uint8_t hops() const { return hdr_.hops; }
    uint32_t xid() const;
    uint16_t secs() const;
    std::array<uint8_t, 2> flags() const;
    bool broadcast() const { return flags()[0] & 0x80; }
    boost::asio::ip::address_v4 ciaddr() const;
    boost::asio::ip::address_v4 yiaddr() const;
    boost::asio::ip::address_v4 siaddr() const;
    boost::asio::ip::address_v4 giaddr() const;
    std::vector<uint8_t> chaddr() const;
    std::string sname() const;
    std::string file() const;

    MessageType message_type() const;
    const option_map &options() const { return options_; }
    bool has_option(uint8_t code) const { return options_.count(code) != 0; }
    // nullptr if absent.
    const std::vector<uint8_t> *option(uint8_t code) const;
    std::optional<uint32_t> option_u32(uint8_t code) const;
    std::optional<boost::asio::ip::address_v4> option_address(uint8_t code) const;

    void set_htype(uint8_t v) { hdr_.htype = v; }
    void set_hops(uint8_t v) { hdr_.hops = v; }
    void set_xid(uint32_t v);
    void set_secs(uint16_t v);
    void set_flags(const std::array<uint8_t, 2> &v);
    void set_broadcast(bool v);
    void set_ciaddr(const boost::asio::ip::address_v4 &a);
    void set_yiaddr(const boost::asio::ip::address_v4 &a);
    void set_siaddr(const boost::asio::ip::address_v4 &a);
    void set_giaddr(const boost::asio::ip::address_v4 &a);
    // Also sets hlen; at most 16 bytes are kept.
    void set_chaddr(const uint8_t *hwaddr, size_t len);

    void set_message_type(MessageType t);
    void set_option(uint8_t code, std::vector<uint8_t> value);
    void set_option_u32(uint8_t code, uint32_t v);
    void set_option_address(uint8_t code, const boost::asio::ip::address_v4 &a);
    void del_option(uint8_t code) { options_.erase(code); }

    std::vector<uint8_t> to_bytes() const;
private:
    Packet() {}

    dhcp_header hdr_;
    option_map options_;
};

}

#endif
