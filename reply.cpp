// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <string>
#include "reply.hpp"

namespace d4 {

namespace {

class reply_category_impl final : public boost::system::error_category
{
public:
    const char *name() const noexcept override { return "d4.reply"; }
    std::string message(int ev) const override
    {
        switch (static_cast<reply_errc>(ev)) {
        case reply_errc::missing_your_address: return "reply has no client address (yiaddr)";
        case reply_errc::unexpected_your_address: return "reply must not carry a client address (yiaddr)";
        case reply_errc::missing_server_id: return "reply has no server identifier option";
        case reply_errc::missing_lease_time: return "reply has no lease time option";
        case reply_errc::unexpected_lease_time: return "reply must not carry a lease time option";
        case reply_errc::too_large: return "encoded reply exceeds the maximum UDP payload";
        case reply_errc::wrong_message_type: return "reply message type was changed";
        }
        return "unknown reply error";
    }
};

}

const boost::system::error_category &reply_category() noexcept
{
    static const reply_category_impl cat;
    return cat;
}

Reply::Reply(Message request, MessageType type)
    : request_(std::move(request)), type_(type), packet_(OpCode::BootReply)
{
    const auto &req = message_packet(request_);
    packet_.set_htype(req.htype());
    const auto ch = req.chaddr();
    packet_.set_chaddr(ch.data(), ch.size());
    packet_.set_xid(req.xid());
    packet_.set_flags(req.flags());
    packet_.set_giaddr(req.giaddr());
    packet_.set_message_type(type);
    // RFC 6842
    if (auto cid = req.option(DCODE_CLIENT_ID))
        packet_.set_option(DCODE_CLIENT_ID, *cid);
}

boost::system::error_code Reply::to_bytes(std::vector<uint8_t> &out) const
{
    auto b = packet_.to_bytes();
    if (b.size() > DHCP_MAX_UDP_PAYLOAD)
        return reply_errc::too_large;
    out = std::move(b);
    return {};
}

boost::system::error_code Reply::check_message_type() const
{
    if (packet().message_type() != type_)
        return reply_errc::wrong_message_type;
    return {};
}

boost::system::error_code Reply::check_server_id() const
{
    if (!packet().option_address(DCODE_SERVER_ID))
        return reply_errc::missing_server_id;
    return {};
}

boost::system::error_code Offer::validate() const
{
    if (auto ec = check_message_type()) return ec;
    if (packet().yiaddr().is_unspecified())
        return reply_errc::missing_your_address;
    if (auto ec = check_server_id()) return ec;
    if (!packet().option_u32(DCODE_LEASET))
        return reply_errc::missing_lease_time;
    return {};
}

Ack::Ack(const Inform &i) : Reply(i, MessageType::Ack)
{
    packet().set_ciaddr(i.packet().ciaddr());
}

boost::system::error_code Ack::validate() const
{
    if (auto ec = check_message_type()) return ec;
    const bool to_inform = std::holds_alternative<Inform>(request());
    if (to_inform) {
        if (!packet().yiaddr().is_unspecified())
            return reply_errc::unexpected_your_address;
    } else if (packet().yiaddr().is_unspecified()) {
        return reply_errc::missing_your_address;
    }
    if (auto ec = check_server_id()) return ec;
    const bool has_lease = packet().has_option(DCODE_LEASET);
    if (to_inform && has_lease)
        return reply_errc::unexpected_lease_time;
    if (!to_inform && !packet().option_u32(DCODE_LEASET))
        return reply_errc::missing_lease_time;
    return {};
}

boost::system::error_code Nak::validate() const
{
    if (auto ec = check_message_type()) return ec;
    if (!packet().yiaddr().is_unspecified())
        return reply_errc::unexpected_your_address;
    if (auto ec = check_server_id()) return ec;
    if (packet().has_option(DCODE_LEASET))
        return reply_errc::unexpected_lease_time;
    return {};
}

}
