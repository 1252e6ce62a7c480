// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_REPLY_HPP_
#define D4SERVE_REPLY_HPP_

#include <stdint.h>
#include <type_traits>
#include <vector>
#include <boost/system/error_code.hpp>
#include "message.hpp"

namespace d4 {

enum class reply_errc {
    missing_your_address = 1,
    unexpected_your_address,
    missing_server_id,
    missing_lease_time,
    unexpected_lease_time,
    too_large,
    wrong_message_type,
};

const boost::system::error_category &reply_category() noexcept;

inline boost::system::error_code make_error_code(reply_errc e) noexcept
{
    return boost::system::error_code(static_cast<int>(e), reply_category());
}

// A server reply to one client message.  The packet starts out as the
// request's header echoed back (xid, flags, giaddr, chaddr, client id) with
// the reply's message type set; the handler fills in the rest.
class Reply
{
public:
    virtual ~Reply() {}

    // Checks the reply against what the protocol requires of it given the
    // request it answers.
    [[nodiscard]] virtual boost::system::error_code validate() const = 0;
    [[nodiscard]] virtual boost::system::error_code to_bytes(std::vector<uint8_t> &out) const;

    const Message &request() const { return request_; }
    Packet &packet() { return packet_; }
    const Packet &packet() const { return packet_; }

    void set_your_address(const boost::asio::ip::address_v4 &a) { packet_.set_yiaddr(a); }
    void set_server_id(const boost::asio::ip::address_v4 &a) { packet_.set_option_address(DCODE_SERVER_ID, a); }
    void set_lease_time(uint32_t secs) { packet_.set_option_u32(DCODE_LEASET, secs); }
protected:
    Reply(Message request, MessageType type);

    // packet() allows set_message_type(); the type must still be the one
    // the constructor set.
    boost::system::error_code check_message_type() const;
    boost::system::error_code check_server_id() const;
private:
    Message request_;
    MessageType type_;
    Packet packet_;
};

class Offer final : public Reply
{
public:
    explicit Offer(const Discover &d) : Reply(d, MessageType::Offer) {}
    [[nodiscard]] boost::system::error_code validate() const override;
};

class Ack final : public Reply
{
public:
    explicit Ack(const Request &r) : Reply(r, MessageType::Ack) {}
    // RFC 2131 4.3.5: ciaddr is echoed and no lease is granted.
    explicit Ack(const Inform &i);
    [[nodiscard]] boost::system::error_code validate() const override;
};

class Nak final : public Reply
{
public:
    explicit Nak(const Request &r) : Reply(r, MessageType::Nak) {}
    [[nodiscard]] boost::system::error_code validate() const override;
};

}

namespace boost::system {
template <> struct is_error_code_enum<d4::reply_errc> : std::true_type {};
}

#endif
