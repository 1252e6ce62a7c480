// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <vector>
#include <boost/asio/error.hpp>
#include "reply_writer.hpp"

namespace ba = boost::asio;

namespace d4 {

boost::system::error_code UdpReplyWriter::write_reply(const Reply &reply) const
{
    if (auto ec = reply.validate()) return ec;

    std::vector<uint8_t> bytes;
    if (auto ec = reply.to_bytes(bytes)) return ec;

    // A client without an address can't receive unicast, and a client may
    // also ask for broadcast explicitly.  Either way the port is kept.
    auto dest = client_;
    const bool bcast = message_packet(reply.request()).flags()[0] & 0x80;
    if (dest.address().is_unspecified() || bcast)
        dest.address(ba::ip::address_v4::broadcast());

    if (!pw_) return ba::error::bad_descriptor;
    boost::system::error_code ec;
    pw_->write_to(ba::buffer(bytes), dest, ifindex_, ec);
    return ec;
}

}
