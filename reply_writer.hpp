// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_REPLY_WRITER_HPP_
#define D4SERVE_REPLY_WRITER_HPP_

#include <memory>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>
#include "packet_conn.hpp"
#include "reply.hpp"

namespace d4 {

class ReplyWriter
{
public:
    virtual ~ReplyWriter() {}
    [[nodiscard]] virtual boost::system::error_code write_reply(const Reply &reply) const = 0;
};

// Sends replies to the client that sent one particular request, out of the
// interface the request came in on.  Holds no mutable state, so any number
// of threads may share one instance.
class UdpReplyWriter final : public ReplyWriter
{
public:
    UdpReplyWriter(std::shared_ptr<PacketWriter> pw,
                   const boost::asio::ip::udp::endpoint &client, int ifindex)
        : pw_(std::move(pw)), client_(client), ifindex_(ifindex) {}

    [[nodiscard]] boost::system::error_code write_reply(const Reply &reply) const override;

    const std::shared_ptr<PacketWriter> &packet_writer() const { return pw_; }
    const boost::asio::ip::udp::endpoint &client() const { return client_; }
    int ifindex() const { return ifindex_; }
private:
    const std::shared_ptr<PacketWriter> pw_;
    const boost::asio::ip::udp::endpoint client_;
    const int ifindex_;
};

}

#endif
