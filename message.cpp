// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <boost/asio/error.hpp>
#include "message.hpp"
#include "reply_writer.hpp"

namespace d4 {

boost::system::error_code ReplyableMessage::write_reply(const Reply &reply) const
{
    if (!writer_) return boost::asio::error::not_connected;
    return writer_->write_reply(reply);
}

const MessageBase &message_base(const Message &msg)
{
    return std::visit([](const auto &m) -> const MessageBase & { return m; }, msg);
}

const char *message_type_name(MessageType t)
{
    switch (t) {
    case MessageType::Discover: return "DISCOVER";
    case MessageType::Offer: return "OFFER";
    case MessageType::Request: return "REQUEST";
    case MessageType::Decline: return "DECLINE";
    case MessageType::Ack: return "ACK";
    case MessageType::Nak: return "NAK";
    case MessageType::Release: return "RELEASE";
    case MessageType::Inform: return "INFORM";
    case MessageType::None: break;
    }
    return "UNKNOWN";
}

std::optional<Message> make_message(std::shared_ptr<const Packet> packet, int ifindex,
                                    std::shared_ptr<ReplyWriter> writer)
{
    if (!packet) return std::nullopt;
    switch (packet->message_type()) {
    case MessageType::Discover: return Message{ Discover{ std::move(packet), ifindex, std::move(writer) } };
    case MessageType::Request:  return Message{ Request{ std::move(packet), ifindex, std::move(writer) } };
    case MessageType::Decline:  return Message{ Decline{ std::move(packet), ifindex } };
    case MessageType::Release:  return Message{ Release{ std::move(packet), ifindex } };
    case MessageType::Inform:   return Message{ Inform{ std::move(packet), ifindex, std::move(writer) } };
    // Server-to-client types and plain BOOTP are not ours to handle.
    case MessageType::None:
    case MessageType::Offer:
    case MessageType::Ack:
    case MessageType::Nak:
        break;
    }
    return std::nullopt;
}

}
