// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_MESSAGE_HPP_
#define D4SERVE_MESSAGE_HPP_

#include <memory>
#include <optional>
#include <variant>
#include <boost/system/error_code.hpp>
#include "packet.hpp"

namespace d4 {

class Reply;
class ReplyWriter;

// Common part of every client message: the parsed packet and the index of
// the interface it arrived on.  The packet is shared, never modified.
class MessageBase
{
public:
    const Packet &packet() const { return *packet_; }
    const std::shared_ptr<const Packet> &packet_ptr() const { return packet_; }
    int ifindex() const { return ifindex_; }
protected:
    MessageBase(std::shared_ptr<const Packet> packet, int ifindex)
        : packet_(std::move(packet)), ifindex_(ifindex) {}
private:
    std::shared_ptr<const Packet> packet_;
    int ifindex_;
};

// A message the server may answer.  Copies share one ReplyWriter, and
// write_reply() may be called from any number of threads.
class ReplyableMessage : public MessageBase
{
public:
    [[nodiscard]] boost::system::error_code write_reply(const Reply &reply) const;
    const std::shared_ptr<ReplyWriter> &reply_writer() const { return writer_; }
protected:
    ReplyableMessage(std::shared_ptr<const Packet> packet, int ifindex,
                     std::shared_ptr<ReplyWriter> writer)
        : MessageBase(std::move(packet), ifindex), writer_(std::move(writer)) {}
private:
    std::shared_ptr<ReplyWriter> writer_;
};

class Discover : public ReplyableMessage
{
public:
    Discover(std::shared_ptr<const Packet> packet, int ifindex, std::shared_ptr<ReplyWriter> writer)
        : ReplyableMessage(std::move(packet), ifindex, std::move(writer)) {}
};

class Request : public ReplyableMessage
{
public:
    Request(std::shared_ptr<const Packet> packet, int ifindex, std::shared_ptr<ReplyWriter> writer)
        : ReplyableMessage(std::move(packet), ifindex, std::move(writer)) {}
};

class Inform : public ReplyableMessage
{
public:
    Inform(std::shared_ptr<const Packet> packet, int ifindex, std::shared_ptr<ReplyWriter> writer)
        : ReplyableMessage(std::move(packet), ifindex, std::move(writer)) {}
};

// The protocol defines no server reply to these two.
class Decline : public MessageBase
{
public:
    Decline(std::shared_ptr<const Packet> packet, int ifindex)
        : MessageBase(std::move(packet), ifindex) {}
};

class Release : public MessageBase
{
public:
    Release(std::shared_ptr<const Packet> packet, int ifindex)
        : MessageBase(std::move(packet), ifindex) {}
};

using Message = std::variant<Discover, Request, Decline, Release, Inform>;

const MessageBase &message_base(const Message &msg);
inline const Packet &message_packet(const Message &msg) { return message_base(msg).packet(); }
inline int message_ifindex(const Message &msg) { return message_base(msg).ifindex(); }
inline MessageType message_type(const Message &msg) { return message_packet(msg).message_type(); }

const char *message_type_name(MessageType t);

// Wraps a client packet in the variant for its message type.  Returns
// nullopt for types a server does not accept.
[[nodiscard]] std::optional<Message> make_message(std::shared_ptr<const Packet> packet, int ifindex,
                                                  std::shared_ptr<ReplyWriter> writer);

}

#endif
