// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_PACKET_CONN_HPP_
#define D4SERVE_PACKET_CONN_HPP_

#include <stddef.h>
#include <atomic>
#include <memory>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

namespace d4 {

// recvfrom() that also says which interface the datagram arrived on.
class PacketReader
{
public:
    virtual ~PacketReader() {}
    // On error, ifindex is set to -1.
    virtual size_t read_from(boost::asio::mutable_buffer buf, boost::asio::ip::udp::endpoint &source,
                             int &ifindex, boost::system::error_code &ec) = 0;
};

// sendto() that leaves through a given interface rather than whichever one
// the routing table picks.  Implementations must allow concurrent callers.
class PacketWriter
{
public:
    virtual ~PacketWriter() {}
    virtual size_t write_to(boost::asio::const_buffer buf, const boost::asio::ip::udp::endpoint &dest,
                            int ifindex, boost::system::error_code &ec) = 0;
};

class PacketConn : public PacketReader, public PacketWriter
{
public:
    virtual void close(boost::system::error_code &ec) = 0;
    // Makes a blocked or later read_from() fail with error::shut_down.
    virtual void shutdown(boost::system::error_code &ec) = 0;
    virtual boost::asio::ip::udp::endpoint local_endpoint(boost::system::error_code &ec) const = 0;
};

// PacketConn over an IPv4 UDP socket, using IP_PKTINFO control messages to
// carry the interface index in both directions.
class Ip4PacketConn final : public PacketConn
{
public:
    Ip4PacketConn(const Ip4PacketConn &) = delete;
    Ip4PacketConn &operator=(const Ip4PacketConn &) = delete;

    // Fails if the socket is not an open IPv4 socket or IP_PKTINFO cannot be
    // enabled on it.
    [[nodiscard]] static std::shared_ptr<Ip4PacketConn> create(boost::asio::ip::udp::socket socket,
                                                               boost::system::error_code &ec);

    size_t read_from(boost::asio::mutable_buffer buf, boost::asio::ip::udp::endpoint &source,
                     int &ifindex, boost::system::error_code &ec) override;
    size_t write_to(boost::asio::const_buffer buf, const boost::asio::ip::udp::endpoint &dest,
                    int ifindex, boost::system::error_code &ec) override;
    // Must not race with read_from() or write_to().
    void close(boost::system::error_code &ec) override;
    void shutdown(boost::system::error_code &ec) override;
    boost::asio::ip::udp::endpoint local_endpoint(boost::system::error_code &ec) const override;
private:
    explicit Ip4PacketConn(boost::asio::ip::udp::socket socket);

    boost::asio::ip::udp::socket socket_;
    std::atomic<bool> shut_down_;
};

}

#endif
