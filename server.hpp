// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_SERVER_HPP_
#define D4SERVE_SERVER_HPP_

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>
#include "message.hpp"
#include "packet_conn.hpp"

namespace d4 {

// Receives every request the server accepts.  The serve loop calls it
// inline, so it should return quickly; slow work belongs on other threads,
// which may keep the Message and reply through it at any time.
class Handler
{
public:
    virtual ~Handler() {}
    virtual void serve_dhcp(Message msg) = 0;
};

class Server
{
public:
    Server(std::shared_ptr<PacketConn> conn, Handler &handler);
    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // Reads and dispatches until the connection fails or stop() is called.
    // Returns the read error, or nothing after stop().
    [[nodiscard]] boost::system::error_code serve();
    // May be called from any thread, including a signal-handling one.
    void stop();
private:
    void dispatch(const uint8_t *buf, size_t len,
                  const boost::asio::ip::udp::endpoint &source, int ifindex);

    std::shared_ptr<PacketConn> conn_;
    Handler &handler_;
    std::vector<uint8_t> buf_;
    std::atomic<bool> stopping_;
};

[[nodiscard]] boost::system::error_code serve(std::shared_ptr<PacketConn> conn, Handler &handler);

// 'address' is "host:port" or ":port"; empty means all interfaces on port
// 67.  A non-empty 'ifname' restricts the socket to that interface.
[[nodiscard]] std::shared_ptr<Ip4PacketConn> listen(boost::asio::io_context &io_context,
                                                    const std::string &address,
                                                    const std::string &ifname,
                                                    boost::system::error_code &ec);

// The socket is closed on return, so handler work that still holds
// messages must be finished by then.
[[nodiscard]] boost::system::error_code listen_and_serve(const std::string &address, Handler &handler);

}

#endif
