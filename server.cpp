// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <errno.h>
#include <string.h>
#include <net/if.h>
#include <sys/socket.h>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include "server.hpp"
#include "reply_writer.hpp"
#include "log.hpp"

namespace ba = boost::asio;
using ba::ip::udp;

namespace d4 {

// Largest possible UDP payload.
#define D4_RECV_BUFSIZE 65536

static std::string endpoint_str(const udp::endpoint &ep)
{
    return fmt::format("{}:{}", ep.address().to_string(), ep.port());
}

Server::Server(std::shared_ptr<PacketConn> conn, Handler &handler)
    : conn_(std::move(conn)), handler_(handler), buf_(D4_RECV_BUFSIZE), stopping_(false)
{}

boost::system::error_code Server::serve()
{
    if (!conn_) return ba::error::bad_descriptor;
    for (;;) {
        if (stopping_) return {};
        udp::endpoint source;
        int ifindex;
        boost::system::error_code ec;
        auto n = conn_->read_from(ba::buffer(buf_), source, ifindex, ec);
        if (ec) {
            if (stopping_) return {};
            return ec;
        }
        dispatch(buf_.data(), n, source, ifindex);
    }
}

void Server::stop()
{
    stopping_ = true;
    if (!conn_) return;
    boost::system::error_code ec;
    conn_->shutdown(ec);
    if (ec) log_line("dhcp4: Failed to shut down the listening socket: {}", ec.message());
}

void Server::dispatch(const uint8_t *buf, size_t len, const udp::endpoint &source, int ifindex)
{
    auto p = Packet::from_bytes(buf, len);
    if (!p) {
        log_debug("dhcp4: Discarding malformed {} byte datagram from {}", len, endpoint_str(source));
        return;
    }
    if (p->op() != OpCode::BootRequest) {
        log_debug("dhcp4: Discarding non-request (op {}) from {}",
                  static_cast<unsigned>(p->op()), endpoint_str(source));
        return;
    }
    std::shared_ptr<const Packet> packet = std::make_shared<Packet>(std::move(*p));
    auto rw = std::make_shared<UdpReplyWriter>(conn_, source, ifindex);
    auto msg = make_message(packet, ifindex, std::move(rw));
    if (!msg) {
        log_debug("dhcp4: Discarding message of type {} from {}",
                  static_cast<unsigned>(packet->message_type()), endpoint_str(source));
        return;
    }
    handler_.serve_dhcp(std::move(*msg));
}

boost::system::error_code serve(std::shared_ptr<PacketConn> conn, Handler &handler)
{
    Server s(std::move(conn), handler);
    return s.serve();
}

static bool resolve_bind_address(ba::io_context &io_context, const std::string &address,
                                 udp::endpoint &ep, boost::system::error_code &ec)
{
    const std::string a = address.empty() ? std::string(":67") : address;
    const auto colon = a.rfind(':');
    if (colon == std::string::npos) {
        log_line("dhcp4: Bind address '{}' lacks a port", a);
        ec = ba::error::invalid_argument;
        return false;
    }
    const auto host = a.substr(0, colon);
    const auto port = a.substr(colon + 1);
    udp::resolver resolver(io_context);
    auto results = resolver.resolve(udp::v4(), host, port, udp::resolver::passive, ec);
    if (ec) {
        log_line("dhcp4: Failed to resolve bind address '{}': {}", a, ec.message());
        return false;
    }
    if (results.empty()) {
        ec = ba::error::host_not_found;
        return false;
    }
    ep = results.begin()->endpoint();
    return true;
}

static bool bind_to_device(int fd, const std::string &ifname, boost::system::error_code &ec)
{
    struct ifreq ifr;
    memset(&ifr, 0, sizeof ifr);
    if (ifname.size() >= sizeof ifr.ifr_name) {
        log_line("dhcp4: Interface name '{}' is too long: {} >= {}",
                 ifname, ifname.size(), sizeof ifr.ifr_name);
        ec = ba::error::invalid_argument;
        return false;
    }
    memcpy(ifr.ifr_name, ifname.c_str(), ifname.size());
    if (setsockopt(fd, SOL_SOCKET, SO_BINDTODEVICE, &ifr, sizeof ifr) < 0) {
        ec.assign(errno, boost::system::system_category());
        log_line("dhcp4: Failed to bind socket to device {}: {}", ifname, ec.message());
        return false;
    }
    return true;
}

std::shared_ptr<Ip4PacketConn> listen(ba::io_context &io_context, const std::string &address,
                                      const std::string &ifname, boost::system::error_code &ec)
{
    udp::endpoint ep;
    if (!resolve_bind_address(io_context, address, ep, ec)) return nullptr;

    udp::socket sock(io_context);
    sock.open(udp::v4(), ec);
    if (ec) {
        log_line("dhcp4: Failed to create v4 UDP socket: {}", ec.message());
        return nullptr;
    }
    sock.set_option(udp::socket::reuse_address(true), ec);
    if (ec) {
        log_line("dhcp4: Failed to set reuse address flag: {}", ec.message());
        return nullptr;
    }
    sock.set_option(udp::socket::broadcast(true), ec);
    if (ec) {
        log_line("dhcp4: Failed to set broadcast flag: {}", ec.message());
        return nullptr;
    }
    if (!ifname.empty() && !bind_to_device(sock.native_handle(), ifname, ec))
        return nullptr;
    sock.bind(ep, ec);
    if (ec) {
        log_line("dhcp4: Failed to bind to {}: {}", endpoint_str(ep), ec.message());
        return nullptr;
    }

    auto conn = Ip4PacketConn::create(std::move(sock), ec);
    if (!conn) {
        log_line("dhcp4: Failed to enable interface control messages: {}", ec.message());
        return nullptr;
    }
    return conn;
}

boost::system::error_code listen_and_serve(const std::string &address, Handler &handler)
{
    ba::io_context io_context;
    boost::system::error_code ec;
    auto conn = listen(io_context, address, std::string(), ec);
    if (!conn) return ec;

    auto r = serve(conn, handler);
    boost::system::error_code cec;
    conn->close(cec);
    if (cec) log_line("dhcp4: Failed to close the listening socket: {}", cec.message());
    return r;
}

}
