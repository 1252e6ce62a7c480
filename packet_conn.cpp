// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <errno.h>
#include <string.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <boost/asio/detail/socket_option.hpp>
#include <boost/asio/error.hpp>
#include "packet_conn.hpp"

// The CMSG_* macros include c-style casts.
#ifdef __GNUC__
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

namespace ba = boost::asio;
using ba::ip::udp;

namespace d4 {

using pktinfo_option = ba::detail::socket_option::boolean<IPPROTO_IP, IP_PKTINFO>;

std::shared_ptr<Ip4PacketConn> Ip4PacketConn::create(udp::socket socket, boost::system::error_code &ec)
{
    if (!socket.is_open()) {
        ec = ba::error::bad_descriptor;
        return nullptr;
    }
    auto ep = socket.local_endpoint(ec);
    if (ec) return nullptr;
    if (ep.protocol() != udp::v4()) {
        ec = ba::error::address_family_not_supported;
        return nullptr;
    }
    socket.set_option(pktinfo_option(true), ec);
    if (ec) return nullptr;
    return std::shared_ptr<Ip4PacketConn>(new Ip4PacketConn(std::move(socket)));
}

Ip4PacketConn::Ip4PacketConn(udp::socket socket)
    : socket_(std::move(socket)), shut_down_(false)
{}

size_t Ip4PacketConn::read_from(ba::mutable_buffer buf, udp::endpoint &source,
                                int &ifindex, boost::system::error_code &ec)
{
    sockaddr_in sai;
    iovec iov;
    iov.iov_base = buf.data();
    iov.iov_len = buf.size();
    union {
        char cbuf[CMSG_SPACE(sizeof(in_pktinfo))];
        cmsghdr align;
    } control;
    msghdr msg;
    ssize_t r;
    for (;;) {
        memset(&sai, 0, sizeof sai);
        memset(&msg, 0, sizeof msg);
        msg.msg_name = &sai;
        msg.msg_namelen = sizeof sai;
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_control = control.cbuf;
        msg.msg_controllen = sizeof control.cbuf;
        r = recvmsg(socket_.native_handle(), &msg, 0);
        if (r < 0) {
            int err = errno;
            if (err == EINTR && !shut_down_) continue;
            ifindex = -1;
            ec.assign(err, boost::system::system_category());
            return 0;
        }
        break;
    }
    if (shut_down_) {
        ifindex = -1;
        ec = ba::error::shut_down;
        return 0;
    }

    source = udp::endpoint(ba::ip::address_v4(ntohl(sai.sin_addr.s_addr)), ntohs(sai.sin_port));
    // Zero lets the kernel choose, should the control message ever be absent.
    ifindex = 0;
    for (auto cm = CMSG_FIRSTHDR(&msg); cm; cm = CMSG_NXTHDR(&msg, cm)) {
        if (cm->cmsg_level == IPPROTO_IP && cm->cmsg_type == IP_PKTINFO) {
            in_pktinfo pi;
            memcpy(&pi, CMSG_DATA(cm), sizeof pi);
            ifindex = pi.ipi_ifindex;
            break;
        }
    }
    ec = boost::system::error_code();
    return static_cast<size_t>(r);
}

size_t Ip4PacketConn::write_to(ba::const_buffer buf, const udp::endpoint &dest,
                               int ifindex, boost::system::error_code &ec)
{
    if (!dest.address().is_v4()) {
        ec = ba::error::address_family_not_supported;
        return 0;
    }
    sockaddr_in sai;
    memset(&sai, 0, sizeof sai);
    sai.sin_family = AF_INET;
    sai.sin_port = htons(dest.port());
    sai.sin_addr.s_addr = htonl(dest.address().to_v4().to_uint());

    iovec iov;
    iov.iov_base = const_cast<void *>(buf.data());
    iov.iov_len = buf.size();
    union {
        char cbuf[CMSG_SPACE(sizeof(in_pktinfo))];
        cmsghdr align;
    } control;
    memset(&control, 0, sizeof control);

    msghdr msg;
    memset(&msg, 0, sizeof msg);
    msg.msg_name = &sai;
    msg.msg_namelen = sizeof sai;
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    if (ifindex > 0) {
        msg.msg_control = control.cbuf;
        msg.msg_controllen = sizeof control.cbuf;
        auto cm = CMSG_FIRSTHDR(&msg);
        cm->cmsg_level = IPPROTO_IP;
        cm->cmsg_type = IP_PKTINFO;
        cm->cmsg_len = CMSG_LEN(sizeof(in_pktinfo));
        in_pktinfo pi;
        memset(&pi, 0, sizeof pi);
        pi.ipi_ifindex = ifindex;
        memcpy(CMSG_DATA(cm), &pi, sizeof pi);
    }

    for (;;) {
        auto r = sendmsg(socket_.native_handle(), &msg, MSG_NOSIGNAL);
        if (r < 0) {
            int err = errno;
            if (err == EINTR) continue;
            ec.assign(err, boost::system::system_category());
            return 0;
        }
        ec = boost::system::error_code();
        return static_cast<size_t>(r);
    }
}

void Ip4PacketConn::close(boost::system::error_code &ec)
{
    socket_.close(ec);
}

void Ip4PacketConn::shutdown(boost::system::error_code &ec)
{
    shut_down_ = true;
    // Only the read side; replies still in flight may be sent until close().
    // An unconnected UDP socket reports ENOTCONN, but its receivers are
    // still woken and see end of file.
    if (::shutdown(socket_.native_handle(), SHUT_RD) < 0 && errno != ENOTCONN) {
        ec.assign(errno, boost::system::system_category());
        return;
    }
    ec = boost::system::error_code();
}

udp::endpoint Ip4PacketConn::local_endpoint(boost::system::error_code &ec) const
{
    return socket_.local_endpoint(ec);
}

}
