// Copyright 2004-2017 Nicholas J. Kain <njkain at gmail dot com>
// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_DHCP_H_
#define D4SERVE_DHCP_H_

#include <stdint.h>

#define DHCP_SERVER_PORT        67
#define DHCP_CLIENT_PORT        68
#define DHCP_MAGIC              0x63825363

// RFC 1542: BOOTP relay agents may drop anything shorter.
#define DHCP_MIN_PACKET_SIZE    300
// 65535 - 20 (IPv4 header) - 8 (UDP header)
#define DHCP_MAX_UDP_PAYLOAD    65507

namespace d4 {

enum class OpCode : uint8_t {
    BootRequest = 1,
    BootReply   = 2,
};

enum class MessageType : uint8_t {
    None     = 0,
    Discover = 1,
    Offer    = 2,
    Request  = 3,
    Decline  = 4,
    Ack      = 5,
    Nak      = 6,
    Release  = 7,
    Inform   = 8,
};

enum {
    DCODE_PADDING   = 0,
    DCODE_SUBNET    = 1,
    DCODE_ROUTER    = 3,
    DCODE_DNS       = 6,
    DCODE_HOSTNAME  = 12,
    DCODE_DOMAIN    = 15,
    DCODE_BROADCAST = 28,
    DCODE_NTPSVR    = 42,
    DCODE_REQIP     = 50,
    DCODE_LEASET    = 51,
    DCODE_OVERLOAD  = 52,
    DCODE_MSGTYPE   = 53,
    DCODE_SERVER_ID = 54,
    DCODE_PARAM_REQ = 55,
    DCODE_MESSAGE   = 56,
    DCODE_MAX_SIZE  = 57,
    DCODE_RENEWAL_T = 58,
    DCODE_REBIND_T  = 59,
    DCODE_VENDOR    = 60,
    DCODE_CLIENT_ID = 61,
    DCODE_END       = 255,
};

// Values of the option overload option; say which of file/sname hold options.
enum {
    OVERLOAD_FILE  = 1,
    OVERLOAD_SNAME = 2,
    OVERLOAD_BOTH  = 3,
};

// Fixed-size part of a BOOTP/DHCP packet.  Multibyte fields are kept in
// network byte order.
struct dhcp_header {
    uint8_t op;      // Message type: 1 = BOOTREQUEST for clients.
    uint8_t htype;   // ARP HW address type: always '1' for ethernet.
    uint8_t hlen;    // Hardware address length: always '6' for ethernet.
    uint8_t hops;    // Client sets to zero.
    uint32_t xid;    // Transaction ID: random number identifying session
    uint16_t secs;   // Filled by client: seconds since client began address
                     // aquisition or renewal process.
    uint16_t flags;  // DHCP flags; high bit of the first byte is broadcast.
    uint32_t ciaddr; // Client IP: only filled in if client is in BOUND, RENEW,
                     // or REBINDING and can reply to ARP requests
    uint32_t yiaddr; // 'your' (client) IP address
    uint32_t siaddr; // Next server IP.
    uint32_t giaddr; // Relay agent IP.
    uint8_t chaddr[16];  // Client MAC address
    uint8_t sname[64];   // More DHCP options (#3)
    uint8_t file[128];   // More DHCP options (#2)
    uint32_t cookie;     // Magic number cookie that starts DHCP options
};

static_assert(sizeof(dhcp_header) == 240, "dhcp_header must not be padded");

}

#endif
