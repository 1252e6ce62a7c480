// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#define D4SERVE_VERSION "1.0"

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>
#include <string>
#include <thread>
#include <variant>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include "log.hpp"
#include "macstr.hpp"
#include "message.hpp"
#include "server.hpp"

namespace ba = boost::asio;

static std::string bind_address(":67");
static std::string bind_ifname;
static unsigned worker_threads = 2;

static std::string addr_opt_str(const d4::Packet &p, uint8_t code)
{
    auto a = p.option_address(code);
    return a ? a->to_string() : std::string("none");
}

static void log_message(const d4::Message &msg)
{
    const auto &p = d4::message_packet(msg);
    d4::log_line("dhcp4: {} xid={:08x} chaddr={} ciaddr={} if={}",
                 d4::message_type_name(p.message_type()), p.xid(),
                 d4::macraw_to_str(p.chaddr()), p.ciaddr().to_string(),
                 d4::message_ifindex(msg));
    if (std::holds_alternative<d4::Request>(msg)) {
        d4::log_line("dhcp4:   requested={} server={}",
                     addr_opt_str(p, d4::DCODE_REQIP), addr_opt_str(p, d4::DCODE_SERVER_ID));
    } else if (std::holds_alternative<d4::Decline>(msg)) {
        d4::log_line("dhcp4:   declined={}", addr_opt_str(p, d4::DCODE_REQIP));
    }
}

// Logs every request on a worker thread; never replies.
class LogHandler final : public d4::Handler
{
public:
    explicit LogHandler(ba::thread_pool &pool) : pool_(pool) {}
    void serve_dhcp(d4::Message msg) override
    {
        ba::post(pool_, [msg = std::move(msg)]() { log_message(msg); });
    }
private:
    ba::thread_pool &pool_;
};

static void usage()
{
    printf("d4serve " D4SERVE_VERSION ", DHCPv4 request listener.\n");
    printf("d4serve [options]...\n\nOptions:\n");
    printf("--bind            -b []  Address to listen on (default :67).\n");
    printf("--interface       -i []  Only listen on this interface.\n");
    printf("--threads         -t []  Number of handler threads (default 2).\n");
    printf("--debug           -d     Log discarded datagrams.\n");
    printf("--syslog          -s     Log to syslog rather than stderr.\n");
    printf("--version         -v     Print version and exit.\n");
    printf("--help            -h     Print this help and exit.\n");
}

static void print_version()
{
    printf("d4serve " D4SERVE_VERSION ", DHCPv4 request listener.\n"
           "SPDX-License-Identifier: MIT\n");
}

static void process_options(int ac, char *av[])
{
    static struct option long_options[] = {
        {"bind", 1, nullptr, 'b'},
        {"interface", 1, nullptr, 'i'},
        {"threads", 1, nullptr, 't'},
        {"debug", 0, nullptr, 'd'},
        {"syslog", 0, nullptr, 's'},
        {"version", 0, nullptr, 'v'},
        {"help", 0, nullptr, 'h'},
        {nullptr, 0, nullptr, 0 }
    };
    for (;;) {
        auto c = getopt_long(ac, av, "b:i:t:dsvh", long_options, nullptr);
        if (c == -1) break;
        switch (c) {
            case 'b': bind_address = optarg; break;
            case 'i': bind_ifname = optarg; break;
            case 't': {
                char *end;
                auto n = strtoul(optarg, &end, 10);
                if (end == optarg || *end || n < 1 || n > 256)
                    d4::suicide("invalid thread count '{}'", optarg);
                worker_threads = static_cast<unsigned>(n);
                break;
            }
            case 'd': d4::log_set_debug(true); break;
            case 's': d4::log_set_syslog("d4serve"); break;
            case 'v': print_version(); exit(EXIT_SUCCESS); break;
            case 'h': usage(); exit(EXIT_SUCCESS); break;
            default: usage(); exit(EXIT_FAILURE); break;
        }
    }
}

int main(int ac, char *av[])
{
    process_options(ac, av);

    ba::io_context io_context;
    boost::system::error_code ec;
    auto conn = d4::listen(io_context, bind_address, bind_ifname, ec);
    if (!conn) d4::suicide("d4serve: failed to listen on {}: {}", bind_address, ec.message());
    auto lep = conn->local_endpoint(ec);
    if (ec) d4::suicide("d4serve: failed to get local address: {}", ec.message());
    d4::log_line("d4serve: listening on {}:{}{}{}", lep.address().to_string(), lep.port(),
                 bind_ifname.empty() ? "" : " interface ", bind_ifname);

    ba::thread_pool pool(worker_threads);
    LogHandler handler(pool);
    d4::Server server(conn, handler);

    ba::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code &error, int signo) {
        if (error) return;
        d4::log_line("d4serve: received signal {}; stopping", signo);
        server.stop();
    });
    std::thread signal_thread([&io_context]() { io_context.run(); });

    auto r = server.serve();

    io_context.stop();
    signal_thread.join();
    pool.join();
    conn->close(ec);
    if (ec) d4::log_line("d4serve: failed to close socket: {}", ec.message());

    if (r) {
        d4::log_error("d4serve: receive failed: {}", r.message());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
