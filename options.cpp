// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#include <algorithm>
#include "options.hpp"
#include "dhcp.h"

namespace d4 {

bool parse_options(const uint8_t *buf, size_t len, option_map &opts, uint8_t *overload)
{
    size_t i = 0;
    while (i < len) {
        const uint8_t code = buf[i];
        if (code == DCODE_PADDING) { ++i; continue; }
        if (code == DCODE_END) return true;
        if (i + 1 >= len) return false;
        const size_t olen = buf[i + 1];
        if (i + 2 + olen > len) return false;
        const uint8_t *val = buf + i + 2;
        if (code == DCODE_OVERLOAD) {
            if (olen == 1 && overload) *overload = val[0];
        } else {
            auto &v = opts[code];
            v.insert(v.end(), val, val + olen);
        }
        i += 2 + olen;
    }
    // No END; accept what was there.
    return true;
}

static void encode_one(uint8_t code, const std::vector<uint8_t> &val, std::vector<uint8_t> &out)
{
    if (val.empty()) {
        out.push_back(code);
        out.push_back(0);
        return;
    }
    for (size_t off = 0; off < val.size();) {
        const auto n = std::min<size_t>(val.size() - off, 255);
        out.push_back(code);
        out.push_back(static_cast<uint8_t>(n));
        out.insert(out.end(), val.begin() + off, val.begin() + off + n);
        off += n;
    }
}

void encode_options(const option_map &opts, std::vector<uint8_t> &out)
{
    auto mt = opts.find(DCODE_MSGTYPE);
    if (mt != opts.end()) encode_one(DCODE_MSGTYPE, mt->second, out);
    for (const auto &o: opts) {
        if (o.first == DCODE_MSGTYPE || o.first == DCODE_PADDING || o.first == DCODE_END)
            continue;
        encode_one(o.first, o.second, out);
    }
    out.push_back(DCODE_END);
}

}
