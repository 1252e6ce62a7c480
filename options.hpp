// Copyright 2026 The d4serve Authors
// SPDX-License-Identifier: MIT
#ifndef D4SERVE_OPTIONS_HPP_
#define D4SERVE_OPTIONS_HPP_

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <vector>

namespace d4 {

// Option code to value.  Repeated instances of a code are concatenated
// (RFC 3396), so each code appears once.
using option_map = std::map<uint8_t, std::vector<uint8_t>>;

// Parses one option area into 'opts'.  Returns false if an option length
// runs past the end of the area.  *overload receives the value of a
// well-formed option overload option, if one is seen.
[[nodiscard]] bool parse_options(const uint8_t *buf, size_t len,
                                 option_map &opts, uint8_t *overload);

// Appends the encoded options and a terminating END to 'out'.  The message
// type option is emitted first; others follow in code order.  Values longer
// than 255 bytes are split across several instances.
void encode_options(const option_map &opts, std::vector<uint8_t> &out);

}

#endif
