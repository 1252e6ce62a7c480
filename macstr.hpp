#ifndef D4SERVE_MACSTR_HPP_
#define D4SERVE_MACSTR_HPP_

#include <stdint.h>
#include <string>
#include <vector>

namespace d4 {

// "aa:bb:cc:dd:ee:ff" for any length of hardware address.
std::string macraw_to_str(const std::vector<uint8_t> &macraw);

}

#endif /* D4SERVE_MACSTR_HPP_ */
