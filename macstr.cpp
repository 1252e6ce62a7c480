#include <fmt/format.h>
#include "macstr.hpp"

namespace d4 {

std::string macraw_to_str(const std::vector<uint8_t> &macraw)
{
    std::string r;
    r.reserve(macraw.size() * 3);
    for (size_t i = 0; i < macraw.size(); ++i) {
        if (i) r.push_back(':');
        r += fmt::format("{:02x}", macraw[i]);
    }
    return r;
}

}
