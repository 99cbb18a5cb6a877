#include "../include/renko/types.hpp"
#include "../include/renko/utils.hpp"
#include <stdexcept>

namespace renko {

std::string to_string(BrickStrategy strategy) {
    switch (strategy) {
        case BrickStrategy::Atr: return "atr";
        case BrickStrategy::Statistical: return "statistical";
    }
    return "unknown";
}

BrickStrategy parse_brick_strategy(const std::string& name) {
    std::string s = lowercase(name);
    if (s == "atr") return BrickStrategy::Atr;
    if (s == "statistical" || s == "std" || s == "stddev") return BrickStrategy::Statistical;
    throw std::invalid_argument("Unknown brick strategy: " + name);
}

} // namespace renko
