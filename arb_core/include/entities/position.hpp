#pragma once
#include <string>

// Open hedged position. Only exists while the machine is not FLAT.
struct Position {
    double size = 0.0;
    double entry_spot_price = 0.0;
    double entry_perp_price = 0.0;
    double entry_spread = 0.0;
    std::string entry_time; // ISO-8601 local time
};
