#pragma once
#include <string>

enum class TimeInForce {
    IOC,
    GTC
};

struct OrderRequest {
    std::string symbol;
    bool is_buy = true;
    double size = 0.0;
    double limit_price = 0.0;
    TimeInForce time_in_force = TimeInForce::IOC;
    bool reduce_only = false;
};

// Result of one leg order
struct Fill {
    bool success = false;
    double size = 0.0;
    double price = 0.0;
    double fee = 0.0;
    std::string order_id;
    std::string error;   // set when !success
};
