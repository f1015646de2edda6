#pragma once
#include <string>

// Local time, ISO-8601 with microseconds: 2024-05-01T12:30:45.123456
std::string iso_now();
