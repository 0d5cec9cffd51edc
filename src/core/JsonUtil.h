#pragma once
#include <string>
#include <chrono>

namespace lan_probe {
namespace jsonutil {

// JSON string escaping (quotes, backslash, control characters as \u00XX).
std::string escape(const std::string& s);

// UTC "YYYY-MM-DDTHH:MM:SSZ"; the epoch maps to an empty string.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
