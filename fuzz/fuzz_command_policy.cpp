#include "sandbox/CommandPolicy.h"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    std::vector<std::string> tokens;
    std::string error;
    lan_probe::CommandPolicy::tokenize(input, tokens, error);

    lan_probe::Validation v = lan_probe::CommandPolicy::validate(input);
    if (!v.ok()) return 0;

    // An accepted command never carries a metacharacter into argv and always names an allowed program.
    std::vector<std::string> argv = lan_probe::CommandPolicy::to_argv(*v.command);
    if (argv.empty()) __builtin_trap();
    const auto& allowed = lan_probe::CommandPolicy::allowed_names();
    if (std::find(allowed.begin(), allowed.end(), argv.front()) == allowed.end()) __builtin_trap();
    for (const auto& arg : argv) {
        if (lan_probe::CommandPolicy::find_metacharacter(arg)) __builtin_trap();
    }
    return 0;
}
