#pragma once
#include "Config.h"
#include <string>
#include <vector>
#include <functional>

namespace lan_probe {

class ArgumentParser {
public:
    ArgumentParser();

    // Returns false when the caller should exit early: --help, --version or a usage error.
    // exit_code() tells them apart (0 for help/version, 2 for errors).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<bool(const std::string&, Config&)> apply;
    };
    const FlagSpec* find_spec(const std::string& flag) const;
    bool fail(const std::string& msg);

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    std::string error_;
};

std::vector<std::string> split_csv(const std::string& s);

}
