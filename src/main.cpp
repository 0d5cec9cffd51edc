#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Config.h"
#include "core/Errors.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Operations.h"
#include "core/Privilege.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unistd.h>
#ifdef LAN_PROBE_HAVE_OPENSSL
#include <openssl/evp.h>
#endif

using namespace lan_probe;

namespace {

std::string self_sha256(){
    std::string hexhash;
#ifdef LAN_PROBE_HAVE_OPENSSL
    char pathbuf[4096];
    ssize_t n = readlink("/proc/self/exe", pathbuf, sizeof(pathbuf)-1);
    if(n <= 0) return hexhash;
    pathbuf[n] = 0;
    FILE* fp = fopen(pathbuf, "rb");
    if(!fp) return hexhash;
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(ctx && EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1){
        unsigned char bufh[8192]; size_t got;
        while((got = fread(bufh, 1, sizeof(bufh), fp)) > 0) EVP_DigestUpdate(ctx, bufh, got);
        if(EVP_DigestFinal_ex(ctx, md, &mdlen) == 1 && mdlen == 32){
            static const char* hx = "0123456789abcdef";
            for(unsigned i = 0; i < mdlen; i++){ hexhash.push_back(hx[md[i]>>4]); hexhash.push_back(hx[md[i]&0xF]); }
        }
    }
    if(ctx) EVP_MD_CTX_free(ctx);
    fclose(fp);
#endif
    return hexhash;
}

bool write_env(const std::string& path){
    std::ofstream envf(path);
    if(!envf){ std::cerr << "Cannot write env file: " << path << "\n"; return false; }
    envf << "LAN_PROBE_VERSION=" << buildinfo::APP_VERSION << "\n";
    envf << "LAN_PROBE_BINARY_SHA256=" << self_sha256() << "\n";
    return true;
}

bool emit(const std::string& json, const Config& cfg){
    if(cfg.output_file.empty()){ std::cout << json; return true; }
    std::ofstream ofs(cfg.output_file);
    if(!ofs){ std::cerr << "Cannot open output file: " << cfg.output_file << "\n"; return false; }
    ofs << json;
    return true;
}

}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    if(!ConfigValidator::validate(cfg)) return 2;
    if(!ConfigValidator::load_external_files(cfg)) return 2;
    if(!cfg.log_level.empty()){
        LogLevel lvl;
        if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);
    }
    set_config(cfg);

    if(cfg.drop_priv && !drop_capabilities(cfg.keep_cap_net_raw)){
        Logger::instance().warn("Capability drop incomplete (continuing)");
    }
    if(cfg.seccomp){
        if(!apply_seccomp_profile()){
            std::cerr << "Failed to apply seccomp profile";
            if(cfg.seccomp_strict){ std::cerr << "\n"; return 4; }
            std::cerr << " (continuing)\n";
        }
    }

    JSONWriter writer;
    std::string json;
    int rc = 0;
    try {
        switch(cfg.mode){
            case Mode::Discover: {
                std::optional<std::string> subnet;
                if(!cfg.subnet.empty()) subnet = cfg.subnet;
                json = writer.write(discover(subnet, discovery_options_from(cfg)), cfg);
                break;
            }
            case Mode::Ports:
                json = writer.write(scan_ports(cfg.positional, cfg.ports, port_scan_options_from(cfg)), cfg);
                break;
            case Mode::Run: {
                CommandOutcome outcome = run_command(cfg.positional, sandbox_options_from(cfg));
                if(!outcome.success) rc = 1;
                json = writer.write(outcome, cfg);
                break;
            }
            case Mode::Status:
                json = writer.write(status(cfg), cfg);
                break;
            case Mode::None:
                parser.print_help();
                return 2;
        }
    } catch(const InvalidSubnet& e) {
        std::cerr << e.what() << "\n";
        return 3;
    } catch(const UnreachableTarget& e) {
        std::cerr << e.what() << "\n";
        return 4;
    } catch(const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    if(!emit(json, cfg)) return 1;
    if(!cfg.write_env_file.empty() && !write_env(cfg.write_env_file)) return 1;
    return rc;
}
