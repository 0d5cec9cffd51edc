#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include <cmath>
#include <cstdlib>
#include <map>
#include <sstream>
#include <vector>
#include <sys/utsname.h>

namespace lan_probe {
namespace {
    struct HostMeta {
        std::string hostname;
        std::string kernel;
        std::string arch;
    };

    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // string text, or the literal token for numbers, booleans and null
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    static void canon_emit(const CanonVal& v, std::ostream& os);

    using jsonutil::escape; using jsonutil::time_to_iso;

    static CanonVal str_val(const std::string& s){ CanonVal v{CanonVal::T_STR}; v.str = s; return v; }
    static CanonVal num_val(long long n){ CanonVal v{CanonVal::T_NUM}; v.str = std::to_string(n); return v; }
    static CanonVal bool_val(bool b){ CanonVal v{CanonVal::T_NUM}; v.str = b ? "true" : "false"; return v; }
    static CanonVal null_val(){ CanonVal v{CanonVal::T_NUM}; v.str = "null"; return v; }
    static CanonVal real_val(double d, int decimals){
        if(!std::isfinite(d)) return null_val();
        std::ostringstream os;
        os.setf(std::ios::fixed);
        os.precision(decimals);
        os << d;
        CanonVal v{CanonVal::T_NUM}; v.str = os.str(); return v;
    }

    static HostMeta collect_host_meta(){
        HostMeta h;
        struct utsname u{};
        if(uname(&u) == 0){
            h.kernel = u.release;
            h.arch = u.machine;
            h.hostname = u.nodename;
        }
        auto get = [](const char* k)->const char*{ const char* v=getenv(k); return (v && *v)? v: nullptr; };
        if(auto v=get("LAN_PROBE_META_HOSTNAME")) h.hostname=v;
        if(auto v=get("LAN_PROBE_META_KERNEL")) h.kernel=v;
        if(auto v=get("LAN_PROBE_META_ARCH")) h.arch=v;
        return h;
    }

    static CanonVal build_provenance_object(){
        CanonVal prov{CanonVal::T_OBJ};
        prov.obj["compiler_id"] = str_val(buildinfo::COMPILER_ID);
        prov.obj["compiler_version"] = str_val(buildinfo::COMPILER_VERSION);
        prov.obj["git_commit"] = str_val(buildinfo::GIT_COMMIT);
        prov.obj["cxx_standard"] = str_val(buildinfo::CXX_STANDARD);
        return prov;
    }

    static CanonVal build_meta_object(const std::string& mode){
        HostMeta host = collect_host_meta();
        CanonVal meta{CanonVal::T_OBJ};
        meta.obj["arch"] = str_val(host.arch);
        meta.obj["hostname"] = str_val(host.hostname);
        meta.obj["kernel"] = str_val(host.kernel);
        meta.obj["mode"] = str_val(mode);
        meta.obj["tool_version"] = str_val(buildinfo::APP_VERSION);
        bool zero_time = std::getenv("LAN_PROBE_CANON_TIME_ZERO") != nullptr;
        meta.obj["generated_at"] = str_val(zero_time ? "" : time_to_iso(std::chrono::system_clock::now()));
        meta.obj["provenance"] = build_provenance_object();
        return meta;
    }

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR: os << '"' << escape(v.str) << '"'; break;
            case CanonVal::T_NUM: os << v.str; break;
            case CanonVal::T_ARR: emit_array(v, os); break;
            case CanonVal::T_OBJ: emit_object(v, os); break;
        }
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;
        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };
        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            if (!in_string && (c == '}' || c == ']')) {
                // empty containers stay on one line
                char prev = out.empty() ? '\0' : out.back();
                if (prev != '{' && prev != '[') {
                    out.push_back('\n');
                    depth = depth > 0 ? depth - 1 : 0;
                    indent(depth);
                } else {
                    depth = depth > 0 ? depth - 1 : 0;
                }
                out.push_back(c);
                continue;
            }
            out.push_back(c);
            if (esc) { esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { in_string = !in_string; continue; }
            if (in_string) continue;
            switch (c) {
                case '{':
                case '[':
                    depth++;
                    if (i + 1 < compact_json.size() && compact_json[i+1] != '}' && compact_json[i+1] != ']') {
                        out.push_back('\n');
                        indent(depth);
                    }
                    break;
                case ',':
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(' ');
                    break;
                default:
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }

    static std::string finish(const CanonVal& root, const Config& cfg){
        std::ostringstream os;
        canon_emit(root, os);
        std::string compact = os.str();
        if (cfg.pretty && !cfg.compact) return pretty_print_json(compact);
        return compact + "\n";
    }

    static CanonVal port_array(const std::vector<uint16_t>& ports){
        CanonVal arr{CanonVal::T_ARR};
        for(uint16_t p : ports) arr.arr.push_back(num_val(p));
        return arr;
    }
}

std::string JSONWriter::write(const DiscoveryReport& report, const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("discover");
    root.obj["cidr"] = str_val(report.cidr);
    root.obj["count"] = num_val(static_cast<long long>(report.devices.size()));
    root.obj["online_count"] = num_val(static_cast<long long>(report.online_count));
    root.obj["offline_count"] = num_val(static_cast<long long>(report.offline_count));
    root.obj["probed_count"] = num_val(static_cast<long long>(report.probed_count));
    root.obj["scan_time"] = real_val(report.elapsed_ms / 1000.0, 2);
    root.obj["deadline_exceeded"] = bool_val(report.deadline_exceeded);
    CanonVal devices{CanonVal::T_ARR};
    for(const auto& d : report.devices){
        CanonVal dev{CanonVal::T_OBJ};
        dev.obj["ip"] = str_val(d.address);
        dev.obj["hostname"] = str_val(d.hostname);
        dev.obj["status"] = str_val(to_string(d.status));
        dev.obj["mac"] = d.hardware_address ? str_val(*d.hardware_address) : null_val();
        dev.obj["method"] = str_val(d.method);
        dev.obj["latency_ms"] = d.latency_ms ? real_val(*d.latency_ms, 3) : null_val();
        devices.arr.push_back(std::move(dev));
    }
    root.obj["devices"] = std::move(devices);
    return finish(root, cfg);
}

std::string JSONWriter::write(const PortScanReport& report, const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("ports");
    root.obj["target"] = str_val(report.target);
    root.obj["ip"] = str_val(report.address);
    std::vector<uint16_t> scanned, open;
    CanonVal results{CanonVal::T_ARR};
    for(const auto& r : report.results){
        scanned.push_back(r.port);
        if(r.state == PortState::Open) open.push_back(r.port);
        CanonVal pr{CanonVal::T_OBJ};
        pr.obj["port"] = num_val(r.port);
        pr.obj["state"] = str_val(to_string(r.state));
        pr.obj["service"] = str_val(r.service);
        results.arr.push_back(std::move(pr));
    }
    root.obj["scanned_ports"] = port_array(scanned);
    root.obj["open_ports"] = port_array(open);
    root.obj["results"] = std::move(results);
    root.obj["scan_time"] = real_val(report.elapsed_ms / 1000.0, 2);
    root.obj["deadline_exceeded"] = bool_val(report.deadline_exceeded);
    return finish(root, cfg);
}

std::string JSONWriter::write(const CommandOutcome& outcome, const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["success"] = bool_val(outcome.success);
    root.obj["output"] = str_val(outcome.output);
    root.obj["exit_code"] = outcome.exit_code ? num_val(*outcome.exit_code) : null_val();
    root.obj["disposition"] = str_val(to_string(outcome.disposition));
    return finish(root, cfg);
}

std::string JSONWriter::write(const StatusReport& status, const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object("status");
    root.obj["status"] = str_val("ready");
    root.obj["version"] = str_val(status.version);
    root.obj["platform"] = str_val(status.platform);
    root.obj["default_subnet"] = str_val(status.default_subnet);
    root.obj["common_ports"] = port_array(status.common_ports);
    CanonVal cmds{CanonVal::T_ARR};
    for(const auto& c : status.allowed_commands) cmds.arr.push_back(str_val(c));
    root.obj["allowed_commands"] = std::move(cmds);
    root.obj["privilege_available"] = bool_val(status.privilege_available);
    root.obj["seccomp_available"] = bool_val(status.seccomp_available);
    return finish(root, cfg);
}

}
