#include "HostProber.h"
#include "Subnet.h"
#include "../core/Logging.h"
#include <future>
#include <system_error>
#include <thread>

namespace lan_probe {

namespace {

// getnameinfo has no timeout of its own, so the lookup runs on a detached
// thread that owns a reference to the resolver and the result slot.
std::string bounded_reverse_lookup(const std::shared_ptr<HostResolver>& resolver, uint32_t addr, Deadline deadline){
    auto slot = std::make_shared<std::promise<std::string>>();
    std::future<std::string> answer = slot->get_future();
    try {
        std::thread([resolver, slot, addr](){
            try {
                slot->set_value(resolver->reverse_lookup(addr));
            } catch(const std::exception&) {
                slot->set_exception(std::current_exception());
            }
        }).detach();
    } catch(const std::system_error& ex) {
        Logger::instance().debug(std::string("reverse lookup skipped: ") + ex.what());
        return "";
    }
    if(answer.wait_until(deadline) != std::future_status::ready){
        Logger::instance().debug("reverse lookup for " + format_ipv4(addr) + " abandoned at deadline");
        return "";
    }
    try {
        return answer.get();
    } catch(const std::exception& ex) {
        Logger::instance().debug("reverse lookup for " + format_ipv4(addr) + " failed: " + ex.what());
        return "";
    }
}

}

HostProber::HostProber(HostProberOptions opts,
                       std::unique_ptr<ReachabilityStrategy> primary,
                       std::unique_ptr<ReachabilityStrategy> fallback,
                       std::unique_ptr<HostResolver> resolver)
    : opts_(opts), primary_(std::move(primary)), fallback_(std::move(fallback)), resolver_(std::move(resolver)) {}

std::unique_ptr<HostProber> HostProber::create_default(HostProberOptions opts, std::vector<uint16_t> fallback_ports){
    return std::make_unique<HostProber>(opts,
        std::make_unique<IcmpEchoStrategy>(),
        std::make_unique<TcpConnectStrategy>(std::move(fallback_ports)),
        std::make_unique<SystemResolver>());
}

LivenessStage HostProber::next_stage(LivenessStage current, ProbeVerdict verdict, bool escalate_on_silence){
    if(current != LivenessStage::ReachabilityAttempted) return LivenessStage::Done;
    switch(verdict){
        case ProbeVerdict::Alive: return LivenessStage::Done;
        case ProbeVerdict::Unsupported: return LivenessStage::Escalated;
        case ProbeVerdict::Silent: return escalate_on_silence ? LivenessStage::Escalated : LivenessStage::Done;
    }
    return LivenessStage::Done;
}

Device HostProber::probe(uint32_t addr, Deadline deadline){
    Device d;
    d.address = format_ipv4(addr);

    LivenessStage stage = LivenessStage::ReachabilityAttempted;
    ProbeEvidence ev = primary_ ? primary_->probe(addr, deadline) : ProbeEvidence{ProbeVerdict::Unsupported, "", 0};
    stage = next_stage(stage, ev.verdict, opts_.escalate_on_silence);
    if(stage == LivenessStage::Escalated && fallback_ && !expired(deadline)){
        Logger::instance().trace(d.address + ": " + (primary_ ? primary_->name() : std::string("primary")) + " gave no verdict, trying " + fallback_->name());
        ev = fallback_->probe(addr, deadline);
        stage = next_stage(stage, ev.verdict, opts_.escalate_on_silence);
    }

    if(ev.verdict != ProbeVerdict::Alive){
        d.status = HostStatus::Offline;
        return d;
    }
    d.status = HostStatus::Online;
    d.method = ev.method;
    d.latency_ms = ev.latency_ms;
    // naming happens after the verdict so a slow resolver cannot flip it
    if(resolver_){
        if(opts_.resolve_hostnames && !expired(deadline)) d.hostname = bounded_reverse_lookup(resolver_, addr, deadline);
        if(opts_.lookup_mac) d.hardware_address = resolver_->hardware_address(addr);
    }
    return d;
}

}
