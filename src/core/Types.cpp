#include "Types.h"

namespace lan_probe {

const char* to_string(HostStatus s){
    return s == HostStatus::Online ? "Online" : "Offline";
}

const char* to_string(PortState s){
    switch(s){
        case PortState::Open: return "open";
        case PortState::Closed: return "closed";
        case PortState::Filtered: return "filtered";
    }
    return "filtered";
}

const char* to_string(CommandDisposition d){
    switch(d){
        case CommandDisposition::Completed: return "completed";
        case CommandDisposition::Rejected: return "rejected";
        case CommandDisposition::TimedOut: return "timed_out";
        case CommandDisposition::SpawnFailed: return "spawn_failed";
    }
    return "rejected";
}

}
