#include "WorkerPool.h"
#include "../core/Logging.h"
#include <atomic>
#include <system_error>
#include <thread>
#include <vector>
#include <algorithm>

namespace lan_probe {

size_t WorkerPool::run(size_t count, Deadline deadline, const std::function<void(size_t)>& task) const {
    if(count == 0) return 0;
    std::atomic<size_t> next{0};
    std::atomic<size_t> started{0};
    auto worker = [&](){
        while(!expired(deadline)){
            size_t i = next.fetch_add(1);
            if(i >= count) return;
            started.fetch_add(1);
            try {
                task(i);
            } catch(const std::exception& ex) {
                Logger::instance().warn(std::string("probe task failed: ") + ex.what());
            }
        }
    };
    size_t n = std::min(max_workers_, count);
    if(n == 1){
        worker();
        return started.load();
    }
    std::vector<std::thread> threads;
    threads.reserve(n);
    for(size_t t = 0; t < n; ++t){
        try {
            threads.emplace_back(worker);
        } catch(const std::system_error& ex) {
            Logger::instance().warn("worker pool: started " + std::to_string(threads.size()) + " of " +
                                    std::to_string(n) + " threads (" + ex.what() + ")");
            break;
        }
    }
    if(threads.empty()) worker();
    for(auto& th : threads) th.join();
    return started.load();
}

}
