#pragma once
#include "../net/Socket.h"
#include <cstddef>
#include <functional>

namespace lan_probe {

// Fans task(i), i in [0, count), out over at most max_workers threads.
// Indices are handed out through one atomic counter; once the deadline has
// passed no further index is started, in-flight tasks run to completion.
class WorkerPool {
public:
    static constexpr size_t kMaxWorkers = 256;

    explicit WorkerPool(size_t max_workers)
        : max_workers_(max_workers == 0 ? 1 : (max_workers > kMaxWorkers ? kMaxWorkers : max_workers)) {}

    // Returns how many indices were started. When the system refuses a thread
    // the pool carries on with the threads it already has.
    size_t run(size_t count, Deadline deadline, const std::function<void(size_t)>& task) const;

    size_t max_workers() const { return max_workers_; }

private:
    size_t max_workers_;
};

}
