#pragma once
/*
Tapline — WorkerPool
Role: Runs handler work off the io thread on a fixed set of workers.
Inputs/Outputs: submit(partitionKey, task). Tasks with equal keys run on the same worker in
                submission order.
Threading: Each worker owns a bounded FIFO guarded by its own mutex; submit() is safe from any thread.
Performance: When a lane is full the oldest queued task is discarded and the drop listener fires,
             so the io thread never blocks on a slow handler.
Related: MessageDispatcher.cpp.
*/
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

class WorkerPool {
public:
    using Task = std::function<void()>;
    using DropListener = std::function<void()>;

    WorkerPool(std::size_t workers, std::size_t capacityPerWorker);
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Enqueue on the lane chosen by key. Returns false if the pool is stopping.
    bool submit(std::size_t partitionKey, Task task);
    bool submit(std::string_view partitionKey, Task task);

    /// Blocks until every lane is empty and no task is running.
    void drain();

    /// Runs what is queued, then joins the workers. Idempotent.
    void stop();

    void setDropListener(DropListener listener);

    [[nodiscard]] std::size_t workerCount() const noexcept { return m_lanes.size(); }
    [[nodiscard]] uint64_t    droppedCount() const noexcept { return m_dropped.load(std::memory_order_relaxed); }

private:
    struct Lane {
        std::mutex              mx;
        std::condition_variable cv;
        std::condition_variable idleCv;
        std::deque<Task>        queue;
        bool                    busy{false};
        std::thread             thread;
    };

    void workerLoop(Lane& lane);

    const std::size_t                  m_capacity;
    std::vector<std::unique_ptr<Lane>> m_lanes;
    std::atomic<bool>                  m_stopping{false};
    std::atomic<uint64_t>              m_dropped{0};

    std::mutex   m_listenerMx;
    DropListener m_onDrop;
};
