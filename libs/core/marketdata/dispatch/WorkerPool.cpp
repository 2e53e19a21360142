#include "WorkerPool.hpp"
#include "TaplineLogging.hpp"
#include <exception>
#include <functional>

WorkerPool::WorkerPool(std::size_t workers, std::size_t capacityPerWorker)
    : m_capacity(capacityPerWorker == 0 ? 1 : capacityPerWorker)
{
    if (workers == 0) workers = 1;
    m_lanes.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        m_lanes.push_back(std::make_unique<Lane>());
    }
    for (auto& lane : m_lanes) {
        Lane* l = lane.get();
        l->thread = std::thread([this, l] { workerLoop(*l); });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(std::size_t partitionKey, Task task) {
    if (m_stopping.load(std::memory_order_acquire)) {
        return false;
    }
    Lane& lane = *m_lanes[partitionKey % m_lanes.size()];
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(lane.mx);
        if (lane.queue.size() >= m_capacity) {
            lane.queue.pop_front();
            dropped = true;
        }
        lane.queue.push_back(std::move(task));
    }
    lane.cv.notify_one();

    if (dropped) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        tLog_DataN(100, "⚠️ WorkerPool backpressure: dropped oldest queued task");
        DropListener cb;
        {
            std::lock_guard<std::mutex> lock(m_listenerMx);
            cb = m_onDrop;
        }
        if (cb) cb();
    }
    return true;
}

bool WorkerPool::submit(std::string_view partitionKey, Task task) {
    return submit(std::hash<std::string_view>{}(partitionKey), std::move(task));
}

void WorkerPool::drain() {
    for (auto& lane : m_lanes) {
        std::unique_lock<std::mutex> lock(lane->mx);
        lane->idleCv.wait(lock, [&] { return lane->queue.empty() && !lane->busy; });
    }
}

void WorkerPool::stop() {
    if (m_stopping.exchange(true)) {
        return;
    }
    for (auto& lane : m_lanes) {
        {
            std::lock_guard<std::mutex> lock(lane->mx);
        }
        lane->cv.notify_all();
    }
    for (auto& lane : m_lanes) {
        if (lane->thread.joinable()) lane->thread.join();
    }
}

void WorkerPool::setDropListener(DropListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMx);
    m_onDrop = std::move(listener);
}

void WorkerPool::workerLoop(Lane& lane) {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(lane.mx);
            lane.cv.wait(lock, [&] { return m_stopping.load(std::memory_order_acquire) || !lane.queue.empty(); });
            if (lane.queue.empty()) {
                // stopping and nothing left
                lane.idleCv.notify_all();
                return;
            }
            task = std::move(lane.queue.front());
            lane.queue.pop_front();
            lane.busy = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            tLog_Warning("❌ WorkerPool task threw:" << e.what());
        }

        {
            std::lock_guard<std::mutex> lock(lane.mx);
            lane.busy = false;
            if (lane.queue.empty()) {
                lane.idleCv.notify_all();
            }
        }
    }
}
