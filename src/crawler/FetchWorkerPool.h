#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "URLFrontier.h"
#include "../../include/seo_audit/crawler/models/PageRecord.h"

namespace seo_audit::crawler {

// Fixed-width pool of fetch threads. The coordinator submits frontier
// entries and collects finished records; workers only run the work function.
class FetchWorkerPool {
public:
    using WorkFunction = std::function<PageRecord(const FrontierEntry&)>;

    FetchWorkerPool(size_t width, WorkFunction work);
    ~FetchWorkerPool();

    FetchWorkerPool(const FetchWorkerPool&) = delete;
    FetchWorkerPool& operator=(const FetchWorkerPool&) = delete;

    void submit(FrontierEntry entry);

    // Finished record if one is ready, without waiting
    std::optional<PageRecord> tryPopResult();

    // Wait up to timeout for a finished record
    std::optional<PageRecord> waitForResult(std::chrono::milliseconds timeout);

    // Finish queued work and join the threads
    void shutdown();

    size_t width() const { return workers.size(); }

private:
    void workerLoop(size_t index);

    WorkFunction work;
    std::vector<std::thread> workers;

    std::mutex taskMutex;
    std::condition_variable taskCv;
    std::deque<FrontierEntry> tasks;

    std::mutex resultMutex;
    std::condition_variable resultCv;
    std::deque<PageRecord> results;

    std::atomic<bool> stopping{false};
};

} // namespace seo_audit::crawler
