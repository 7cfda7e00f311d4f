#include "FetchWorkerPool.h"
#include "../../include/Logger.h"
#include <stdexcept>

namespace seo_audit::crawler {

FetchWorkerPool::FetchWorkerPool(size_t width, WorkFunction workFunction)
    : work(std::move(workFunction)) {
    if (width == 0) {
        throw std::invalid_argument("FetchWorkerPool width must be at least 1");
    }
    if (!work) {
        throw std::invalid_argument("FetchWorkerPool requires a work function");
    }

    workers.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        workers.emplace_back(&FetchWorkerPool::workerLoop, this, i);
    }
    LOG_DEBUG("Started " + std::to_string(width) + " fetch workers");
}

FetchWorkerPool::~FetchWorkerPool() {
    shutdown();
}

void FetchWorkerPool::submit(FrontierEntry entry) {
    if (stopping.load()) {
        throw std::logic_error("FetchWorkerPool::submit after shutdown");
    }
    {
        std::lock_guard<std::mutex> lock(taskMutex);
        tasks.push_back(std::move(entry));
    }
    taskCv.notify_one();
}

std::optional<PageRecord> FetchWorkerPool::tryPopResult() {
    std::lock_guard<std::mutex> lock(resultMutex);
    if (results.empty()) {
        return std::nullopt;
    }
    PageRecord record = std::move(results.front());
    results.pop_front();
    return record;
}

std::optional<PageRecord> FetchWorkerPool::waitForResult(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(resultMutex);
    if (!resultCv.wait_for(lock, timeout, [this] { return !results.empty(); })) {
        return std::nullopt;
    }
    PageRecord record = std::move(results.front());
    results.pop_front();
    return record;
}

void FetchWorkerPool::shutdown() {
    if (stopping.exchange(true)) {
        return;
    }
    taskCv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    LOG_DEBUG("Fetch workers stopped");
}

void FetchWorkerPool::workerLoop(size_t index) {
    while (true) {
        FrontierEntry entry;
        {
            std::unique_lock<std::mutex> lock(taskMutex);
            taskCv.wait(lock, [this] { return stopping.load() || !tasks.empty(); });
            if (tasks.empty()) {
                return;
            }
            entry = std::move(tasks.front());
            tasks.pop_front();
        }

        LOG_TRACE("Worker " + std::to_string(index) + " fetching " + entry.url);

        PageRecord record;
        try {
            record = work(entry);
        } catch (const std::exception& e) {
            // Keep the URL accounted for: the coordinator is waiting on it
            LOG_ERROR("Worker " + std::to_string(index) + " failed on " + entry.url + ": " + e.what());
            record = PageRecord{};
            record.url = entry.url;
            record.finalUrl = entry.url;
            record.redirectChain = {entry.url};
            record.depth = entry.depth;
            record.source = entry.source;
            record.failure = FetchFailure{FetchFailureKind::INVALID_RESPONSE, 0, e.what()};
        }

        {
            std::lock_guard<std::mutex> lock(resultMutex);
            results.push_back(std::move(record));
        }
        resultCv.notify_one();
    }
}

} // namespace seo_audit::crawler
