#include "blindxfer/part_pool.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace blindxfer::upload {

PartPool::PartPool(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

PartPool::~PartPool() {
    for (auto& entry : workers_) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
}

void PartPool::Admit(std::uint32_t part_number, Job job) {
    if (Full()) {
        throw std::logic_error("PartPool::Admit on a full pool");
    }
    if (workers_.count(part_number) != 0) {
        throw std::logic_error("Part " + std::to_string(part_number) + " already in flight");
    }
    std::thread worker([this, part_number, job = std::move(job)]() {
        Settlement result;
        try {
            result = job();
        } catch (const std::exception& ex) {
            result.outcome = Outcome::kFailed;
            result.error = ex.what();
        }
        result.part_number = part_number;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settled_.push_back(std::move(result));
        }
        settled_cv_.notify_one();
    });
    workers_.emplace(part_number, std::move(worker));
    peak_ = std::max(peak_, workers_.size());
}

Settlement PartPool::AwaitOne() {
    if (workers_.empty()) {
        throw std::logic_error("PartPool::AwaitOne with nothing in flight");
    }
    Settlement result;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        settled_cv_.wait(lock, [this] { return !settled_.empty(); });
        result = std::move(settled_.front());
        settled_.pop_front();
    }
    auto it = workers_.find(result.part_number);
    if (it != workers_.end()) {
        if (it->second.joinable()) {
            it->second.join();
        }
        workers_.erase(it);
    }
    return result;
}

}  // namespace blindxfer::upload
