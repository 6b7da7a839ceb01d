#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace blindxfer::upload {

enum class Outcome {
    kCompleted,
    kFailed,
    kCancelled,
};

struct Settlement {
    std::uint32_t part_number = 0;
    Outcome outcome = Outcome::kFailed;
    std::string etag;
    std::string error;
    std::size_t attempts = 0;
};

// Fixed-capacity set of part uploads, each on its own worker thread.
// Admit takes a slot, AwaitOne blocks until some job settles and gives its
// slot back. Only the owning thread calls Admit and AwaitOne.
class PartPool {
public:
    using Job = std::function<Settlement()>;

    explicit PartPool(std::size_t capacity);
    ~PartPool();

    PartPool(const PartPool&) = delete;
    PartPool& operator=(const PartPool&) = delete;

    // Throws std::logic_error when the pool is full.
    void Admit(std::uint32_t part_number, Job job);
    Settlement AwaitOne();

    std::size_t Capacity() const noexcept { return capacity_; }
    std::size_t InFlight() const noexcept { return workers_.size(); }
    bool Full() const noexcept { return workers_.size() >= capacity_; }
    std::size_t PeakInFlight() const noexcept { return peak_; }

private:
    std::size_t capacity_;
    std::size_t peak_ = 0;
    std::map<std::uint32_t, std::thread> workers_;

    std::mutex mutex_;
    std::condition_variable settled_cv_;
    std::deque<Settlement> settled_;
};

}  // namespace blindxfer::upload
