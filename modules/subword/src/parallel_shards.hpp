/**
 * @file parallel_shards.hpp
 * @brief Fork-join over contiguous shards of an index range
 */

#ifndef OPENCV_SUBWORD_PARALLEL_SHARDS_HPP
#define OPENCV_SUBWORD_PARALLEL_SHARDS_HPP

#include <algorithm>
#include <exception>
#include <thread>
#include <vector>

namespace cv {
namespace subword {

/** @brief Maps a requested thread count to a usable one; <= 0 means hardware concurrency */
inline int resolveThreadCount(int requested) {
    if (requested > 0) {
        return requested;
    }
    int detected = static_cast<int>(std::thread::hardware_concurrency());
    return detected > 0 ? detected : 4;
}

/**
 * @brief Partition of [0, count) into at most numThreads contiguous shards
 *
 * Callers allocate one local accumulator per shard, run the plan and then
 * combine accumulators in shard order, so the combined result does not
 * depend on thread timing.
 */
class ShardPlan {
public:
    ShardPlan(size_t count, int numThreads)
        : count_(count), chunk_(0), shards_(0) {
        if (count_ == 0) {
            return;
        }
        size_t threads = std::min(static_cast<size_t>(resolveThreadCount(numThreads)), count_);
        chunk_ = (count_ + threads - 1) / threads;
        shards_ = (count_ + chunk_ - 1) / chunk_;
    }

    size_t size() const { return shards_; }
    size_t begin(size_t shard) const { return shard * chunk_; }
    size_t end(size_t shard) const { return std::min(count_, (shard + 1) * chunk_); }

    /**
     * @brief Calls body(shard, begin, end) for every shard and waits for all of them
     *
     * A single shard runs on the calling thread. If shards throw, the
     * exception of the lowest-numbered failing shard is rethrown after join.
     */
    template <typename Body>
    void run(const Body& body) const {
        if (shards_ == 1) {
            body(size_t(0), begin(0), end(0));
            return;
        }

        std::vector<std::exception_ptr> errors(shards_);
        std::vector<std::thread> threads;
        threads.reserve(shards_);
        for (size_t t = 0; t < shards_; ++t) {
            threads.push_back(std::thread([&, t]() {
                try {
                    body(t, begin(t), end(t));
                } catch (...) {
                    errors[t] = std::current_exception();
                }
            }));
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

private:
    size_t count_;
    size_t chunk_;
    size_t shards_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_PARALLEL_SHARDS_HPP
