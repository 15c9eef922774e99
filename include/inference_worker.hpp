#pragma once

#include "classifier.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace signrec {

// Runs classifier calls on a dedicated thread so the caller can bound the
// wait. Every job carries a sequence number; only the result for the job the
// caller is currently waiting on is delivered. A result that arrives after
// its caller gave up is dropped and counted as stale.
class InferenceWorker {
public:
    explicit InferenceWorker(Classifier& classifier);
    ~InferenceWorker();

    void start();
    // Joins the thread; blocks until an in-flight classifier call returns.
    void stop();

    // Submit a snapshot and wait up to timeout for its result.
    // Returns false with error set on classifier failure or timeout.
    bool run(std::vector<float> snapshot, size_t steps, size_t features,
             std::chrono::milliseconds timeout,
             std::vector<float>& probabilities, std::string& error);

    uint64_t stale_results() const { return stale_results_; }

private:
    struct Job {
        uint64_t seq;
        std::vector<float> input;
        size_t steps;
        size_t features;
    };

    struct Result {
        uint64_t seq;
        bool ok;
        std::vector<float> probabilities;
        std::string error;
    };

    void worker_thread_fn();

    Classifier& classifier_;

    std::mutex mutex_;
    std::condition_variable job_cv_, result_cv_;
    std::optional<Job> pending_;     // at most one queued job, newest wins
    std::optional<Result> result_;
    uint64_t next_seq_{0};
    uint64_t awaited_seq_{0};        // 0 = nobody waiting
    std::atomic<uint64_t> stale_results_{0};

    std::atomic<bool> running_{false};
    std::thread thread_;

    // Disable copy
    InferenceWorker(const InferenceWorker&) = delete;
    InferenceWorker& operator=(const InferenceWorker&) = delete;
};

} // namespace signrec
