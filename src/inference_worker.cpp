#include "inference_worker.hpp"
#include <iostream>
#include <sstream>

namespace signrec
{

    InferenceWorker::InferenceWorker(Classifier &classifier)
        : classifier_(classifier)
    {
    }

    InferenceWorker::~InferenceWorker() { stop(); }

    void InferenceWorker::start()
    {
        if (running_)
            return;
        running_ = true;
        thread_ = std::thread(&InferenceWorker::worker_thread_fn, this);
    }

    void InferenceWorker::stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            pending_.reset();
            awaited_seq_ = 0;
        }
        job_cv_.notify_all();
        result_cv_.notify_all();
        if (thread_.joinable())
            thread_.join();
    }

    bool InferenceWorker::run(std::vector<float> snapshot, size_t steps, size_t features,
                              std::chrono::milliseconds timeout,
                              std::vector<float> &probabilities, std::string &error)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!running_)
        {
            error = "inference worker not running";
            return false;
        }

        uint64_t seq = ++next_seq_;
        pending_ = Job{seq, std::move(snapshot), steps, features};
        awaited_seq_ = seq;
        result_.reset();
        job_cv_.notify_one();

        bool done = result_cv_.wait_for(lock, timeout, [&]
                                        { return (result_ && result_->seq == seq) || !running_; });
        awaited_seq_ = 0;

        if (!done)
        {
            std::ostringstream oss;
            oss << "inference timed out after " << timeout.count() << " ms";
            error = oss.str();
            return false;
        }
        if (!result_ || result_->seq != seq)
        {
            error = "inference worker stopped";
            return false;
        }

        Result r = std::move(*result_);
        result_.reset();
        if (!r.ok)
        {
            error = r.error;
            return false;
        }
        probabilities = std::move(r.probabilities);
        return true;
    }

    void InferenceWorker::worker_thread_fn()
    {
        while (true)
        {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                job_cv_.wait(lock, [&]
                             { return pending_.has_value() || !running_; });
                if (!running_)
                    break;
                job = std::move(*pending_);
                pending_.reset();
            }

            Result r{job.seq, false, {}, {}};
            try
            {
                r.probabilities = classifier_.infer(job.input, job.steps, job.features);
                r.ok = true;
            }
            catch (const std::exception &e)
            {
                r.error = e.what();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (job.seq != awaited_seq_)
                {
                    ++stale_results_;
                    std::cerr << "[Inference] Dropping late result for job " << job.seq << "\n";
                    continue;
                }
                result_ = std::move(r);
            }
            result_cv_.notify_all();
        }
    }

} // namespace signrec
