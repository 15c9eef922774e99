#include "inference_adapter.hpp"
#include <chrono>
#include <cmath>
#include <sstream>

namespace signrec
{

    InferenceAdapter::InferenceAdapter(Classifier &classifier, const LabelSet &labels,
                                       const RecognizerConfig &config)
        : classifier_(classifier),
          labels_(labels),
          min_confidence_(config.min_confidence),
          timeout_ms_(config.inference_timeout_ms)
    {
        if (timeout_ms_ > 0)
        {
            worker_ = std::make_unique<InferenceWorker>(classifier_);
            worker_->start();
        }
    }

    InferenceAdapter::~InferenceAdapter()
    {
        if (worker_)
            worker_->stop();
    }

    uint64_t InferenceAdapter::stale_results() const
    {
        return worker_ ? worker_->stale_results() : 0;
    }

    std::string InferenceAdapter::check_probabilities(const std::vector<float> &probabilities,
                                                      size_t expected_classes)
    {
        std::ostringstream oss;
        if (expected_classes == 0)
            return "label set is empty";
        if (probabilities.size() != expected_classes)
        {
            oss << "malformed output: expected " << expected_classes
                << " probabilities, got " << probabilities.size();
            return oss.str();
        }

        double sum = 0.0;
        for (size_t i = 0; i < probabilities.size(); ++i)
        {
            float p = probabilities[i];
            if (!std::isfinite(p) || p < 0.0f || p > 1.0f)
            {
                oss << "malformed output: probability[" << i << "] = " << p;
                return oss.str();
            }
            sum += p;
        }
        if (std::fabs(sum - 1.0) > constants::kProbabilitySumTolerance)
        {
            oss << "malformed output: probabilities sum to " << sum;
            return oss.str();
        }
        return {};
    }

    InferenceResult InferenceAdapter::run(const SampleWindow &window)
    {
        InferenceResult result;
        if (!window.is_full())
        {
            result.error = "window not full";
            return result;
        }

        const size_t steps = window.size();
        const size_t features = window.feature_dim();

        auto t0 = std::chrono::steady_clock::now();
        std::vector<float> probabilities;
        if (worker_)
        {
            std::string error;
            if (!worker_->run(window.snapshot(), steps, features,
                              std::chrono::milliseconds(timeout_ms_), probabilities, error))
            {
                result.error = error;
                return result;
            }
        }
        else
        {
            try
            {
                probabilities = classifier_.infer(window.snapshot(), steps, features);
            }
            catch (const std::exception &e)
            {
                result.error = std::string("classifier error: ") + e.what();
                return result;
            }
        }
        auto t1 = std::chrono::steady_clock::now();
        result.inference_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

        std::string problem = check_probabilities(probabilities, labels_.size());
        if (!problem.empty())
        {
            result.error = problem;
            return result;
        }

        // argmax, first maximal index wins
        size_t best = 0;
        for (size_t i = 1; i < probabilities.size(); ++i)
        {
            if (probabilities[i] > probabilities[best])
                best = i;
        }

        result.prediction.label_index = static_cast<int>(best);
        result.prediction.label = labels_.at(best);
        result.prediction.confidence = probabilities[best];
        result.probabilities = std::move(probabilities);

        result.status = result.prediction.confidence < min_confidence_
                            ? InferenceStatus::LOW_CONFIDENCE
                            : InferenceStatus::ACCEPTED;
        return result;
    }

} // namespace signrec
