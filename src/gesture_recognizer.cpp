#include "gesture_recognizer.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace signrec
{

    namespace
    {

        // Clears the re-entrancy flag on every exit path
        struct FrameGuard
        {
            std::atomic<bool> &flag;
            ~FrameGuard() { flag = false; }
        };

    } // namespace

    GestureRecognizer::GestureRecognizer() = default;

    GestureRecognizer::~GestureRecognizer() = default;

    bool GestureRecognizer::init(const RecognizerConfig &config, Classifier &classifier,
                                 const LabelSet &labels)
    {
        initialized_ = false;
        adapter_.reset();
        last_error_.clear();

        if (!config.validate())
        {
            last_error_ = "invalid configuration: " + config.describe_invalid();
            std::cerr << "[Recognizer] " << last_error_ << "\n";
            return false;
        }
        if (labels.empty())
        {
            last_error_ = "label set is empty";
            std::cerr << "[Recognizer] " << last_error_ << "\n";
            return false;
        }
        if (classifier.num_classes() != 0 && classifier.num_classes() != labels.size())
        {
            std::ostringstream oss;
            oss << "classifier produces " << classifier.num_classes()
                << " classes but the label set has " << labels.size();
            last_error_ = oss.str();
            std::cerr << "[Recognizer] " << last_error_ << "\n";
            return false;
        }

        config_ = config;
        labels_ = labels;
        classifier_ = &classifier;

        encoder_ = PoseEncoder(config_.max_hands);
        window_ = std::make_unique<SampleWindow>(static_cast<size_t>(config_.window_capacity),
                                                 static_cast<size_t>(config_.feature_dim));
        presence_ = PresenceTracker(config_.reset_threshold);
        smoother_ = VoteSmoother(static_cast<size_t>(config_.vote_history_size));
        emission_.reset();
        adapter_ = std::make_unique<InferenceAdapter>(*classifier_, labels_, config_);
        last_confidence_ = 0.0f;
        stats_.reset();

        initialized_ = true;

        if (config_.verbose)
        {
            std::cerr << "[Recognizer] Initialized\n";
            std::cerr << "  Classifier: " << classifier_->name() << " (" << labels_.size() << " labels)\n";
            std::cerr << "  Window: " << config_.window_capacity << " x " << config_.feature_dim << "\n";
            std::cerr << "  Min confidence: " << config_.min_confidence << "\n";
            std::cerr << "  Reset after: " << config_.reset_threshold << " absent frames\n";
            std::cerr << "  Vote history: " << config_.vote_history_size << "\n";
            std::cerr << "  Inference timeout: "
                      << (config_.inference_timeout_ms > 0 ? std::to_string(config_.inference_timeout_ms) + " ms" : "none")
                      << "\n";
        }
        return true;
    }

    RecognitionEvent GestureRecognizer::process_frame(const Hands &hands)
    {
        if (in_frame_.exchange(true))
        {
            return RecognitionEvent::error("process_frame called while another frame is in progress");
        }
        FrameGuard guard{in_frame_};

        if (!initialized_)
        {
            return RecognitionEvent::error("recognizer not initialized" +
                                           (last_error_.empty() ? std::string() : ": " + last_error_));
        }

        stats_.frames_processed++;

        // Presence: absent frames never push zero samples
        const bool present = !hands.empty();
        if (presence_.update(present, window_->empty()))
        {
            clear_evidence();
            stats_.absence_resets++;
            if (config_.verbose)
            {
                std::cerr << "[Recognizer] Window reset after " << presence_.absent_frames()
                          << " frames without hands\n";
            }
        }
        if (!present)
        {
            return RecognitionEvent::none();
        }

        stats_.frames_with_hands++;
        window_->push(encoder_.encode(hands));
        if (!window_->is_full())
        {
            return RecognitionEvent::none();
        }

        InferenceResult result = adapter_->run(*window_);
        stats_.inferences_run++;

        if (result.status == InferenceStatus::FAILED)
        {
            stats_.inference_failures++;
            std::cerr << "[Inference] Frame skipped: " << result.error << "\n";
            return RecognitionEvent::error(result.error);
        }
        record_inference_time(result.inference_ms);

        if (result.status == InferenceStatus::LOW_CONFIDENCE)
        {
            stats_.low_confidence_discards++;
            if (config_.verbose)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(3) << result.prediction.confidence
                    << " < " << adapter_->min_confidence();
                std::cerr << "[Inference] Discarded " << result.prediction.label << " ("
                          << oss.str() << ")\n";
            }
            return RecognitionEvent::none();
        }

        stats_.predictions_accepted++;
        std::string smoothed = smoother_.add(result.prediction.label);

        if (!emission_.should_emit(smoothed))
        {
            // Same gesture held: keep sliding, infer again next frame
            return RecognitionEvent::none();
        }

        // New gesture: require a completely fresh window before the next one
        clear_evidence();
        last_confidence_ = result.prediction.confidence;
        stats_.gestures_recognized++;

        if (config_.verbose)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(3) << last_confidence_;
            std::cerr << "[Recognizer] Recognized " << smoothed << " (" << oss.str() << ")\n";
        }
        return RecognitionEvent::recognized(smoothed, last_confidence_);
    }

    void GestureRecognizer::reset()
    {
        if (window_)
            window_->clear();
        smoother_.clear();
        presence_.reset();
        emission_.reset();
        last_confidence_ = 0.0f;
    }

    bool GestureRecognizer::set_min_confidence(float min_confidence)
    {
        if (!(min_confidence >= 0.0f && min_confidence <= 1.0f))
            return false;
        config_.min_confidence = min_confidence;
        if (adapter_)
            adapter_->set_min_confidence(min_confidence);
        return true;
    }

    void GestureRecognizer::clear_evidence()
    {
        window_->clear();
        smoother_.clear();
    }

    void GestureRecognizer::record_inference_time(double ms)
    {
        stats_.last_inference_ms = ms;
        // Running mean over completed inferences
        uint64_t n = stats_.inferences_run - stats_.inference_failures;
        if (n == 0)
            return;
        stats_.avg_inference_ms += (ms - stats_.avg_inference_ms) / static_cast<double>(n);
    }

    std::string GestureRecognizer::event_type_to_string(EventType type)
    {
        switch (type)
        {
        case EventType::NONE:
            return "NONE";
        case EventType::RECOGNIZED:
            return "RECOGNIZED";
        case EventType::ERROR:
            return "ERROR";
        }
        return "UNKNOWN";
    }

} // namespace signrec
