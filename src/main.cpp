#include "gesture_recognizer.hpp"
#include "label_set.hpp"
#include "landmark_source.hpp"
#include "recognizer_config.hpp"
#include "target_filter.hpp"
#include "tflite_classifier.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace signrec;

static void usage(const char *prog)
{
    std::cerr << "Usage: " << prog << " --model <model.tflite> --labels <metadata.json|labels.txt>\n"
              << "       --input <frames.jsonl> [--config <file>] [--confidence <0..1>]\n"
              << "       [--target <gesture>] [--timeout-ms <n>] [--threads <n>] [--verbose]\n"
              << "\n"
              << "Environment: SIGNREC_MODEL_PATH, SIGNREC_LABELS_PATH, SIGNREC_SECRET,\n"
              << "             SIGNREC_MIN_CONFIDENCE, SIGNREC_RESET_THRESHOLD, ...\n";
}

static bool parse_float(const std::string &s, float &out)
{
    char *end = nullptr;
    out = std::strtof(s.c_str(), &end);
    return end != s.c_str() && *end == '\0' && std::isfinite(out);
}

static bool parse_int(const std::string &s, int &out)
{
    char *end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX)
        return false;
    out = static_cast<int>(v);
    return true;
}

int main(int argc, char **argv)
{
    std::string model_path;
    std::string labels_path;
    std::string input_path;
    std::string config_path;
    std::string target;
    float cli_confidence = -1.0f;
    int cli_timeout_ms = -1;
    int threads = 2;
    bool verbose = false;

    if (const char *env_model = std::getenv("SIGNREC_MODEL_PATH"); env_model && *env_model)
        model_path = env_model;
    if (const char *env_labels = std::getenv("SIGNREC_LABELS_PATH"); env_labels && *env_labels)
        labels_path = env_labels;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto need_value = [&](const char *flag) -> const char *
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << flag << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        const char *value = nullptr;
        if (arg == "--help" || arg == "-h")
        {
            usage(argv[0]);
            return 0;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            verbose = true;
        }
        else if (arg == "--model" || arg == "--labels" || arg == "--input" || arg == "--config" ||
                 arg == "--target" || arg == "--confidence" || arg == "--timeout-ms" || arg == "--threads")
        {
            if (!(value = need_value(arg.c_str())))
                return 2;
            if (arg == "--model")
                model_path = value;
            else if (arg == "--labels")
                labels_path = value;
            else if (arg == "--input")
                input_path = value;
            else if (arg == "--config")
                config_path = value;
            else if (arg == "--target")
                target = value;
            else if (arg == "--confidence" && !parse_float(value, cli_confidence))
            {
                std::cerr << "Invalid --confidence: " << value << "\n";
                return 2;
            }
            else if (arg == "--timeout-ms" && !parse_int(value, cli_timeout_ms))
            {
                std::cerr << "Invalid --timeout-ms: " << value << "\n";
                return 2;
            }
            else if (arg == "--threads" && !parse_int(value, threads))
            {
                std::cerr << "Invalid --threads: " << value << "\n";
                return 2;
            }
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    if (model_path.empty() || labels_path.empty() || input_path.empty())
    {
        usage(argv[0]);
        return 2;
    }

    // Precedence: defaults < metadata < config file < environment < flags
    RecognizerConfig config;
    LabelSet labels;
    if (!labels.load(labels_path))
    {
        std::cerr << "[Config] Cannot load label set: " << labels.last_error() << "\n";
        return 2;
    }
    labels.apply_to(config);

    if (!config_path.empty() && !config.load_from_file(config_path))
    {
        std::cerr << "[Config] Invalid configuration file: " << config_path << "\n";
        return 2;
    }
    config.apply_env_overrides();
    if (cli_confidence >= 0.0f)
        config.min_confidence = cli_confidence;
    if (cli_timeout_ms >= 0)
        config.inference_timeout_ms = cli_timeout_ms;
    if (verbose)
        config.verbose = true;

    if (!config.validate())
    {
        std::cerr << "[Config] " << config.describe_invalid() << "\n";
        return 2;
    }

    // Integrity checks on metadata and model
    std::string secret;
    if (const char *env_secret = std::getenv("SIGNREC_SECRET"); env_secret && *env_secret)
        secret = env_secret;
    if (!labels.verify_signature(secret))
    {
        std::cerr << "[Config] " << labels_path << ": " << labels.last_error() << "\n";
        return 2;
    }
    if (!labels.verify_model(model_path))
    {
        std::cerr << "[Config] " << labels.last_error() << "\n";
        return 2;
    }

    tflite::TFLiteConfig tfl_config;
    tfl_config.model_path = model_path;
    tfl_config.num_threads = threads;
    tfl_config.verbose = config.verbose;

    if (!tflite::TFLiteClassifier::is_available())
    {
        std::cerr << "[Config] This build has no TensorFlow Lite support\n";
        return 2;
    }
    tflite::TFLiteClassifier classifier;
    if (!classifier.init(tfl_config))
    {
        std::cerr << "[Config] Cannot load model: " << classifier.last_error() << "\n";
        return 2;
    }
    if (classifier.input_steps() != static_cast<size_t>(config.window_capacity) ||
        classifier.input_features() != static_cast<size_t>(config.feature_dim))
    {
        std::cerr << "[Config] Model expects [" << classifier.input_steps() << ", "
                  << classifier.input_features() << "] but window is ["
                  << config.window_capacity << ", " << config.feature_dim << "]\n";
        return 2;
    }

    GestureRecognizer recognizer;
    if (!recognizer.init(config, classifier, labels))
    {
        std::cerr << "[Config] " << recognizer.last_error() << "\n";
        return 2;
    }

    JsonlLandmarkSource source;
    if (!source.open(input_path))
    {
        std::cerr << "[Replay] " << source.last_error() << "\n";
        return 2;
    }

    TargetGestureFilter quiz;
    if (!target.empty())
        quiz.set_target(target);

    std::cerr << "[Replay] Window " << config.window_capacity << " frames, min confidence "
              << config.min_confidence << ", reset after " << config.reset_threshold
              << " frames without hands\n";
    if (quiz.target())
        std::cerr << "[Replay] Target gesture: " << *quiz.target() << "\n";

    Hands hands;
    uint64_t frame = 0;
    while (source.next(hands))
    {
        ++frame;
        RecognitionEvent event = recognizer.process_frame(hands);
        if (event.is_error())
        {
            std::cerr << "[Replay] frame " << frame << ": error: " << event.reason << "\n";
            continue;
        }
        if (!event.is_recognized())
            continue;

        std::cout << "frame " << frame << ": " << event.label << " ("
                  << std::fixed << std::setprecision(0) << event.confidence * 100.0f << "%)";
        switch (quiz.evaluate(event))
        {
        case TargetVerdict::HIT:
            std::cout << " correct " << quiz.hits() << "/" << quiz.attempts();
            break;
        case TargetVerdict::MISS:
            std::cout << " wrong, expected " << *quiz.target() << " " << quiz.hits() << "/" << quiz.attempts();
            break;
        case TargetVerdict::NO_TARGET:
            break;
        }
        std::cout << "\n";
    }

    int rc = 0;
    if (!source.last_error().empty())
    {
        std::cerr << "[Replay] Input error at " << source.last_error() << "\n";
        rc = 1;
    }

    const RecognitionStats &stats = recognizer.get_stats();
    std::cerr << std::fixed;
    std::cerr << "\n[Replay] Session summary\n";
    std::cerr << "  Frames: " << stats.frames_processed << " (" << stats.frames_with_hands << " with hands)\n";
    std::cerr << "  Inferences: " << stats.inferences_run << " (avg " << std::setprecision(2)
              << stats.avg_inference_ms << " ms, " << stats.inference_failures << " failed, "
              << stats.low_confidence_discards << " below threshold)\n";
    std::cerr << "  Gestures recognized: " << stats.gestures_recognized << "\n";
    std::cerr << "  Absence resets: " << stats.absence_resets << "\n";
    if (quiz.target() && quiz.attempts() > 0)
    {
        std::cerr << "  Target " << *quiz.target() << ": " << quiz.hits() << "/" << quiz.attempts()
                  << " (" << std::setprecision(1) << quiz.hit_rate() * 100.0 << "%)\n";
    }
    return rc;
}
