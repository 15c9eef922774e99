#include "recognizer_config.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace signrec {

namespace {

// Reads an integer env var; returns false when unset or unparsable
bool env_int(const char* name, int& out)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0') {
        std::cerr << "[Config] Ignoring " << name << "=" << value << " (not an integer)\n";
        return false;
    }
    if (errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
        std::cerr << "[Config] Ignoring " << name << "=" << value << " (out of range)\n";
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool env_float(const char* name, float& out)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    char* end = nullptr;
    float parsed = std::strtof(value, &end);
    if (end == value || *end != '\0' || !std::isfinite(parsed)) {
        std::cerr << "[Config] Ignoring " << name << "=" << value << " (not a number)\n";
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

bool RecognizerConfig::validate() const noexcept {
    if (window_capacity < 1) return false;
    if (max_hands < 1) return false;
    if (feature_dim != max_hands * constants::kValuesPerHand) return false;
    // NaN fails both comparisons
    if (!(min_confidence >= 0.0f && min_confidence <= 1.0f)) return false;
    if (reset_threshold < 0) return false;
    if (vote_history_size < 1) return false;
    if (inference_timeout_ms < 0) return false;
    return true;
}

std::string RecognizerConfig::describe_invalid() const {
    if (window_capacity < 1) return "window_capacity must be >= 1";
    if (max_hands < 1) return "max_hands must be >= 1";
    if (feature_dim != max_hands * constants::kValuesPerHand) {
        std::ostringstream oss;
        oss << "feature_dim " << feature_dim << " does not match max_hands * "
            << constants::kValuesPerHand << " = " << max_hands * constants::kValuesPerHand;
        return oss.str();
    }
    if (!(min_confidence >= 0.0f && min_confidence <= 1.0f)) return "min_confidence must be within [0, 1]";
    if (reset_threshold < 0) return "reset_threshold must be >= 0";
    if (vote_history_size < 1) return "vote_history_size must be >= 1";
    if (inference_timeout_ms < 0) return "inference_timeout_ms must be >= 0";
    return {};
}

bool RecognizerConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return false;
    }

    std::string line;
    int line_no = 0;
    bool ok = true;
    while (std::getline(file, line)) {
        ++line_no;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        bool known = true;
        if (key == "window_capacity") iss >> window_capacity;
        else if (key == "max_hands") iss >> max_hands;
        else if (key == "feature_dim") iss >> feature_dim;
        else if (key == "min_confidence") iss >> min_confidence;
        else if (key == "reset_threshold") iss >> reset_threshold;
        else if (key == "vote_history_size") iss >> vote_history_size;
        else if (key == "inference_timeout_ms") iss >> inference_timeout_ms;
        else if (key == "verbose") iss >> verbose;
        else known = false;

        if (!known) {
            std::cerr << "[Config] " << path << ":" << line_no << ": unknown key '" << key << "'\n";
        } else if (iss.fail()) {
            std::cerr << "[Config] " << path << ":" << line_no << ": bad value for '" << key << "'\n";
            ok = false;
        }
    }

    if (!ok) return false;
    if (!validate()) {
        std::cerr << "[Config] " << path << ": " << describe_invalid() << "\n";
        return false;
    }
    return true;
}

bool RecognizerConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to save to: " << path << "\n";
        return false;
    }

    file << "# Sign Recognizer Configuration\n";
    file << "# Window\n";
    file << "window_capacity " << window_capacity << "\n";
    file << "max_hands " << max_hands << "\n";
    file << "feature_dim " << feature_dim << "\n";
    file << "\n# Gating and smoothing\n";
    file << "min_confidence " << min_confidence << "\n";
    file << "reset_threshold " << reset_threshold << "\n";
    file << "vote_history_size " << vote_history_size << "\n";
    file << "\n# Inference\n";
    file << "inference_timeout_ms " << inference_timeout_ms << "\n";
    file << "verbose " << verbose << "\n";
    return file.good();
}

void RecognizerConfig::apply_env_overrides() {
    int int_value = 0;
    float float_value = 0.0f;

    if (env_int("SIGNREC_WINDOW_CAPACITY", int_value)) window_capacity = int_value;
    if (env_float("SIGNREC_MIN_CONFIDENCE", float_value)) min_confidence = float_value;
    if (env_int("SIGNREC_RESET_THRESHOLD", int_value)) reset_threshold = int_value;
    if (env_int("SIGNREC_HISTORY_SIZE", int_value)) vote_history_size = int_value;
    if (env_int("SIGNREC_INFERENCE_TIMEOUT_MS", int_value)) inference_timeout_ms = int_value;
    if (env_int("SIGNREC_VERBOSE", int_value)) verbose = int_value != 0;
}

} // namespace signrec
