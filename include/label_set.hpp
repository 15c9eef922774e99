#pragma once

#include "recognizer_config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace signrec {

// Optional fields of a model metadata file
struct ModelMetadata {
    std::string model_version;
    std::optional<float> min_confidence;   // "minConfidenceThreshold"
    std::optional<int> buffer_size;        // "bufferSize"
    std::optional<int> reset_threshold;    // "resetThreshold"
    std::optional<int> history_size;       // "historySize"
    std::optional<int> features;           // "features"
    std::string model_sha256;              // "modelSha256"
    std::string signature;                 // "signature"
};

// Ordered class labels of the classifier, fixed at load time.
// Index i of the probability vector belongs to labels()[i].
class LabelSet {
public:
    LabelSet() = default;
    explicit LabelSet(std::vector<std::string> labels);

    // metadata.json ("classes" array + optional thresholds)
    bool load_metadata(const std::string& path);
    bool parse_metadata(const std::string& json_text);

    // One label per line, '#' comments
    bool load_text(const std::string& path);

    // Picks load_metadata() for *.json, load_text() otherwise
    bool load(const std::string& path);

    size_t size() const { return labels_.size(); }
    bool empty() const { return labels_.empty(); }
    const std::string& at(size_t index) const { return labels_.at(index); }
    const std::vector<std::string>& labels() const { return labels_; }

    // Exact match; -1 when absent
    int index_of(const std::string& label) const;

    const ModelMetadata& metadata() const { return metadata_; }

    // Copy metadata-supplied thresholds into config
    void apply_to(RecognizerConfig& config) const;

    // Compare the model file digest against "modelSha256".
    // Passes when the metadata carries no digest.
    bool verify_model(const std::string& model_path);

    // Recompute the signature of the loaded metadata and compare.
    // Passes when the metadata carries no signature.
    bool verify_signature(const std::string& secret);

    const std::string& last_error() const { return last_error_; }

private:
    bool set_labels(std::vector<std::string> labels);

    std::vector<std::string> labels_;
    ModelMetadata metadata_;
    std::string raw_json_;
    std::string last_error_;
};

// Signature over the CBOR encoding of a metadata document without its
// "signature" field: HMAC-SHA256 when secret is non-empty, SHA-256 otherwise.
// Returns empty string if json_text does not parse.
std::string metadata_signature(const std::string& json_text, const std::string& secret);

} // namespace signrec
