#include "label_set.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace signrec
{

    namespace
    {

        std::string trim(const std::string &s)
        {
            const char *ws = " \t\r\n";
            size_t b = s.find_first_not_of(ws);
            if (b == std::string::npos)
                return {};
            size_t e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }

        bool ends_with(const std::string &s, const std::string &suffix)
        {
            return s.size() >= suffix.size() &&
                   s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

    } // namespace

    LabelSet::LabelSet(std::vector<std::string> labels)
    {
        set_labels(std::move(labels));
    }

    bool LabelSet::set_labels(std::vector<std::string> labels)
    {
        if (labels.empty())
        {
            last_error_ = "label set is empty";
            return false;
        }
        std::set<std::string> seen;
        for (const auto &l : labels)
        {
            if (l.empty())
            {
                last_error_ = "label set contains an empty label";
                return false;
            }
            if (!seen.insert(l).second)
            {
                last_error_ = "duplicate label: " + l;
                return false;
            }
        }
        labels_ = std::move(labels);
        return true;
    }

    bool LabelSet::load(const std::string &path)
    {
        if (ends_with(path, ".json"))
            return load_metadata(path);
        return load_text(path);
    }

    bool LabelSet::load_metadata(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            last_error_ = "cannot open metadata: " + path;
            std::cerr << "[LabelSet] " << last_error_ << "\n";
            return false;
        }
        std::stringstream ss;
        ss << in.rdbuf();
        if (!parse_metadata(ss.str()))
        {
            std::cerr << "[LabelSet] " << path << ": " << last_error_ << "\n";
            return false;
        }
        return true;
    }

    bool LabelSet::parse_metadata(const std::string &json_text)
    {
        last_error_.clear();
        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(json_text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            last_error_ = std::string("JSON parse error: ") + e.what();
            return false;
        }

        if (!j.is_object() || !j.contains("classes") || !j["classes"].is_array())
        {
            last_error_ = "metadata has no \"classes\" array";
            return false;
        }

        ModelMetadata meta;
        std::vector<std::string> labels;
        try
        {
            for (const auto &c : j["classes"])
                labels.push_back(c.get<std::string>());

            if (j.contains("modelVersion"))
                meta.model_version = j["modelVersion"].get<std::string>();
            if (j.contains("minConfidenceThreshold"))
                meta.min_confidence = j["minConfidenceThreshold"].get<float>();
            if (j.contains("bufferSize"))
                meta.buffer_size = j["bufferSize"].get<int>();
            if (j.contains("resetThreshold"))
                meta.reset_threshold = j["resetThreshold"].get<int>();
            if (j.contains("historySize"))
                meta.history_size = j["historySize"].get<int>();
            if (j.contains("features"))
                meta.features = j["features"].get<int>();
            if (j.contains("modelSha256"))
                meta.model_sha256 = j["modelSha256"].get<std::string>();
            if (j.contains("signature"))
                meta.signature = j["signature"].get<std::string>();
        }
        catch (const nlohmann::json::exception &e)
        {
            last_error_ = std::string("bad metadata field: ") + e.what();
            return false;
        }

        if (j.contains("numClasses") && j["numClasses"].is_number_integer() &&
            j["numClasses"].get<size_t>() != labels.size())
        {
            last_error_ = "numClasses does not match the classes array";
            return false;
        }

        if (!set_labels(std::move(labels)))
            return false;

        metadata_ = meta;
        raw_json_ = json_text;
        return true;
    }

    bool LabelSet::load_text(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            last_error_ = "cannot open labels: " + path;
            std::cerr << "[LabelSet] " << last_error_ << "\n";
            return false;
        }

        std::vector<std::string> labels;
        std::string line;
        while (std::getline(in, line))
        {
            std::string label = trim(line);
            if (label.empty() || label[0] == '#')
                continue;
            labels.push_back(label);
        }

        if (!set_labels(std::move(labels)))
        {
            std::cerr << "[LabelSet] " << path << ": " << last_error_ << "\n";
            return false;
        }
        metadata_ = ModelMetadata{};
        raw_json_.clear();
        return true;
    }

    int LabelSet::index_of(const std::string &label) const
    {
        auto it = std::find(labels_.begin(), labels_.end(), label);
        if (it == labels_.end())
            return -1;
        return static_cast<int>(it - labels_.begin());
    }

    void LabelSet::apply_to(RecognizerConfig &config) const
    {
        if (metadata_.min_confidence)
            config.min_confidence = *metadata_.min_confidence;
        if (metadata_.buffer_size)
            config.window_capacity = *metadata_.buffer_size;
        if (metadata_.reset_threshold)
            config.reset_threshold = *metadata_.reset_threshold;
        if (metadata_.history_size)
            config.vote_history_size = *metadata_.history_size;
        if (metadata_.features)
            config.feature_dim = *metadata_.features;
    }

    bool LabelSet::verify_model(const std::string &model_path)
    {
        if (metadata_.model_sha256.empty())
            return true;

        std::string digest = crypto::sha256_file_hex(model_path);
        if (digest.empty())
        {
            last_error_ = "cannot read model for digest: " + model_path;
            return false;
        }
        if (!crypto::digest_equal(digest, metadata_.model_sha256))
        {
            last_error_ = "model digest mismatch for " + model_path;
            return false;
        }
        return true;
    }

    bool LabelSet::verify_signature(const std::string &secret)
    {
        if (metadata_.signature.empty())
            return true;

        std::string expected = metadata_signature(raw_json_, secret);
        if (!crypto::digest_equal(expected, metadata_.signature))
        {
            last_error_ = "metadata signature mismatch";
            return false;
        }
        return true;
    }

    std::string metadata_signature(const std::string &json_text, const std::string &secret)
    {
        nlohmann::json j = nlohmann::json::parse(json_text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return {};

        if (j.contains("signature"))
            j.erase("signature");

        // CBOR of the object with keys in sorted order is deterministic
        std::vector<uint8_t> cbor = nlohmann::json::to_cbor(j);
        std::string payload(cbor.begin(), cbor.end());

        if (!secret.empty())
            return crypto::hmac_sha256_hex(payload, secret);
        return crypto::sha256_hex(payload);
    }

} // namespace signrec
