#include "landmark_source.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace signrec {

bool JsonlLandmarkSource::open(const std::string& path) {
    file_.close();
    file_.clear();
    file_.open(path);
    line_no_ = 0;
    if (!file_.is_open()) {
        last_error_ = "cannot open " + path;
        in_ = nullptr;
        return false;
    }
    in_ = &file_;
    return true;
}

void JsonlLandmarkSource::attach(std::istream& in) {
    in_ = &in;
    line_no_ = 0;
}

bool JsonlLandmarkSource::next(Hands& hands) {
    hands.clear();
    if (!in_) {
        last_error_ = "no input";
        return false;
    }

    std::string line;
    while (std::getline(*in_, line)) {
        ++line_no_;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        std::string error;
        uint64_t ts = last_timestamp_ns_;
        if (!parse_line(line, hands, ts, error)) {
            std::ostringstream oss;
            oss << "line " << line_no_ << ": " << error;
            last_error_ = oss.str();
            return false;
        }
        last_timestamp_ns_ = ts;
        return true;
    }

    last_error_.clear(); // clean end of stream
    return false;
}

bool JsonlLandmarkSource::parse_line(const std::string& line, Hands& hands,
                                     uint64_t& timestamp_ns, std::string& error) {
    hands.clear();
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        error = "record is not an object";
        return false;
    }
    if (j.contains("t")) {
        if (!j["t"].is_number_unsigned()) {
            error = "\"t\" must be a non-negative integer";
            return false;
        }
        timestamp_ns = j["t"].get<uint64_t>();
    }
    if (!j.contains("hands")) {
        return true; // frame without detections
    }
    if (!j["hands"].is_array()) {
        error = "\"hands\" must be an array";
        return false;
    }

    for (const auto& hand_json : j["hands"]) {
        if (!hand_json.is_array() || hand_json.size() != static_cast<size_t>(constants::kLandmarksPerHand)) {
            std::ostringstream oss;
            oss << "hand " << hands.size() << " must have exactly "
                << constants::kLandmarksPerHand << " landmarks";
            error = oss.str();
            hands.clear();
            return false;
        }
        HandLandmarks hand;
        for (size_t i = 0; i < hand_json.size(); ++i) {
            const auto& p = hand_json[i];
            if (!p.is_array() || p.size() != static_cast<size_t>(constants::kCoordsPerLandmark) ||
                !p[0].is_number() || !p[1].is_number() || !p[2].is_number()) {
                std::ostringstream oss;
                oss << "hand " << hands.size() << " landmark " << i << " must be [x, y, z]";
                error = oss.str();
                hands.clear();
                return false;
            }
            hand.points[i] = Landmark(p[0].get<float>(), p[1].get<float>(), p[2].get<float>());
        }
        hands.push_back(hand);
    }
    return true;
}

} // namespace signrec
