#pragma once

#include "pose_encoder.hpp"
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>

namespace signrec {

// Pose detector contract: one call per captured frame
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    // Fill hands for the next frame (may be empty).
    // Returns false at end of stream or on error (see last_error()).
    virtual bool next(Hands& hands) = 0;

    const std::string& last_error() const { return last_error_; }

protected:
    std::string last_error_;
};

// Replays recorded detector output, one JSON object per line:
//   {"t": 1234, "hands": [[[x, y, z], ... 21 points], ...]}
// "t" (capture timestamp, ns) is optional. Blank lines are skipped.
class JsonlLandmarkSource : public LandmarkSource {
public:
    JsonlLandmarkSource() = default;

    bool open(const std::string& path);
    // Read from an existing stream (not owned)
    void attach(std::istream& in);

    bool next(Hands& hands) override;

    uint64_t line_number() const { return line_no_; }
    uint64_t last_timestamp_ns() const { return last_timestamp_ns_; }

    // Parse one record; false with error set on malformed input
    static bool parse_line(const std::string& line, Hands& hands,
                           uint64_t& timestamp_ns, std::string& error);

private:
    std::ifstream file_;
    std::istream* in_{nullptr};
    uint64_t line_no_{0};
    uint64_t last_timestamp_ns_{0};
};

} // namespace signrec
