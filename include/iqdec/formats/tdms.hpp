#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "iqdec/formats/reader.hpp"
#include "iqdec/formats/tdms_segment.hpp"

namespace iqdec::formats {

enum class StrideState {
    ScanningMetadata, // no I/Q values seen yet
    ScanningRecord,   // inside a record, last values unchanged
    BoundaryDetected, // the latest segment closed a record
};

const char* to_string(StrideState s);

// Learns where records end from the sequence of segment end offsets and the
// last accumulated I and Q values. A record boundary is a segment after which
// both last values differ from those at the previous boundary; the first
// segment carrying I/Q data always closes record 1.
class RecordStrideProbe {
public:
    StrideState observe(uint64_t segment_end, std::optional<int16_t> last_i, std::optional<int16_t> last_q);

    StrideState state() const { return state_; }
    std::size_t boundaries() const { return boundaries_; }
    bool complete() const { return boundaries_ >= 2; }

    // Valid once the first / second boundary has been seen.
    uint64_t first_record_end() const { return first_end_; }
    uint64_t record_stride() const { return stride_; }

private:
    StrideState state_{StrideState::ScanningMetadata};
    std::size_t boundaries_{0};
    std::optional<int16_t> prev_i_;
    std::optional<int16_t> prev_q_;
    uint64_t first_end_{0};
    uint64_t stride_{0};
};

// Bounds the segment scan performed by probe().
struct TdmsProbeLimits {
    std::size_t max_segments{65536};
    uint64_t max_bytes{uint64_t{1} << 34};
};

// Root properties written by the NI I/Q recorder.
struct TdmsRootInfo {
    double iq_rate{0.0};
    double rf_attenuation{0.0};
    double carrier_frequency{0.0};
    uint64_t samples_per_record{0};
    uint64_t records_per_file{0};
};

// NI TDMS recording of int16 I and Q records with a float64 gain channel.
class TdmsReader : public Reader {
public:
    explicit TdmsReader(std::filesystem::path path, TdmsProbeLimits limits = {});

    std::string_view format_name() const override { return "tdms"; }

    const TdmsRootInfo& root_info() const { return root_; }
    // Root object properties as found during probe().
    const std::map<std::string, TdmsValue, std::less<>>& root_properties() const { return root_props_; }
    // Segments parsed by the most recent read().
    std::size_t last_segments_read() const { return segments_read_; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;

private:
    TdmsProbeLimits limits_;
    TdmsRootInfo root_;
    std::map<std::string, TdmsValue, std::less<>> root_props_;
    std::size_t segments_read_{0};
};

} // namespace iqdec::formats
