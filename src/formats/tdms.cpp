#include "iqdec/formats/tdms.hpp"
#include "iqdec/constants.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"
#include "iqdec/utils/normalize.hpp"
#include "iqdec/utils/text_header.hpp"
#include "iqdec/window.hpp"

#include <initializer_list>
#include <span>
#include <vector>

namespace iqdec::formats {

namespace {

constexpr const char* kFormat = "tdms";

std::optional<int16_t> last_i16(const TdmsSegmentParser& parser, const char* path) {
    const TdmsChannel* ch = parser.channel(path);
    if (!ch) return std::nullopt;
    return ch->last<int16_t>();
}

double root_number(const std::map<std::string, TdmsValue, std::less<>>& props, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = props.find(name);
        if (it == props.end()) continue;
        if (auto v = tdms_value_as_double(it->second)) return *v;
        throw_malformed(kFormat, "root property is not numeric", name);
    }
    throw_malformed(kFormat, "missing root property", *names.begin());
}

uint64_t root_count(const std::map<std::string, TdmsValue, std::less<>>& props, const char* name) {
    const double v = root_number(props, {name});
    const auto count = utils::to_count(v);
    if (!count || *count == 0) throw_malformed(kFormat, "must be a positive integer below 2^64", name);
    return *count;
}

} // namespace

const char* to_string(StrideState s) {
    switch (s) {
    case StrideState::ScanningMetadata: return "ScanningMetadata";
    case StrideState::ScanningRecord: return "ScanningRecord";
    case StrideState::BoundaryDetected: return "BoundaryDetected";
    }
    return "?";
}

StrideState RecordStrideProbe::observe(uint64_t segment_end, std::optional<int16_t> last_i,
                                       std::optional<int16_t> last_q) {
    if (complete()) return state_;
    if (!last_i || !last_q) {
        if (state_ == StrideState::BoundaryDetected) state_ = StrideState::ScanningRecord;
        return state_;
    }
    if (last_i != prev_i_ && last_q != prev_q_) {
        prev_i_ = last_i;
        prev_q_ = last_q;
        ++boundaries_;
        if (boundaries_ == 1) first_end_ = segment_end;
        else stride_ = segment_end - first_end_;
        state_ = StrideState::BoundaryDetected;
    } else {
        state_ = StrideState::ScanningRecord;
    }
    return state_;
}

TdmsReader::TdmsReader(std::filesystem::path path, TdmsProbeLimits limits)
    : Reader(std::move(path)), limits_(limits) {}

void TdmsReader::do_probe() {
    const uint64_t size = file_size();
    auto in = open_stream();
    TdmsSegmentParser parser(in, size, kFormat);
    RecordStrideProbe stride;

    while (!stride.complete()) {
        if (parser.segments_parsed() >= limits_.max_segments)
            throw_structural(kFormat, "no two record boundaries within " + std::to_string(limits_.max_segments) +
                                          " segments", "record_stride");
        if (parser.position() >= limits_.max_bytes)
            throw_structural(kFormat, "no two record boundaries within " + std::to_string(limits_.max_bytes) +
                                          " bytes", "record_stride");
        if (!parser.next_segment())
            throw_structural(kFormat, "end of file before two record boundaries", "record_stride");
        const StrideState st = stride.observe(parser.position(), last_i16(parser, TDMS_CHANNEL_I),
                                              last_i16(parser, TDMS_CHANNEL_Q));
        if (st == StrideState::BoundaryDetected)
            IQDEC_LOGF("tdms: record boundary %zu at %llu", stride.boundaries(),
                       static_cast<unsigned long long>(parser.position()));
    }
    if (stride.record_stride() == 0) throw_structural(kFormat, "record stride is zero", "record_stride");

    const TdmsObject* root = parser.object(TDMS_ROOT_PATH);
    if (!root) throw_malformed(kFormat, "root object absent", TDMS_ROOT_PATH);
    root_props_ = root->properties;
    root_.iq_rate = root_number(root_props_, {"IQRate"});
    root_.rf_attenuation = root_number(root_props_, {"RFAttentuation", "RFAttenuation"});
    root_.carrier_frequency = root_number(root_props_, {"IQCarrierFrequency"});
    root_.samples_per_record = root_count(root_props_, "NSamplesPerRecord");
    root_.records_per_file = root_count(root_props_, "NRecordsPerFile");

    const TdmsChannel* gain = parser.channel(TDMS_CHANNEL_GAIN);
    if (!gain || gain->size() == 0) throw_malformed(kFormat, "gain channel absent", TDMS_CHANNEL_GAIN);
    const double scale = gain->values<double>().front();

    SegmentGeometry geom;
    geom.first_record_end = stride.first_record_end();
    geom.record_stride = stride.record_stride();
    geom.samples_per_record = root_.samples_per_record;
    geom.records_per_file = root_.records_per_file;

    meta_ = CaptureMetadata{};
    meta_.sample_rate_hz = root_.iq_rate;
    meta_.center_hz = root_.carrier_frequency;
    meta_.rf_attenuation_db = root_.rf_attenuation;
    meta_.scale = scale;
    meta_.total_samples = geom.samples_per_record * geom.records_per_file;
    meta_.date_time = file_time_string();
    geometry_ = geom;
    IQDEC_LOGF("tdms: first record ends at %llu, stride %llu, %llu x %llu samples",
               static_cast<unsigned long long>(geom.first_record_end),
               static_cast<unsigned long long>(geom.record_stride),
               static_cast<unsigned long long>(geom.records_per_file),
               static_cast<unsigned long long>(geom.samples_per_record));
}

SampleBuffer TdmsReader::do_read(const WindowRequest& req) {
    const auto& geom = std::get<SegmentGeometry>(geometry_);
    const WindowPlan plan = compute_window(req, {geom.samples_per_record, geom.records_per_file}, kFormat);

    const uint64_t size = file_size();
    const uint64_t stop = geom.first_record_end + (plan.start_unit + plan.units_needed - 1) * geom.record_stride;
    if (stop > size)
        throw_structural(kFormat, "record " + std::to_string(plan.start_unit + plan.units_needed) +
                                      " would end beyond the file", "record_stride");

    auto in = open_stream();
    TdmsSegmentParser parser(in, size, kFormat);
    bool jumped = plan.start_unit == 0;
    while (parser.position() < stop) {
        if (!jumped && parser.position() == geom.first_record_end) {
            const uint64_t target = geom.first_record_end + (plan.start_unit - 1) * geom.record_stride;
            IQDEC_LOGF("tdms: end of first record, jumping to %llu", static_cast<unsigned long long>(target));
            parser.seek(target);
            jumped = true;
            continue;
        }
        parser.next_segment();
    }
    segments_read_ = parser.segments_parsed();
    if (!jumped) throw_structural(kFormat, "no segment ends at the first record boundary", "first_record_end");

    const TdmsChannel* ich = parser.channel(TDMS_CHANNEL_I);
    const TdmsChannel* qch = parser.channel(TDMS_CHANNEL_Q);
    if (!ich || !qch) throw_structural(kFormat, "I/Q channels absent", TDMS_CHANNEL_I);
    const std::vector<int16_t> ii = ich->values<int16_t>();
    const std::vector<int16_t> qq = qch->values<int16_t>();

    // The first record is always parsed; drop it when the window starts later.
    const uint64_t skip = (plan.start_unit > 0 ? geom.samples_per_record : 0) + plan.intra_unit_offset;
    if (ii.size() < skip + plan.total_samples || qq.size() < skip + plan.total_samples)
        throw_structural(kFormat, "records hold fewer samples than NSamplesPerRecord", "NSamplesPerRecord");

    const std::span<const int16_t> is(ii.data() + skip, plan.total_samples);
    const std::span<const int16_t> qs(qq.data() + skip, plan.total_samples);
    return utils::planar_to_complex<int16_t>(is, qs, meta_.scale);
}

} // namespace iqdec::formats
