// Synthetic capture files for the reader tests.
#pragma once
#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace iqdec::test {

// Per-test scratch directory, removed on destruction.
class ScratchDir {
public:
  ScratchDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "iqdec_";
    if (info) name += std::string(info->test_suite_name()) + "_" + info->name();
    dir_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  std::filesystem::path write(const std::string& name, const std::vector<uint8_t>& bytes) const {
    auto p = dir_ / name;
    std::ofstream out(p, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return p;
  }
  std::filesystem::path write_text(const std::string& name, std::string_view text) const {
    return write(name, std::vector<uint8_t>(text.begin(), text.end()));
  }
  const std::filesystem::path& path() const { return dir_; }

private:
  std::filesystem::path dir_;
};

// Append-only byte builder.
struct Bytes {
  std::vector<uint8_t> b;

  template <typename T> Bytes& le(T v) {
    uint8_t raw[sizeof(T)];
    std::memcpy(raw, &v, sizeof(T));
    for (std::size_t i = 0; i < sizeof(T); ++i) b.push_back(raw[i]);  // host is little-endian
    return *this;
  }
  template <typename T> Bytes& be(T v) {
    uint8_t raw[sizeof(T)];
    std::memcpy(raw, &v, sizeof(T));
    for (std::size_t i = sizeof(T); i-- > 0;) b.push_back(raw[i]);
    return *this;
  }
  Bytes& text(std::string_view s) {
    b.insert(b.end(), s.begin(), s.end());
    return *this;
  }
  Bytes& tdms_string(std::string_view s) {
    le<uint32_t>(static_cast<uint32_t>(s.size()));
    return text(s);
  }
  Bytes& append(const Bytes& o) {
    b.insert(b.end(), o.b.begin(), o.b.end());
    return *this;
  }
  Bytes& zeros(std::size_t n) {
    b.insert(b.end(), n, 0);
    return *this;
  }
  std::size_t size() const { return b.size(); }
};

// <d><d digits of length><block>
inline Bytes length_prefixed(std::string_view block) {
  const std::string len = std::to_string(block.size());
  Bytes out;
  out.text(std::to_string(len.size())).text(len).text(block);
  return out;
}

// ---- IQT ------------------------------------------------------------------

struct IqtCapture {
  uint32_t fft_points = 4;
  uint32_t frames = 3;
  double gain_offset = 0.0;
  double max_input_level = 0.0;
  double level_offset = 0.0;
  std::string frame_length = "4u";  // 4 points per 4 us -> 1 MHz
};

inline std::string iqt_header_text(const IqtCapture& s) {
  return "FFTPoints=" + std::to_string(s.fft_points) + "\n" +
         "MaxInputLevel=" + std::to_string(s.max_input_level) + "\n" +
         "LevelOffset=" + std::to_string(s.level_offset) + "\n" +
         "FrameLength=" + s.frame_length + "\n" +
         "GainOffset=" + std::to_string(s.gain_offset) + "\n" +
         "CenterFrequency=245M\n"
         "Span=500k\n"
         "ValidFrames=" + std::to_string(s.frames) + "\n" +
         "DateTime=2019/04/23 10:15:00 AM\n";
}

// Sample k of the file has I = k + 1, Q = -(k + 1), stored Q first.
inline std::vector<uint8_t> make_iqt(const IqtCapture& s) {
  Bytes out = length_prefixed(iqt_header_text(s));
  int16_t k = 0;
  for (uint32_t f = 0; f < s.frames; ++f) {
    out.le<int16_t>(0).le<int16_t>(1).le<int16_t>(1).le<int16_t>(1).le<int16_t>(1);
    out.le<int16_t>(static_cast<int16_t>(s.fft_points)).le<int16_t>(0).le<int16_t>(0);
    out.le<int16_t>(f == 1 ? 1 : 0).le<int16_t>(f + 1 == s.frames ? 1 : 0).le<int32_t>(static_cast<int32_t>(f * 100));
    for (uint32_t p = 0; p < s.fft_points; ++p) {
      ++k;
      out.le<int16_t>(static_cast<int16_t>(-k)).le<int16_t>(k);
    }
  }
  return out.b;
}

// ---- TIQ ------------------------------------------------------------------

inline std::string tiq_xml(uint64_t samples, std::string_view extra = {}) {
  return std::string(
             "<DataFile xmlns=\"http://www.tektronix.com\">\n"
             "<DataSetsCollection><DataSets><DataDescription>\n"
             "<NumberSamples>") + std::to_string(samples) + "</NumberSamples>\n"
         "<SamplingFrequency>1000000</SamplingFrequency>\n"
         "<Scaling>0.5</Scaling>\n"
         "</DataDescription>\n"
         "<ProductSpecific><AcquisitionBandwidth>800000</AcquisitionBandwidth>\n"
         "<Frequency>245000000</Frequency>\n"
         "<DateTime>2016-05-11T10:00:00.000+02:00</DateTime>\n"
         "<RFAttenuation>10</RFAttenuation></ProductSpecific>\n"
         "</DataSets></DataSetsCollection>\n"
         "<Setup>\n"
         "<NumericParameter name=\"Span\" pid=\"span\"><Value>1</Value></NumericParameter>\n"
         "<NumericParameter name=\"Span\" pid=\"globalrange\"><Value>500000</Value></NumericParameter>\n"
         "<NumericParameter name=\"Resolution Bandwidth\" pid=\"rbw\"><Value>300</Value></NumericParameter>\n" +
         std::string(extra) +
         "</Setup>\n"
         "</DataFile>";
}

// Sample k has I = 1000 + k, Q = -1000 - k.
inline Bytes tiq_payload(uint64_t samples) {
  Bytes out;
  for (uint64_t k = 0; k < samples; ++k)
    out.le<int32_t>(static_cast<int32_t>(1000 + k)).le<int32_t>(-static_cast<int32_t>(1000 + k));
  return out;
}

inline std::vector<uint8_t> make_tiq_prefixed(uint64_t samples) {
  Bytes out = length_prefixed(tiq_xml(samples));
  return out.append(tiq_payload(samples)).b;
}

// Instrument form: root element carries offset="NNN" to the payload.
inline std::vector<uint8_t> make_tiq_offset(uint64_t samples, std::size_t offset = 4096) {
  std::string xml = tiq_xml(samples);
  const std::string root = "<DataFile ";
  xml.replace(0, root.size(), "<DataFile offset=\"" + std::string(9 - std::to_string(offset).size(), '0') +
                                  std::to_string(offset) + "\" ");
  xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n" + xml;
  Bytes out;
  out.text(xml).zeros(offset - xml.size());
  return out.append(tiq_payload(samples)).b;
}

// ---- TCAP -----------------------------------------------------------------

constexpr std::size_t kTcapHeader = 88;
constexpr std::size_t kTcapPayload = 131072;

// BCD register for day 005, 12:30:45.1234567.
inline Bytes tcap_time_register() {
  Bytes r;
  r.zeros(3);
  r.le<uint8_t>(0x00).le<uint8_t>(0x05);  // status | days hundreds, days tens | units
  r.le<uint8_t>(0x12).le<uint8_t>(0x30).le<uint8_t>(0x45);  // hh mm ss
  r.le<uint8_t>(0x12).le<uint8_t>(0x34).le<uint8_t>(0x56).le<uint8_t>(0x70);  // 1e-1 .. 1e-7
  return r;
}

// Global sample g carries I = g % 32768, Q = -(g % 32768) - 1, big-endian.
inline std::vector<uint8_t> make_tcap(std::size_t blocks) {
  Bytes out;
  const std::size_t spb = kTcapPayload / 4;
  for (std::size_t blk = 0; blk < blocks; ++blk) {
    Bytes hdr = tcap_time_register();
    hdr.zeros(kTcapHeader - hdr.size());
    out.append(hdr);
    for (std::size_t k = 0; k < spb; ++k) {
      const auto v = static_cast<int16_t>((blk * spb + k) % 32768);
      out.be<int16_t>(v).be<int16_t>(static_cast<int16_t>(-v - 1));
    }
  }
  return out.b;
}

// ---- TDMS -----------------------------------------------------------------

constexpr uint32_t kTocMeta = 1u << 1;
constexpr uint32_t kTocNewObjList = 1u << 2;
constexpr uint32_t kTocRaw = 1u << 3;
constexpr uint32_t kTocInterleaved = 1u << 5;
constexpr uint32_t kTocBigEndian = 1u << 6;

inline Bytes tdms_segment(uint32_t toc, const Bytes& meta, const Bytes& raw) {
  Bytes out;
  out.text("TDSm").le<uint32_t>(toc).le<uint32_t>(4713);
  out.le<uint64_t>(meta.size() + raw.size()).le<uint64_t>(meta.size());
  return out.append(meta).append(raw);
}

// Raw index for a channel of `count` values of `type`.
inline Bytes tdms_index(uint32_t type, uint64_t count) {
  Bytes out;
  out.le<uint32_t>(20).le<uint32_t>(type).le<uint32_t>(1).le<uint64_t>(count);
  return out;
}

struct TdmsRecorderCapture {
  uint32_t samples_per_record = 8;
  uint32_t records = 4;
  uint32_t declared_records = 0;  // 0: same as records
  std::string declared_records_text;  // replaces the NRecordsPerFile text when set
  double gain = 0.5;
  bool trailing_header_segments = false;
};

// I of record r, sample k.
inline int16_t tdms_i(uint32_t r, uint32_t k) { return static_cast<int16_t>(r * 100 + k + 1); }
inline int16_t tdms_q(uint32_t r, uint32_t k) { return static_cast<int16_t>(-(static_cast<int>(r) * 100 + static_cast<int>(k) + 1)); }

// Recorder layout: record 0 carries the root properties and full indexes,
// later records reuse the indexes. Each record is one segment of gain, I, Q.
inline std::vector<uint8_t> make_recorder_tdms(const TdmsRecorderCapture& s) {
  const uint32_t nspr = s.samples_per_record;
  const uint32_t declared = s.declared_records ? s.declared_records : s.records;
  Bytes file;
  for (uint32_t r = 0; r < s.records; ++r) {
    Bytes meta;
    if (r == 0) {
      meta.le<uint32_t>(6);
      meta.tdms_string("/").le<uint32_t>(0xFFFFFFFF).le<uint32_t>(5);
      meta.tdms_string("IQRate").le<uint32_t>(0x0A).le<double>(2.0e6);
      meta.tdms_string("RFAttentuation").le<uint32_t>(0x0A).le<double>(20.0);
      meta.tdms_string("IQCarrierFrequency").le<uint32_t>(0x0A).le<double>(1.0e9);
      meta.tdms_string("NSamplesPerRecord").le<uint32_t>(0x03).le<int32_t>(static_cast<int32_t>(nspr));
      meta.tdms_string("NRecordsPerFile").le<uint32_t>(0x20).tdms_string(s.declared_records_text.empty() ? std::to_string(declared) : s.declared_records_text);
      meta.tdms_string("/'RecordHeader'").le<uint32_t>(0xFFFFFFFF).le<uint32_t>(0);
      meta.tdms_string("/'RecordHeader'/'gain'").append(tdms_index(0x0A, 1)).le<uint32_t>(0);
      meta.tdms_string("/'RecordData'").le<uint32_t>(0xFFFFFFFF).le<uint32_t>(0);
      meta.tdms_string("/'RecordData'/'I'").append(tdms_index(0x02, nspr)).le<uint32_t>(0);
      meta.tdms_string("/'RecordData'/'Q'").append(tdms_index(0x02, nspr)).le<uint32_t>(0);
    } else {
      meta.le<uint32_t>(3);
      meta.tdms_string("/'RecordHeader'/'gain'").le<uint32_t>(0).le<uint32_t>(0);
      meta.tdms_string("/'RecordData'/'I'").le<uint32_t>(0).le<uint32_t>(0);
      meta.tdms_string("/'RecordData'/'Q'").le<uint32_t>(0).le<uint32_t>(0);
    }
    Bytes raw;
    raw.le<double>(r == 0 ? s.gain : s.gain * 2);
    for (uint32_t k = 0; k < nspr; ++k) raw.le<int16_t>(tdms_i(r, k));
    for (uint32_t k = 0; k < nspr; ++k) raw.le<int16_t>(tdms_q(r, k));
    file.append(tdms_segment(kTocMeta | kTocNewObjList | kTocRaw, meta, raw));

    if (s.trailing_header_segments) {
      Bytes none;
      none.le<uint32_t>(0);
      file.append(tdms_segment(kTocMeta, none, Bytes{}));
    }
  }
  return file.b;
}

// ---- WAV ------------------------------------------------------------------

struct WavCapture {
  uint16_t format_tag = 1;  // PCM
  uint16_t sub_format = 0;  // SubFormat tag when format_tag is 0xFFFE
  uint16_t bits = 16;
  uint16_t channels = 2;
  uint32_t rate = 48000;
  uint32_t samples = 64;
};

// Channel 0 of sample k holds k + 1, channel 1 holds -(k + 1); float
// encodings hold a quarter of that. An odd-sized "note" chunk sits between
// 'fmt ' and 'data'.
inline std::vector<uint8_t> make_wav(const WavCapture& s) {
  const uint16_t tag = s.format_tag == 0xFFFE ? s.sub_format : s.format_tag;
  const auto align = static_cast<uint16_t>(s.channels * s.bits / 8);
  Bytes fmt;
  fmt.le<uint16_t>(s.format_tag).le<uint16_t>(s.channels).le<uint32_t>(s.rate);
  fmt.le<uint32_t>(s.rate * align).le<uint16_t>(align).le<uint16_t>(s.bits);
  if (s.format_tag == 0xFFFE) {
    fmt.le<uint16_t>(22).le<uint16_t>(s.bits).le<uint32_t>(3).le<uint16_t>(s.sub_format).zeros(14);
  }
  Bytes data;
  for (uint32_t k = 0; k < s.samples; ++k) {
    for (uint16_t c = 0; c < s.channels; ++c) {
      const int32_t v = c == 0 ? static_cast<int32_t>(k + 1) : -static_cast<int32_t>(k + 1);
      if (tag == 3 && s.bits == 32) data.le<float>(static_cast<float>(v) * 0.25f);
      else if (tag == 3) data.le<double>(v * 0.25);
      else if (s.bits == 16) data.le<int16_t>(static_cast<int16_t>(v));
      else data.le<int32_t>(v);
    }
  }
  Bytes body;
  body.text("WAVE");
  body.text("fmt ").le<uint32_t>(static_cast<uint32_t>(fmt.size())).append(fmt);
  body.text("note").le<uint32_t>(3).text("abc").zeros(1);
  body.text("data").le<uint32_t>(static_cast<uint32_t>(data.size())).append(data);
  Bytes out;
  out.text("RIFF").le<uint32_t>(static_cast<uint32_t>(body.size())).append(body);
  return out.b;
}

}  // namespace iqdec::test
