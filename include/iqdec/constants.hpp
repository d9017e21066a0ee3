#pragma once
#include <cstddef>
#include <cstdint>

namespace iqdec {

// TDMS lead-in and table-of-contents flags (NI TDMS file format, version 2.0).
inline constexpr std::size_t TDMS_LEAD_IN_SIZE = 28;
inline constexpr uint32_t TDMS_TOC_META_DATA    = 1u << 1;
inline constexpr uint32_t TDMS_TOC_NEW_OBJ_LIST = 1u << 2;
inline constexpr uint32_t TDMS_TOC_RAW_DATA     = 1u << 3;
inline constexpr uint32_t TDMS_TOC_INTERLEAVED  = 1u << 5;
inline constexpr uint32_t TDMS_TOC_BIG_ENDIAN   = 1u << 6;
inline constexpr uint32_t TDMS_TOC_DAQMX_RAW    = 1u << 7;
inline constexpr uint32_t TDMS_NO_RAW_DATA      = 0xFFFFFFFFu;
inline constexpr uint32_t TDMS_SAME_RAW_INDEX   = 0x00000000u;

// Channel paths written by the NI I/Q recorder.
inline constexpr const char* TDMS_ROOT_PATH    = "/";
inline constexpr const char* TDMS_CHANNEL_I    = "/'RecordData'/'I'";
inline constexpr const char* TDMS_CHANNEL_Q    = "/'RecordData'/'Q'";
inline constexpr const char* TDMS_CHANNEL_GAIN = "/'RecordHeader'/'gain'";

// IQT frame: ten int16 header words plus one int32 tick counter.
inline constexpr std::size_t IQT_FRAME_HEADER_SIZE = 24;
inline constexpr uint32_t IQT_DEFAULT_FFT_POINTS = 1024;

// TIQ payload: two little-endian int32 per sample.
inline constexpr std::size_t TIQ_BYTES_PER_SAMPLE = 8;
inline constexpr const char* TIQ_XML_NAMESPACE = "http://www.tektronix.com";

// TCAP block grid and first-block header regions.
inline constexpr std::size_t TCAP_BLOCK_HEADER_SIZE = 88;
inline constexpr std::size_t TCAP_BLOCK_PAYLOAD_SIZE = 1u << 17;
inline constexpr std::size_t TCAP_BLOCK_COUNT = 15625;
inline constexpr std::size_t TCAP_TIME_REGISTER_SIZE = 12;
inline constexpr std::size_t TCAP_PIO_SIZE = 12;
inline constexpr std::size_t TCAP_SCALER_TABLE_SIZE = 64;
inline constexpr std::size_t TCAP_BYTES_PER_SAMPLE = 4;

// RIFF/WAVE chunk framing and fmt chunk format tags.
inline constexpr std::size_t WAV_RIFF_HEADER_SIZE = 12;
inline constexpr std::size_t WAV_CHUNK_HEADER_SIZE = 8;
inline constexpr std::size_t WAV_FMT_MIN_SIZE = 16;
inline constexpr std::size_t WAV_FMT_EXTENSIBLE_SIZE = 40;
inline constexpr uint16_t WAV_FORMAT_PCM = 0x0001;
inline constexpr uint16_t WAV_FORMAT_IEEE_FLOAT = 0x0003;
inline constexpr uint16_t WAV_FORMAT_EXTENSIBLE = 0xFFFE;

} // namespace iqdec
