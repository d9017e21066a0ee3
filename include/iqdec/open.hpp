#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include "iqdec/formats/reader.hpp"
#include "iqdec/formats/tcap.hpp"
#include "iqdec/formats/tdms.hpp"

namespace iqdec {

// Construction-time settings for the readers that take any.
struct ReaderOptions {
    formats::TcapLayout tcap;
    formats::TdmsProbeLimits tdms;
};

// Lower-case extension including the dot, e.g. ".tdms".
std::string normalized_extension(const std::filesystem::path& path);

// Picks the reader by file extension (case-insensitive):
//   .tdms .iqt .tiq .dat(TCAP) .bin .txt .csv .wav .iq(header only)
// Throws DecodeError(StructuralMismatch) for anything else. Nothing is read
// until probe() or read().
std::unique_ptr<formats::Reader> open_reader(const std::filesystem::path& path, const ReaderOptions& options = {});

} // namespace iqdec
