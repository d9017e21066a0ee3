#include "iqdec/open.hpp"
#include "iqdec/error.hpp"
#include "iqdec/formats/iqt.hpp"
#include "iqdec/formats/raw.hpp"
#include "iqdec/formats/tiq.hpp"
#include "iqdec/formats/wav.hpp"
#include "iqdec/log.hpp"

#include <algorithm>
#include <cctype>

namespace iqdec {

std::string normalized_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::unique_ptr<formats::Reader> open_reader(const std::filesystem::path& path, const ReaderOptions& options) {
    const std::string ext = normalized_extension(path);
    IQDEC_LOGF("open: %s as '%s'", path.string().c_str(), ext.c_str());
    if (ext == ".tdms") return std::make_unique<formats::TdmsReader>(path, options.tdms);
    if (ext == ".iqt") return std::make_unique<formats::IqtReader>(path);
    if (ext == ".tiq") return std::make_unique<formats::TiqReader>(path);
    if (ext == ".dat") return std::make_unique<formats::TcapReader>(path, options.tcap);
    if (ext == ".bin") return std::make_unique<formats::RawBinReader>(path);
    if (ext == ".txt" || ext == ".csv") return std::make_unique<formats::AsciiReader>(path);
    if (ext == ".wav") return std::make_unique<formats::WavReader>(path);
    if (ext == ".iq") return std::make_unique<formats::IqHeaderReader>(path);
    throw_structural("open", "unsupported file extension '" + ext + "'", "extension");
}

} // namespace iqdec
