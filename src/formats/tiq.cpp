#include "iqdec/formats/tiq.hpp"
#include "iqdec/constants.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"
#include "iqdec/utils/normalize.hpp"
#include "iqdec/utils/text_header.hpp"
#include "iqdec/window.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <istream>
#include <memory>
#include <optional>

namespace iqdec::formats {

namespace {

constexpr const char* kFormat = "tiq";

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
struct XmlCharDeleter {
    void operator()(xmlChar* p) const { xmlFree(p); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlString = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string node_text(xmlNode* node) {
    XmlString content(xmlNodeGetContent(node));
    return content ? std::string(reinterpret_cast<const char*>(content.get())) : std::string();
}

std::string attribute(xmlNode* node, const char* name) {
    XmlString value(xmlGetProp(node, reinterpret_cast<const xmlChar*>(name)));
    return value ? std::string(reinterpret_cast<const char*>(value.get())) : std::string();
}

bool has_name(const xmlNode* node, const char* name) {
    return xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

bool in_tektronix_ns(const xmlNode* node) {
    return node->ns && node->ns->href &&
           xmlStrcmp(node->ns->href, reinterpret_cast<const xmlChar*>(TIQ_XML_NAMESPACE)) == 0;
}

xmlNode* child_element(xmlNode* node, const char* name) {
    for (xmlNode* c = node->children; c; c = c->next)
        if (c->type == XML_ELEMENT_NODE && has_name(c, name)) return c;
    return nullptr;
}

double to_number(const std::string& text, const char* field) {
    const std::string_view t = utils::trim(text);
    const std::string s(t);
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0') throw_malformed(kFormat, "value '" + s + "' is not numeric", field);
    return v;
}

struct Collected {
    std::optional<double> acq_bw, center, rbw, rf_att, fs, span, scaling, number_samples;
    std::string date_time;
};

// Document order traversal; later matches overwrite earlier ones.
void collect(xmlNode* node, Collected& c) {
    for (xmlNode* n = node; n; n = n->next) {
        if (n->type != XML_ELEMENT_NODE) continue;
        if (in_tektronix_ns(n)) {
            if (has_name(n, "AcquisitionBandwidth")) c.acq_bw = to_number(node_text(n), "AcquisitionBandwidth");
            else if (has_name(n, "Frequency")) c.center = to_number(node_text(n), "Frequency");
            else if (has_name(n, "DateTime")) c.date_time = std::string(utils::trim(node_text(n)));
            else if (has_name(n, "NumberSamples")) c.number_samples = to_number(node_text(n), "NumberSamples");
            else if (has_name(n, "RFAttenuation")) c.rf_att = to_number(node_text(n), "RFAttenuation");
            else if (has_name(n, "SamplingFrequency")) c.fs = to_number(node_text(n), "SamplingFrequency");
            else if (has_name(n, "Scaling")) c.scaling = to_number(node_text(n), "Scaling");
        }
        if (has_name(n, "NumericParameter")) {
            const std::string name = attribute(n, "name");
            const std::string pid = attribute(n, "pid");
            xmlNode* value = child_element(n, "Value");
            if (value && name == "Resolution Bandwidth" && pid == "rbw") c.rbw = to_number(node_text(value), "rbw");
            if (value && name == "Span" && pid == "globalrange") c.span = to_number(node_text(value), "globalrange");
        }
        collect(n->children, c);
    }
}

uint64_t parse_offset_attribute(const std::string& first_line) {
    const std::size_t key = first_line.find("offset=\"");
    if (key == std::string::npos) throw_malformed(kFormat, "first line carries no offset attribute", "offset");
    const std::size_t begin = key + std::strlen("offset=\"");
    const std::size_t end = first_line.find('"', begin);
    if (end == std::string::npos || end == begin) throw_malformed(kFormat, "unterminated offset attribute", "offset");
    const std::string text = first_line.substr(begin, end - begin);
    uint64_t value = 0;
    for (const char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
            throw_malformed(kFormat, "offset '" + text + "' is not a number", "offset");
        if (!utils::append_decimal_digit(value, ch))
            throw_malformed(kFormat, "offset '" + text + "' overflows", "offset");
    }
    return value;
}

} // namespace

TiqHeader parse_tiq_xml(std::string_view xml) {
    // Instrument headers are padded up to the payload offset; parse up to the
    // closing bracket of the root element.
    const std::size_t last = xml.rfind('>');
    if (last == std::string_view::npos) throw_malformed(kFormat, "header holds no XML", "xml");
    xml = xml.substr(0, last + 1);

    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "header.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        throw_malformed(kFormat, std::string("XML header does not parse: ") + (err && err->message ? err->message : "?"),
                        "xml");
    }
    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) throw_malformed(kFormat, "XML header has no root element", "xml");

    Collected c;
    collect(root, c);

    if (!c.number_samples) throw_malformed(kFormat, "element missing", "NumberSamples");
    if (!c.fs) throw_malformed(kFormat, "element missing", "SamplingFrequency");
    if (!c.scaling) throw_malformed(kFormat, "element missing", "Scaling");
    const auto number_samples = utils::to_count(*c.number_samples);
    if (!number_samples) throw_malformed(kFormat, "not a sample count below 2^64", "NumberSamples");

    TiqHeader h;
    h.acq_bandwidth = c.acq_bw.value_or(0.0);
    h.center_frequency = c.center.value_or(0.0);
    h.date_time = c.date_time;
    h.number_samples = *number_samples;
    h.rbw = c.rbw.value_or(0.0);
    h.rf_attenuation = c.rf_att.value_or(0.0);
    h.sampling_frequency = *c.fs;
    h.span = c.span.value_or(0.0);
    h.scaling = *c.scaling;
    return h;
}

TiqFraming read_tiq_framing(std::istream& in) {
    const int first = in.peek();
    if (first == std::char_traits<char>::eof()) throw_io(kFormat, "file is empty", "header");

    TiqFraming out;
    if (std::isdigit(first)) {
        auto block = utils::read_prefixed_block(in, kFormat);
        out.xml = std::move(block.block);
        out.header_size = block.header_size;
        return out;
    }
    if (first != '<') throw_structural(kFormat, "header starts with neither a length prefix nor XML", "header");

    std::string line;
    std::getline(in, line);
    // An XML declaration may precede the root element.
    if (line.rfind("<?xml", 0) == 0 && line.find("offset=\"") == std::string::npos) {
        std::string next;
        std::getline(in, next);
        line += next;
    }
    const uint64_t offset = parse_offset_attribute(line);
    in.clear();
    in.seekg(0, std::ios::beg);
    const auto available = utils::remaining_bytes(in);
    if (available && offset > *available)
        throw_io(kFormat, "offset " + std::to_string(offset) + " lies beyond end of file", "offset");
    out.header_size = static_cast<std::size_t>(offset);
    out.xml.resize(out.header_size);
    in.read(out.xml.data(), static_cast<std::streamsize>(out.header_size));
    if (static_cast<std::size_t>(in.gcount()) != out.header_size)
        throw_io(kFormat, "offset " + std::to_string(out.header_size) + " lies beyond end of file", "offset");
    return out;
}

TiqReader::TiqReader(std::filesystem::path path) : Reader(std::move(path)) {}

void TiqReader::do_probe() {
    auto in = open_stream();
    TiqFraming framing = read_tiq_framing(in);
    header_ = parse_tiq_xml(framing.xml);
    xml_ = std::move(framing.xml);

    FlatGeometry geom;
    geom.header_size = framing.header_size;
    geom.bytes_per_sample = TIQ_BYTES_PER_SAMPLE;
    geom.sample_count = header_.number_samples;

    const uint64_t size = file_size();
    const uint64_t payload = size > geom.header_size ? size - geom.header_size : 0;
    if (payload / TIQ_BYTES_PER_SAMPLE < geom.sample_count) {
        throw_structural(kFormat,
                         "payload holds " + std::to_string(payload / TIQ_BYTES_PER_SAMPLE) +
                             " samples, header declares " + std::to_string(geom.sample_count),
                         "NumberSamples");
    }

    meta_ = CaptureMetadata{};
    meta_.acq_bandwidth_hz = header_.acq_bandwidth;
    meta_.center_hz = header_.center_frequency;
    meta_.date_time = header_.date_time;
    meta_.total_samples = header_.number_samples;
    meta_.rbw_hz = header_.rbw;
    meta_.rf_attenuation_db = header_.rf_attenuation;
    meta_.sample_rate_hz = header_.sampling_frequency;
    meta_.span_hz = header_.span;
    meta_.scale = header_.scaling;
    geometry_ = geom;

    IQDEC_LOGF("tiq: header size %zu bytes, center %.6g Hz, span %.6g Hz, fs %.6g, scale %.6g", geom.header_size,
               meta_.center_hz, meta_.span_hz, meta_.sample_rate_hz, meta_.scale);
}

SampleBuffer TiqReader::do_read(const WindowRequest& req) {
    const auto& geom = std::get<FlatGeometry>(geometry_);
    const WindowPlan plan = compute_window(req, {1, geom.sample_count}, kFormat);

    auto in = open_stream();
    const uint64_t offset = geom.header_size + geom.bytes_per_sample * plan.start_sample;
    const auto bytes = read_bytes(in, offset, geom.bytes_per_sample * plan.total_samples, "payload");

    SampleBuffer out;
    utils::append_interleaved_bytes<int32_t>(bytes, utils::ByteOrder::Little, utils::IqOrder::IQ, meta_.scale, out);
    return out;
}

} // namespace iqdec::formats
