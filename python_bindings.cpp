#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/complex.h>
#include <pybind11/numpy.h>
#include <complex>
#include <cstdint>
#include <memory>
#include <string>

#include "iqdec/error.hpp"
#include "iqdec/open.hpp"

namespace py = pybind11;

// Copy a decoded sample buffer into a fresh numpy complex128 array
py::array_t<std::complex<double>> samples_to_numpy(const iqdec::SampleBuffer& samples) {
    py::array_t<std::complex<double>> out(static_cast<py::ssize_t>(samples.size()));
    auto view = out.mutable_unchecked<1>();
    for (py::ssize_t k = 0; k < view.shape(0); ++k) view(k) = samples[static_cast<std::size_t>(k)];
    return out;
}

py::dict metadata_to_dict(const iqdec::CaptureMetadata& meta) {
    py::dict d;
    d["center"] = meta.center_hz;
    d["fs"] = meta.sample_rate_hz;
    d["span"] = meta.span_hz;
    d["rbw"] = meta.rbw_hz;
    d["rf_att"] = meta.rf_attenuation_db;
    d["acq_bw"] = meta.acq_bandwidth_hz;
    d["scale"] = meta.scale;
    d["date_time"] = meta.date_time;
    d["number_samples"] = meta.total_samples;
    return d;
}

PYBIND11_MODULE(iqdec, m) {
    m.doc() = "I/Q capture decoder Python bindings";

    py::register_exception<iqdec::DecodeError>(m, "DecodeError", PyExc_RuntimeError);

    py::class_<iqdec::WindowRequest>(m, "WindowRequest")
        .def(py::init<>())
        .def_readwrite("frame_length", &iqdec::WindowRequest::frame_length)
        .def_readwrite("frame_count", &iqdec::WindowRequest::frame_count)
        .def_readwrite("start_frame", &iqdec::WindowRequest::start_frame);

    py::class_<iqdec::formats::Reader, std::unique_ptr<iqdec::formats::Reader>>(m, "Reader")
        .def_property_readonly("format", [](const iqdec::formats::Reader& self) {
            return std::string(self.format_name());
        })
        .def("probe", [](iqdec::formats::Reader& self) { return metadata_to_dict(self.probe()); })
        .def("read", [](iqdec::formats::Reader& self, uint64_t nframes, uint64_t lframes, uint64_t sframes) {
            iqdec::WindowRequest req;
            req.frame_count = nframes;
            req.frame_length = lframes;
            req.start_frame = sframes;
            auto result = self.read(req);
            return samples_to_numpy(result.samples);
        }, "Decode nframes frames of lframes samples starting at 1-based frame sframes",
           py::arg("nframes") = 10, py::arg("lframes") = 1024, py::arg("sframes") = 1);

    m.def("open", [](const std::string& path) { return iqdec::open_reader(path); },
          "Open a capture file, choosing the format by extension", py::arg("path"));
}
