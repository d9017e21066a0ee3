#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include "iqdec/types.hpp"
#include "iqdec/utils/byte_order.hpp"

namespace iqdec::utils {

// Order of the two components inside one interleaved sample pair.
enum class IqOrder { IQ, QI };

// Interleaved integer pairs [i0,q0,i1,q1,...] (or [q0,i0,...] for QI) to
// scaled complex samples. An odd trailing value is ignored.
template <typename T>
SampleBuffer interleaved_to_complex(std::span<const T> values, double scale, IqOrder order = IqOrder::IQ) {
    const std::size_t n = values.size() / 2;
    SampleBuffer out(n);
    const std::size_t ii = order == IqOrder::IQ ? 0 : 1;
    const std::size_t qq = 1 - ii;
    for (std::size_t k = 0; k < n; ++k) {
        out[k] = Sample(static_cast<double>(values[2 * k + ii]) * scale,
                        static_cast<double>(values[2 * k + qq]) * scale);
    }
    return out;
}

// Same as interleaved_to_complex but reading integers straight from file
// bytes in the given byte order. Appends to `out`.
template <typename T>
void append_interleaved_bytes(std::span<const uint8_t> bytes, ByteOrder byte_order, IqOrder order, double scale,
                              SampleBuffer& out) {
    const std::size_t n = bytes.size() / (2 * sizeof(T));
    const std::size_t ii = order == IqOrder::IQ ? 0 : sizeof(T);
    const std::size_t qq = order == IqOrder::IQ ? sizeof(T) : 0;
    out.reserve(out.size() + n);
    for (std::size_t k = 0; k < n; ++k) {
        const uint8_t* pair = bytes.data() + k * 2 * sizeof(T);
        const T i = load<T>(pair + ii, byte_order);
        const T q = load<T>(pair + qq, byte_order);
        out.emplace_back(static_cast<double>(i) * scale, static_cast<double>(q) * scale);
    }
}

// Separate I and Q channels of equal length to scaled complex samples.
template <typename T>
SampleBuffer planar_to_complex(std::span<const T> i, std::span<const T> q, double scale) {
    if (i.size() != q.size()) throw std::invalid_argument("I and Q channels differ in length");
    SampleBuffer out(i.size());
    for (std::size_t k = 0; k < i.size(); ++k) {
        out[k] = Sample(static_cast<double>(i[k]) * scale, static_cast<double>(q[k]) * scale);
    }
    return out;
}

} // namespace iqdec::utils
