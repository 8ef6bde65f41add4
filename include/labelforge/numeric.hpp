#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <variant>
#include <vector>

namespace lf {

// A shaped numeric buffer, row-major. This is the form tracer output and
// flattened segmentations travel in before they are normalized for encoding.
struct NumericArray {
    using Storage = std::variant<std::vector<uint8_t>,  std::vector<int32_t>,
                                 std::vector<int64_t>,  std::vector<uint64_t>,
                                 std::vector<float>,    std::vector<double>>;

    std::vector<size_t> shape{0};
    Storage data = std::vector<int64_t>{};

    NumericArray() = default;
    template<typename T>
    NumericArray(std::vector<size_t> s, std::vector<T> v) : shape(std::move(s)), data(std::move(v)) {
        if (count() != size()) throw std::invalid_argument("NumericArray: shape does not match element count");
    }

    // Elements implied by the shape (1 for a scalar shape).
    size_t count() const {
        return std::accumulate(shape.begin(), shape.end(), size_t(1), std::multiplies<size_t>());
    }
    size_t size() const { return std::visit([](const auto& v){ return v.size(); }, data); }
    bool is_integral() const {
        return !std::holds_alternative<std::vector<float>>(data) &&
               !std::holds_alternative<std::vector<double>>(data);
    }
    double value(size_t i) const { return std::visit([i](const auto& v){ return double(v.at(i)); }, data); }

    // Same elements viewed as one dimension.
    NumericArray flattened() const {
        NumericArray out = *this;
        out.shape = { size() };
        return out;
    }
};

// Shape and element values must agree; the storage type may differ.
inline bool operator==(const NumericArray& a, const NumericArray& b) {
    if (a.shape != b.shape || a.size() != b.size()) return false;
    for (size_t i=0; i<a.size(); ++i) if (a.value(i) != b.value(i)) return false;
    return true;
}
inline bool operator!=(const NumericArray& a, const NumericArray& b) { return !(a==b); }

// A single number in whichever width the producer happened to use.
using Scalar = std::variant<int32_t, int64_t, uint64_t, float, double>;

} // namespace lf
