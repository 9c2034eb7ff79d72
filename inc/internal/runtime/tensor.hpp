#ifndef TENSOR_HPP
#define TENSOR_HPP

#include <cstdint>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace voice {

// =============================================================================
// Tensor - host-side tensor exchanged with inference sessions
// =============================================================================
//
// Row-major, CPU-resident. Only the two element types the synthesis graphs
// consume are supported: float32 activations and int64 text codes.
//

enum class TensorType {
    FLOAT32,
    INT64,
};

struct Tensor {
    TensorType type = TensorType::FLOAT32;
    std::vector<int64_t> shape;
    std::vector<float> f32;
    std::vector<int64_t> i64;

    static Tensor ofFloat(std::vector<float> data, std::vector<int64_t> dims) {
        Tensor t;
        t.type = TensorType::FLOAT32;
        t.f32 = std::move(data);
        t.shape = std::move(dims);
        return t;
    }

    static Tensor ofInt64(std::vector<int64_t> data, std::vector<int64_t> dims) {
        Tensor t;
        t.type = TensorType::INT64;
        t.i64 = std::move(data);
        t.shape = std::move(dims);
        return t;
    }

    /// @brief Product of dims; 0 for an empty shape
    static size_t countElements(const std::vector<int64_t>& dims) {
        if (dims.empty()) return 0;
        size_t n = 1;
        for (auto d : dims) {
            n *= static_cast<size_t>(d < 0 ? 0 : d);
        }
        return n;
    }

    size_t elementCount() const {
        return type == TensorType::FLOAT32 ? f32.size() : i64.size();
    }

    /// @brief Data length agrees with the declared shape
    bool isConsistent() const {
        return countElements(shape) == elementCount();
    }

    bool empty() const {
        return elementCount() == 0;
    }
};

using TensorMap = std::map<std::string, Tensor>;

}  // namespace voice

#endif  // TENSOR_HPP
