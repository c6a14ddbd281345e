#ifndef DUALATTN_ML_TENSOR_H
#define DUALATTN_ML_TENSOR_H

#include "backend/backend.h"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace dualattn {
namespace ml {

class RandomSource;

// Data types supported by tensors
enum class DataType {
    FLOAT32,
    FLOAT16,
    BF16,
    INT32,
    INT8,
    UINT8,
    BOOL
};

// Dense row-major tensor. Memory comes from the attached backend, or from
// the host heap when no backend is set.
class Tensor {
public:
    Tensor();
    Tensor(const std::vector<int64_t>& shape, DataType dtype = DataType::FLOAT32);
    Tensor(std::initializer_list<int64_t> shape, DataType dtype = DataType::FLOAT32);

    // Copy and move semantics
    Tensor(const Tensor& other);
    Tensor(Tensor&& other) noexcept;
    Tensor& operator=(const Tensor& other);
    Tensor& operator=(Tensor&& other) noexcept;

    ~Tensor();

    // Shape and type access
    const std::vector<int64_t>& shape() const { return shape_; }
    DataType dtype() const { return dtype_; }
    int ndim() const { return static_cast<int>(shape_.size()); }
    int64_t dim(int index) const;
    void* data() const { return data_; }
    int64_t numel() const;
    size_t itemSize() const;
    size_t nbytes() const;

    // Data access
    template<typename T>
    T* data() const { return static_cast<T*>(data_); }

    template<typename T>
    T& at(const std::vector<int64_t>& indices) {
        return static_cast<T*>(data_)[offsetOf(indices)];
    }

    template<typename T>
    const T& at(const std::vector<int64_t>& indices) const {
        return static_cast<const T*>(data_)[offsetOf(indices)];
    }

    // Returns a copy with the same elements and a new shape
    Tensor reshape(const std::vector<int64_t>& newShape) const;

    // Memory management
    // Throws std::bad_alloc when the backend or heap has no memory left
    void allocate(Backend* backend = nullptr);
    void deallocate();
    bool isAllocated() const { return data_ != nullptr; }

    // Backend access
    Backend* backend() const { return backend_; }
    DeviceType deviceType() const;
    bool isHostAccessible() const;

    // Data copying
    void copyFromHost(const void* hostData, size_t bytes);
    void copyToHost(void* hostData, size_t bytes) const;
    std::vector<float> toVector() const;

    bool sameShape(const Tensor& other) const { return shape_ == other.shape_; }

    // Host-allocated factories
    static Tensor zeros(const std::vector<int64_t>& shape, DataType dtype = DataType::FLOAT32);
    static Tensor full(const std::vector<int64_t>& shape, float value);
    static Tensor fromVector(const std::vector<float>& values, const std::vector<int64_t>& shape);
    static Tensor randn(const std::vector<int64_t>& shape, RandomSource& rng,
                        float mean = 0.0f, float stddev = 1.0f);

private:
    std::vector<int64_t> shape_;
    DataType dtype_;
    void* data_;
    Backend* backend_;
    bool ownsData_;

    // Copies element data across backends; sizes and dtypes must match
    void copyDataFrom(const Tensor& other);
    int64_t offsetOf(const std::vector<int64_t>& indices) const;
    void validateShape(const std::vector<int64_t>& shape) const;
    static size_t getDataTypeSize(DataType dtype);
};

// Row-major strides of a shape, in elements
std::vector<int64_t> computeStrides(const std::vector<int64_t>& shape);

std::string shapeToString(const std::vector<int64_t>& shape);

// Utility functions
std::string dataTypeToString(DataType dtype);
DataType stringToDataType(const std::string& dtypeStr);

} // namespace ml
} // namespace dualattn

#endif // DUALATTN_ML_TENSOR_H
