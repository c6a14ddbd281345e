#include "tensor.h"
#include "random.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <new>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace dualattn {
namespace ml {

Tensor::Tensor()
    : dtype_(DataType::FLOAT32), data_(nullptr), backend_(nullptr),
      ownsData_(false) {}

Tensor::Tensor(const std::vector<int64_t> &shape, DataType dtype)
    : shape_(shape), dtype_(dtype), data_(nullptr), backend_(nullptr),
      ownsData_(false) {
  validateShape(shape);
}

Tensor::Tensor(std::initializer_list<int64_t> shape, DataType dtype)
    : Tensor(std::vector<int64_t>(shape), dtype) {}

Tensor::Tensor(const Tensor &other)
    : shape_(other.shape_), dtype_(other.dtype_), data_(nullptr),
      backend_(other.backend_), ownsData_(false) {
  if (other.data_ && other.numel() > 0) {
    allocate(backend_);
    copyDataFrom(other);
  }
}

Tensor::Tensor(Tensor &&other) noexcept
    : shape_(std::move(other.shape_)), dtype_(other.dtype_), data_(other.data_),
      backend_(other.backend_), ownsData_(other.ownsData_) {
  other.data_ = nullptr;
  other.ownsData_ = false;
}

Tensor &Tensor::operator=(const Tensor &other) {
  if (this != &other) {
    deallocate();
    shape_ = other.shape_;
    dtype_ = other.dtype_;
    backend_ = other.backend_;
    ownsData_ = false;

    if (other.data_ && other.numel() > 0) {
      allocate(backend_);
      copyDataFrom(other);
    } else {
      data_ = nullptr;
    }
  }
  return *this;
}

Tensor &Tensor::operator=(Tensor &&other) noexcept {
  if (this != &other) {
    deallocate();
    shape_ = std::move(other.shape_);
    dtype_ = other.dtype_;
    data_ = other.data_;
    backend_ = other.backend_;
    ownsData_ = other.ownsData_;

    other.data_ = nullptr;
    other.ownsData_ = false;
  }
  return *this;
}

Tensor::~Tensor() { deallocate(); }

int64_t Tensor::dim(int index) const {
  if (index < 0) {
    index += static_cast<int>(shape_.size());
  }
  if (index < 0 || index >= static_cast<int>(shape_.size())) {
    throw std::out_of_range("Dimension index out of range");
  }
  return shape_[index];
}

int64_t Tensor::numel() const {
  if (shape_.empty())
    return 0;
  return std::accumulate(shape_.begin(), shape_.end(), int64_t{1},
                         std::multiplies<int64_t>());
}

size_t Tensor::itemSize() const { return getDataTypeSize(dtype_); }

size_t Tensor::nbytes() const {
  return static_cast<size_t>(numel()) * itemSize();
}

int64_t Tensor::offsetOf(const std::vector<int64_t> &indices) const {
  if (indices.size() != shape_.size()) {
    throw std::invalid_argument("at: expected " + std::to_string(shape_.size()) +
                                " indices, got " + std::to_string(indices.size()));
  }
  if (!data_) {
    throw std::runtime_error("at: tensor data is not allocated");
  }
  int64_t offset = 0;
  for (size_t d = 0; d < shape_.size(); ++d) {
    if (indices[d] < 0 || indices[d] >= shape_[d]) {
      throw std::out_of_range("at: index " + std::to_string(indices[d]) +
                              " out of range for dim " + std::to_string(d) +
                              " of size " + std::to_string(shape_[d]));
    }
    offset = offset * shape_[d] + indices[d];
  }
  return offset;
}

void Tensor::allocate(Backend *backend) {
  if (data_ && ownsData_) {
    deallocate();
  }

  if (backend) {
    backend_ = backend;
  }

  size_t bytes = nbytes();
  if (bytes > 0) {
    if (backend_) {
      data_ = backend_->allocate(bytes);
    } else {
      data_ = std::malloc(bytes);
    }
    if (!data_) {
      throw std::bad_alloc();
    }
    ownsData_ = true;
  }
}

void Tensor::deallocate() {
  if (data_ && ownsData_) {
    if (backend_) {
      backend_->deallocate(data_);
    } else {
      std::free(data_);
    }
  }
  data_ = nullptr;
  ownsData_ = false;
}

DeviceType Tensor::deviceType() const {
  return backend_ ? backend_->getType() : DeviceType::CPU;
}

bool Tensor::isHostAccessible() const {
  return backend_ == nullptr || backend_->isHostMemory();
}

void Tensor::copyDataFrom(const Tensor &other) {
  if (numel() != other.numel() || dtype_ != other.dtype_) {
    throw std::invalid_argument("Tensor sizes and dtypes must match for copying");
  }
  if (numel() == 0) {
    return;
  }
  if (!other.data_) {
    throw std::runtime_error("copy: source tensor data is not allocated");
  }

  if (!data_) {
    allocate(backend_);
  }

  size_t bytes = nbytes();
  if (backend_ && other.backend_) {
    backend_->copyDeviceToDevice(data_, other.data_, bytes);
  } else if (backend_) {
    backend_->copyToDevice(data_, other.data_, bytes);
  } else if (other.backend_) {
    other.backend_->copyFromDevice(data_, other.data_, bytes);
  } else {
    std::memcpy(data_, other.data_, bytes);
  }
}

void Tensor::copyFromHost(const void *hostData, size_t bytes) {
  if (bytes != nbytes()) {
    throw std::invalid_argument("copyFromHost: expected " +
                                std::to_string(nbytes()) + " bytes, got " +
                                std::to_string(bytes));
  }
  if (bytes == 0) {
    return;
  }
  if (!data_) {
    allocate(backend_);
  }

  if (backend_) {
    backend_->copyToDevice(data_, hostData, bytes);
  } else {
    std::memcpy(data_, hostData, bytes);
  }
}

void Tensor::copyToHost(void *hostData, size_t bytes) const {
  if (bytes == 0) {
    return;
  }
  if (!data_) {
    throw std::runtime_error("Tensor data is not allocated");
  }
  if (bytes > nbytes()) {
    throw std::invalid_argument("copyToHost: requested more bytes than the tensor holds");
  }

  if (backend_) {
    backend_->copyFromDevice(hostData, data_, bytes);
  } else {
    std::memcpy(hostData, data_, bytes);
  }
}

std::vector<float> Tensor::toVector() const {
  if (dtype_ != DataType::FLOAT32) {
    throw std::runtime_error("toVector: only FLOAT32 supported");
  }
  std::vector<float> host(static_cast<size_t>(numel()));
  copyToHost(host.data(), host.size() * sizeof(float));
  return host;
}

Tensor Tensor::reshape(const std::vector<int64_t> &newShape) const {
  Tensor result(newShape, dtype_);
  if (result.numel() != numel()) {
    throw std::invalid_argument("reshape: cannot reshape " + shapeToString(shape_) +
                                " into " + shapeToString(newShape));
  }
  if (data_ && numel() > 0) {
    result.allocate(backend_);
    result.copyDataFrom(*this);
  }
  return result;
}

Tensor Tensor::zeros(const std::vector<int64_t> &shape, DataType dtype) {
  Tensor tensor(shape, dtype);
  tensor.allocate();

  size_t bytes = tensor.nbytes();
  if (bytes > 0) {
    std::memset(tensor.data_, 0, bytes);
  }

  return tensor;
}

Tensor Tensor::full(const std::vector<int64_t> &shape, float value) {
  Tensor tensor(shape, DataType::FLOAT32);
  tensor.allocate();
  float *data = tensor.data<float>();
  std::fill(data, data + tensor.numel(), value);
  return tensor;
}

Tensor Tensor::fromVector(const std::vector<float> &values,
                          const std::vector<int64_t> &shape) {
  Tensor tensor(shape, DataType::FLOAT32);
  if (static_cast<int64_t>(values.size()) != tensor.numel()) {
    throw std::invalid_argument("fromVector: " + std::to_string(values.size()) +
                                " values do not fill shape " + shapeToString(shape));
  }
  tensor.allocate();
  if (!values.empty()) {
    std::memcpy(tensor.data_, values.data(), values.size() * sizeof(float));
  }
  return tensor;
}

Tensor Tensor::randn(const std::vector<int64_t> &shape, RandomSource &rng,
                     float mean, float stddev) {
  Tensor tensor(shape, DataType::FLOAT32);
  tensor.allocate();
  float *data = tensor.data<float>();
  for (int64_t i = 0; i < tensor.numel(); ++i) {
    data[i] = rng.normal(mean, stddev);
  }
  return tensor;
}

void Tensor::validateShape(const std::vector<int64_t> &shape) const {
  for (int64_t dim : shape) {
    if (dim < 0) {
      throw std::invalid_argument("Shape dimensions must be non-negative");
    }
  }
}

size_t Tensor::getDataTypeSize(DataType dtype) {
  switch (dtype) {
  case DataType::FLOAT32:
    return sizeof(float);
  case DataType::FLOAT16:
    return sizeof(uint16_t);
  case DataType::BF16:
    return sizeof(uint16_t);
  case DataType::INT32:
    return sizeof(int32_t);
  case DataType::INT8:
    return sizeof(int8_t);
  case DataType::UINT8:
    return sizeof(uint8_t);
  case DataType::BOOL:
    return sizeof(bool);
  default:
    return 0;
  }
}

std::vector<int64_t> computeStrides(const std::vector<int64_t> &shape) {
  std::vector<int64_t> strides(shape.size(), 1);
  for (int i = static_cast<int>(shape.size()) - 2; i >= 0; --i) {
    strides[i] = strides[i + 1] * shape[i + 1];
  }
  return strides;
}

std::string shapeToString(const std::vector<int64_t> &shape) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0)
      oss << ", ";
    oss << shape[i];
  }
  oss << "]";
  return oss.str();
}

std::string dataTypeToString(DataType dtype) {
  switch (dtype) {
  case DataType::FLOAT32:
    return "float32";
  case DataType::FLOAT16:
    return "float16";
  case DataType::BF16:
    return "bf16";
  case DataType::INT32:
    return "int32";
  case DataType::INT8:
    return "int8";
  case DataType::UINT8:
    return "uint8";
  case DataType::BOOL:
    return "bool";
  default:
    return "unknown";
  }
}

DataType stringToDataType(const std::string &dtypeStr) {
  if (dtypeStr == "float32")
    return DataType::FLOAT32;
  if (dtypeStr == "float16")
    return DataType::FLOAT16;
  if (dtypeStr == "bf16")
    return DataType::BF16;
  if (dtypeStr == "int32")
    return DataType::INT32;
  if (dtypeStr == "int8")
    return DataType::INT8;
  if (dtypeStr == "uint8")
    return DataType::UINT8;
  if (dtypeStr == "bool")
    return DataType::BOOL;
  throw std::invalid_argument("Unknown data type: " + dtypeStr);
}

} // namespace ml
} // namespace dualattn
