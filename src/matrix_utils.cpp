#include "matrix_utils.h"
#include <cstdlib> // For posix_memalign and free
#include <cstring>
#include <new>
#include <random>

namespace matrix_utils {

float* alloc(int rows, int cols) {
    void* p = nullptr;
    // Align memory to a 64-byte boundary for AVX-512 compatibility
    if (posix_memalign(&p, 64, sizeof(float) * size_t(rows) * size_t(cols)) != 0) {
        return nullptr;
    }
    return static_cast<float*>(p);
}

void fill(float *data, std::size_t n, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    for (std::size_t i = 0; i < n; ++i) {
        data[i] = dist(rng);
    }
}

Matrix Matrix::zeros(int rows, int cols) {
    float *p = alloc(rows, cols);
    if (!p) throw std::bad_alloc();
    std::memset(p, 0, sizeof(float) * size_t(rows) * size_t(cols));
    return Matrix(rows, cols, p, true);
}

Matrix Matrix::random(int rows, int cols, std::uint32_t seed) {
    float *p = alloc(rows, cols);
    if (!p) throw std::bad_alloc();
    fill(p, size_t(rows) * size_t(cols), seed);
    return Matrix(rows, cols, p, true);
}

Matrix::Matrix(Matrix &&other) noexcept
    : data_(other.data_), rows_(other.rows_), cols_(other.cols_), owned_(other.owned_) {
    other.data_ = nullptr;
    other.owned_ = false;
}

Matrix &Matrix::operator=(Matrix &&other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        rows_ = other.rows_;
        cols_ = other.cols_;
        owned_ = other.owned_;
        other.data_ = nullptr;
        other.owned_ = false;
    }
    return *this;
}

void Matrix::release() {
    if (owned_) free(data_);
    data_ = nullptr;
    owned_ = false;
}

void Matrix::zero() {
    if (!data_) return;
    std::memset(data_, 0, sizeof(float) * size_t(rows_) * size_t(cols_));
}

double Matrix::sum() const {
    double s = 0.0;
    const std::size_t n = std::size_t(rows_) * std::size_t(cols_);
    for (std::size_t i = 0; i < n; ++i) s += data_[i];
    return s;
}

} // namespace matrix_utils
