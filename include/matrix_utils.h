#pragma once

#include <immintrin.h>
#include <cassert>
#include <cstddef>
#include <cstdint>

namespace matrix_utils {

// Lanes of one AVX-512 float register
constexpr int kLanes = 16;

// Allocates rows x cols floats with 64-byte alignment suitable for AVX512.
// Returns nullptr on failure.
float* alloc(int rows, int cols);

// Fills n floats with uniform values in [0, 1) drawn from seed
void fill(float *data, std::size_t n, std::uint32_t seed);

// Row-major float32 matrix. Owns its buffer unless created with view().
class Matrix {
public:
    // Throw std::bad_alloc when the buffer cannot be allocated
    static Matrix zeros(int rows, int cols);
    static Matrix random(int rows, int cols, std::uint32_t seed);
    // Wraps an existing buffer of rows*cols floats; the buffer is never freed
    static Matrix view(int rows, int cols, float *data) { return Matrix(rows, cols, data, false); }

    Matrix(Matrix &&other) noexcept;
    Matrix &operator=(Matrix &&other) noexcept;
    Matrix(const Matrix &) = delete;
    Matrix &operator=(const Matrix &) = delete;
    ~Matrix() { release(); }

    void release();
    void zero();

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    bool owned() const { return owned_; }
    float *data() { return data_; }
    const float *data() const { return data_; }

    // Element offset of (y, x); size_t so rows * cols may exceed INT_MAX
    std::size_t index(int y, int x) const {
        return std::size_t(y) * std::size_t(cols_) + std::size_t(x);
    }

    float get(int y, int x) const {
        assert(y >= 0 && y < rows_ && x >= 0 && x < cols_);
        return data_[index(y, x)];
    }
    void set(int y, int x, float v) {
        assert(y >= 0 && y < rows_ && x >= 0 && x < cols_);
        data_[index(y, x)] = v;
    }

    // Full-register access at (y, x..x+kLanes)
    __m512 load(int y, int x) const {
        assert(x + kLanes <= cols_);
        return _mm512_loadu_ps(&data_[index(y, x)]);
    }
    void store(int y, int x, __m512 v) {
        assert(x + kLanes <= cols_);
        _mm512_storeu_ps(&data_[index(y, x)], v);
    }

    // Partial access for width <= kLanes; unused lanes load as zero
    __m512 load(int y, int x, int width) const {
        assert(width > 0 && width <= kLanes && x + width <= cols_);
        return _mm512_maskz_loadu_ps(lane_mask(width), &data_[index(y, x)]);
    }
    void store(int y, int x, __m512 v, int width) {
        assert(width > 0 && width <= kLanes && x + width <= cols_);
        _mm512_mask_storeu_ps(&data_[index(y, x)], lane_mask(width), v);
    }

    // Sum of all elements, accumulated in double
    double sum() const;

private:
    Matrix(int rows, int cols, float *data, bool owned)
        : data_(data), rows_(rows), cols_(cols), owned_(owned) {}

    static __mmask16 lane_mask(int width) {
        return static_cast<__mmask16>((1u << width) - 1u);
    }

    float *data_ = nullptr;
    int rows_ = 0;
    int cols_ = 0;
    bool owned_ = false;
};

} // namespace matrix_utils
