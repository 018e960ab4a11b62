#pragma once

#include "matrix_utils.h"

using matrix_utils::Matrix;

// Define a function pointer type for all matmul kernels.
// Every kernel accumulates A * B into C; C must be zeroed by the caller.
// A.cols == B.rows, C is A.rows x B.cols, and the dimensions must be
// multiples of the kernel's block sizes (see dispatch_kernels.cpp).
using matmul_func_t = void (*)(Matrix &C, const Matrix &A, const Matrix &B);

// Vector width used by every vectorized kernel
constexpr int kNelts = matrix_utils::kLanes;

// Declare all kernel functions
void kernel_naive(Matrix &C, const Matrix &A, const Matrix &B);
void kernel_vectorized(Matrix &C, const Matrix &A, const Matrix &B);
void kernel_parallelized(Matrix &C, const Matrix &A, const Matrix &B);
void kernel_tiled(Matrix &C, const Matrix &A, const Matrix &B);
void kernel_unrolled(Matrix &C, const Matrix &A, const Matrix &B);
void kernel_reordered(Matrix &C, const Matrix &A, const Matrix &B);
void kernel_swizzled(Matrix &C, const Matrix &A, const Matrix &B);
void kernel_blas(Matrix &C, const Matrix &A, const Matrix &B);
