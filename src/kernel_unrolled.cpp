#include "kernels.h"
#include "tiling.h"
#include "vectorize.h"

#include <algorithm>

#ifndef UNROLLED_VECTOR_UNROLL
#define UNROLLED_VECTOR_UNROLL 4
#endif

constexpr int TILE_SIZE = 4;
constexpr int TILE_X = kNelts * TILE_SIZE;
constexpr int TILE_Y = TILE_SIZE;

// Same blocking as kernel_tiled with the column loop unrolled
void kernel_unrolled(Matrix &C, const Matrix &A, const Matrix &B) {
    const int rows = C.rows();
    const int workers = std::min(rows, num_workers());

#pragma omp parallel for schedule(dynamic, 1) num_threads(workers)
    for (int m = 0; m < rows; ++m) {
        tile<TILE_X, TILE_Y>([&](int x, int y) {
            for (int k = y; k < y + TILE_Y; ++k) {
                const float a = A.get(m, k);
                vectorize_unroll<kNelts, UNROLLED_VECTOR_UNROLL>([&](int n, int width) {
                    dot_accumulate(C, m, x + n, a, B, k, x + n, width);
                }, TILE_X);
            }
        }, C.cols(), A.cols());
    }
}
