#include "kernels.h"
#include "tiling.h"
#include "vectorize.h"

#include <algorithm>

constexpr int TILE_SIZE = 4;
constexpr int TILE_X = kNelts * TILE_SIZE; // output columns per tile
constexpr int TILE_Y = TILE_SIZE;          // reduction steps per tile

// Row-parallel; each row walks (n, k) in TILE_X x TILE_Y tiles so a strip
// of C stays in registers/L1 across TILE_Y rows of B.
void kernel_tiled(Matrix &C, const Matrix &A, const Matrix &B) {
    const int rows = C.rows();
    const int workers = std::min(rows, num_workers());

#pragma omp parallel for schedule(dynamic, 1) num_threads(workers)
    for (int m = 0; m < rows; ++m) {
        tile<TILE_X, TILE_Y>([&](int x, int y) {
            for (int k = y; k < y + TILE_Y; ++k) {
                const float a = A.get(m, k);
                vectorize<kNelts>([&](int n, int width) {
                    dot_accumulate(C, m, x + n, a, B, k, x + n, width);
                }, TILE_X);
            }
        }, C.cols(), A.cols());
    }
}
