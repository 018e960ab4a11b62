#include "kernels.h"
#include "tiling.h"
#include "vectorize.h"

#include <algorithm>

// One task per output row; rows never share a write region
void kernel_parallelized(Matrix &C, const Matrix &A, const Matrix &B) {
    const int rows = C.rows();
    const int workers = std::min(rows, num_workers());

#pragma omp parallel for schedule(dynamic, 1) num_threads(workers)
    for (int m = 0; m < rows; ++m) {
        for (int k = 0; k < A.cols(); ++k) {
            const float a = A.get(m, k);
            vectorize<kNelts>([&](int n, int width) {
                dot_accumulate(C, m, n, a, B, k, n, width);
            }, C.cols());
        }
    }
}
