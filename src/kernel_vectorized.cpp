#include "kernels.h"
#include "vectorize.h"

void kernel_vectorized(Matrix &C, const Matrix &A, const Matrix &B) {
    for (int m = 0; m < C.rows(); ++m) {
        for (int k = 0; k < A.cols(); ++k) {
            const float a = A.get(m, k);
            vectorize<kNelts>([&](int n, int width) {
                dot_accumulate(C, m, n, a, B, k, n, width);
            }, C.cols());
        }
    }
}
