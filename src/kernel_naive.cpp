#include "kernels.h"

// Plain triple loop, reduction innermost
void kernel_naive(Matrix &C, const Matrix &A, const Matrix &B) {
    for (int m = 0; m < C.rows(); ++m) {
        for (int n = 0; n < C.cols(); ++n) {
            float sum = C.get(m, n);
            for (int k = 0; k < A.cols(); ++k) {
                sum += A.get(m, k) * B.get(k, n);
            }
            C.set(m, n, sum);
        }
    }
}
