#include "kernels.h"

// BLAS sgemm is often implemented in Fortran, so we declare it with C linkage
// to handle potential name mangling (e.g., sgemm -> sgemm_).
extern "C" {
    void sgemm_(const char *TRANSA, const char *TRANSB, const int *M, const int *N, const int *K,
                const float *ALPHA, const float *A, const int *LDA, const float *B, const int *LDB,
                const float *BETA, float *C, const int *LDC);
}

// Reference kernel backed by the system BLAS.
// BLAS is column-major, so the row-major product C = A*B is computed as
// C^T = B^T * A^T, which needs no transposes on either operand.
void kernel_blas(Matrix &C, const Matrix &A, const Matrix &B) {
    char trans = 'N';
    int m = C.cols();
    int n = C.rows();
    int k = A.cols();
    int lda = B.cols();
    int ldb = A.cols();
    int ldc = C.cols();
    float alpha = 1.0f;
    float beta = 1.0f; // Add to existing values in C

    sgemm_(&trans, &trans, &m, &n, &k, &alpha, B.data(), &lda, A.data(), &ldb, &beta, C.data(), &ldc);
}
