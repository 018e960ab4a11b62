#include "runner.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <climits>
#include <cstdlib>
#include <cerrno>

BenchResult run_benchmark(const KernelInfo& kernel, Matrix& C, const Matrix& A,
                          const Matrix& B, int warmups, int trials) {
    for (int w = 0; w < warmups; ++w) {
        C.zero();
        kernel.fn(C, A, B);
    }

    trials = std::max(trials, 1);
    double total = 0.0;
    for (int t = 0; t < trials; ++t) {
        C.zero();
        auto t0 = std::chrono::high_resolution_clock::now();
        kernel.fn(C, A, B);
        auto t1 = std::chrono::high_resolution_clock::now();
        total += std::chrono::duration<double>(t1 - t0).count();
    }

    BenchResult r;
    r.name = kernel.name;
    r.seconds = total / trials;
    r.gflops = gflops(A.rows(), B.cols(), A.cols(), r.seconds);
    r.checksum = C.sum();
    return r;
}

double gflops(int M, int N, int K, double seconds) {
    if (seconds <= 0.0) return 0.0;
    return 2.0 * double(M) * double(N) * double(K) / seconds / 1e9;
}

std::string format_speedup(double baseline, double seconds) {
    if (baseline <= 0.0 || seconds <= 0.0) return "n/a";
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f", baseline / seconds);
    return buf;
}

bool parse_seed(const std::string& text, unsigned int& seed) {
    if (text.empty() || text[0] < '0' || text[0] > '9') return false;
    errno = 0;
    char *end = nullptr;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v > UINT_MAX) return false;
    seed = static_cast<unsigned int>(v);
    return true;
}

bool sums_match(double a, double b, double rel_tol) {
    return std::abs(a - b) <= rel_tol * std::max(std::abs(a), std::abs(b));
}

bool check_all(const Matrix& A, const Matrix& B, double rel_tol) {
    const int M = A.rows(), N = B.cols(), K = A.cols();
    Matrix C = Matrix::zeros(M, N);

    kernel_naive(C, A, B);
    const double reference = C.sum();

    bool ok = true;
    for (const auto& k : all_kernels()) {
        if (k.fn == kernel_naive) continue;
        if (!shape_supported(k, M, N, K)) {
            fprintf(stderr, "check: skipping %s (shape %dx%dx%d not supported)\n", k.name, M, N, K);
            continue;
        }
        C.zero();
        k.fn(C, A, B);
        const double s = C.sum();
        if (!sums_match(s, reference, rel_tol)) {
            fprintf(stderr, "check: %s output does not match naive implementation (sum=%.9g naive=%.9g)\n",
                    k.name, s, reference);
            ok = false;
        }
    }
    return ok;
}
