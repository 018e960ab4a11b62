#pragma once

#include "dispatch_kernels.h"
#include "matrix_utils.h"

#include <string>
#include <vector>

// Timing of one kernel over a benchmark run
struct BenchResult {
    std::string name;
    double seconds;  // mean over the timed trials
    double gflops;
    double checksum; // sum of C after the last trial
};

// Runs warmups untimed then trials timed; C is zeroed before every run
BenchResult run_benchmark(const KernelInfo& kernel, Matrix& C, const Matrix& A,
                          const Matrix& B, int warmups, int trials);

double gflops(int M, int N, int K, double seconds);

// "baseline/seconds" with two decimals, or "n/a" when there is no baseline
std::string format_speedup(double baseline, double seconds);

// Parses a non-negative decimal seed that fits in unsigned int.
// Returns false on malformed or out-of-range input.
bool parse_seed(const std::string& text, unsigned int& seed);

// |a - b| <= rel_tol * max(|a|, |b|)
bool sums_match(double a, double b, double rel_tol);

// Runs every kernel that supports the shape of A and B once on a fresh C and
// compares its sum with the naive kernel. Each mismatch is reported on stderr
// by name. Returns false if any kernel disagrees.
bool check_all(const Matrix& A, const Matrix& B, double rel_tol = 1e-3);
