#pragma once

#include "kernels.h"
#include <string>
#include <vector>

// A registered kernel and the multiples its dimensions must satisfy
struct KernelInfo {
    const char *name;
    matmul_func_t fn;
    int m_multiple; // rows of A and C
    int n_multiple; // cols of B and C
    int k_multiple; // cols of A, rows of B
};

// All kernels in benchmark order; naive comes first and is the baseline
const std::vector<KernelInfo>& all_kernels();

// Returns nullptr if mode is not found
const KernelInfo* find_kernel(const std::string& mode);

matmul_func_t get_kernel_for_mode(const std::string& mode);

// True when an M x K by K x N product satisfies the kernel's block sizes
bool shape_supported(const KernelInfo& kernel, int M, int N, int K);
