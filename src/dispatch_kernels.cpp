#include "dispatch_kernels.h"
#include "blocked_matmul.h"

static constexpr int kTiledCols = kNelts * 4;
static constexpr int kTiledDepth = 4;

const std::vector<KernelInfo>& all_kernels() {
    static const std::vector<KernelInfo> kernels = {
        {"naive", kernel_naive, 1, 1, 1},
        {"vectorized", kernel_vectorized, 1, 1, 1},
        {"parallelized", kernel_parallelized, 1, 1, 1},
        {"tiled", kernel_tiled, 1, kTiledCols, kTiledDepth},
        {"unrolled", kernel_unrolled, 1, kTiledCols, kTiledDepth},
        {"reordered", kernel_reordered, DefaultBlockShape::tile_i,
         DefaultBlockShape::tile_j, DefaultBlockShape::k_block},
        {"swizzled", kernel_swizzled, DefaultBlockShape::tile_i,
         DefaultBlockShape::tile_j, DefaultBlockShape::k_block},
        {"blas", kernel_blas, 1, 1, 1}
    };
    return kernels;
}

const KernelInfo* find_kernel(const std::string& mode) {
    for (const auto& k : all_kernels()) {
        if (mode == k.name) return &k;
    }
    return nullptr;
}

// The dispatcher function that returns the correct kernel
matmul_func_t get_kernel_for_mode(const std::string& mode) {
    const KernelInfo* k = find_kernel(mode);
    return k ? k->fn : nullptr; // Return null if mode is not found
}

bool shape_supported(const KernelInfo& kernel, int M, int N, int K) {
    if (M <= 0 || N <= 0 || K <= 0) return false;
    return M % kernel.m_multiple == 0 && N % kernel.n_multiple == 0 &&
           K % kernel.k_multiple == 0;
}
