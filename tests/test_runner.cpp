#include "dispatch_kernels.h"
#include "runner.h"

#include <gtest/gtest.h>
#include <string>

TEST(Registry, NaiveIsFirstAndNamesResolve) {
    const auto &kernels = all_kernels();
    ASSERT_FALSE(kernels.empty());
    EXPECT_EQ(std::string(kernels.front().name), "naive");

    for (const char *name : {"naive", "vectorized", "parallelized", "tiled", "unrolled",
                             "reordered", "swizzled", "blas"}) {
        const KernelInfo *k = find_kernel(name);
        ASSERT_NE(k, nullptr) << name;
        EXPECT_EQ(get_kernel_for_mode(name), k->fn);
    }
    EXPECT_EQ(find_kernel("strassen"), nullptr);
    EXPECT_EQ(get_kernel_for_mode(""), nullptr);
}

TEST(Registry, ShapeRequirements) {
    const KernelInfo *naive = find_kernel("naive");
    const KernelInfo *tiled = find_kernel("tiled");
    const KernelInfo *swizzled = find_kernel("swizzled");

    EXPECT_TRUE(shape_supported(*naive, 3, 5, 7));
    EXPECT_FALSE(shape_supported(*naive, 0, 5, 7));
    EXPECT_TRUE(shape_supported(*tiled, 3, 64, 8));
    EXPECT_FALSE(shape_supported(*tiled, 3, 48, 8));
    EXPECT_FALSE(shape_supported(*tiled, 3, 64, 6));
    EXPECT_TRUE(shape_supported(*swizzled, 32, 64, 64));
    EXPECT_FALSE(shape_supported(*swizzled, 16, 64, 64));
    EXPECT_FALSE(shape_supported(*swizzled, 32, 64, 32));
}

TEST(Runner, Gflops) {
    EXPECT_DOUBLE_EQ(gflops(1000, 1000, 1000, 2.0), 1.0);
    EXPECT_DOUBLE_EQ(gflops(8, 8, 8, 0.0), 0.0);
}

TEST(Runner, SumsMatchIsRelative) {
    EXPECT_TRUE(sums_match(1000.0, 1000.5, 1e-3));
    EXPECT_FALSE(sums_match(1000.0, 1002.0, 1e-3));
    EXPECT_TRUE(sums_match(0.0, 0.0, 1e-3));
    EXPECT_FALSE(sums_match(0.0, 1e-9, 1e-3));
}

TEST(Runner, RunBenchmarkZeroesBetweenTrials) {
    const int M = 32, N = 64, K = 64;
    Matrix A = Matrix::random(M, K, 1);
    Matrix B = Matrix::random(K, N, 2);
    Matrix ref = Matrix::zeros(M, N);
    kernel_naive(ref, A, B);

    Matrix C = Matrix::zeros(M, N);
    BenchResult r = run_benchmark(*find_kernel("swizzled"), C, A, B, 2, 3);
    EXPECT_EQ(r.name, "swizzled");
    EXPECT_GE(r.seconds, 0.0);
    EXPECT_GE(r.gflops, 0.0);
    EXPECT_TRUE(sums_match(r.checksum, ref.sum(), 1e-4));
}

TEST(Runner, CheckAllPassesOnSupportedShape) {
    Matrix A = Matrix::random(64, 128, 3);
    Matrix B = Matrix::random(128, 64, 4);
    EXPECT_TRUE(check_all(A, B));
}

TEST(Runner, CheckAllSkipsUnsupportedKernels) {
    Matrix A = Matrix::random(8, 8, 5);
    Matrix B = Matrix::random(8, 8, 6);
    EXPECT_TRUE(check_all(A, B, 1e-3));
}

TEST(Runner, SpeedupWithoutBaselineIsNotAvailable) {
    EXPECT_EQ(format_speedup(0.0, 0.5), "n/a");
    EXPECT_EQ(format_speedup(2.0, 0.5), "4.00");
    EXPECT_EQ(format_speedup(1.0, 1.0), "1.00");
}

TEST(Runner, SeedMustFitUnsignedInt) {
    unsigned int seed = 7;
    EXPECT_TRUE(parse_seed("0", seed));
    EXPECT_EQ(seed, 0u);
    EXPECT_TRUE(parse_seed("4294967295", seed));
    EXPECT_EQ(seed, 4294967295u);

    seed = 7;
    EXPECT_FALSE(parse_seed("4294967296", seed));
    EXPECT_FALSE(parse_seed("-1", seed));
    EXPECT_FALSE(parse_seed("12abc", seed));
    EXPECT_FALSE(parse_seed("", seed));
    EXPECT_EQ(seed, 7u);
}
