#include "matrix_utils.h"

#include <gtest/gtest.h>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <utility>

using matrix_utils::Matrix;
using matrix_utils::kLanes;

TEST(Matrix, ZerosIsZeroFilledAndOwned) {
    Matrix M = Matrix::zeros(3, 5);
    EXPECT_EQ(M.rows(), 3);
    EXPECT_EQ(M.cols(), 5);
    EXPECT_TRUE(M.owned());
    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 5; ++x)
            EXPECT_EQ(M.get(y, x), 0.0f);
}

TEST(Matrix, RandomIsSeededAndInUnitRange) {
    Matrix a = Matrix::random(4, 4, 7);
    Matrix b = Matrix::random(4, 4, 7);
    Matrix c = Matrix::random(4, 4, 8);
    bool differs = false;
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            EXPECT_EQ(a.get(y, x), b.get(y, x));
            EXPECT_GE(a.get(y, x), 0.0f);
            EXPECT_LT(a.get(y, x), 1.0f);
            if (a.get(y, x) != c.get(y, x)) differs = true;
        }
    }
    EXPECT_TRUE(differs);
}

TEST(Matrix, BufferIs64ByteAligned) {
    Matrix M = Matrix::zeros(7, 3);
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(M.data()) % 64, 0u);
}

TEST(Matrix, RowMajorLayout) {
    Matrix M = Matrix::zeros(2, 3);
    M.set(1, 2, 4.5f);
    EXPECT_EQ(M.data()[1 * 3 + 2], 4.5f);
}

TEST(Matrix, ViewWrapsCallerBuffer) {
    float buf[6] = {1, 2, 3, 4, 5, 6};
    {
        Matrix V = Matrix::view(2, 3, buf);
        EXPECT_FALSE(V.owned());
        EXPECT_EQ(V.get(1, 0), 4.0f);
        V.set(0, 1, 9.0f);
    }
    // Destroying the view leaves the buffer alone
    EXPECT_EQ(buf[1], 9.0f);
    EXPECT_EQ(buf[5], 6.0f);
}

TEST(Matrix, FullWidthStoreThenLoad) {
    Matrix M = Matrix::zeros(2, 2 * kLanes);
    alignas(64) float in[kLanes];
    for (int i = 0; i < kLanes; ++i) in[i] = float(i) + 0.5f;
    M.store(1, kLanes, _mm512_load_ps(in));

    alignas(64) float out[kLanes];
    _mm512_store_ps(out, M.load(1, kLanes));
    for (int i = 0; i < kLanes; ++i) EXPECT_EQ(out[i], in[i]);
    EXPECT_EQ(M.get(1, kLanes - 1), 0.0f);
}

TEST(Matrix, PartialStoreTouchesOnlyWidthElements) {
    Matrix M = Matrix::zeros(1, 8);
    M.store(0, 2, _mm512_set1_ps(3.0f), 5);
    for (int x = 0; x < 8; ++x) {
        EXPECT_EQ(M.get(0, x), (x >= 2 && x < 7) ? 3.0f : 0.0f) << "x=" << x;
    }

    alignas(64) float out[kLanes];
    _mm512_store_ps(out, M.load(0, 2, 5));
    for (int i = 0; i < 5; ++i) EXPECT_EQ(out[i], 3.0f);
    for (int i = 5; i < kLanes; ++i) EXPECT_EQ(out[i], 0.0f);
}

TEST(Matrix, MoveTransfersOwnership) {
    Matrix a = Matrix::random(2, 2, 1);
    float *p = a.data();
    Matrix b = std::move(a);
    EXPECT_EQ(b.data(), p);
    EXPECT_TRUE(b.owned());
    EXPECT_EQ(a.data(), nullptr);
    EXPECT_FALSE(a.owned());
}

TEST(Matrix, ReleaseDropsBuffer) {
    Matrix M = Matrix::zeros(2, 2);
    M.release();
    EXPECT_EQ(M.data(), nullptr);
    EXPECT_FALSE(M.owned());
    M.release();
}

TEST(Matrix, ZeroAndSum) {
    Matrix M = Matrix::zeros(2, 2);
    M.set(0, 0, 1.5f);
    M.set(1, 1, 2.5f);
    EXPECT_DOUBLE_EQ(M.sum(), 4.0);
    M.zero();
    EXPECT_DOUBLE_EQ(M.sum(), 0.0);
}

TEST(Matrix, AllocAndFill) {
    float *p = matrix_utils::alloc(4, 4);
    ASSERT_NE(p, nullptr);
    matrix_utils::fill(p, 16, 3);
    for (int i = 0; i < 16; ++i) {
        EXPECT_GE(p[i], 0.0f);
        EXPECT_LT(p[i], 1.0f);
    }
    free(p);
}

TEST(Matrix, IndexDoesNotOverflowInt) {
    float dummy = 0.0f;
    Matrix V = Matrix::view(65536, 65536, &dummy);
    EXPECT_EQ(V.index(32768, 0), std::size_t(32768) * 65536u);
    EXPECT_EQ(V.index(65535, 65535), std::size_t(65536) * 65536u - 1u);
}

TEST(Matrix, FailedAllocationThrowsBadAlloc) {
    EXPECT_THROW(Matrix::zeros(1 << 30, 1 << 30), std::bad_alloc);
    EXPECT_THROW(Matrix::random(1 << 30, 1 << 30, 1), std::bad_alloc);
}

TEST(Matrix, ZeroAfterReleaseIsNoOp) {
    Matrix M = Matrix::zeros(4, 4);
    M.release();
    M.zero();
    EXPECT_EQ(M.data(), nullptr);
}
