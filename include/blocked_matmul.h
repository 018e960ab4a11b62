#pragma once

#include "kernels.h"
#include "tiling.h"
#include "vectorize.h"

#include <cstring>

// Block shape of the cache-blocked kernels. The reduction dimension is
// consumed TileK * TileKUnroll columns at a time.
template <int TileI, int TileJ, int TileK, int TileKUnroll>
struct BlockShape {
    static constexpr int tile_i = TileI;
    static constexpr int tile_j = TileJ;
    static constexpr int tile_k = TileK;
    static constexpr int tile_k_unroll = TileKUnroll;
    static constexpr int k_block = TileK * TileKUnroll;
};

using DefaultBlockShape = BlockShape<32, kNelts * 4, 8, 8>;

// Computes the TileI x TileJ output tile at (io, jo) into a stack
// accumulator, then adds it to C. Requires C.rows % TileI == 0,
// C.cols % TileJ == 0 and A.cols % (TileK * TileKUnroll) == 0.
template <class Shape>
inline void blocked_tile(Matrix &C, const Matrix &A, const Matrix &B, int jo, int io) {
    alignas(64) float acc_buf[Shape::tile_i * Shape::tile_j];
    std::memset(acc_buf, 0, sizeof(acc_buf));
    Matrix acc = Matrix::view(Shape::tile_i, Shape::tile_j, acc_buf);

    for (int ko = 0; ko < A.cols(); ko += Shape::k_block) {
        for (int i = 0; i < Shape::tile_i; ++i) {
            for (int kb = 0; kb < Shape::k_block; kb += Shape::tile_k_unroll) {
#pragma GCC unroll 8
                for (int ku = 0; ku < Shape::tile_k_unroll; ++ku) {
                    const int k = ko + kb + ku;
                    const float a = A.get(io + i, k);
                    vectorize_unroll<kNelts, 4>([&](int j, int width) {
                        dot_accumulate(acc, i, j, a, B, k, jo + j, width);
                    }, Shape::tile_j);
                }
            }
        }
    }

    // Only write to C for this tile
    for (int i = 0; i < Shape::tile_i; ++i) {
        vectorize<kNelts>([&](int j, int width) {
            __m512 cvec = C.load(io + i, jo + j, width);
            cvec = _mm512_add_ps(cvec, acc.load(i, j, width));
            C.store(io + i, jo + j, cvec, width);
        }, Shape::tile_j);
    }
}

template <class Shape>
inline void matmul_reordered(Matrix &C, const Matrix &A, const Matrix &B) {
    tile_parallel<Shape::tile_j, Shape::tile_i>([&](int jo, int io) {
        blocked_tile<Shape>(C, A, B, jo, io);
    }, C.cols(), C.rows());
}

template <class Shape>
inline void matmul_swizzled(Matrix &C, const Matrix &A, const Matrix &B) {
    tile_parallel_swizzled<Shape::tile_j, Shape::tile_i>([&](int jo, int io) {
        blocked_tile<Shape>(C, A, B, jo, io);
    }, C.cols(), C.rows());
}
