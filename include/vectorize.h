#pragma once

#include "matrix_utils.h"

// C[cy, cx..cx+width) += a * B[by, bx..bx+width)
// Full-register path when width == kLanes, masked path for narrower runs.
inline void dot_accumulate(matrix_utils::Matrix &C, int cy, int cx, float a,
                           const matrix_utils::Matrix &B, int by, int bx,
                           int width = matrix_utils::kLanes) {
    const __m512 avec = _mm512_set1_ps(a);
    if (width == matrix_utils::kLanes) {
        __m512 cvec = C.load(cy, cx);
        cvec = _mm512_fmadd_ps(avec, B.load(by, bx), cvec);
        C.store(cy, cx, cvec);
    } else {
        __m512 cvec = C.load(cy, cx, width);
        cvec = _mm512_fmadd_ps(avec, B.load(by, bx, width), cvec);
        C.store(cy, cx, cvec, width);
    }
}

// Calls fn(offset, width) for floor(size / Width) full chunks, then once
// more with the remaining size % Width columns if there are any.
template <int Width, typename Fn>
inline void vectorize(Fn &&fn, int size) {
    static_assert(Width > 0 && Width <= matrix_utils::kLanes, "Width must fit one register");
    int n = 0;
    for (; n + Width <= size; n += Width) {
        fn(n, Width);
    }
    if (n < size) {
        fn(n, size - n);
    }
}

// Same chunking as vectorize, but issues Unroll full chunks per step
template <int Width, int Unroll, typename Fn>
inline void vectorize_unroll(Fn &&fn, int size) {
    static_assert(Unroll > 0, "Unroll must be positive");
    constexpr int step = Width * Unroll;
    int n = 0;
    for (; n + step <= size; n += step) {
#pragma GCC unroll 8
        for (int u = 0; u < Unroll; ++u) {
            fn(n + u * Width, Width);
        }
    }
    vectorize<Width>([&](int off, int width) { fn(n + off, width); }, size - n);
}
