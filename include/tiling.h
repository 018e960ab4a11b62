#pragma once

#include <algorithm>
#include <omp.h>

#ifndef TILEMM_SWIZZLE_OUTER
#define TILEMM_SWIZZLE_OUTER 8
#endif

#ifndef TILEMM_SWIZZLE_ROWS
#define TILEMM_SWIZZLE_ROWS 4
#endif

// Tile index on the tile grid
struct TileCoord {
    int x;
    int y;
};

// Upper bound on workers for the parallel iterators (OpenMP max threads)
int num_workers();

// Maps linear task id t onto the tile grid in grouped order.
// Groups are outer x-tiles wide and rows y-tiles tall; both shrink to the
// largest divisor of the tile count that fits, so the mapping is a bijection
// over [0, tiles_x * tiles_y).
TileCoord swizzle_tile(int t, int tiles_x, int tiles_y,
                       int outer = TILEMM_SWIZZLE_OUTER,
                       int rows = TILEMM_SWIZZLE_ROWS);

// Calls fn(x, y) for each TileW x TileH tile of [0, end_x) x [0, end_y).
// end_x % TileW == 0 and end_y % TileH == 0 are required.
template <int TileW, int TileH, typename Fn>
inline void tile(Fn &&fn, int end_x, int end_y) {
    for (int y = 0; y < end_y; y += TileH) {
        for (int x = 0; x < end_x; x += TileW) {
            fn(x, y);
        }
    }
}

// Row-band parallel form of tile(): each band of TileH rows is one task
// scanning the whole x range. Blocks until every band is done.
template <int TileW, int TileH, typename Fn>
inline void tile_parallel(Fn &&fn, int end_x, int end_y) {
    const int bands = end_y / TileH;
    if (bands <= 0) return;
    const int workers = std::min(bands, num_workers());

#pragma omp parallel for schedule(dynamic, 1) num_threads(workers)
    for (int band = 0; band < bands; ++band) {
        const int y = band * TileH;
        for (int x = 0; x < end_x; x += TileW) {
            fn(x, y);
        }
    }
}

// One task per tile, visited in swizzle_tile() order. Same tiles and same
// blocking behaviour as tile_parallel().
template <int TileW, int TileH, typename Fn>
inline void tile_parallel_swizzled(Fn &&fn, int end_x, int end_y) {
    const int tiles_x = end_x / TileW;
    const int tiles_y = end_y / TileH;
    const int tasks = tiles_x * tiles_y;
    if (tasks <= 0) return;
    const int workers = std::min(tasks, num_workers());

#pragma omp parallel for schedule(dynamic, 1) num_threads(workers)
    for (int t = 0; t < tasks; ++t) {
        const TileCoord c = swizzle_tile(t, tiles_x, tiles_y);
        fn(c.x * TileW, c.y * TileH);
    }
}
