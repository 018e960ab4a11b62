#include "tiling.h"

static int largest_divisor_at_most(int n, int cap) {
    for (int d = std::min(n, cap); d > 1; --d) {
        if (n % d == 0) return d;
    }
    return 1;
}

int num_workers() {
    return omp_get_max_threads();
}

TileCoord swizzle_tile(int t, int tiles_x, int tiles_y, int outer, int rows) {
    const int group_w = largest_divisor_at_most(tiles_x, outer);
    const int group_h = largest_divisor_at_most(tiles_y, rows);
    const int group_size = group_w * group_h;

    const int group_id = t / group_size;
    const int col_offset = (group_id * group_w) % tiles_x;
    const int band = (group_id * group_w) / tiles_x;

    TileCoord c;
    c.x = col_offset + t % group_w;
    c.y = band * group_h + (t % group_size) / group_w;
    return c;
}
