#pragma once

#include <mutex>
#include <vector>

// Square ordered-dither threshold table. values is a permutation of
// [0, size*size); max == size*size is the normalization divisor.
struct BayerMatrix {
    int              size = 0;
    int              max  = 0;
    std::vector<int> values;  // row-major

    int at(int x, int y) const { return values[static_cast<size_t>(y) * size + x]; }
};

// Snaps a requested tile size to 2, 4, 8 or 16 (largest not exceeding the
// request, with everything <= 2 mapping to 2 and everything > 8 to 16).
int snap_bayer_size(int requested);

// Builds the matrix for a power-of-two size >= 2 from the 2x2 seed
// [[0,2],[3,1]]. Pure; callers normally go through BayerCache.
BayerMatrix generate_bayer_matrix(int size);

// Lazily built matrices for every supported size. Safe for concurrent
// first access; each size is generated exactly once.
class BayerCache {
public:
    const BayerMatrix& get(int requested_size);

private:
    static constexpr int SIZE_COUNT = 4;  // 2, 4, 8, 16

    std::once_flag built[SIZE_COUNT];
    BayerMatrix    matrices[SIZE_COUNT];
};
