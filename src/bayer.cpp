#include "bayer.hpp"

int snap_bayer_size(int requested)
{
    if (requested <= 2) return 2;
    if (requested <= 4) return 4;
    if (requested <= 8) return 8;
    return 16;
}

BayerMatrix generate_bayer_matrix(int size)
{
    BayerMatrix m;
    if (size <= 2) {
        m.size   = 2;
        m.max    = 4;
        m.values = {0, 2,
                    3, 1};
        return m;
    }

    const int         half    = size / 2;
    const BayerMatrix smaller = generate_bayer_matrix(half);

    // Quadrant order is TL, TR, BL, BR; the offsets follow the seed pattern,
    // not raster order.
    static const int offsets[4] = {0, 2, 3, 1};

    m.size = size;
    m.max  = size * size;
    m.values.resize(static_cast<size_t>(size) * size);
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            const int quadrant = (y / half) * 2 + (x / half);
            m.values[static_cast<size_t>(y) * size + x] =
                4 * smaller.at(x % half, y % half) + offsets[quadrant];
        }
    }
    return m;
}

const BayerMatrix& BayerCache::get(int requested_size)
{
    const int size = snap_bayer_size(requested_size);
    int slot = 0;
    while ((2 << slot) < size) ++slot;

    std::call_once(built[slot], [this, slot, size] {
        matrices[slot] = generate_bayer_matrix(size);
    });
    return matrices[slot];
}
