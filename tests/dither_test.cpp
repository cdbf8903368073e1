#include <gtest/gtest.h>

#include "config_error.hpp"
#include "dither.hpp"
#include "gradient.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <set>

namespace {
const DitherAlgorithm kQuantizing[] = {
    DitherAlgorithm::Bayer,
    DitherAlgorithm::FloydSteinberg,
    DitherAlgorithm::Atkinson,
    DitherAlgorithm::Random,
};

// Radial test card with a deliberately non-opaque alpha channel.
PixelBuffer make_card(int w, int h) {
    PixelBuffer buf;
    buf.resize(w, h);
    GradientParams p;
    p.center_x = w * 0.5;
    p.center_y = h * 0.5;
    p.size     = std::max(w, h);
    fill_radial_gradient(buf, parse_color_stops({"#ff6b6b", "#4ecdc4", "#45b7d1"}), p);
    for (size_t i = 3; i < buf.pixels.size(); i += 4)
        buf.pixels[i] = static_cast<uint8_t>(i % 251);
    return buf;
}

PixelBuffer make_gray(int w, int h, uint8_t v) {
    PixelBuffer buf;
    buf.resize(w, h);
    for (size_t i = 0; i < buf.pixels.size(); i += 4)
        buf.pixels[i] = buf.pixels[i + 1] = buf.pixels[i + 2] = v;
    return buf;
}

void set_gray(PixelBuffer& buf, int x, int y, uint8_t v) {
    uint8_t* px = buf.at(x, y);
    px[0] = px[1] = px[2] = v;
}

DitherSettings settings(DitherAlgorithm algo, double strength, int size, int levels) {
    DitherSettings s;
    s.algorithm    = algo;
    s.strength     = strength;
    s.size         = size;
    s.color_levels = levels;
    return s;
}

} // namespace

TEST(DitherTest, QuantizeProducesExactlyLevelsValues) {
    for (int levels = 2; levels <= 32; ++levels) {
        std::set<int> seen;
        for (int v = 0; v <= 255; ++v) {
            const int q = quantize(v, levels);
            const double k = q / (255.0 / (levels - 1));
            EXPECT_NEAR(k, std::round(k), 0.5 / (255.0 / (levels - 1)) + 1e-9);
            seen.insert(q);
        }
        EXPECT_EQ(static_cast<int>(seen.size()), levels) << "levels " << levels;
        EXPECT_EQ(*seen.begin(), 0);
        EXPECT_EQ(*seen.rbegin(), 255);
    }
}

TEST(DitherTest, QuantizeRoundsHalfUp) {
    EXPECT_EQ(quantize(127, 2), 0);
    EXPECT_EQ(quantize(128, 2), 255);
    EXPECT_EQ(quantize(127.5, 2), 255);
    // step 85: 42.5 is exactly half a step
    EXPECT_EQ(quantize(42.5, 4), 85);
    EXPECT_EQ(quantize(42.4, 4), 0);
}

TEST(DitherTest, NamesRoundTripAndUnknownMeansNone) {
    for (DitherAlgorithm algo : kQuantizing)
        EXPECT_EQ(parse_dither_algorithm(dither_algorithm_name(algo)), algo);
    EXPECT_EQ(parse_dither_algorithm("halftone"), DitherAlgorithm::None);
    EXPECT_EQ(parse_dither_algorithm(""), DitherAlgorithm::None);
    EXPECT_FALSE(dither_quantizes(DitherAlgorithm::None));
}

TEST(DitherTest, EveryAlgorithmOutputsOpaqueQuantizedPixels) {
    const PixelBuffer in = make_card(37, 23);
    DitherEngine engine;
    for (DitherAlgorithm algo : kQuantizing) {
        for (int size : {1, 3, 4, 16}) {
            DitherSettings s = settings(algo, 0.8, size, 5);
            s.seed = 7;
            const PixelBuffer out = engine.apply(in, s);
            ASSERT_EQ(out.width, in.width);
            ASSERT_EQ(out.height, in.height);
            ASSERT_EQ(out.pixels.size(), in.pixels.size());
            for (size_t i = 0; i < out.pixels.size(); i += 4) {
                ASSERT_EQ(out.pixels[i + 3], 255) << dither_algorithm_name(algo);
                for (int c = 0; c < 3; ++c)
                    ASSERT_EQ(out.pixels[i + c], quantize(out.pixels[i + c], 5))
                        << dither_algorithm_name(algo) << " size " << size;
            }
        }
    }
}

TEST(DitherTest, UnknownAlgorithmIsByteIdenticalPassThrough) {
    const PixelBuffer in = make_card(16, 9);
    DitherEngine engine;

    const PixelBuffer none = engine.apply(in, settings(DitherAlgorithm::None, 1.0, 4, 2));
    EXPECT_EQ(none.pixels, in.pixels);

    const PixelBuffer bogus =
        engine.apply(in, settings(static_cast<DitherAlgorithm>(42), 1.0, 4, 2));
    EXPECT_EQ(bogus.pixels, in.pixels);
    EXPECT_EQ(bogus.width, in.width);
    EXPECT_EQ(bogus.height, in.height);
}

TEST(DitherTest, TooFewLevelsIsAConfigError) {
    const PixelBuffer in = make_gray(4, 4, 100);
    DitherEngine engine;
    for (DitherAlgorithm algo : kQuantizing)
        EXPECT_THROW(engine.apply(in, settings(algo, 0.5, 2, 1)), ConfigError);
    EXPECT_NO_THROW(engine.apply(in, settings(DitherAlgorithm::None, 0.5, 2, 1)));
}

TEST(DitherTest, MidGrayWithZeroStrengthIgnoresBayerPosition) {
    const PixelBuffer in = make_gray(2, 2, 128);
    DitherEngine engine;
    const PixelBuffer out = engine.apply(in, settings(DitherAlgorithm::Bayer, 0.0, 2, 2));
    const int expected = quantize(128, 2);
    EXPECT_EQ(expected, 255);
    for (size_t i = 0; i < out.pixels.size(); i += 4) {
        EXPECT_EQ(out.pixels[i], expected);
        EXPECT_EQ(out.pixels[i + 1], expected);
        EXPECT_EQ(out.pixels[i + 2], expected);
    }
}

TEST(DitherTest, BayerThresholdFollowsMatrixRank) {
    // Threshold at strength 1 and a 2x2 tile: (m / 4 - 0.5) * 255.
    // m = 0 -> -127.5, 2 -> 0, 3 -> 63.75, 1 -> -63.75
    const PixelBuffer in = make_gray(2, 2, 100);
    DitherEngine engine;
    const PixelBuffer out = engine.apply(in, settings(DitherAlgorithm::Bayer, 1.0, 2, 2));
    EXPECT_EQ(out.at(0, 0)[0], 0);    //   0 -> 0
    EXPECT_EQ(out.at(1, 0)[0], 0);    // 100 -> 0
    EXPECT_EQ(out.at(0, 1)[0], 255);  // 163.75 -> 255
    EXPECT_EQ(out.at(1, 1)[0], 0);    // 36.25 -> 0
}

TEST(DitherTest, DiffusionKernelsRedistributeExpectedShare) {
    double fs = 0.0;
    for (int i = 0; i < FLOYD_STEINBERG_KERNEL.count; ++i)
        fs += FLOYD_STEINBERG_KERNEL.taps[i].weight;
    EXPECT_DOUBLE_EQ(fs, 1.0);

    double atkinson = 0.0;
    for (int i = 0; i < ATKINSON_KERNEL.count; ++i)
        atkinson += ATKINSON_KERNEL.taps[i].weight;
    EXPECT_DOUBLE_EQ(atkinson, 0.75);
}

TEST(DitherTest, DiffusionTapsPointAtUnvisitedPixels) {
    for (const DiffusionKernel* kernel : {&FLOYD_STEINBERG_KERNEL, &ATKINSON_KERNEL}) {
        for (int i = 0; i < kernel->count; ++i) {
            const DiffusionTap& tap = kernel->taps[i];
            EXPECT_TRUE(tap.dy > 0 || (tap.dy == 0 && tap.dx > 0))
                << "tap " << i << " at (" << tap.dx << "," << tap.dy << ")";
        }
    }
}

// A source pixel of 64 quantizes to 0 at two levels and passes on whole
// shares. Neighbors that receive a share but are not being checked sit that
// far below 255: they land exactly on a level and pass nothing on, so the
// checked neighbor sees only the share aimed at it.
TEST(DitherTest, FloydSteinbergPushesSouthWestAndSouthEastShares) {
    // Shares of 64: 28 east, 12 south-west, 20 south, 4 south-east.
    auto grid = [](int south_west, int south_east) {
        PixelBuffer buf = make_gray(3, 2, 0);
        set_gray(buf, 1, 0, 64);
        set_gray(buf, 2, 0, 255 - 28);
        set_gray(buf, 0, 1, static_cast<uint8_t>(south_west));
        set_gray(buf, 1, 1, 255 - 20);
        set_gray(buf, 2, 1, static_cast<uint8_t>(south_east));
        return buf;
    };
    DitherEngine engine;
    const DitherSettings s = settings(DitherAlgorithm::FloydSteinberg, 1.0, 1, 2);

    EXPECT_EQ(engine.apply(grid(116, 0), s).at(0, 1)[0], 255);       // 116 + 12 = 128
    EXPECT_EQ(engine.apply(grid(115, 0), s).at(0, 1)[0], 0);         // 115 + 12 = 127
    EXPECT_EQ(engine.apply(grid(255 - 12, 124), s).at(2, 1)[0], 255); // 124 + 4 = 128
    EXPECT_EQ(engine.apply(grid(255 - 12, 123), s).at(2, 1)[0], 0);   // 123 + 4 = 127
}

TEST(DitherTest, AtkinsonPushesOneEighthToEveryLowerTarget) {
    // 64 passes 8 to each of its six targets; (3,0) falls off the edge.
    struct Target { int x, y; };
    const Target targets[] = {{0, 1}, {1, 1}, {2, 1}, {1, 2}};
    DitherEngine engine;
    const DitherSettings s = settings(DitherAlgorithm::Atkinson, 1.0, 1, 2);

    for (const Target& t : targets) {
        for (int base : {119, 120}) {
            PixelBuffer in = make_gray(3, 3, 0);
            set_gray(in, 1, 0, 64);
            set_gray(in, 2, 0, 255 - 8);
            for (const Target& other : targets)
                set_gray(in, other.x, other.y, 255 - 8);
            set_gray(in, t.x, t.y, static_cast<uint8_t>(base));

            const PixelBuffer out = engine.apply(in, s);
            EXPECT_EQ(out.at(t.x, t.y)[0], base + 8 >= 128 ? 255 : 0)
                << "target (" << t.x << "," << t.y << ") from " << base;
        }
    }
}

// A single pixel of value 100 quantizes to 0 at two levels, so its whole
// value is the error. The neighbor sits below the 127.5 threshold and only
// flips to 255 when the diffused share pushes it over.
TEST(DitherTest, FloydSteinbergPushesSevenSixteenthsEast) {
    DitherEngine engine;
    PixelBuffer in = make_gray(2, 1, 0);
    set_gray(in, 0, 0, 100);

    set_gray(in, 1, 0, 90);   // 90 + 43.75 = 133.75
    EXPECT_EQ(engine.apply(in, settings(DitherAlgorithm::FloydSteinberg, 1.0, 1, 2)).at(1, 0)[0], 255);
    set_gray(in, 1, 0, 80);   // 80 + 43.75 = 123.75
    EXPECT_EQ(engine.apply(in, settings(DitherAlgorithm::FloydSteinberg, 1.0, 1, 2)).at(1, 0)[0], 0);

    // Half strength halves the error.
    set_gray(in, 1, 0, 100);  // 100 + 21.875 = 121.875
    EXPECT_EQ(engine.apply(in, settings(DitherAlgorithm::FloydSteinberg, 0.5, 1, 2)).at(1, 0)[0], 0);
    EXPECT_EQ(engine.apply(in, settings(DitherAlgorithm::FloydSteinberg, 1.0, 1, 2)).at(1, 0)[0], 255);
}

TEST(DitherTest, FloydSteinbergPushesFiveSixteenthsSouth) {
    DitherEngine engine;
    PixelBuffer in = make_gray(1, 2, 0);
    set_gray(in, 0, 0, 100);

    set_gray(in, 0, 1, 100);  // 100 + 31.25 = 131.25
    EXPECT_EQ(engine.apply(in, settings(DitherAlgorithm::FloydSteinberg, 1.0, 1, 2)).at(0, 1)[0], 255);
    set_gray(in, 0, 1, 90);   // 90 + 31.25 = 121.25
    EXPECT_EQ(engine.apply(in, settings(DitherAlgorithm::FloydSteinberg, 1.0, 1, 2)).at(0, 1)[0], 0);
}

TEST(DitherTest, AtkinsonPushesOneEighthPerTarget) {
    DitherEngine engine;
    PixelBuffer row = make_gray(3, 1, 0);
    set_gray(row, 0, 0, 100);

    set_gray(row, 1, 0, 100);  // 100 + 12.5 = 112.5, FS would give 143.75
    EXPECT_EQ(engine.apply(row, settings(DitherAlgorithm::Atkinson, 1.0, 1, 2)).at(1, 0)[0], 0);
    EXPECT_EQ(engine.apply(row, settings(DitherAlgorithm::FloydSteinberg, 1.0, 1, 2)).at(1, 0)[0], 255);
    set_gray(row, 1, 0, 120);  // 120 + 12.5 = 132.5
    EXPECT_EQ(engine.apply(row, settings(DitherAlgorithm::Atkinson, 1.0, 1, 2)).at(1, 0)[0], 255);

    // Two columns east: 1/8 directly plus 1/8 of what pixel 1 passes on.
    PixelBuffer far = make_gray(3, 1, 0);
    set_gray(far, 0, 0, 100);
    set_gray(far, 2, 0, 110);  // 110 + 12.5 + 12.5 / 8 = 124.06
    EXPECT_EQ(engine.apply(far, settings(DitherAlgorithm::Atkinson, 1.0, 1, 2)).at(2, 0)[0], 0);
    set_gray(far, 2, 0, 114);  // 114 + 14.06 = 128.06
    EXPECT_EQ(engine.apply(far, settings(DitherAlgorithm::Atkinson, 1.0, 1, 2)).at(2, 0)[0], 255);
}

TEST(DitherTest, DiffusionScaleWorksOnDownsampledBlocks) {
    const PixelBuffer in = make_card(20, 12);
    DitherEngine engine;
    const PixelBuffer out = engine.apply(in, settings(DitherAlgorithm::FloydSteinberg, 0.7, 4, 3));
    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            const uint8_t* block = out.at(x / 4 * 4, y / 4 * 4);
            ASSERT_EQ(std::memcmp(out.at(x, y), block, 4), 0) << x << "," << y;
        }
    }
}

TEST(DitherTest, DiffusionScaleLargerThanImageUsesOnePixel) {
    const PixelBuffer in = make_card(5, 3);
    DitherEngine engine;
    const PixelBuffer out = engine.apply(in, settings(DitherAlgorithm::Atkinson, 1.0, 16, 2));
    ASSERT_EQ(out.width, 5);
    ASSERT_EQ(out.height, 3);
    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 5; ++x)
            EXPECT_EQ(std::memcmp(out.at(x, y), out.at(0, 0), 4), 0);
}

TEST(DitherTest, SeededRandomIsReproducible) {
    const PixelBuffer in = make_gray(32, 32, 128);
    DitherEngine engine;
    DitherSettings s = settings(DitherAlgorithm::Random, 1.0, 1, 2);
    s.seed = 1234;
    const PixelBuffer a = engine.apply(in, s);
    const PixelBuffer b = engine.apply(in, s);
    EXPECT_EQ(a.pixels, b.pixels);

    s.seed = 1235;
    const PixelBuffer c = engine.apply(in, s);
    EXPECT_NE(a.pixels, c.pixels);
}

TEST(DitherTest, RandomNoiseIsConstantWithinAGrainCell) {
    const PixelBuffer in = make_gray(10, 7, 128);
    DitherEngine engine;
    DitherSettings s = settings(DitherAlgorithm::Random, 1.0, 3, 2);
    s.seed = 99;
    const PixelBuffer out = engine.apply(in, s);
    for (int y = 0; y < out.height; ++y)
        for (int x = 0; x < out.width; ++x)
            ASSERT_EQ(out.at(x, y)[0], out.at(x / 3 * 3, y / 3 * 3)[0]) << x << "," << y;
}

TEST(DitherTest, ZeroStrengthRandomIsPlainQuantization) {
    const PixelBuffer in = make_card(12, 12);
    DitherEngine engine;
    const PixelBuffer out = engine.apply(in, settings(DitherAlgorithm::Random, 0.0, 2, 4));
    for (size_t i = 0; i < in.pixels.size(); i += 4)
        for (int c = 0; c < 3; ++c)
            ASSERT_EQ(out.pixels[i + c], quantize(in.pixels[i + c], 4));
}

TEST(DitherTest, EngineBayerCacheIsSnapped) {
    DitherEngine engine;
    EXPECT_EQ(engine.bayer_matrix(6).size, 8);
    EXPECT_EQ(&engine.bayer_matrix(6), &engine.bayer_matrix(7));
}
