// pixblend color conversion Unit Tests
// Color16 ↔ ColorF 変換と RGB ↔ HSL 変換のテスト

#include "doctest.h"

#define PIXBLEND_NAMESPACE pixblend
#include "pixblend/color/color.h"

#include <cmath>
#include <cstdlib>

using namespace pixblend;

// =============================================================================
// Helper Functions
// =============================================================================

// チャンネルごとの差が tolerance 以内か
static bool nearlyEqual(const Color16& a, const Color16& b, int tolerance) {
    return std::abs(static_cast<int>(a.r) - static_cast<int>(b.r)) <= tolerance
        && std::abs(static_cast<int>(a.g) - static_cast<int>(b.g)) <= tolerance
        && std::abs(static_cast<int>(a.b) - static_cast<int>(b.b)) <= tolerance;
}

// =============================================================================
// toFloat / fromFloat Tests
// =============================================================================

TEST_CASE("toFloat widens without loss") {
    ColorF f = toFloat(Color16(0, 1, 65534, 65535));
    CHECK(f.r == 0.0);
    CHECK(f.g == 1.0);
    CHECK(f.b == 65534.0);
    CHECK(f.a == 65535.0);
}

TEST_CASE("fromFloat(toFloat(c)) round trip") {
    // 全16bit値を各チャンネル位置で確認
    int mismatches = 0;
    for (uint32_t v = 0; v <= 0xFFFF; ++v) {
        uint16_t c = static_cast<uint16_t>(v);
        Color16 color(c, static_cast<uint16_t>(0xFFFF - c), c, static_cast<uint16_t>(c ^ 0x5A5A));
        if (fromFloat(toFloat(color)) != color) {
            ++mismatches;
        }
    }
    CHECK(mismatches == 0);
}

TEST_CASE("channelFromFloat clamp and rounding") {
    SUBCASE("clamp") {
        CHECK(channelFromFloat(-1.0) == 0);
        CHECK(channelFromFloat(-100000.0) == 0);
        CHECK(channelFromFloat(65536.0) == 65535);
        CHECK(channelFromFloat(1.0e12) == 65535);
        CHECK(channelFromFloat(HUGE_VAL) == 65535);
        CHECK(channelFromFloat(std::nan("")) == 0);
    }

    SUBCASE("round half up") {
        CHECK(channelFromFloat(0.49) == 0);
        CHECK(channelFromFloat(0.5) == 1);
        CHECK(channelFromFloat(1.5) == 2);
        CHECK(channelFromFloat(2.5) == 3);
        CHECK(channelFromFloat(65534.4) == 65534);
        CHECK(channelFromFloat(65534.5) == 65535);
        CHECK(channelFromFloat(65535.0) == 65535);
    }

    SUBCASE("fromFloat clamps every channel") {
        Color16 c = fromFloat(ColorF(-5.0, 70000.0, 100.4, 32767.5));
        CHECK(c == Color16(0, 65535, 100, 32768));
    }
}

TEST_CASE("8bit channel helpers") {
    CHECK(channelFromFloat8(-3.0) == 0);
    CHECK(channelFromFloat8(300.0) == 255);
    CHECK(channelFromFloat8(127.5) == 128);
    CHECK(channelFromFloat8(127.4) == 127);

    CHECK(expand8to16(0) == 0);
    CHECK(expand8to16(255) == 65535);
    CHECK(expand8to16(128) == 32896);

    for (int v = 0; v < 256; ++v) {
        CHECK(reduce16to8(expand8to16(static_cast<uint8_t>(v))) == v);
    }
}

// =============================================================================
// RGB ↔ HSL Tests
// =============================================================================

TEST_CASE("rgbToHsl primaries") {
    SUBCASE("red") {
        HSL h = rgbToHsl(Color16(65535, 0, 0, 65535));
        CHECK(h.h == doctest::Approx(0.0));
        CHECK(h.s == doctest::Approx(1.0));
        CHECK(h.l == doctest::Approx(CHANNEL_MID));
    }

    SUBCASE("green") {
        HSL h = rgbToHsl(Color16(0, 65535, 0, 65535));
        CHECK(h.h == doctest::Approx(120.0));
        CHECK(h.s == doctest::Approx(1.0));
    }

    SUBCASE("blue") {
        HSL h = rgbToHsl(Color16(0, 0, 65535, 65535));
        CHECK(h.h == doctest::Approx(240.0));
        CHECK(h.s == doctest::Approx(1.0));
    }

    SUBCASE("magenta wraps below 360") {
        HSL h = rgbToHsl(Color16(65535, 0, 65535, 65535));
        CHECK(h.h == doctest::Approx(300.0));
        CHECK(h.h < 360.0);
    }

    SUBCASE("gray has zero saturation") {
        HSL h = rgbToHsl(Color16(20000, 20000, 20000, 65535));
        CHECK(h.s == 0.0);
        CHECK(h.h == 0.0);
        CHECK(h.l == doctest::Approx(20000.0));
    }
}

TEST_CASE("hslToRgb known values") {
    SUBCASE("zero saturation ignores hue") {
        Color16 a = fromFloat(hslToRgb(0.0, 0.0, 12345.0));
        Color16 b = fromFloat(hslToRgb(200.0, 0.0, 12345.0));
        CHECK(a == Color16(12345, 12345, 12345, 65535));
        CHECK(a == b);
    }

    SUBCASE("pure blue") {
        Color16 c = fromFloat(hslToRgb(240.0, 1.0, CHANNEL_MID));
        CHECK(c == Color16(0, 0, 65535, 65535));
    }

    SUBCASE("black and white") {
        CHECK(fromFloat(hslToRgb(90.0, 1.0, 0.0)) == Color16(0, 0, 0, 65535));
        CHECK(fromFloat(hslToRgb(90.0, 1.0, CHANNEL_MAX)) == Color16(65535, 65535, 65535, 65535));
    }

    SUBCASE("hue outside [0, 360) is wrapped") {
        Color16 a = fromFloat(hslToRgb(-120.0, 1.0, CHANNEL_MID));
        Color16 b = fromFloat(hslToRgb(240.0, 1.0, CHANNEL_MID));
        CHECK(a == b);
    }
}

TEST_CASE("HSL round trip") {
    SUBCASE("achromatic colors are exact") {
        int mismatches = 0;
        for (uint32_t v = 0; v <= 0xFFFF; ++v) {
            uint16_t c = static_cast<uint16_t>(v);
            Color16 gray(c, c, c, 65535);
            if (fromFloat(hslToRgb(rgbToHsl(gray))) != gray) {
                ++mismatches;
            }
        }
        CHECK(mismatches == 0);
    }

    SUBCASE("chromatic colors within one step") {
        int failures = 0;
        for (uint32_t r = 0; r <= 0xFFFF; r += 4369) {
            for (uint32_t g = 0; g <= 0xFFFF; g += 4369) {
                for (uint32_t b = 0; b <= 0xFFFF; b += 4369) {
                    Color16 c(static_cast<uint16_t>(r), static_cast<uint16_t>(g),
                              static_cast<uint16_t>(b), 65535);
                    if (!nearlyEqual(fromFloat(hslToRgb(rgbToHsl(c))), c, 1)) {
                        ++failures;
                    }
                }
            }
        }
        CHECK(failures == 0);
    }

    SUBCASE("odd values") {
        const Color16 samples[] = {
            Color16(1, 2, 3, 65535),
            Color16(65534, 65535, 65533, 65535),
            Color16(12345, 54321, 33333, 65535),
            Color16(40000, 100, 39999, 65535),
            Color16(32767, 32768, 32769, 65535),
        };
        for (const auto& c : samples) {
            CHECK(nearlyEqual(fromFloat(hslToRgb(rgbToHsl(c))), c, 1));
        }
    }
}
