// pixblend channel blend Unit Tests
// チャンネルブレンド関数のテスト

#include "doctest.h"

#define PIXBLEND_NAMESPACE pixblend
#include "pixblend/operations/channel_blend.h"

#include <cmath>
#include <vector>

using namespace pixblend;

// =============================================================================
// Helper Functions
// =============================================================================

static double call(ChannelBlendFunc f, double d, double s) {
    return f(DstChannel(d), SrcChannel(s));
}

// 境界値を含むテスト用の入力値（昇順）
static std::vector<double> sampleValues() {
    std::vector<double> values;
    for (int v = 0; v <= 65535; v += 1285) {
        values.push_back(v);
    }
    const double edges[] = {1, 2, 32766, 32767, 32768, 32769, 65533, 65534, 65535};
    for (double e : edges) values.push_back(e);
    return values;
}

struct NamedFunc {
    const char* name;
    ChannelBlendFunc func;
};

static const NamedFunc kAllChannelFuncs[] = {
    {"darken", channel::darken},           {"multiply", channel::multiply},
    {"colorBurn", channel::colorBurn},     {"linearBurn", channel::linearBurn},
    {"lighten", channel::lighten},         {"screen", channel::screen},
    {"colorDodge", channel::colorDodge},   {"linearDodge", channel::linearDodge},
    {"overlay", channel::overlay},         {"softLight", channel::softLight},
    {"hardLight", channel::hardLight},     {"vividLight", channel::vividLight},
    {"linearLight", channel::linearLight}, {"pinLight", channel::pinLight},
    {"hardMix", channel::hardMix},         {"difference", channel::difference},
    {"exclusion", channel::exclusion},     {"subtract", channel::subtract},
    {"divide", channel::divide},           {"add", channel::add},
    {"reflex", channel::reflex},           {"phoenix", channel::phoenix},
};

// =============================================================================
// Identity / Idempotence Tests
// =============================================================================

TEST_CASE("darken and lighten are idempotent") {
    for (double d : sampleValues()) {
        CHECK(call(channel::darken, d, d) == d);
        CHECK(call(channel::lighten, d, d) == d);
    }
}

TEST_CASE("multiply and screen identity elements") {
    for (double d : sampleValues()) {
        // Multiply: src = max が単位元
        CHECK(call(channel::multiply, d, CHANNEL_MAX) == d);
        // Screen: src = 0 が単位元
        CHECK(call(channel::screen, d, 0.0) == d);
    }
}

TEST_CASE("difference is symmetric") {
    for (double d : sampleValues()) {
        for (double s : sampleValues()) {
            CHECK(call(channel::difference, d, s) == call(channel::difference, s, d));
        }
    }
}

// =============================================================================
// Formula Tests
// =============================================================================

TEST_CASE("darken family formulas") {
    CHECK(call(channel::darken, 100, 200) == 100);
    CHECK(call(channel::multiply, 65535, 0) == 0);
    CHECK(call(channel::multiply, 32768, 32768) == doctest::Approx(32768.0 * 32768.0 / 65535.0));

    SUBCASE("color burn") {
        // src == 0 は 0
        CHECK(call(channel::colorBurn, 65535, 0) == 0);
        CHECK(call(channel::colorBurn, 65535, 1000) == 65535);
        CHECK(call(channel::colorBurn, 0, 65535) == 0);
        CHECK(call(channel::colorBurn, 49152, 32768)
              == doctest::Approx(65535.0 - (65535.0 - 49152.0) * 65535.0 / 32768.0));
    }

    SUBCASE("linear burn") {
        CHECK(call(channel::linearBurn, 30000, 30000) == 0);
        CHECK(call(channel::linearBurn, 40000, 30000) == 40000 + 30000 - 65535);
        CHECK(call(channel::linearBurn, 65535, 65535) == 65535);
    }
}

TEST_CASE("lighten family formulas") {
    CHECK(call(channel::lighten, 100, 200) == 200);
    CHECK(call(channel::screen, 0, 65535) == 65535);
    CHECK(call(channel::screen, 65535, 0) == 65535);

    SUBCASE("color dodge") {
        // src == max は max
        CHECK(call(channel::colorDodge, 0, 65535) == 65535);
        CHECK(call(channel::colorDodge, 0, 1000) == 0);
        CHECK(call(channel::colorDodge, 60000, 30000) == 65535);
        CHECK(call(channel::colorDodge, 10000, 32768)
              == doctest::Approx(10000.0 * 65535.0 / (65535.0 - 32768.0)));
    }

    SUBCASE("linear dodge") {
        CHECK(call(channel::linearDodge, 1000, 2000) == 3000);
        CHECK(call(channel::linearDodge, 60000, 60000) == 65535);
    }
}

TEST_CASE("contrast family formulas") {
    SUBCASE("overlay branches on destination") {
        CHECK(call(channel::overlay, 0, 40000) == 0);
        CHECK(call(channel::overlay, 65535, 100) == 65535);
        CHECK(call(channel::overlay, 16384, 32768)
              == doctest::Approx(2.0 * 32768.0 * 16384.0 / 65535.0));
    }

    SUBCASE("soft light") {
        CHECK(call(channel::softLight, 0, 50000) == 0);
        CHECK(call(channel::softLight, 65535, 0) == doctest::Approx(65535.0));
        CHECK(call(channel::softLight, 65535, 65535) == doctest::Approx(65535.0));
    }

    SUBCASE("hard light branches on source") {
        CHECK(call(channel::hardLight, 20000, 0) == 0);
        CHECK(call(channel::hardLight, 20000, 65535) == doctest::Approx(65535.0));
        CHECK(call(channel::hardLight, 20000, 16384) == doctest::Approx(20000.0 * 16384.0 / CHANNEL_MID));
    }

    SUBCASE("vivid light delegates destination first") {
        // 下位関数には (dst, 2*src) の順で渡す
        for (double d : sampleValues()) {
            CHECK(call(channel::vividLight, d, 16384)
                  == call(channel::colorBurn, d, 32768));
            CHECK(call(channel::vividLight, d, 49152)
                  == call(channel::colorDodge, d, 2.0 * (49152.0 - CHANNEL_MID)));
        }
        // 引数順が逆だと一致しない値
        CHECK(call(channel::vividLight, 49152, 16384)
              != doctest::Approx(call(channel::colorBurn, 32768, 49152)));
    }

    SUBCASE("linear light") {
        CHECK(call(channel::linearLight, 0, 65535) == 65535);
        CHECK(call(channel::linearLight, 40000, 0) == 0);
        CHECK(call(channel::linearLight, 40000, 16384) == call(channel::linearBurn, 40000, 32768));
    }

    SUBCASE("pin light") {
        CHECK(call(channel::pinLight, 10000, 0) == 0);
        CHECK(call(channel::pinLight, 10000, 65535) == 65535);
        CHECK(call(channel::pinLight, 10000, 8000) == 10000);
    }

    SUBCASE("hard mix is binary") {
        for (double d : sampleValues()) {
            for (double s : sampleValues()) {
                double v = call(channel::hardMix, d, s);
                CHECK((v == 0.0 || v == CHANNEL_MAX));
            }
        }
        CHECK(call(channel::hardMix, 65535, 65535) == 65535);
        CHECK(call(channel::hardMix, 0, 0) == 0);
    }
}

TEST_CASE("comparative family formulas") {
    CHECK(call(channel::difference, 1000, 3000) == 2000);
    CHECK(call(channel::exclusion, 0, 12345) == 12345);
    CHECK(call(channel::exclusion, 65535, 65535) == 0);
    CHECK(call(channel::subtract, 1000, 3000) == 0);
    CHECK(call(channel::subtract, 3000, 1000) == 2000);

    SUBCASE("divide") {
        CHECK(call(channel::divide, 12345, 65535) == doctest::Approx(12345.0));
        CHECK(call(channel::divide, 10000, 20000) == doctest::Approx(32767.5));
        // 分母 0 は飽和
        CHECK(call(channel::divide, 0, 0) == CHANNEL_MAX);
        CHECK(call(channel::divide, 12345, 0) == CHANNEL_MAX);
    }
}

TEST_CASE("extra mode formulas") {
    CHECK(call(channel::add, 1000, 2000) == 3000);
    CHECK(call(channel::add, 40000, 40000) == 65535);

    CHECK(call(channel::reflex, 1234, 65535) == 65535);
    CHECK(call(channel::reflex, 0, 30000) == 0);
    CHECK(call(channel::reflex, 30000, 30000)
          == doctest::Approx(30000.0 * 30000.0 / (65535.0 - 30000.0)));

    CHECK(call(channel::phoenix, 5000, 5000) == 65535);
    CHECK(call(channel::phoenix, 1000, 4000) == 65535 - 3000);
}

// =============================================================================
// Range Tests
// =============================================================================

TEST_CASE("channel functions stay finite and in range") {
    const std::vector<double> values = sampleValues();
    for (const auto& nf : kAllChannelFuncs) {
        CAPTURE(nf.name);
        int outOfRange = 0;
        for (double d : values) {
            for (double s : values) {
                double v = call(nf.func, d, s);
                CHECK(std::isfinite(v));
                // divide のみクランプ前に max を超え得る
                if (nf.func != channel::divide) {
                    if (v < -1e-6 || v > CHANNEL_MAX + 1e-6) ++outOfRange;
                }
            }
        }
        CHECK(outOfRange == 0);
    }
}

// =============================================================================
// blendPerChannel Tests
// =============================================================================

TEST_CASE("blendPerChannel applies per channel and keeps destination alpha") {
    ColorF dst(65535, 0, 32768, 12345);
    ColorF src(0, 65535, 32768, 999);

    ColorF r = blendPerChannel(dst, src, channel::lighten);
    CHECK(r.r == 65535);
    CHECK(r.g == 65535);
    CHECK(r.b == 32768);
    CHECK(r.a == 12345);

    ColorF r16 = blendPerChannel(Color16(65535, 0, 0, 65535), Color16(0, 0, 65535, 1),
                                 channel::multiply);
    CHECK(fromFloat(r16) == Color16(0, 0, 0, 65535));
}
