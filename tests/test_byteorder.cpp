// tests/test_byteorder.cpp
#include "tests.hpp"
#include <array>
#include <random>
#include <limits>
#include <type_traits>

#include "chunkio/core/byteorder.hpp"

using namespace chunkio::core::byteorder;

TEST_SUITE("byteorder (little-endian words)") {

    template <typename T>
    void check_roundtrip_le(T value) {
        std::array<chunkio::core::byte, sizeof(T)> buf{};
        native_to_le<T>(value, buf.data());
        T back = le_to_native<T>(buf.data());
        CHECK(back == value);
    }

    TEST_CASE("on-disk layout is little-endian") {
        std::array<chunkio::core::byte, 8> buf{};

        SUBCASE("int64 1") {
            native_to_le<std::int64_t>(1, buf.data());
            CHECK(buf[0] == chunkio::core::byte{ 0x01 });
            for (std::size_t i = 1; i < buf.size(); ++i) {
                CHECK(buf[i] == chunkio::core::byte{ 0x00 });
            }
        }
        SUBCASE("uint32 0x11223344") {
            native_to_le<std::uint32_t>(0x11223344u, buf.data());
            CHECK(buf[0] == chunkio::core::byte{ 0x44 });
            CHECK(buf[1] == chunkio::core::byte{ 0x33 });
            CHECK(buf[2] == chunkio::core::byte{ 0x22 });
            CHECK(buf[3] == chunkio::core::byte{ 0x11 });
        }
        SUBCASE("int64 -1 is all ones") {
            native_to_le<std::int64_t>(-1, buf.data());
            for (auto b : buf) {
                CHECK(b == chunkio::core::byte{ 0xFF });
            }
        }
        SUBCASE("float 1.0f") {
            // IEEE-754 single 1.0 = 0x3F800000
            native_to_le<float>(1.0f, buf.data());
            CHECK(buf[0] == chunkio::core::byte{ 0x00 });
            CHECK(buf[1] == chunkio::core::byte{ 0x00 });
            CHECK(buf[2] == chunkio::core::byte{ 0x80 });
            CHECK(buf[3] == chunkio::core::byte{ 0x3F });
        }
    }

    TEST_CASE("fixed patterns signed/unsigned") {
        SUBCASE("16 bit") {
            check_roundtrip_le<std::uint16_t>(0x1122u);
            check_roundtrip_le<std::int16_t>(-12345);
        }
        SUBCASE("32 bit") {
            check_roundtrip_le<std::uint32_t>(0x11223344u);
            check_roundtrip_le<std::int32_t>(-0x1020304);
        }
        SUBCASE("64 bit") {
            check_roundtrip_le<std::uint64_t>(0x1122334455667788ull);
            check_roundtrip_le<std::int64_t>(-0x123456789ABCDELL);
            check_roundtrip_le<std::int64_t>(std::numeric_limits<std::int64_t>::min());
        }
        SUBCASE("floating point") {
            check_roundtrip_le<float>(-3.25f);
            check_roundtrip_le<double>(6.02214076e23);
        }
    }

    TEST_CASE("fuzz roundtrip integers") {
        std::mt19937_64 rng{ 987654321ULL };
        for (int i = 0; i < 1000; ++i) {
            const auto v = rng();
            check_roundtrip_le<std::uint64_t>(v);
            check_roundtrip_le<std::int64_t>(static_cast<std::int64_t>(v));
            check_roundtrip_le<std::int32_t>(static_cast<std::int32_t>(v));
            check_roundtrip_le<std::uint16_t>(static_cast<std::uint16_t>(v));
        }
    }
}
