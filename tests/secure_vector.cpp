#include <doctest/doctest.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include "jose/jwk.hpp"
#include "jose/secure_vector.hpp"

using namespace jose;

TEST_CASE("SecureAllocator: Locked page allocation") {
    SecureAllocator<uint8_t> allocator;

    // Larger than one page
    const size_t size = 3 * 4096 + 17;
    auto ptr = allocator.allocate(size);
    REQUIRE(ptr != nullptr);
    std::memset(ptr, 0xAA, size);
    CHECK(ptr[size - 1] == 0xAA);
    allocator.deallocate(ptr, size);

    CHECK(allocator.allocate(0) == nullptr);
    allocator.deallocate(nullptr, 0);
}

TEST_CASE("SecureAllocator: Rebinding") {
    using traits = std::allocator_traits<SecureAllocator<uint8_t>>;

    CHECK(std::is_same_v<traits::rebind_alloc<char>, SecureAllocator<char>>);
    CHECK(SecureAllocator<int>() == SecureAllocator<char>());
}

TEST_CASE("SecureBytes: Growth keeps the contents") {
    SecureBytes secret;
    for (int i = 0; i < 1000; ++i) {
        secret.push_back(static_cast<uint8_t>(i));
    }

    REQUIRE(secret.size() == 1000);
    CHECK(secret[0] == 0);
    CHECK(secret[999] == static_cast<uint8_t>(999));

    SecureBytes moved = std::move(secret);
    CHECK(moved.size() == 1000);
}

TEST_CASE("constantTimeEqual - lengths and contents") {
    SecureBytes expected = {0x01, 0x02, 0x03, 0x04};
    std::vector<uint8_t> same = {0x01, 0x02, 0x03, 0x04};
    std::vector<uint8_t> lastDiffers = {0x01, 0x02, 0x03, 0x05};
    std::vector<uint8_t> prefix = {0x01, 0x02, 0x03};

    CHECK(secure_utils::constantTimeEqual(expected, same));
    CHECK_FALSE(secure_utils::constantTimeEqual(expected, lastDiffers));
    CHECK_FALSE(secure_utils::constantTimeEqual(expected, prefix));
    CHECK(secure_utils::constantTimeEqual(SecureBytes{}, std::vector<uint8_t>{}));
}

TEST_CASE("to_secure_vector - conversions") {
    std::vector<uint8_t> decoded = Base64URL(std::string("AQIDBAU")).decode();

    SecureBytes secret = secure_utils::to_secure_vector(decoded);
    REQUIRE(secret.size() == 5);
    CHECK(secret[4] == 0x05);
    CHECK(secure_utils::to_regular_vector(secret) == decoded);
}

TEST_CASE("SecureBytes: Octet sequence key material") {
    SecureBytes secret(32, 0x0b);
    OctetSequenceKey key = OctetSequenceKey::Builder(secret).build();

    CHECK(key.toByteArray() == secret);
    CHECK(key.size() == 256);
    CHECK(key.keyValue() == Base64URL::encode(secret));

    // Parsed "k" lands in locked memory as well
    OctetSequenceKey parsed = OctetSequenceKey::parse(key.toJSONObject().dump());
    CHECK(parsed.toByteArray() == secret);
}
