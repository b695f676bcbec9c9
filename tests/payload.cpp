#include <doctest/doctest.h>
#include <thread>
#include "jose/payload.hpp"

using namespace jose;

TEST_CASE("Payload: From JSON object") {
    Payload payload(json{{"iss", "joe"}, {"exp", 1300819380}});

    CHECK(payload.origin() == Payload::Origin::JSON);
    CHECK(payload.toString() == R"({"iss":"joe","exp":1300819380})");
    REQUIRE(payload.toJSONObject().has_value());
    CHECK((*payload.toJSONObject())["iss"] == "joe");
    CHECK(payload.toBase64URL() == Base64URL::encode(payload.toString()));
}

TEST_CASE("Payload: JSON payload must be an object") {
    CHECK_THROWS_AS(Payload(json::array({1, 2})), InvalidArgumentError);
    CHECK_THROWS_AS(Payload(json("text")), InvalidArgumentError);
}

TEST_CASE("Payload: From string") {
    Payload payload("Hello, world!");

    CHECK(payload.origin() == Payload::Origin::STRING);
    CHECK(payload.toString() == "Hello, world!");
    CHECK(payload.toBytes().size() == 13);
    CHECK(payload.toBase64URL().toString() == "SGVsbG8sIHdvcmxkIQ");

    // Not a JSON object
    CHECK_FALSE(payload.toJSONObject().has_value());
}

TEST_CASE("Payload: String holding a JSON object") {
    Payload payload(std::string(R"({"sub":"alice"})"));
    auto object = payload.toJSONObject();
    REQUIRE(object.has_value());
    CHECK((*object)["sub"] == "alice");

    // A JSON array is not an object
    CHECK_FALSE(Payload("[1,2,3]").toJSONObject().has_value());
}

TEST_CASE("Payload: From bytes") {
    std::vector<uint8_t> bytes = {0x00, 0xff, 0x10, 0x80};
    Payload payload(bytes);

    CHECK(payload.origin() == Payload::Origin::BYTE_ARRAY);
    CHECK(payload.toBytes() == bytes);
    CHECK(payload.toBase64URL().toString() == "AP8QgA");
    CHECK_FALSE(payload.toJSONObject().has_value());
}

TEST_CASE("Payload: From Base64URL") {
    Payload payload(Base64URL(std::string("eyJhIjoxfQ")));

    CHECK(payload.origin() == Payload::Origin::BASE64URL);
    CHECK(payload.toString() == R"({"a":1})");
    CHECK(payload.toBase64URL().toString() == "eyJhIjoxfQ");
    REQUIRE(payload.toJSONObject().has_value());
    CHECK((*payload.toJSONObject())["a"] == 1);
}

TEST_CASE("Payload: Copy and move keep the views") {
    Payload original("copy me");
    (void)original.toBase64URL();

    Payload copy(original);
    CHECK(copy.origin() == Payload::Origin::STRING);
    CHECK(copy.toBase64URL() == original.toBase64URL());

    Payload moved(std::move(copy));
    CHECK(moved.toString() == "copy me");

    Payload assigned("other");
    assigned = original;
    CHECK(assigned.toString() == "copy me");
}

TEST_CASE("Payload: Concurrent view access") {
    Payload payload(std::vector<uint8_t>(1024, 0x41));
    std::string expected(1024, 'A');

    std::vector<std::thread> threads;
    std::vector<int> ok(8, 0);
    for (size_t i = 0; i < ok.size(); ++i) {
        threads.emplace_back([&, i] {
            ok[i] = payload.toString() == expected &&
                    payload.toBase64URL().decode().size() == 1024;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int result : ok) {
        CHECK(result == 1);
    }
}
