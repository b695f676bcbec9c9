#include <benchmark/benchmark.h>
#include "jose/base64url.hpp"
#include "jose/payload.hpp"
#include <vector>
#include <string>
#include <random>

using namespace jose;

static std::vector<uint8_t> CreateRandomData(size_t size) {
    std::vector<uint8_t> data(size);
    std::mt19937 gen(42); // Fixed seed for reproducible benchmarks
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

// Header-sized, claim-set-sized, 10KB and 100KB inputs
static void BM_Base64URL_Encode(benchmark::State& state) {
    auto data = CreateRandomData(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        std::string encoded = base64UrlEncode(data);
        benchmark::DoNotOptimize(encoded);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64URL_Encode)->Arg(32)->Arg(256)->Arg(10240)->Arg(102400);

static void BM_Base64URL_Decode(benchmark::State& state) {
    std::string encoded = base64UrlEncode(CreateRandomData(static_cast<size_t>(state.range(0))));
    for (auto _ : state) {
        auto decoded = base64UrlDecode(encoded);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64URL_Decode)->Arg(32)->Arg(256)->Arg(10240)->Arg(102400);

static void BM_Base64_Encode_CertificateChain(benchmark::State& state) {
    // Typical DER certificate size for an x5c entry
    auto der = CreateRandomData(1200);
    for (auto _ : state) {
        std::string encoded = base64Encode(der);
        benchmark::DoNotOptimize(encoded);
    }
}
BENCHMARK(BM_Base64_Encode_CertificateChain);

static void BM_Base64URL_Validate(benchmark::State& state) {
    std::string encoded = base64UrlEncode(CreateRandomData(1024));
    for (auto _ : state) {
        Base64URL value(encoded);
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_Base64URL_Validate);

static void BM_Payload_Views(benchmark::State& state) {
    std::string claims = R"({"iss":"https://issuer.example.com","sub":"alice","aud":"api","exp":1300819380})";
    for (auto _ : state) {
        Payload payload(claims);
        auto encoded = payload.toBase64URL();
        auto object = payload.toJSONObject();
        benchmark::DoNotOptimize(encoded);
        benchmark::DoNotOptimize(object);
    }
}
BENCHMARK(BM_Payload_Views);
