/**
 * @file bench.cpp
 * @brief Throughput benchmarks for the bitcodec encoders.
 *
 * Measures encode/decode throughput for regression testing during
 * development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/bitcodec_bench          # Run with default 100 iterations
 *   ./build/bitcodec_bench 1000     # Run with custom iteration count
 */

#include <bitcodec/bitcodec.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace bitcodec;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t VALUES_PER_ITERATION = 4096;

// Keeps the optimizer from discarding decoded values
static volatile std::uint64_t g_sink = 0;

using WriteFn = void (*)(BitBuffer&, std::uint32_t);
using ReadFn = std::uint64_t (*)(BitBuffer&);

static std::vector<std::uint32_t> make_values(std::uint32_t mask) {
    std::vector<std::uint32_t> values(VALUES_PER_ITERATION);
    std::uint32_t state = 0x12345678U;
    for (auto& v : values) {
        // xorshift32
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        v = state & mask;
    }
    return values;
}

static void report(const char* name, double total_us, int iterations, std::size_t bytes) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_value_ns = per_iter_us * 1000.0 / static_cast<double>(VALUES_PER_ITERATION);
    double throughput_kbps = (static_cast<double>(bytes) * 8.0 * 1000.0) / per_iter_us;

    std::printf("%-24s %10.2f us/iter  %8.2f ns/value  %10.1f Kbps  (%zu bytes)\n", name,
                per_iter_us, per_value_ns, throughput_kbps, bytes);
}

static void bench_codec(const char* name, std::uint32_t mask, WriteFn write_fn, ReadFn read_fn,
                        int iterations) {
    auto values = make_values(mask);

    // Warmup run, also sizes the encoded stream
    BitBuffer warmup;
    for (auto v : values) {
        write_fn(warmup, v);
    }
    std::size_t encoded_bytes = warmup.length();

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        BitBuffer bb;
        for (auto v : values) {
            write_fn(bb, v);
        }
    }
    auto end = std::chrono::high_resolution_clock::now();

    char label[64];
    std::snprintf(label, sizeof(label), "%s write", name);
    report(label, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           encoded_bytes);

    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        BitBuffer bb(warmup.data());
        for (std::size_t n = 0; n < VALUES_PER_ITERATION; ++n) {
            g_sink = g_sink + read_fn(bb);
        }
    }
    end = std::chrono::high_resolution_clock::now();

    std::snprintf(label, sizeof(label), "%s read", name);
    report(label, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           encoded_bytes);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("bitcodec Benchmarks (v%s)\n", version());
    std::printf("=========================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Values per iteration: %zu\n\n", VALUES_PER_ITERATION);

    bench_codec(
        "bits(13)", 0x1FFFU, [](BitBuffer& bb, std::uint32_t v) { bb.write_bits(v, 13); },
        [](BitBuffer& bb) -> std::uint64_t { return bb.read_bits(13); }, iterations);

    bench_codec(
        "long", 0xFFFFFFFFU, [](BitBuffer& bb, std::uint32_t v) { bb.write_long(v); },
        [](BitBuffer& bb) -> std::uint64_t { return bb.read_long(); }, iterations);

    bench_codec(
        "compressed long (small)", 0xFFU,
        [](BitBuffer& bb, std::uint32_t v) { bb.write_compressed_long(v); },
        [](BitBuffer& bb) -> std::uint64_t { return bb.read_compressed_long(); }, iterations);

    bench_codec(
        "compressed long (full)", 0xFFFFFFFFU,
        [](BitBuffer& bb, std::uint32_t v) { bb.write_compressed_long(v); },
        [](BitBuffer& bb) -> std::uint64_t { return bb.read_compressed_long(); }, iterations);

    bench_codec(
        "float", 0xFFFFU,
        [](BitBuffer& bb, std::uint32_t v) { bb.write_float(static_cast<double>(v) / 7.0); },
        [](BitBuffer& bb) -> std::uint64_t {
            return static_cast<std::uint64_t>(bb.read_float());
        },
        iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
