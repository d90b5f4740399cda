#include <benchmark/benchmark.h>
#include "ua/codec.hpp"
#include "test_fixtures.hpp"
#include <string>
#include <vector>

using namespace ua;
using namespace ua::test;

static const Envelope kEnvelope = sample_envelope();

// Reading with a long sample array, for array-heavy throughput.
static SensorReading make_large_reading(size_t n) {
    SensorReading r = sample_reading();
    r.samples.resize(n);
    for (size_t i = 0; i < n; ++i) r.samples[i] = static_cast<uint32_t>(i * 7);
    r.tags.assign(n / 10, "tag");
    return r;
}

static const SensorReading kLargeReading = make_large_reading(10000);

// ---- Encode benchmarks ----

static void BM_Encode(benchmark::State& state, EncodingType format, const IEncodeable& message) {
    MessageContext context = make_context();
    size_t bytes = 0;
    for (auto _ : state) {
        auto out = Codec::encode_message(message, context, format);
        bytes = out.size();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * bytes));
}
BENCHMARK_CAPTURE(BM_Encode, BinaryEnvelope, EncodingType::Binary, kEnvelope);
BENCHMARK_CAPTURE(BM_Encode, XmlEnvelope, EncodingType::Xml, kEnvelope);
BENCHMARK_CAPTURE(BM_Encode, JsonEnvelope, EncodingType::Json, kEnvelope);
BENCHMARK_CAPTURE(BM_Encode, BinaryLargeReading, EncodingType::Binary, kLargeReading);
BENCHMARK_CAPTURE(BM_Encode, JsonLargeReading, EncodingType::Json, kLargeReading);

// ---- Decode benchmarks ----

static void BM_Decode(benchmark::State& state, EncodingType format, const IEncodeable& message) {
    MessageContext context = make_context();
    const std::vector<uint8_t> data = Codec::encode_message(message, context, format);
    for (auto _ : state) {
        auto decoded = Codec::decode_message(data, context, format);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * data.size()));
}
BENCHMARK_CAPTURE(BM_Decode, BinaryEnvelope, EncodingType::Binary, kEnvelope);
BENCHMARK_CAPTURE(BM_Decode, XmlEnvelope, EncodingType::Xml, kEnvelope);
BENCHMARK_CAPTURE(BM_Decode, JsonEnvelope, EncodingType::Json, kEnvelope);
BENCHMARK_CAPTURE(BM_Decode, BinaryLargeReading, EncodingType::Binary, kLargeReading);
BENCHMARK_CAPTURE(BM_Decode, JsonLargeReading, EncodingType::Json, kLargeReading);

// ---- JSON encodings ----

static void BM_EncodeJsonEncoding(benchmark::State& state) {
    MessageContext context = make_context();
    JsonEncoderOptions options;
    options.encoding = static_cast<JsonEncoding>(state.range(0));
    for (auto _ : state) {
        auto out = Codec::encode_message(kEnvelope, context, EncodingType::Json, options);
        benchmark::DoNotOptimize(out);
    }
    state.SetLabel(std::string(json_encoding_name(options.encoding)));
}
BENCHMARK(BM_EncodeJsonEncoding)
    ->Arg(static_cast<int>(JsonEncoding::Reversible))
    ->Arg(static_cast<int>(JsonEncoding::NonReversible))
    ->Arg(static_cast<int>(JsonEncoding::Compact))
    ->Arg(static_cast<int>(JsonEncoding::Verbose));

// ---- Variant ----

static void BM_MatrixVariantBinary(benchmark::State& state) {
    MessageContext context = make_context();
    const auto n = static_cast<size_t>(state.range(0));
    std::vector<double> elements(n * n, 1.5);
    Variant matrix = Variant::from_storage(Variant::Storage(std::move(elements)), true,
                                           {static_cast<int32_t>(n), static_cast<int32_t>(n)});
    for (auto _ : state) {
        BinaryEncoder encoder(context);
        encoder.write_variant("", matrix);
        auto bytes = encoder.release();
        BinaryDecoder decoder(bytes.data(), bytes.size(), context);
        auto back = decoder.read_variant("");
        benchmark::DoNotOptimize(back);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * n * n));
}
BENCHMARK(BM_MatrixVariantBinary)->Arg(16)->Arg(128);

BENCHMARK_MAIN();
