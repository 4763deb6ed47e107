#include <string>

#include <benchmark/benchmark.h>

#include "cabinet/security/signing.hpp"
#include "cabinet/security/token.hpp"

namespace {
static cabinet::security::Key256 make_key256_seq(cabinet::core::u8 start) {
    cabinet::security::Key256 k{};
    for (size_t i = 0; i < 32; ++i) {
        k.b[i] = static_cast<cabinet::core::u8>(start + static_cast<cabinet::core::u8>(i));
    }
    return k;
}
} // namespace

static void BM_TokenGenerate(benchmark::State& state) {
    for (auto _ : state) {
        std::string token;
        const cabinet::core::Status s = cabinet::security::token_generate(&token);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(token.data());
    }
}
BENCHMARK(BM_TokenGenerate);

static void BM_DownloadSeal(benchmark::State& state) {
    const cabinet::security::Key256 key = make_key256_seq(3);
    cabinet::security::DownloadGrant grant;
    grant.blob_key = "42/" + std::string(64, 'a') + "-" + std::string(32, 'b');
    grant.expires_at = 1700003600;

    for (auto _ : state) {
        cabinet::security::Tag16 tag{};
        const cabinet::core::Status s = cabinet::security::download_seal(key, grant, &tag);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(tag.b[0]);
    }
}
BENCHMARK(BM_DownloadSeal);

static void BM_DownloadVerify(benchmark::State& state) {
    const cabinet::security::Key256 key = make_key256_seq(3);
    cabinet::security::DownloadGrant grant;
    grant.blob_key = "42/" + std::string(64, 'a') + "-" + std::string(32, 'b');
    grant.expires_at = 1700003600;
    (void)cabinet::security::download_seal(key, grant, &grant.proof);

    for (auto _ : state) {
        const cabinet::core::Status s = cabinet::security::download_verify(key, grant, 1700000000);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
    }
}
BENCHMARK(BM_DownloadVerify);
