#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include <benchmark/benchmark.h>

#include "ocid/core/content_id.hpp"

namespace {
ocid::core::ContentId patterned(size_t seed){
    ocid::core::ContentId id{};
    for (size_t i = 0; i < id.b.size(); ++i){
        id.b[i] = static_cast<ocid::core::u8>((seed * 131u + i * 7u) & 0xffu);
    }
    for (size_t i = 0; i < 4; ++i){
        id.b[i] = static_cast<ocid::core::u8>((seed >> (8 * i)) & 0xffu);
    }
    return id;
}
} // namespace

static void BM_EncodeText(benchmark::State& state){
    const ocid::core::ContentId id = patterned(1);
    for (auto _ : state){
        ocid::core::ContentIdText text{};
        ocid::core::Status s = ocid::core::content_id_encode_text(id, &text);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(text);
    }
}

static void BM_DecodeText(benchmark::State& state){
    const std::string text = ocid::core::content_id_to_text(patterned(2));
    for (auto _ : state){
        ocid::core::ContentId out{};
        ocid::core::DecodeError e = ocid::core::content_id_from_text(text, &out);
        benchmark::DoNotOptimize(e);
        benchmark::DoNotOptimize(out);
    }
}

static void BM_DecodeTextRejectsBadCharacter(benchmark::State& state){
    std::string text = ocid::core::content_id_to_text(patterned(3));
    text[text.size() / 2] = '+';
    for (auto _ : state){
        ocid::core::ContentId out{};
        ocid::core::DecodeError e = ocid::core::content_id_from_text(text, &out);
        benchmark::DoNotOptimize(e);
    }
}

static void BM_HashSetInsert(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<ocid::core::ContentId> ids;
    ids.reserve(n);
    for (size_t i = 0; i < n; ++i){
        ids.push_back(patterned(i));
    }

    for (auto _ : state){
        std::unordered_set<ocid::core::ContentId> set;
        set.reserve(n);
        for (const auto& id : ids){
            set.insert(id);
        }
        benchmark::DoNotOptimize(set.size());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_EncodeText);
BENCHMARK(BM_DecodeText);
BENCHMARK(BM_DecodeTextRejectsBadCharacter);
BENCHMARK(BM_HashSetInsert)->Arg(64)->Arg(4096);
