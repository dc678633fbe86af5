#include <random>
#include <stdexcept>
#include <unordered_set>
#include <vector>
#include <benchmark/benchmark.h>
#include "rsv/resizing_vector.hpp"
#include "chains.hpp"

using rsv_bench::chain;
using rsv_bench::QUERY_COUNT;

// Two levels of resizing_vector, channel first then locate
struct rv_root {
	rsv::resizing_vector<rsv::resizing_vector<chain>> data;
	auto get(size_t channel, size_t locate) const -> const chain* {
		if (const auto locates{data.get(channel)}) {
			return locates->get(locate);
		}
		return nullptr;
	}
};

struct hs_root {
	std::unordered_set<chain, rsv_bench::chain_hash, rsv_bench::chain_equal> data;
	auto get(size_t channel, size_t locate) const -> const chain* {
		const auto pos{data.find(chain{channel, locate})};
		return pos == data.end() ? nullptr : &*pos;
	}
};

static auto make_rv_root(const std::vector<chain>& chains) -> rv_root {
	rv_root root;
	for (const auto& c : chains) {
		if (!root.data.get(c.channel)) {
			root.data.insert(c.channel, rsv::resizing_vector<chain>{});
		}
		root.data.get(c.channel)->insert(c.locate, c);
	}
	return root;
}

static auto make_hs_root(const std::vector<chain>& chains) -> hs_root {
	hs_root root;
	for (const auto& c : chains) {
		root.data.insert(c);
	}
	if (root.data.size() != chains.size()) {
		throw std::runtime_error{"duplicate (channel, locate) rows in input"};
	}
	return root;
}

static auto chains() -> const std::vector<chain>& {
	static const auto out{rsv_bench::load_chains()};
	return out;
}

// Looking up the same locate across the first few channels
static void BM_resizing_vector_get(benchmark::State& state) {
	const auto locate{static_cast<size_t>(state.range(0))};
	rv_root root;
	try {
		root = make_rv_root(chains());
	} catch (const std::exception& err) {
		state.SkipWithError(err.what());
		return;
	}
	for (auto _ : state) {
		for (size_t channel = 0; channel < QUERY_COUNT; channel++) {
			benchmark::DoNotOptimize(root.get(channel, locate));
		}
	}
}
BENCHMARK(BM_resizing_vector_get)->DenseRange(0, QUERY_COUNT - 1);

static void BM_unordered_set_get(benchmark::State& state) {
	const auto locate{static_cast<size_t>(state.range(0))};
	hs_root root;
	try {
		root = make_hs_root(chains());
	} catch (const std::exception& err) {
		state.SkipWithError(err.what());
		return;
	}
	for (auto _ : state) {
		for (size_t channel = 0; channel < QUERY_COUNT; channel++) {
			benchmark::DoNotOptimize(root.get(channel, locate));
		}
	}
}
BENCHMARK(BM_unordered_set_get)->DenseRange(0, QUERY_COUNT - 1);

// Packing a sparse vector back down after most of it was removed
static void BM_resizing_vector_compact(benchmark::State& state) {
	const auto slots{static_cast<size_t>(state.range(0))};
	std::mt19937 rng(1234);
	std::bernoulli_distribution keep(0.1);
	for (auto _ : state) {
		state.PauseTiming();
		rsv::resizing_vector<size_t> v;
		for (size_t idx = 0; idx < slots; idx++) {
			if (keep(rng)) {
				v.insert(idx, idx);
			}
		}
		state.ResumeTiming();
		benchmark::DoNotOptimize(v.compact());
	}
}
BENCHMARK(BM_resizing_vector_compact)->Range(1 << 10, 1 << 16);

BENCHMARK_MAIN();
