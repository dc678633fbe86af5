#pragma once

#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Benchmark input. Rows look like "<anything>,<channel>,<locate>,..."
// after a single header line. Path comes from RSV_BENCH_CSV.
namespace rsv_bench {

static constexpr auto DEFAULT_CSV_PATH{"./nl.csv"};
static constexpr size_t GENERATED_CHANNELS{64};
static constexpr size_t GENERATED_LOCATES{512};
static constexpr size_t QUERY_COUNT{3};

struct chain {
	size_t channel;
	size_t locate;
};

struct chain_hash {
	auto operator()(const chain& c) const -> size_t {
		return std::hash<size_t>{}(c.channel) ^ (std::hash<size_t>{}(c.locate) << 1);
	}
};

struct chain_equal {
	auto operator()(const chain& a, const chain& b) const -> bool {
		return a.channel == b.channel && a.locate == b.locate;
	}
};

// Digits only. std::stoull would take "-1" and wrap it to SIZE_MAX.
inline auto parse_column(const std::string& line, size_t line_number, const std::string& field) -> size_t {
	const auto bad_column = [&] {
		return std::runtime_error{"line " + std::to_string(line_number) + ": bad column in \"" + line + "\""};
	};
	if (field.empty() || field.find_first_not_of("0123456789") != std::string::npos) {
		throw bad_column();
	}
	try {
		return static_cast<size_t>(std::stoull(field));
	} catch (const std::out_of_range&) {
		throw bad_column();
	}
}

inline auto parse_row(const std::string& line, size_t line_number) -> chain {
	std::stringstream ss{line};
	std::vector<std::string> fields;
	std::string field;
	while (std::getline(ss, field, ',')) {
		fields.push_back(field);
	}
	if (fields.size() < 3) {
		throw std::runtime_error{"line " + std::to_string(line_number) + ": expected at least 3 columns"};
	}
	return chain{parse_column(line, line_number, fields[1]), parse_column(line, line_number, fields[2])};
}

inline auto read_chains(std::istream& in) -> std::vector<chain> {
	std::vector<chain> out;
	std::string line;
	size_t line_number{0};
	while (std::getline(in, line)) {
		if (line_number++ == 0) {
			continue;
		}
		if (line.empty()) {
			continue;
		}
		out.push_back(parse_row(line, line_number));
	}
	return out;
}

inline auto generate_chains() -> std::vector<chain> {
	std::mt19937 rng(1234);
	std::bernoulli_distribution keep(0.25);
	std::vector<chain> out;
	for (size_t channel = 0; channel < GENERATED_CHANNELS; channel++) {
		for (size_t locate = 0; locate < GENERATED_LOCATES; locate++) {
			if (locate < QUERY_COUNT || keep(rng)) {
				out.push_back(chain{channel, locate});
			}
		}
	}
	return out;
}

inline auto load_chains() -> std::vector<chain> {
	const auto env{std::getenv("RSV_BENCH_CSV")};
	const std::string path{env ? env : DEFAULT_CSV_PATH};
	std::ifstream file{path};
	if (!file) {
		if (env) {
			throw std::runtime_error{"can't open " + path};
		}
		std::cout << "No " << path << ", using generated chains\n";
		return generate_chains();
	}
	return read_chains(file);
}

} // rsv_bench
