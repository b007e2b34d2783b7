#pragma once

#include <cstdint>
#include <cstddef>
#include <cmath>
#include <random>
#include <vector>
#include <string>
#include <stdexcept>

namespace libestim {
namespace utils {

/**
 * Seedable source of uniform draws
 *
 * One RandomSource is owned per run (or per test) and passed explicitly to
 * every routine that draws. It is not thread-safe: concurrent work derives
 * one independent source per task with Derive(), which keeps results
 * reproducible under a fixed seed regardless of scheduling.
 */
class RandomSource {
public:
	/// Non-reproducible source seeded from std::random_device
	RandomSource() : RandomSource(EntropySeed()) {
	}

	explicit RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {
	}

	uint64_t Seed() const {
		return seed_;
	}

	std::mt19937_64 &Engine() {
		return engine_;
	}

	/**
	 * Uniform real draw in [lo, hi]
	 *
	 * lo == hi returns lo without consuming entropy.
	 * @throws std::invalid_argument if lo > hi or a bound is not finite
	 */
	double UniformReal(double lo, double hi) {
		if (!std::isfinite(lo) || !std::isfinite(hi)) {
			throw std::invalid_argument("UniformReal bounds must be finite");
		}
		if (lo > hi) {
			throw std::invalid_argument("UniformReal requires lo <= hi (got [" + std::to_string(lo) + ", " +
			                            std::to_string(hi) + "])");
		}
		if (lo == hi) {
			return lo;
		}
		std::uniform_real_distribution<double> dist(lo, hi);
		double draw = dist(engine_);
		// uniform_real_distribution is half-open; rounding can still land on hi
		return draw > hi ? hi : draw;
	}

	/**
	 * Uniform index in [0, n)
	 *
	 * @throws std::invalid_argument if n == 0
	 */
	size_t UniformIndex(size_t n) {
		if (n == 0) {
			throw std::invalid_argument("UniformIndex requires n > 0");
		}
		std::uniform_int_distribution<size_t> dist(0, n - 1);
		return dist(engine_);
	}

	/// count indices drawn independently and uniformly from [0, n)
	std::vector<size_t> SampleWithReplacement(size_t n, size_t count) {
		std::vector<size_t> indices(count);
		for (auto &idx : indices) {
			idx = UniformIndex(n);
		}
		return indices;
	}

	/// Raw 64-bit draw, used to seed derived sources
	uint64_t NextSeed() {
		return static_cast<uint64_t>(engine_());
	}

	/// Independent source for stream `stream` of base seed `seed`
	static RandomSource Derive(uint64_t seed, uint64_t stream) {
		return RandomSource(HashCombine(seed, stream));
	}

	// Simple 64-bit splitmix hash (deterministic, good avalanche)
	static uint64_t SplitMix64(uint64_t x) {
		x += 0x9e3779b97f4a7c15ull;
		x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
		x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
		return x ^ (x >> 31);
	}

	static uint64_t HashCombine(uint64_t seed, uint64_t stream) {
		uint64_t h = 0x6a09e667f3bcc909ull;
		h = SplitMix64(h ^ seed);
		h = SplitMix64(h ^ stream);
		return h;
	}

private:
	static uint64_t EntropySeed() {
		std::random_device rd;
		return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
	}

	uint64_t seed_;
	std::mt19937_64 engine_;
};

} // namespace utils
} // namespace libestim
