#pragma once

#include "libsynthctl/core/errors.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <vector>

namespace libsynthctl {
namespace inference {

/**
 * ICombinationSource: producer of size-k subsets of {0, ..., n-1}
 *
 * The placebo aggregation loop is written once against this interface and
 * does not know whether subsets are enumerated or sampled.
 */
class ICombinationSource {
public:
	virtual ~ICombinationSource() = default;

	/**
	 * Write the next combination into `combination`
	 *
	 * @param combination Output, resized to k indexes
	 * @return false once the source is exhausted
	 */
	virtual bool Next(std::vector<size_t> &combination) = 0;

	/// Number of combinations this source produces in total
	virtual size_t Size() const = 0;

	/// True for randomly sampled sources
	virtual bool IsSampled() const = 0;
};

/**
 * All C(n, k) combinations in lexicographic order
 */
class LexicographicCombinationSource : public ICombinationSource {
public:
	LexicographicCombinationSource(size_t n, size_t k, size_t total) : n_(n), k_(k), total_(total), current_(k) {
		std::iota(current_.begin(), current_.end(), size_t(0));
	}

	bool Next(std::vector<size_t> &combination) override {
		if (produced_ >= total_) {
			return false;
		}
		if (produced_ > 0 && !Advance()) {
			return false;
		}
		combination = current_;
		produced_++;
		return true;
	}

	size_t Size() const override {
		return total_;
	}

	bool IsSampled() const override {
		return false;
	}

private:
	// Move current_ to its lexicographic successor
	bool Advance() {
		if (k_ == 0) {
			return false;
		}
		size_t i = k_;
		while (i > 0) {
			i--;
			if (current_[i] < n_ - k_ + i) {
				current_[i]++;
				for (size_t j = i + 1; j < k_; j++) {
					current_[j] = current_[j - 1] + 1;
				}
				return true;
			}
		}
		return false;
	}

	size_t n_;
	size_t k_;
	size_t total_;
	size_t produced_ = 0;
	std::vector<size_t> current_;
};

/**
 * `count` independent uniform draws of a size-k subset
 *
 * Each draw has no repeated index (partial Fisher-Yates shuffle), but distinct
 * draws may coincide. The generator is owned by the caller and must outlive
 * the source.
 */
class RandomCombinationSource : public ICombinationSource {
public:
	RandomCombinationSource(size_t n, size_t k, size_t count, std::mt19937_64 &rng)
	    : k_(k), count_(count), rng_(rng), pool_(n) {
		std::iota(pool_.begin(), pool_.end(), size_t(0));
	}

	bool Next(std::vector<size_t> &combination) override {
		if (produced_ >= count_) {
			return false;
		}
		const size_t n = pool_.size();
		for (size_t j = 0; j < k_; j++) {
			std::uniform_int_distribution<size_t> pick(j, n - 1);
			std::swap(pool_[j], pool_[pick(rng_)]);
		}
		combination.assign(pool_.begin(), pool_.begin() + static_cast<std::ptrdiff_t>(k_));
		std::sort(combination.begin(), combination.end());
		produced_++;
		return true;
	}

	size_t Size() const override {
		return count_;
	}

	bool IsSampled() const override {
		return true;
	}

private:
	size_t k_;
	size_t count_;
	size_t produced_ = 0;
	std::mt19937_64 &rng_;
	std::vector<size_t> pool_;
};

/**
 * Combination counting and source selection
 */
class CombinationSource {
public:
	/// Value returned by BinomialCoefficient when C(n, k) does not fit in 64 bits
	static constexpr uint64_t kSaturated = std::numeric_limits<uint64_t>::max();

	/**
	 * Exact C(n, k), saturating at kSaturated on overflow
	 */
	static uint64_t BinomialCoefficient(uint64_t n, uint64_t k);

	/**
	 * C(n, k) in floating point (finite for any count reachable in practice)
	 */
	static double BinomialCoefficientAsDouble(uint64_t n, uint64_t k);

	/**
	 * Pick exact enumeration or random sampling
	 *
	 * Sampling is used iff max_combinations > 0 and max_combinations < C(n, k).
	 *
	 * @param n Number of control units
	 * @param k Number of treated units (combination size), k <= n
	 * @param max_combinations Cap on the number of combinations (<= 0: no cap)
	 * @param rng Generator used by the sampling source
	 * @throws InvalidArgumentError (TOO_MANY_COMBINATIONS) if exact enumeration
	 *         is required but C(n, k) is not representable
	 */
	static std::unique_ptr<ICombinationSource> Create(size_t n, size_t k, int64_t max_combinations,
	                                                  std::mt19937_64 &rng);
};

// ============================================================================
// Implementation
// ============================================================================

inline uint64_t CombinationSource::BinomialCoefficient(uint64_t n, uint64_t k) {
	if (k > n) {
		return 0;
	}
	const uint64_t r = std::min(k, n - k);
	uint64_t result = 1;
	for (uint64_t i = 1; i <= r; i++) {
		// result * (n - r + i) is divisible by i; reduce first to keep the product small
		const uint64_t factor = n - r + i;
		const uint64_t g = std::gcd(result, i);
		const uint64_t reduced = result / g;
		const uint64_t multiplier = factor / (i / g);
		if (multiplier != 0 && reduced > std::numeric_limits<uint64_t>::max() / multiplier) {
			return kSaturated;
		}
		result = reduced * multiplier;
	}
	return result;
}

inline double CombinationSource::BinomialCoefficientAsDouble(uint64_t n, uint64_t k) {
	if (k > n) {
		return 0.0;
	}
	const uint64_t r = std::min(k, n - k);
	double result = 1.0;
	for (uint64_t i = 1; i <= r; i++) {
		result = result * static_cast<double>(n - r + i) / static_cast<double>(i);
	}
	return result;
}

inline std::unique_ptr<ICombinationSource> CombinationSource::Create(size_t n, size_t k, int64_t max_combinations,
                                                                     std::mt19937_64 &rng) {
	const uint64_t n_pl = BinomialCoefficient(n, k);

	if (max_combinations > 0 && static_cast<uint64_t>(max_combinations) < n_pl) {
		return std::make_unique<RandomCombinationSource>(n, k, static_cast<size_t>(max_combinations), rng);
	}

	if (n_pl == kSaturated || n_pl > std::numeric_limits<size_t>::max()) {
		throw InvalidArgumentError(InvalidArgumentCause::TOO_MANY_COMBINATIONS,
		                           "C(" + std::to_string(n) + ", " + std::to_string(k) +
		                               ") combinations cannot be enumerated; set max_combinations");
	}
	return std::make_unique<LexicographicCombinationSource>(n, k, static_cast<size_t>(n_pl));
}

} // namespace inference
} // namespace libsynthctl
