#pragma once

#include <algorithm>
#include <chrono>
#include <random>

namespace ytupload {

// Exponential backoff for transient failures: attempt k (1-based) waits
// min(max_delay, base_delay * 2^(k-1)), scaled by a random factor in
// [1 - jitter, 1 + jitter].
struct RetryPolicy {
	int max_attempts = 5;
	std::chrono::milliseconds base_delay{1000};
	std::chrono::milliseconds max_delay{32000};
	double jitter = 0.2;

	template <typename Rng>
	[[nodiscard]] std::chrono::milliseconds delay_for(int attempt,
													  Rng &rng) const {
		if (base_delay.count() <= 0) return std::chrono::milliseconds{0};

		double delay = static_cast<double>(base_delay.count());
		for (int i = 1; i < attempt; ++i) {
			delay *= 2.0;
			if (delay >= static_cast<double>(max_delay.count())) break;
		}
		delay = std::min(delay, static_cast<double>(max_delay.count()));

		if (jitter > 0.0) {
			std::uniform_real_distribution<double> dist(1.0 - jitter,
														1.0 + jitter);
			delay *= dist(rng);
		}
		return std::chrono::milliseconds{static_cast<long long>(delay)};
	}

	static RetryPolicy immediate(int attempts) {
		RetryPolicy p;
		p.max_attempts = attempts;
		p.base_delay = std::chrono::milliseconds{0};
		p.jitter = 0.0;
		return p;
	}
};

}  // namespace ytupload
