#include "draft_bandit/market.hpp"
#include "draft_bandit/errors.hpp"

#include <fmt/format.h>

namespace draft_bandit {

namespace {

// Keeps the market stream apart from strategies seeded with the same value
constexpr std::uint64_t kMarketStream = 0x6d61726b6574ULL;

inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

} // namespace

CompetitiveMarket::CompetitiveMarket(double low_factor, double high_factor,
                                     std::uint64_t seed)
    : low_factor_(low_factor), high_factor_(high_factor),
      rng_(mix_seed(seed, kMarketStream)) {
  if (!(low_factor_ > 0.0 && low_factor_ <= high_factor_)) {
    throw ConfigurationError(fmt::format(
        "Competitive bid factors must satisfy 0 < low <= high, got [{}, {}]",
        low_factor_, high_factor_));
  }
}

double CompetitiveMarket::next_bid(const Player &p) {
  // A degenerate [a, a] range yields exactly a
  std::uniform_real_distribution<double> factor(low_factor_, high_factor_);
  return p.value * factor(rng_);
}

} // namespace draft_bandit
