#pragma once

#include <mutex>
#include <random>
#include <string>

#include "arbscan/types.hpp"

namespace arbscan {

// arb_<epochMs>_<9 base-36 chars>. Biased toward time order but not strictly
// increasing; uniqueness against existing ids is the caller's check.
class IdGenerator {
public:
    IdGenerator();
    explicit IdGenerator(std::uint64_t seed);

    std::string next(TimePoint now);

    static constexpr std::size_t SUFFIX_LENGTH = 9;

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

} // namespace arbscan
