#include "arbscan/id_generator.hpp"

namespace arbscan {

namespace {
    constexpr char BASE36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
}

IdGenerator::IdGenerator()
    : rng_(std::random_device{}())
{
}

IdGenerator::IdGenerator(std::uint64_t seed)
    : rng_(seed)
{
}

std::string IdGenerator::next(TimePoint now) {
    std::string id = "arb_" + std::to_string(to_epoch_ms(now)) + "_";

    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<int> digit(0, 35);
    for (std::size_t i = 0; i < SUFFIX_LENGTH; ++i) {
        id.push_back(BASE36[digit(rng_)]);
    }
    return id;
}

} // namespace arbscan
