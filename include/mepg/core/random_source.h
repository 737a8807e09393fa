#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

#include "mepg/core/types.h"

namespace mepg {

/**
 * @brief The single pseudo-random stream shared by every pipeline stage
 *
 * Stages draw in a fixed call order, so the same seed reproduces the same
 * graph. Without a seed one is taken from std::random_device and kept so the
 * run can be repeated.
 */
class RandomSource {
  public:
    explicit RandomSource(std::optional<std::uint64_t> seed = std::nullopt)
        : seed_(seed ? *seed : draw_seed()), engine_(seed_) {}

    std::uint64_t seed() const noexcept { return seed_; }

    /**
     * @brief Uniform real in [low, high)
     */
    Float uniform(Float low, Float high) {
        std::uniform_real_distribution<Float> dist(low, high);
        return dist(engine_);
    }

    /**
     * @brief Uniform integer in [low, high]
     */
    int uniform_int(int low, int high) {
        std::uniform_int_distribution<int> dist(low, high);
        return dist(engine_);
    }

    template <typename T>
    T const& choice(std::vector<T> const& values) {
        if (values.empty()) {
            throw std::invalid_argument("Cannot choose from an empty list");
        }
        return values[static_cast<size_t>(uniform_int(0, static_cast<int>(values.size()) - 1))];
    }

  private:
    static std::uint64_t draw_seed() {
        std::random_device device;
        return (static_cast<std::uint64_t>(device()) << 32) ^ device();
    }

    std::uint64_t seed_;
    std::mt19937_64 engine_;
};

}  // namespace mepg
