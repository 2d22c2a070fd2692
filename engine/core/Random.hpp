#pragma once

#include <cstdint>
#include <random>

namespace Crimson {

/**
 * @brief Source of uniform random numbers
 *
 * Injected into anything that rolls dice so tests can script the outcome.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Next uniform float in [0, 1)
     */
    [[nodiscard]] virtual float NextFloat() = 0;

    /**
     * @brief Uniform float in [min, max)
     */
    [[nodiscard]] float NextRange(float min, float max) {
        return min + (max - min) * NextFloat();
    }
};

/**
 * @brief Mersenne twister backed random source
 */
class MersenneRandom : public IRandomSource {
public:
    explicit MersenneRandom(uint32_t seed = 5489u);

    [[nodiscard]] float NextFloat() override;

    void Reseed(uint32_t seed);

private:
    std::mt19937 m_engine;
    std::uniform_real_distribution<float> m_dist{0.0f, 1.0f};
};

} // namespace Crimson
