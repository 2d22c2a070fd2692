#include "core/Random.hpp"

namespace Crimson {

MersenneRandom::MersenneRandom(uint32_t seed)
    : m_engine(seed) {
}

float MersenneRandom::NextFloat() {
    float value = m_dist(m_engine);
    // uniform_real_distribution<float> may round up to 1.0 on some libraries
    return value < 1.0f ? value : 0.0f;
}

void MersenneRandom::Reseed(uint32_t seed) {
    m_engine.seed(seed);
    m_dist.reset();
}

} // namespace Crimson
