#include "random_source.hpp"

namespace dice {

MersenneRandomSource::MersenneRandomSource() : gen(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(std::uint32_t seed) : gen(seed) {}

int MersenneRandomSource::roll(int faces) {
    std::uniform_int_distribution<int> die(1, faces);
    return die(gen);
}

void MersenneRandomSource::reseed(std::uint32_t seed) {
    gen.seed(seed);
}

MersenneRandomSource& defaultRandomSource() {
    static MersenneRandomSource source;
    return source;
}

} // namespace dice
