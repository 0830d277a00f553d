#include "vb/random_source.h"
#include <sstream>
#include <stdexcept>

namespace vb {

// --- RandomSource ---

RandomSource::RandomSource(uint32_t seed) : rng_(seed) {}

RandomSource::RandomSource() : rng_(std::random_device{}()) {}

double RandomSource::uniform() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

std::string RandomSource::saveState() const {
    std::ostringstream os;
    os << rng_;
    return os.str();
}

void RandomSource::restoreState(const std::string& state) {
    std::istringstream is(state);
    std::mt19937 restored;
    if (!(is >> restored)) {
        throw std::invalid_argument("RandomSource: malformed state");
    }
    rng_ = restored;
}

// --- FixedRandomSource ---

FixedRandomSource::FixedRandomSource(std::vector<double> values)
    : values_(std::move(values)) {}

double FixedRandomSource::next() {
    if (index_ >= values_.size()) {
        throw std::out_of_range("FixedRandomSource: no more values");
    }
    return values_[index_++];
}

double FixedRandomSource::uniform() { return next(); }

std::string FixedRandomSource::saveState() const {
    return std::to_string(index_);
}

void FixedRandomSource::restoreState(const std::string& state) {
    size_t pos = 0;
    unsigned long index = 0;
    try {
        index = std::stoul(state, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("FixedRandomSource: malformed state");
    }
    if (pos != state.size() || index > values_.size()) {
        throw std::invalid_argument("FixedRandomSource: malformed state");
    }
    index_ = index;
}

} // namespace vb
