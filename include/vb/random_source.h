#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace vb {

// Injected source for every random draw (serve lane, skill variance, shot choice)
class RandomSourceBase {
public:
    virtual ~RandomSourceBase() = default;

    // Uniform in [0, 1)
    virtual double uniform() = 0;

    // True with probability p
    virtual bool chance(double p) { return uniform() < p; }

    // Opaque stream position. Restoring it replays the same draws.
    virtual std::string saveState() const = 0;
    // Throws std::invalid_argument on a state this source did not produce
    virtual void restoreState(const std::string& state) = 0;
};

class RandomSource : public RandomSourceBase {
    std::mt19937 rng_;
public:
    explicit RandomSource(uint32_t seed);
    RandomSource();  // uses random_device

    double uniform() override;
    std::string saveState() const override;
    void restoreState(const std::string& state) override;
};

class FixedRandomSource : public RandomSourceBase {
    std::vector<double> values_;
    size_t index_ = 0;

    double next();
public:
    explicit FixedRandomSource(std::vector<double> values);

    double uniform() override;
    std::string saveState() const override;
    void restoreState(const std::string& state) override;

    size_t remaining() const { return values_.size() - index_; }
};

} // namespace vb
