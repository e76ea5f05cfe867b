#pragma once

#include <random>

// Source of uniform draws for sampling. Tests substitute scripted streams.
class RandomStream {
  public:
    virtual ~RandomStream() = default;
    virtual double uniform(double lo = 0.0, double hi = 1.0) = 0;
};

class StdRandomStream : public RandomStream {
  public:
    explicit StdRandomStream(std::mt19937_64& rng);

    double uniform(double lo, double hi) override;

  private:
    std::mt19937_64& rng_;
};
