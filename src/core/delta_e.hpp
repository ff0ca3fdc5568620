#pragma once

#include "core/types.hpp"
#include "core/color_space.hpp"

namespace ctune {

// Parametric factors of CIEDE2000. Reference conditions use 1 for all three.
struct DeltaEWeights {
    double k_L = 1.0;
    double k_C = 1.0;
    double k_H = 1.0;
};

// CIEDE2000 (Sharma, Wu, Dalal 2005). Symmetric, zero on identical input.
double delta_e_2000(const Lab& lab1, const Lab& lab2, const DeltaEWeights& weights = {});

double difference(const RGB& a, const RGB& b);
double difference(const NormalizedRGB& a, const NormalizedRGB& b);

}
