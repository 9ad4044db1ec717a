#include "polymer/Statistics.h"
#include <cmath>
#include <stdexcept>
#include <string>

WeightedAverage weightedAverage(const Matrix& values, const Matrix& weights) {
    if (values.rows != weights.rows || values.cols != weights.cols) {
        throw std::invalid_argument("value matrix " + std::to_string(values.rows) + "x" +
                                    std::to_string(values.cols) + " does not match weight matrix " +
                                    std::to_string(weights.rows) + "x" +
                                    std::to_string(weights.cols));
    }

    const std::size_t cols = values.cols;
    WeightedAverage avg;
    avg.mean.assign(cols, 0.0);
    avg.error.assign(cols, 0.0);
    avg.totalWeight.assign(cols, 0.0);
    avg.effectiveSamples.assign(cols, 0.0);

    for (std::size_t c = 0; c < cols; ++c) {
        double sw = 0.0;
        double sw2 = 0.0;
        double swx = 0.0;
        for (std::size_t r = 0; r < values.rows; ++r) {
            const double w = weights.at(r, c);
            sw += w;
            sw2 += w * w;
            swx += w * values.at(r, c);
        }
        if (sw <= 0.0) continue;

        const double mean = swx / sw;
        double sq = 0.0;
        for (std::size_t r = 0; r < values.rows; ++r) {
            const double diff = values.at(r, c) - mean;
            sq += weights.at(r, c) * diff * diff;
        }
        const double variance = sq / sw;
        const double nEff = (sw * sw) / sw2;

        avg.mean[c] = mean;
        avg.totalWeight[c] = sw;
        avg.effectiveSamples[c] = nEff;
        avg.error[c] = std::sqrt(variance / nEff);
    }
    return avg;
}
