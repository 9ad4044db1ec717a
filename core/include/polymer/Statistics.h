#ifndef STATISTICS_H
#define STATISTICS_H

#include <cstddef>
#include <vector>

// ---------- Dense row-major matrix (one row per chain, one column per length) ----------
struct Matrix {
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::vector<double> data;

    Matrix() = default;
    Matrix(std::size_t r, std::size_t c) : rows(r), cols(c), data(r * c, 0.0) {}

    double& at(std::size_t r, std::size_t c) { return data[r * cols + c]; }
    double at(std::size_t r, std::size_t c) const { return data[r * cols + c]; }
};

// Observable matrices of an ensemble, zero-padded past each chain's length
struct EnsembleMatrices {
    Matrix endToEnd;
    Matrix gyration;
    Matrix weight;
};

// Per-column weighted mean with its standard error
struct WeightedAverage {
    std::vector<double> mean;
    std::vector<double> error;
    std::vector<double> totalWeight;
    std::vector<double> effectiveSamples;  // (sum w)^2 / sum w^2
};

// Columns with zero total weight report mean and error 0.
// `values` and `weights` must have the same shape (std::invalid_argument otherwise).
WeightedAverage weightedAverage(const Matrix& values, const Matrix& weights);

#endif
