#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <cstddef>
#include <iostream>

// Debug-only numeric sanity checks. Problems are reported on std::cerr and
// never alter the computation; release builds (NDEBUG) compile them out.
namespace validation {

#ifndef NDEBUG
inline void checkFinite(double value, const char* what) {
    if (!std::isfinite(value)) {
        std::cerr << "[VALIDATION] " << what << " is not finite: " << value << "\n";
    }
}

inline void checkNonNegative(double value, const char* what) {
    if (!(value >= 0.0)) {
        std::cerr << "[VALIDATION] " << what << " is negative: " << value << "\n";
    }
}

inline void checkSeries(const double* values, std::size_t n, const char* what) {
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(values[i]) || values[i] < 0.0) {
            std::cerr << "[VALIDATION] " << what << "[" << i << "] out of range: "
                      << values[i] << "\n";
        }
    }
}
#else
inline void checkFinite(double, const char*) {}
inline void checkNonNegative(double, const char*) {}
inline void checkSeries(const double*, std::size_t, const char*) {}
#endif

}  // namespace validation

#endif
