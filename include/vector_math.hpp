#pragma once
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace context_engine {

// Cosine similarity in [-1, 1]; 0 when either vector has zero norm.
// Mismatched lengths are a caller bug and throw.
inline double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("vector dimensions do not match: " +
                                    std::to_string(a.size()) + " vs " + std::to_string(b.size()));
    }
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

inline double l2_norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return std::sqrt(sum);
}

} // namespace context_engine
