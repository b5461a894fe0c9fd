/**
 * Multiple-testing correction (Benjamini-Hochberg, Bonferroni)
 */

#include "multiple_testing.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace goenrich {

namespace {

void check_p_values(const std::vector<double>& p_values) {
    if (p_values.empty()) {
        throw ValidationError("Cannot correct an empty set of p-values");
    }
    for (size_t i = 0; i < p_values.size(); ++i) {
        double p = p_values[i];
        if (std::isnan(p) || p < 0.0 || p > 1.0) {
            throw ValidationError("P-value at position " + std::to_string(i) +
                                  " is outside [0, 1]: " + std::to_string(p));
        }
    }
}

} // anonymous namespace

std::vector<double> benjamini_hochberg(const std::vector<double>& p_values) {
    check_p_values(p_values);

    const size_t m = p_values.size();

    // order[k] = original position of the hypothesis at rank k + 1
    std::vector<size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&p_values](size_t lhs, size_t rhs) {
        return p_values[lhs] < p_values[rhs];
    });

    // Cumulative minimum from the least significant rank down
    std::vector<double> adjusted(m);
    double running_min = 1.0;
    for (size_t k = m; k-- > 0;) {
        size_t idx = order[k];
        double q = p_values[idx] * static_cast<double>(m) / static_cast<double>(k + 1);
        running_min = std::min(running_min, q);
        adjusted[idx] = running_min;
    }

    return adjusted;
}

std::vector<double> bonferroni(const std::vector<double>& p_values) {
    check_p_values(p_values);

    const double m = static_cast<double>(p_values.size());
    std::vector<double> adjusted;
    adjusted.reserve(p_values.size());
    for (double p : p_values) {
        adjusted.push_back(std::min(1.0, p * m));
    }
    return adjusted;
}

std::vector<double> adjust_p_values(const std::vector<double>& p_values,
                                    CorrectionMethod method) {
    switch (method) {
        case CorrectionMethod::BENJAMINI_HOCHBERG: return benjamini_hochberg(p_values);
        case CorrectionMethod::BONFERRONI:         return bonferroni(p_values);
    }
    return benjamini_hochberg(p_values);
}

std::vector<TermPValue> adjust_p_values(const std::vector<TermPValue>& raw,
                                        CorrectionMethod method) {
    std::vector<double> p_values;
    p_values.reserve(raw.size());
    for (const auto& entry : raw) {
        p_values.push_back(entry.p_value);
    }

    std::vector<double> adjusted = adjust_p_values(p_values, method);

    std::vector<TermPValue> result;
    result.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        result.push_back({raw[i].term_id, adjusted[i]});
    }
    return result;
}

} // namespace goenrich
