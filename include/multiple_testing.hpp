/**
 * Multiple-Testing Correction
 *
 * Adjusts a whole batch of p-values at once. Each adjusted value is
 * computed at the sorted rank of its own hypothesis and scattered back by
 * the hypothesis' original position, so tied raw values never share a
 * looked-up slot.
 */

#ifndef MULTIPLE_TESTING_HPP
#define MULTIPLE_TESTING_HPP

#include "go_enrichment.hpp"
#include <string>
#include <vector>

namespace goenrich {

/**
 * Term id paired with a p-value
 */
struct TermPValue {
    std::string term_id;
    double p_value;
};

/**
 * Benjamini-Hochberg FDR adjustment.
 * Output is parallel to the input.
 * @throws ValidationError if empty or any value is NaN or outside [0, 1]
 */
std::vector<double> benjamini_hochberg(const std::vector<double>& p_values);

/**
 * Bonferroni adjustment: min(1, p * m)
 * @throws ValidationError if empty or any value is NaN or outside [0, 1]
 */
std::vector<double> bonferroni(const std::vector<double>& p_values);

/**
 * Adjust with the selected method
 */
std::vector<double> adjust_p_values(const std::vector<double>& p_values,
                                    CorrectionMethod method);

/**
 * Adjust (term, raw p-value) pairs; returns (term, adjusted p-value) in
 * input order
 */
std::vector<TermPValue> adjust_p_values(const std::vector<TermPValue>& raw,
                                        CorrectionMethod method);

} // namespace goenrich

#endif // MULTIPLE_TESTING_HPP
