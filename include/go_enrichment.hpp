/**
 * GO Enrichment Analyzer - Pure C++ Local Implementation
 *
 * Tests which Gene Ontology terms are over-represented in a set of
 * features of interest relative to the whole genome.
 *
 * Pipeline:
 * - Annotation index (feature <-> GO term) built from per-feature records
 * - One 2x2 contingency table per GO term
 * - One-sided Fisher exact test per table
 * - Benjamini-Hochberg correction over the whole batch
 * - Assembled, canonically ordered results
 */

#ifndef GO_ENRICHMENT_HPP
#define GO_ENRICHMENT_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <memory>
#include <stdexcept>
#include <variant>

namespace goenrich {

// Forward declarations
class GenomeFeatureSource;

// ============================================================================
// Errors
// ============================================================================

/**
 * Malformed or missing required input (missing feature id, inconsistent
 * contingency table, empty hypothesis set)
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Numeric failure inside the exact test
 */
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& message)
        : std::runtime_error(message) {}
};

// ============================================================================
// Test options
// ============================================================================

/**
 * Tail of the Fisher exact test
 */
enum class Alternative {
    GREATER,    // Over-representation: P(X >= a)
    LESS,       // Under-representation: P(X <= a)
    TWO_SIDED
};

/**
 * Multiple-testing correction method
 */
enum class CorrectionMethod {
    BENJAMINI_HOCHBERG,
    BONFERRONI
};

std::string alternative_to_string(Alternative alternative);
std::string correction_to_string(CorrectionMethod method);

/**
 * Parse test tail from string ("greater", "less", "two-sided")
 * @throws ValidationError on unknown names
 */
Alternative parse_alternative(const std::string& name);

/**
 * Parse correction method from string ("bh", "fdr", "bonferroni")
 * @throws ValidationError on unknown names
 */
CorrectionMethod parse_correction_method(const std::string& name);

/**
 * Parse a non-negative result count (0 means no limit)
 * @throws ValidationError on negative or non-numeric values, or trailing text
 */
size_t parse_top_n(const std::string& value);

// ============================================================================
// Data model
// ============================================================================

/**
 * Ontology terms of one feature: namespace -> term id -> label
 * (e.g., "GO" -> {"GO:0008150" -> "biological_process"})
 */
using OntologyTerms = std::map<std::string, std::map<std::string, std::string>>;

/**
 * Raw annotation record for one genome feature
 */
struct FeatureRecord {
    std::string feature_id;
    std::optional<std::string> function;
    std::string feature_type;
    std::optional<OntologyTerms> ontology_terms;
};

/**
 * Per-feature metadata kept for diagnostics
 */
struct FeatureInfo {
    std::optional<std::string> function;
    std::string feature_type;
};

/**
 * Bidirectional feature <-> GO term relation plus term labels.
 * feature_to_terms and term_to_features always describe the same
 * set of (feature, term) pairs.
 */
struct AnnotationIndex {
    std::map<std::string, std::set<std::string>> feature_to_terms;
    std::map<std::string, std::set<std::string>> term_to_features;
    std::map<std::string, std::string> term_labels;

    /**
     * Label of a term, empty if unknown
     */
    std::string get_label(const std::string& term_id) const;

    /**
     * Number of distinct (feature, term) pairs
     */
    size_t pair_count() const;
};

using FeatureUniverse = std::set<std::string>;

/**
 * Everything the index builder derives from the raw records
 */
struct AnnotationData {
    AnnotationIndex index;
    FeatureUniverse universe;
    std::map<std::string, FeatureInfo> feature_info;

    /**
     * Feature counts by feature type
     */
    std::map<std::string, int> feature_type_counts() const;

    /**
     * Summary string for --stats
     */
    std::string get_stats() const;
};

/**
 * 2x2 table for one term
 *
 *                  annotated   not annotated
 *   in set             a             b
 *   not in set         c             d
 */
struct ContingencyTable {
    int64_t a = 0;
    int64_t b = 0;
    int64_t c = 0;
    int64_t d = 0;

    int64_t set_size() const { return a + b; }
    int64_t term_size() const { return a + c; }
    int64_t total() const { return a + b + c + d; }

    bool operator==(const ContingencyTable& other) const {
        return a == other.a && b == other.b && c == other.c && d == other.d;
    }
};

/**
 * Enrichment result for one term
 */
struct EnrichmentResult {
    std::string term_id;
    std::string term_label;
    double raw_p_value = 1.0;
    double adjusted_p_value = 1.0;

    // Overlap counts from the contingency table
    int64_t set_hits = 0;        // a
    int64_t set_size = 0;        // n
    int64_t term_size = 0;       // a + c
    int64_t universe_size = 0;   // N

    // Exact test underflowed; the raw p-value is approximate
    bool approximate = false;

    /**
     * Observed over expected overlap: (a/n) / ((a+c)/N), 0 if undefined
     */
    double fold_enrichment() const;
};

/**
 * Canonical ordering: ascending raw p-value, ties broken by term id
 */
bool result_order(const EnrichmentResult& lhs, const EnrichmentResult& rhs);

/**
 * Sort results into canonical order
 */
void sort_results(std::vector<EnrichmentResult>& results);

// ============================================================================
// Pipeline stages
// ============================================================================

/**
 * True if the id is a GO term id ("GO:" followed by digits, prefix
 * case-insensitive)
 */
bool is_go_term(const std::string& term_id);

/**
 * Build the annotation index from raw per-feature records.
 * Non-GO ontology ids are dropped; features without GO terms still join
 * the universe.
 * @throws ValidationError if a record has no feature id
 */
AnnotationData build_annotation_index(const std::vector<FeatureRecord>& records);

/**
 * Build one contingency table per annotated term.
 * Feature-set ids outside the universe are ignored.
 * @throws ValidationError if the index references features outside the universe
 */
std::map<std::string, ContingencyTable> build_contingency_tables(
    const AnnotationIndex& index,
    const FeatureUniverse& universe,
    const std::vector<std::string>& feature_set
);

/**
 * Merge labels, tables, raw and adjusted p-values into results.
 * Vectors are parallel to term_ids.
 */
std::vector<EnrichmentResult> assemble_results(
    const AnnotationIndex& index,
    const std::vector<std::string>& term_ids,
    const std::map<std::string, ContingencyTable>& tables,
    const std::vector<double>& raw_p_values,
    const std::vector<double>& adjusted_p_values
);

/**
 * Options for a single enrichment run
 */
struct EnrichmentOptions {
    Alternative alternative = Alternative::GREATER;
    CorrectionMethod correction = CorrectionMethod::BENJAMINI_HOCHBERG;
};

/**
 * Run the full pipeline on raw records.
 * Returns results in canonical order; empty if no term is annotated.
 */
std::vector<EnrichmentResult> run_enrichment(
    const std::vector<FeatureRecord>& records,
    const std::vector<std::string>& feature_set,
    const EnrichmentOptions& options = {}
);

/**
 * Run the pipeline on an already built index
 */
std::vector<EnrichmentResult> run_enrichment(
    const AnnotationData& data,
    const std::vector<std::string>& feature_set,
    const EnrichmentOptions& options = {}
);

// ============================================================================
// Configuration
// ============================================================================

/**
 * Feature set given directly as ids
 */
struct FeatureIdList {
    std::vector<std::string> ids;
};

/**
 * Feature set read from a file (one id per line)
 */
struct FeatureSetFile {
    std::string path;
};

using FeatureSetSpec = std::variant<FeatureIdList, FeatureSetFile>;

/**
 * Configuration for an analyzer run
 */
struct EnrichmentConfig {
    FeatureSetSpec feature_set;             // Required, caller supplied
    EnrichmentOptions options;
    size_t top_n = 0;                       // Keep only the first N results (0 = all)
};

/**
 * Resolve a feature set specification to ids
 * @throws ValidationError if the resulting set is empty
 */
std::vector<std::string> resolve_feature_set(const FeatureSetSpec& spec);

/**
 * Main analyzer class
 */
class EnrichmentAnalyzer {
public:
    /**
     * @throws ValidationError if the configured feature set is empty
     */
    explicit EnrichmentAnalyzer(const EnrichmentConfig& config);
    ~EnrichmentAnalyzer();

    // Prevent copying
    EnrichmentAnalyzer(const EnrichmentAnalyzer&) = delete;
    EnrichmentAnalyzer& operator=(const EnrichmentAnalyzer&) = delete;

    /**
     * Analyze raw records
     */
    std::vector<EnrichmentResult> run(const std::vector<FeatureRecord>& records);

    /**
     * Analyze the features provided by a source (initialized on demand)
     */
    std::vector<EnrichmentResult> run(GenomeFeatureSource& source);

    /**
     * Feature set of interest after resolution
     */
    const std::vector<std::string>& get_feature_set() const { return feature_set_; }

    /**
     * Annotation data of the last run (for --stats)
     */
    const AnnotationData& get_annotation_data() const { return data_; }

private:
    EnrichmentConfig config_;
    std::vector<std::string> feature_set_;
    AnnotationData data_;
};

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
void log(LogLevel level, const std::string& message);

} // namespace goenrich

#endif // GO_ENRICHMENT_HPP
