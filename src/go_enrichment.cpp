/**
 * GO Enrichment Analyzer - Pure C++ Local Implementation
 */

#include "go_enrichment.hpp"
#include "annotation_source.hpp"
#include "exact_test.hpp"
#include "file_parsers.hpp"
#include "multiple_testing.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>

namespace goenrich {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::cerr << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// Option utilities
// ============================================================================

static std::string to_lower(const std::string& s) {
    std::string lower = s;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }
    return lower;
}

std::string alternative_to_string(Alternative alternative) {
    switch (alternative) {
        case Alternative::GREATER:   return "greater";
        case Alternative::LESS:      return "less";
        case Alternative::TWO_SIDED: return "two-sided";
    }
    return "greater";
}

std::string correction_to_string(CorrectionMethod method) {
    switch (method) {
        case CorrectionMethod::BENJAMINI_HOCHBERG: return "bh";
        case CorrectionMethod::BONFERRONI:         return "bonferroni";
    }
    return "bh";
}

Alternative parse_alternative(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "greater" || lower == "right") return Alternative::GREATER;
    if (lower == "less" || lower == "left") return Alternative::LESS;
    if (lower == "two-sided" || lower == "two_sided" || lower == "two") return Alternative::TWO_SIDED;
    throw ValidationError("Unknown test alternative: " + name);
}

CorrectionMethod parse_correction_method(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "bh" || lower == "fdr" || lower == "benjamini-hochberg") {
        return CorrectionMethod::BENJAMINI_HOCHBERG;
    }
    if (lower == "bonferroni") return CorrectionMethod::BONFERRONI;
    throw ValidationError("Unknown correction method: " + name);
}

size_t parse_top_n(const std::string& value) {
    size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &pos);
    } catch (const std::logic_error&) {
        throw ValidationError("Invalid top-N value: " + value);
    }
    if (pos != value.size() || n < 0) {
        throw ValidationError("Invalid top-N value: " + value);
    }
    return static_cast<size_t>(n);
}

// ============================================================================
// Data model
// ============================================================================

std::string AnnotationIndex::get_label(const std::string& term_id) const {
    auto it = term_labels.find(term_id);
    return it != term_labels.end() ? it->second : "";
}

size_t AnnotationIndex::pair_count() const {
    size_t count = 0;
    for (const auto& [feature_id, terms] : feature_to_terms) {
        count += terms.size();
    }
    return count;
}

std::map<std::string, int> AnnotationData::feature_type_counts() const {
    std::map<std::string, int> counts;
    for (const auto& [feature_id, info] : feature_info) {
        counts[info.feature_type.empty() ? "unknown" : info.feature_type]++;
    }
    return counts;
}

std::string AnnotationData::get_stats() const {
    std::ostringstream oss;
    oss << "=== Annotation Statistics ===\n";
    oss << "Features: " << universe.size() << "\n";
    oss << "Features with GO terms: " << index.feature_to_terms.size() << "\n";
    oss << "Distinct GO terms: " << index.term_to_features.size() << "\n";
    oss << "Feature-term pairs: " << index.pair_count() << "\n";
    oss << "\nFeature types:\n";
    for (const auto& [type, count] : feature_type_counts()) {
        oss << "  " << type << ": " << count << "\n";
    }
    return oss.str();
}

double EnrichmentResult::fold_enrichment() const {
    if (set_size <= 0 || term_size <= 0 || universe_size <= 0) return 0.0;
    double observed = static_cast<double>(set_hits) / static_cast<double>(set_size);
    double expected = static_cast<double>(term_size) / static_cast<double>(universe_size);
    return observed / expected;
}

bool result_order(const EnrichmentResult& lhs, const EnrichmentResult& rhs) {
    if (lhs.raw_p_value != rhs.raw_p_value) {
        return lhs.raw_p_value < rhs.raw_p_value;
    }
    return lhs.term_id < rhs.term_id;
}

void sort_results(std::vector<EnrichmentResult>& results) {
    std::sort(results.begin(), results.end(), result_order);
}

// ============================================================================
// Annotation Index Builder
// ============================================================================

bool is_go_term(const std::string& term_id) {
    static const std::regex go_pattern("^[gG][oO]:[0-9]+$");
    return std::regex_match(term_id, go_pattern);
}

AnnotationData build_annotation_index(const std::vector<FeatureRecord>& records) {
    AnnotationData data;

    size_t dropped_terms = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        const FeatureRecord& record = records[i];

        if (record.feature_id.empty()) {
            throw ValidationError("Feature record " + std::to_string(i) +
                                  " has no feature identifier");
        }

        data.universe.insert(record.feature_id);
        data.feature_info[record.feature_id] = FeatureInfo{record.function, record.feature_type};

        if (!record.ontology_terms) continue;

        for (const auto& [ontology, terms] : *record.ontology_terms) {
            for (const auto& [term_id, label] : terms) {
                if (!is_go_term(term_id)) {
                    dropped_terms++;
                    continue;
                }

                data.index.term_labels[term_id] = label;
                data.index.feature_to_terms[record.feature_id].insert(term_id);
                data.index.term_to_features[term_id].insert(record.feature_id);
            }
        }
    }

    if (dropped_terms > 0) {
        log(LogLevel::DEBUG, "Dropped " + std::to_string(dropped_terms) +
            " non-GO ontology annotations");
    }

    log(LogLevel::INFO, "Indexed " + std::to_string(data.universe.size()) + " features (" +
        std::to_string(data.index.feature_to_terms.size()) + " with GO terms, " +
        std::to_string(data.index.term_to_features.size()) + " distinct terms)");

    return data;
}

// ============================================================================
// Contingency Table Builder
// ============================================================================

std::map<std::string, ContingencyTable> build_contingency_tables(
    const AnnotationIndex& index,
    const FeatureUniverse& universe,
    const std::vector<std::string>& feature_set
) {
    // Restrict the set of interest to the universe
    std::set<std::string> in_set;
    std::vector<std::string> unknown;
    for (const auto& id : feature_set) {
        if (universe.count(id)) {
            in_set.insert(id);
        } else {
            unknown.push_back(id);
        }
    }

    if (!unknown.empty()) {
        std::string examples;
        for (size_t i = 0; i < unknown.size() && i < 5; ++i) {
            if (i > 0) examples += ", ";
            examples += unknown[i];
        }
        log(LogLevel::WARNING, std::to_string(unknown.size()) +
            " feature set ids are not in the genome and were ignored (e.g. " + examples + ")");
    }

    const int64_t N = static_cast<int64_t>(universe.size());
    const int64_t n = static_cast<int64_t>(in_set.size());

    std::map<std::string, ContingencyTable> tables;
    for (const auto& [term_id, features] : index.term_to_features) {
        if (features.empty()) continue;

        int64_t a = 0;
        for (const auto& feature_id : features) {
            if (!universe.count(feature_id)) {
                throw ValidationError("Term " + term_id + " is annotated on feature " +
                                      feature_id + " which is not in the genome");
            }
            if (in_set.count(feature_id)) a++;
        }

        ContingencyTable table;
        table.a = a;
        table.b = n - a;
        table.c = static_cast<int64_t>(features.size()) - a;
        table.d = N - n - table.c;
        check_table(table, n, N);

        tables.emplace(term_id, table);
    }

    log(LogLevel::DEBUG, "Built " + std::to_string(tables.size()) +
        " contingency tables (n=" + std::to_string(n) + ", N=" + std::to_string(N) + ")");

    return tables;
}

// ============================================================================
// Result Assembler
// ============================================================================

std::vector<EnrichmentResult> assemble_results(
    const AnnotationIndex& index,
    const std::vector<std::string>& term_ids,
    const std::map<std::string, ContingencyTable>& tables,
    const std::vector<double>& raw_p_values,
    const std::vector<double>& adjusted_p_values
) {
    if (raw_p_values.size() != term_ids.size() || adjusted_p_values.size() != term_ids.size()) {
        throw ValidationError("Mismatched result vectors: " + std::to_string(term_ids.size()) +
                              " terms, " + std::to_string(raw_p_values.size()) + " raw and " +
                              std::to_string(adjusted_p_values.size()) + " adjusted p-values");
    }

    std::vector<EnrichmentResult> results;
    results.reserve(term_ids.size());

    for (size_t i = 0; i < term_ids.size(); ++i) {
        auto it = tables.find(term_ids[i]);
        if (it == tables.end()) {
            throw ValidationError("No contingency table for term " + term_ids[i]);
        }
        const ContingencyTable& table = it->second;

        EnrichmentResult result;
        result.term_id = term_ids[i];
        result.term_label = index.get_label(term_ids[i]);
        result.raw_p_value = raw_p_values[i];
        result.adjusted_p_value = adjusted_p_values[i];
        result.set_hits = table.a;
        result.set_size = table.set_size();
        result.term_size = table.term_size();
        result.universe_size = table.total();
        results.push_back(std::move(result));
    }

    return results;
}

// ============================================================================
// Pipeline
// ============================================================================

std::vector<EnrichmentResult> run_enrichment(
    const AnnotationData& data,
    const std::vector<std::string>& feature_set,
    const EnrichmentOptions& options
) {
    auto tables = build_contingency_tables(data.index, data.universe, feature_set);

    if (tables.empty()) {
        log(LogLevel::WARNING, "No GO-annotated features; nothing to test");
        return {};
    }

    std::vector<std::string> term_ids;
    std::vector<double> raw_p_values;
    term_ids.reserve(tables.size());
    raw_p_values.reserve(tables.size());

    std::set<std::string> underflowed;
    for (const auto& [term_id, table] : tables) {
        FisherResult fisher = fisher_exact(table);
        if (fisher.underflow) underflowed.insert(term_id);

        term_ids.push_back(term_id);
        raw_p_values.push_back(tail_probability(fisher, options.alternative));
    }

    if (!underflowed.empty()) {
        std::string examples;
        size_t shown = 0;
        for (const auto& term_id : underflowed) {
            if (shown == 5) break;
            if (shown++ > 0) examples += ", ";
            examples += term_id;
        }
        log(LogLevel::WARNING, std::to_string(underflowed.size()) +
            " GO terms have table probabilities below double precision; their p-values "
            "are approximate (e.g. " + examples + ")");
    }

    std::vector<double> adjusted_p_values = adjust_p_values(raw_p_values, options.correction);

    auto results = assemble_results(data.index, term_ids, tables, raw_p_values, adjusted_p_values);
    for (auto& result : results) {
        result.approximate = underflowed.count(result.term_id) > 0;
    }
    sort_results(results);

    log(LogLevel::INFO, "Tested " + std::to_string(results.size()) + " GO terms (" +
        alternative_to_string(options.alternative) + ", " +
        correction_to_string(options.correction) + ")");

    return results;
}

std::vector<EnrichmentResult> run_enrichment(
    const std::vector<FeatureRecord>& records,
    const std::vector<std::string>& feature_set,
    const EnrichmentOptions& options
) {
    AnnotationData data = build_annotation_index(records);
    return run_enrichment(data, feature_set, options);
}

// ============================================================================
// EnrichmentAnalyzer
// ============================================================================

std::vector<std::string> resolve_feature_set(const FeatureSetSpec& spec) {
    std::vector<std::string> ids;
    std::string origin;

    if (const auto* list = std::get_if<FeatureIdList>(&spec)) {
        ids = list->ids;
        origin = "command line";
    } else {
        const auto& file = std::get<FeatureSetFile>(spec);
        ids = read_feature_set(file.path);
        origin = file.path;
    }

    if (ids.empty()) {
        throw ValidationError("Feature set of interest is empty (" + origin + ")");
    }

    log(LogLevel::INFO, "Feature set of interest: " + std::to_string(ids.size()) +
        " ids from " + origin);
    return ids;
}

EnrichmentAnalyzer::EnrichmentAnalyzer(const EnrichmentConfig& config)
    : config_(config), feature_set_(resolve_feature_set(config.feature_set)) {
}

EnrichmentAnalyzer::~EnrichmentAnalyzer() = default;

std::vector<EnrichmentResult> EnrichmentAnalyzer::run(const std::vector<FeatureRecord>& records) {
    data_ = build_annotation_index(records);

    auto results = run_enrichment(data_, feature_set_, config_.options);
    if (config_.top_n > 0 && results.size() > config_.top_n) {
        results.resize(config_.top_n);
    }
    return results;
}

std::vector<EnrichmentResult> EnrichmentAnalyzer::run(GenomeFeatureSource& source) {
    log(LogLevel::INFO, "Loading features from " + source.name() +
        (source.get_data_path().empty() ? "" : " (" + source.get_data_path() + ")"));
    return run(source.get_features());
}

} // namespace goenrich
