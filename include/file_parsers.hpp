/**
 * File Format Parsers
 *
 * Utilities for reading enrichment inputs:
 * - FeatureTableReader: tab-delimited genome feature tables (via htslib)
 * - Feature set lists (one id per line)
 * - Ontology term fields ("GO:0008150=biological_process;...")
 */

#ifndef FILE_PARSERS_HPP
#define FILE_PARSERS_HPP

#include "go_enrichment.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>

namespace goenrich {

// ============================================================================
// Feature Table Reader
// ============================================================================

/**
 * Genome feature table reader
 *
 * Columns: feature_id, function, feature_type, ontology_terms.
 * Lines starting with '#' are skipped. Plain, gzip and bgzip input are
 * all read through hts_open.
 */
class FeatureTableReader {
public:
    /**
     * Open a feature table
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit FeatureTableReader(const std::string& path);

    ~FeatureTableReader();

    // Prevent copying
    FeatureTableReader(const FeatureTableReader&) = delete;
    FeatureTableReader& operator=(const FeatureTableReader&) = delete;

    /**
     * Read the next record
     * @return false at end of file
     */
    bool next(FeatureRecord& record);

    /**
     * Read all remaining records
     */
    std::vector<FeatureRecord> read_all();

    /**
     * 1-based number of the last line read
     */
    size_t line_number() const;

    /**
     * Get the file path
     */
    std::string get_path() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string path_;
};

/**
 * Read a whole feature table
 */
std::vector<FeatureRecord> read_feature_table(const std::string& path);

/**
 * Read a feature set of interest: one id per line (first tab-delimited
 * column), '#' comments and blank lines skipped, duplicates dropped
 * @throws std::runtime_error if the file cannot be opened
 */
std::vector<std::string> read_feature_set(const std::string& path);

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * Parse a line into fields by delimiter
 */
std::vector<std::string> split_line(const std::string& line, char delim = '\t');

/**
 * Strip leading/trailing whitespace
 */
std::string trim(const std::string& str);

/**
 * Parse a comma-separated id list ("F1,F2, F3"), dropping empty entries
 */
std::vector<std::string> parse_id_list(const std::string& list);

/**
 * Parse an ontology_terms column: ';'-separated "TERM_ID=label" entries,
 * grouped by namespace (text before the first ':'). Labels are URL decoded.
 * "." or empty gives nullopt.
 */
std::optional<OntologyTerms> parse_ontology_terms(const std::string& field);

/**
 * Build a record from the columns of one feature table row
 */
FeatureRecord parse_feature_row(const std::vector<std::string>& fields);

/**
 * URL decode a string (for term labels)
 */
std::string url_decode(const std::string& str);

/**
 * Check if a file exists
 */
bool file_exists(const std::string& path);

} // namespace goenrich

#endif // FILE_PARSERS_HPP
