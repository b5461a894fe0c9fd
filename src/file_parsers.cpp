/**
 * File Format Parsers - Implementation
 */

#include "file_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <sys/stat.h>

#include <htslib/hts.h>
#include <htslib/kstring.h>

namespace goenrich {

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::string> split_line(const std::string& line, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = line.find(delim);
    while (pos != std::string::npos) {
        result.emplace_back(line, start, pos - start);
        start = pos + 1;
        pos = line.find(delim, start);
    }
    result.emplace_back(line, start);
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return str.substr(start, end - start);
}

std::vector<std::string> parse_id_list(const std::string& list) {
    std::vector<std::string> ids;
    for (const auto& field : split_line(list, ',')) {
        std::string id = trim(field);
        if (!id.empty()) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::string url_decode(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    auto hex_val = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_val(str[i + 1]);
            int lo = hex_val(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        result += str[i];
    }

    return result;
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

static bool is_null_field(const std::string& field) {
    return field.empty() || field == ".";
}

std::optional<OntologyTerms> parse_ontology_terms(const std::string& field) {
    std::string value = trim(field);
    if (is_null_field(value)) return std::nullopt;

    OntologyTerms terms;
    for (const auto& entry : split_line(value, ';')) {
        std::string item = trim(entry);
        if (item.empty()) continue;

        std::string term_id;
        std::string label;
        size_t eq = item.find('=');
        if (eq != std::string::npos) {
            term_id = trim(item.substr(0, eq));
            label = url_decode(item.substr(eq + 1));
        } else {
            term_id = item;
        }
        if (term_id.empty()) continue;

        size_t colon = term_id.find(':');
        std::string ontology = colon != std::string::npos ? term_id.substr(0, colon) : "";
        terms[ontology][term_id] = label;
    }

    return terms;
}

FeatureRecord parse_feature_row(const std::vector<std::string>& fields) {
    FeatureRecord record;
    if (fields.empty()) return record;

    record.feature_id = trim(fields[0]);

    if (fields.size() > 1 && !is_null_field(trim(fields[1]))) {
        record.function = url_decode(trim(fields[1]));
    }
    if (fields.size() > 2 && !is_null_field(trim(fields[2]))) {
        record.feature_type = trim(fields[2]);
    }
    if (fields.size() > 3) {
        record.ontology_terms = parse_ontology_terms(fields[3]);
    }

    return record;
}

// ============================================================================
// FeatureTableReader Implementation
// ============================================================================

struct FeatureTableReader::Impl {
    htsFile* fp = nullptr;
    kstring_t str = {0, 0, nullptr};
    size_t line_number = 0;

    ~Impl() {
        free(str.s);
        if (fp) hts_close(fp);
    }

    // Next line without trailing CR; false at EOF
    bool read_line(std::string& line) {
        if (hts_getline(fp, KS_SEP_LINE, &str) < 0) return false;
        line_number++;
        line.assign(str.s ? str.s : "", str.l);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        return true;
    }
};

FeatureTableReader::FeatureTableReader(const std::string& path)
    : pimpl_(std::make_unique<Impl>()), path_(path) {

    pimpl_->fp = hts_open(path.c_str(), "r");
    if (!pimpl_->fp) {
        throw std::runtime_error("Cannot open feature table: " + path);
    }

    log(LogLevel::DEBUG, "Opened feature table: " + path);
}

FeatureTableReader::~FeatureTableReader() = default;

bool FeatureTableReader::next(FeatureRecord& record) {
    std::string line;
    while (pimpl_->read_line(line)) {
        if (line.empty() || line[0] == '#') continue;
        if (trim(line).empty()) continue;

        record = parse_feature_row(split_line(line, '\t'));
        return true;
    }
    return false;
}

std::vector<FeatureRecord> FeatureTableReader::read_all() {
    std::vector<FeatureRecord> records;
    FeatureRecord record;
    while (next(record)) {
        records.push_back(std::move(record));
        record = FeatureRecord();
    }
    return records;
}

size_t FeatureTableReader::line_number() const {
    return pimpl_->line_number;
}

std::vector<FeatureRecord> read_feature_table(const std::string& path) {
    log(LogLevel::INFO, "Loading feature table: " + path);

    FeatureTableReader reader(path);
    auto records = reader.read_all();

    log(LogLevel::INFO, "Loaded " + std::to_string(records.size()) + " features from " +
        reader.get_path());
    return records;
}

// ============================================================================
// Feature set lists
// ============================================================================

std::vector<std::string> read_feature_set(const std::string& path) {
    htsFile* fp = hts_open(path.c_str(), "r");
    if (!fp) {
        throw std::runtime_error("Cannot open feature set file: " + path);
    }

    std::vector<std::string> ids;
    std::set<std::string> seen;
    kstring_t str = {0, 0, nullptr};

    while (hts_getline(fp, KS_SEP_LINE, &str) >= 0) {
        std::string line(str.s ? str.s : "", str.l);
        if (line.empty() || line[0] == '#') continue;

        std::string id = trim(split_line(line, '\t')[0]);
        if (id.empty()) continue;

        if (seen.insert(id).second) {
            ids.push_back(id);
        }
    }

    free(str.s);
    hts_close(fp);

    log(LogLevel::DEBUG, "Read " + std::to_string(ids.size()) + " feature ids from " + path);
    return ids;
}

} // namespace goenrich
