/**
 * Output Writer - Multiple Output Format Support
 *
 * Supports TSV (default), CSV and JSON output of enrichment results.
 * Paths ending in .gz (or compress = true) are written through zlib.
 */

#ifndef OUTPUT_WRITER_HPP
#define OUTPUT_WRITER_HPP

#include "go_enrichment.hpp"
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <zlib.h>

namespace goenrich {

/**
 * Output format types
 */
enum class OutputFormat {
    TSV,    // Tab-separated values (default)
    CSV,    // functional_enrichment.csv layout
    JSON    // JSON format
};

/**
 * Parse output format from string ("tsv", "csv", "json")
 * @throws ValidationError on unknown names
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "tsv") return OutputFormat::TSV;
    if (lower == "json") return OutputFormat::JSON;
    if (lower == "csv") return OutputFormat::CSV;
    throw ValidationError("Unknown output format: " + format);
}

/**
 * Format a probability with 6 significant digits
 */
inline std::string format_p_value(double p) {
    std::ostringstream oss;
    oss << std::setprecision(6) << p;
    return oss.str();
}

/**
 * Statistics collector for the result summary
 */
struct EnrichmentStats {
    double alpha = 0.05;
    int tested_terms = 0;
    int significant_raw = 0;
    int significant_adjusted = 0;
    int approximate = 0;
    double min_adjusted_p_value = 1.0;

    void add(const EnrichmentResult& result) {
        tested_terms++;
        if (result.raw_p_value < alpha) significant_raw++;
        if (result.adjusted_p_value < alpha) significant_adjusted++;
        if (result.approximate) approximate++;
        if (result.adjusted_p_value < min_adjusted_p_value) {
            min_adjusted_p_value = result.adjusted_p_value;
        }
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "=== Enrichment Statistics ===\n";
        oss << "Tested GO terms: " << tested_terms << "\n";
        oss << "Raw p < " << alpha << ": " << significant_raw << "\n";
        oss << "Adjusted p < " << alpha << ": " << significant_adjusted << "\n";
        if (tested_terms > 0) {
            oss << "Smallest adjusted p: " << format_p_value(min_adjusted_p_value) << "\n";
        }
        if (approximate > 0) {
            oss << "Approximate p-values (underflow): " << approximate << "\n";
        }
        return oss.str();
    }

    std::string to_json() const {
        std::ostringstream oss;
        oss << "{\n";
        oss << "    \"alpha\": " << alpha << ",\n";
        oss << "    \"tested_terms\": " << tested_terms << ",\n";
        oss << "    \"significant_raw\": " << significant_raw << ",\n";
        oss << "    \"significant_adjusted\": " << significant_adjusted << ",\n";
        oss << "    \"approximate\": " << approximate << "\n";
        oss << "  }";
        return oss.str();
    }
};

// Helper to check if path ends with .gz
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

/**
 * Abstract base class for output writers
 */
class OutputWriter {
public:
    OutputWriter(const std::string& output_path, bool compress)
        : output_path_(output_path), compress_(compress), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            compress_ = false;  // Cannot compress stdout
        } else if (compress_ || ends_with_gz(output_path_)) {
            compress_ = true;
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    virtual ~OutputWriter() {
        close();
    }

    OutputWriter(const OutputWriter&) = delete;
    OutputWriter& operator=(const OutputWriter&) = delete;

    virtual void write_header() = 0;
    virtual void write_result(const EnrichmentResult& result) = 0;
    virtual void write_footer() = 0;

    void write_results(const std::vector<EnrichmentResult>& results) {
        for (const auto& result : results) {
            write_result(result);
        }
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
    }

    const EnrichmentStats& get_stats() const { return stats_; }

    void set_skip_header(bool v) { skip_header_ = v; }

protected:
    EnrichmentStats stats_;
    bool skip_header_ = false;

    void write_string(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (compress_ && gz_file_) {
            if (gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) == 0 && !s.empty()) {
                throw std::runtime_error("Failed to write compressed output: " + output_path_);
            }
        } else {
            output_ << s;
        }
    }

private:
    std::string output_path_;
    bool compress_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
};

/**
 * TSV output writer (default format)
 */
class TSVWriter : public OutputWriter {
public:
    explicit TSVWriter(const std::string& output_path, bool compress = false)
        : OutputWriter(output_path, compress) {}

    void write_header() override {
        if (skip_header_) return;
        write_string("#go_id\tgo_term\traw_p_value\tadjusted_p_value\tset_hits\t"
                     "set_size\tterm_size\tuniverse_size\tfold_enrichment\n");
    }

    void write_result(const EnrichmentResult& result) override {
        stats_.add(result);

        std::ostringstream line;
        line << result.term_id << "\t"
             << sanitize(result.term_label) << "\t"
             << format_p_value(result.raw_p_value) << "\t"
             << format_p_value(result.adjusted_p_value) << "\t"
             << result.set_hits << "\t"
             << result.set_size << "\t"
             << result.term_size << "\t"
             << result.universe_size << "\t"
             << std::fixed << std::setprecision(3) << result.fold_enrichment() << "\n";
        write_string(line.str());
    }

    void write_footer() override {
        // TSV has no footer
    }

private:
    static std::string sanitize(const std::string& s) {
        if (s.empty()) return "-";
        std::string result = s;
        for (char& c : result) {
            if (c == '\t' || c == '\n' || c == '\r') c = ' ';
        }
        return result;
    }
};

/**
 * CSV output writer: go_id,go_term,raw_p_value,adjusted_p_value
 */
class CSVWriter : public OutputWriter {
public:
    explicit CSVWriter(const std::string& output_path, bool compress = false)
        : OutputWriter(output_path, compress) {}

    void write_header() override {
        if (skip_header_) return;
        write_string("go_id,go_term,raw_p_value,adjusted_p_value\n");
    }

    void write_result(const EnrichmentResult& result) override {
        stats_.add(result);
        write_string(quote(result.term_id) + "," + quote(result.term_label) + "," +
                     format_p_value(result.raw_p_value) + "," +
                     format_p_value(result.adjusted_p_value) + "\n");
    }

    void write_footer() override {}

    /**
     * Quote a field if it contains a comma, quote or line break
     */
    static std::string quote(const std::string& s) {
        if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
        std::string result = "\"";
        for (char c : s) {
            if (c == '"') result += '"';
            result += c;
        }
        result += '"';
        return result;
    }
};

/**
 * JSON output writer
 *
 * {"results": [ {...}, ... ], "summary": {...}}
 */
class JSONWriter : public OutputWriter {
public:
    explicit JSONWriter(const std::string& output_path, bool compress = false)
        : OutputWriter(output_path, compress) {}

    void write_header() override {
        write_string("{\n  \"results\": [");
    }

    void write_result(const EnrichmentResult& result) override {
        stats_.add(result);

        std::ostringstream json;
        json << (first_result_ ? "\n" : ",\n");
        first_result_ = false;

        json << "    {"
             << "\"go_id\": \"" << escape_json(result.term_id) << "\", "
             << "\"go_term\": \"" << escape_json(result.term_label) << "\", "
             << "\"raw_p_value\": " << format_p_value(result.raw_p_value) << ", "
             << "\"adjusted_p_value\": " << format_p_value(result.adjusted_p_value) << ", "
             << "\"set_hits\": " << result.set_hits << ", "
             << "\"set_size\": " << result.set_size << ", "
             << "\"term_size\": " << result.term_size << ", "
             << "\"universe_size\": " << result.universe_size << ", "
             << "\"fold_enrichment\": " << std::fixed << std::setprecision(3)
             << result.fold_enrichment() << ", "
             << "\"approximate\": " << (result.approximate ? "true" : "false") << "}";
        write_string(json.str());
    }

    void write_footer() override {
        write_string(std::string(first_result_ ? "" : "\n  ") + "],\n  \"summary\": " +
                     stats_.to_json() + "\n}\n");
    }

    static std::string escape_json(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default: result += c; break;
            }
        }
        return result;
    }

private:
    bool first_result_ = true;
};

/**
 * Factory function to create appropriate writer
 */
inline std::unique_ptr<OutputWriter> create_output_writer(
    const std::string& output_path,
    OutputFormat format,
    bool compress = false) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JSONWriter>(output_path, compress);
    } else if (format == OutputFormat::CSV) {
        return std::make_unique<CSVWriter>(output_path, compress);
    } else {
        return std::make_unique<TSVWriter>(output_path, compress);
    }
}

/**
 * Write a complete result set (header, results, footer) and close
 */
inline EnrichmentStats write_results(
    const std::vector<EnrichmentResult>& results,
    const std::string& output_path,
    OutputFormat format,
    bool compress = false) {

    auto writer = create_output_writer(output_path, format, compress);
    writer->write_header();
    writer->write_results(results);
    writer->write_footer();
    writer->close();
    return writer->get_stats();
}

} // namespace goenrich

#endif // OUTPUT_WRITER_HPP
