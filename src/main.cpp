/**
 * GO Enrichment Analyzer - Main Entry Point
 *
 * Pure C++ local implementation of GO term enrichment.
 * Requires a local genome feature table - no external API calls.
 */

#include "go_enrichment.hpp"
#include "annotation_source.hpp"
#include "file_parsers.hpp"
#include "output_writer.hpp"
#include <iostream>
#include <string>

void print_usage(const char* program_name) {
    std::cout << "GO Enrichment Analyzer - Pure C++ Local Implementation\n"
              << "======================================================\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Required Data Files:\n"
              << "  --features FILE         Genome feature table (TSV, .gz/.bgz accepted)\n"
              << "                          Columns: feature_id, function, feature_type,\n"
              << "                          ontology_terms (GO:0008150=label;EC:1.1.1.1=label)\n\n"
              << "Feature Set of Interest (choose one):\n"
              << "  --feature-set FILE      File with one feature id per line\n"
              << "  --ids ID[,ID...]        Comma-separated feature ids\n\n"
              << "Test Options:\n"
              << "  --alternative TAIL      greater (default), less, two-sided\n"
              << "  --correction METHOD     bh (default, Benjamini-Hochberg FDR), bonferroni\n\n"
              << "Output Options:\n"
              << "  -o, --output FILE       Output file path (default: stdout)\n"
              << "  --format FORMAT         tsv (default), csv, json\n"
              << "  --compress              gzip the output (implied by a .gz path)\n"
              << "  --top N                 Report only the N most significant terms\n\n"
              << "Other Options:\n"
              << "  --stats                 Print annotation and enrichment statistics\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n\n"
              << "Examples:\n"
              << "  # Test a list of differentially expressed genes\n"
              << "  " << program_name << " --features genome_features.tsv.gz \\\n"
              << "      --feature-set de_genes.txt -o enrichment.tsv\n\n"
              << "  # Inline ids, CSV output\n"
              << "  " << program_name << " --features genome_features.tsv \\\n"
              << "      --ids AT1G01010,AT1G01020,AT1G01030 --format csv -o functional_enrichment.csv\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string features_path;
    std::string feature_set_path;
    std::string ids;
    std::string output_path = "-";
    std::string format = "tsv";
    std::string alternative = "greater";
    std::string correction = "bh";
    bool compress = false;
    bool show_stats = false;
    bool debug = false;
    size_t top_n = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--features" && i + 1 < argc) {
            features_path = argv[++i];
        } else if (arg == "--feature-set" && i + 1 < argc) {
            feature_set_path = argv[++i];
        } else if (arg == "--ids" && i + 1 < argc) {
            ids = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--alternative" && i + 1 < argc) {
            alternative = argv[++i];
        } else if (arg == "--correction" && i + 1 < argc) {
            correction = argv[++i];
        } else if (arg == "--top" && i + 1 < argc) {
            try {
                top_n = goenrich::parse_top_n(argv[++i]);
            } catch (const goenrich::ValidationError& e) {
                std::cerr << "Error: " << e.what() << std::endl;
                return 1;
            }
        } else if (arg == "--compress") {
            compress = true;
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (arg == "--debug") {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Set log level
    if (debug) {
        goenrich::set_log_level(goenrich::LogLevel::DEBUG);
    }

    // Validate required arguments
    if (features_path.empty()) {
        std::cerr << "Error: --features is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (feature_set_path.empty() == ids.empty()) {
        std::cerr << "Error: Exactly one of --feature-set or --ids is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        goenrich::OutputFormat output_format = goenrich::parse_output_format(format);

        goenrich::EnrichmentConfig config;
        if (!feature_set_path.empty()) {
            config.feature_set = goenrich::FeatureSetFile{feature_set_path};
        } else {
            config.feature_set = goenrich::FeatureIdList{goenrich::parse_id_list(ids)};
        }
        config.options.alternative = goenrich::parse_alternative(alternative);
        config.options.correction = goenrich::parse_correction_method(correction);
        config.top_n = top_n;

        goenrich::EnrichmentAnalyzer analyzer(config);

        auto source = goenrich::create_feature_table_source(features_path);
        auto results = analyzer.run(*source);

        auto stats = goenrich::write_results(results, output_path, output_format, compress);

        if (show_stats) {
            std::cerr << "\nSource: " << source->name() << " - " << source->description()
                      << " (" << source->get_data_path() << ")\n"
                      << analyzer.get_annotation_data().get_stats()
                      << "\n" << stats.to_string() << std::endl;
        }

        if (output_path != "-") {
            std::cerr << "Enrichment complete. Results saved to: " << output_path << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
