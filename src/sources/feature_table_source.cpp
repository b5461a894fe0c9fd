/**
 * Feature Table Source
 *
 * Loads genome features from a tab-delimited feature table
 * (feature_id, function, feature_type, ontology_terms).
 */

#include "annotation_source.hpp"
#include "file_parsers.hpp"
#include "go_enrichment.hpp"
#include <stdexcept>

namespace goenrich {

class FeatureTableSource : public GenomeFeatureSource {
public:
    explicit FeatureTableSource(const std::string& path)
        : path_(path) {}

    std::string name() const override { return "feature_table"; }
    std::string description() const override {
        return "Tab-delimited genome feature table with GO annotations";
    }

    bool is_ready() const override { return loaded_; }

    void initialize() override {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (loaded_) return;

        if (!file_exists(path_)) {
            throw std::runtime_error("Feature table not found: " + path_);
        }

        features_ = read_feature_table(path_);
        loaded_ = true;
    }

    std::string get_data_path() const override { return path_; }

private:
    std::string path_;
    bool loaded_ = false;
};

std::shared_ptr<GenomeFeatureSource> create_feature_table_source(const std::string& path) {
    return std::make_shared<FeatureTableSource>(path);
}

} // namespace goenrich
