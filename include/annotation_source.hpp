/**
 * Genome Feature Source Interface
 *
 * Base class for everything that supplies per-feature GO annotation
 * records (feature tables on disk, in-memory records, ...).
 */

#ifndef ANNOTATION_SOURCE_HPP
#define ANNOTATION_SOURCE_HPP

#include "go_enrichment.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>

namespace goenrich {

/**
 * Abstract base class for all genome feature sources
 */
class GenomeFeatureSource {
public:
    virtual ~GenomeFeatureSource() = default;

    /**
     * Get the source name (e.g., "feature_table", "memory")
     */
    virtual std::string name() const = 0;

    /**
     * Get a description of this source
     */
    virtual std::string description() const = 0;

    /**
     * Check if the source is initialized and ready
     */
    virtual bool is_ready() const = 0;

    /**
     * Initialize the source (lazy loading)
     * Called automatically on first use if not manually initialized
     * @throws std::runtime_error if the data cannot be loaded
     */
    virtual void initialize() = 0;

    /**
     * All feature records of the genome
     */
    const std::vector<FeatureRecord>& get_features() {
        ensure_initialized();
        return features_;
    }

    /**
     * Number of loaded features (0 before initialization)
     */
    size_t feature_count() const { return features_.size(); }

    /**
     * Get the data file path (for debugging/info)
     */
    virtual std::string get_data_path() const { return ""; }

protected:
    mutable std::recursive_mutex mutex_;
    std::vector<FeatureRecord> features_;

    /**
     * Ensure the source is initialized
     */
    void ensure_initialized() {
        if (!is_ready()) {
            std::lock_guard<std::recursive_mutex> lock(mutex_);
            if (!is_ready()) {
                initialize();
            }
        }
    }
};

/**
 * Create a source reading a tab-delimited feature table
 * (feature_id, function, feature_type, ontology_terms; plain, gzip or bgzip)
 * @param path Path to the feature table
 */
std::shared_ptr<GenomeFeatureSource> create_feature_table_source(const std::string& path);

/**
 * Create a source over records already in memory
 */
std::shared_ptr<GenomeFeatureSource> create_memory_source(
    std::vector<FeatureRecord> records,
    const std::string& name = "memory"
);

} // namespace goenrich

#endif // ANNOTATION_SOURCE_HPP
