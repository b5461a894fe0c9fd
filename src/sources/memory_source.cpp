/**
 * In-memory feature source (records supplied by the caller)
 */

#include "annotation_source.hpp"

namespace goenrich {

class MemoryFeatureSource : public GenomeFeatureSource {
public:
    MemoryFeatureSource(std::vector<FeatureRecord> records, const std::string& name)
        : name_(name) {
        features_ = std::move(records);
    }

    std::string name() const override { return name_; }
    std::string description() const override {
        return "Genome features held in memory";
    }

    bool is_ready() const override { return true; }
    void initialize() override {}

private:
    std::string name_;
};

std::shared_ptr<GenomeFeatureSource> create_memory_source(
    std::vector<FeatureRecord> records,
    const std::string& name
) {
    return std::make_shared<MemoryFeatureSource>(std::move(records), name);
}

} // namespace goenrich
