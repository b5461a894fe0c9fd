/**
 * Tests for the annotation index builder: GO filtering, bidirectional
 * maps, labels, universe and validation.
 */

#include <gtest/gtest.h>
#include "go_enrichment.hpp"

#include <set>
#include <string>
#include <vector>

using namespace goenrich;

// ============================================================================
// Helpers
// ============================================================================

static FeatureRecord make_feature(const std::string& id, const OntologyTerms& terms,
                                  const std::string& type = "gene") {
    FeatureRecord record;
    record.feature_id = id;
    record.feature_type = type;
    record.ontology_terms = terms;
    return record;
}

// F1, F3 -> GO:0001; F2 -> GO:9999; F4, F5 unannotated
static std::vector<FeatureRecord> make_synthetic_genome() {
    std::vector<FeatureRecord> records;
    records.push_back(make_feature("F1", {{"GO", {{"GO:0001", "test process"}}}}));
    records.push_back(make_feature("F2", {{"GO", {{"GO:9999", "other"}}}}));
    records.push_back(make_feature("F3", {{"GO", {{"GO:0001", "test process"}}}}));

    FeatureRecord f4;
    f4.feature_id = "F4";
    f4.feature_type = "gene";
    f4.function = std::string("hypothetical protein");
    records.push_back(f4);

    records.push_back(make_feature("F5", {}, "CDS"));
    return records;
}

// ============================================================================
// GO term pattern
// ============================================================================

TEST(GoTermPattern, AcceptsGoIds) {
    EXPECT_TRUE(is_go_term("GO:0008150"));
    EXPECT_TRUE(is_go_term("GO:1"));
    EXPECT_TRUE(is_go_term("go:0008150"));
    EXPECT_TRUE(is_go_term("Go:0005575"));
}

TEST(GoTermPattern, RejectsOtherIds) {
    EXPECT_FALSE(is_go_term("EC:1.1.1.1"));
    EXPECT_FALSE(is_go_term("GO:"));
    EXPECT_FALSE(is_go_term("GO:abc"));
    EXPECT_FALSE(is_go_term("GO_0008150"));
    EXPECT_FALSE(is_go_term("SSO:000001234"));
    EXPECT_FALSE(is_go_term(""));
}

// ============================================================================
// Index construction
// ============================================================================

TEST(AnnotationIndex, SyntheticGenomeRoundTrip) {
    auto data = build_annotation_index(make_synthetic_genome());

    EXPECT_EQ(data.universe.size(), 5u);

    ASSERT_EQ(data.index.term_to_features.size(), 2u);
    EXPECT_EQ(data.index.term_to_features.at("GO:0001"),
              (std::set<std::string>{"F1", "F3"}));
    EXPECT_EQ(data.index.term_to_features.at("GO:9999"),
              (std::set<std::string>{"F2"}));

    EXPECT_EQ(data.index.get_label("GO:0001"), "test process");
    EXPECT_EQ(data.index.get_label("GO:9999"), "other");
}

TEST(AnnotationIndex, UnannotatedFeaturesOnlyJoinUniverse) {
    auto data = build_annotation_index(make_synthetic_genome());

    EXPECT_EQ(data.universe.count("F4"), 1u);
    EXPECT_EQ(data.universe.count("F5"), 1u);
    EXPECT_EQ(data.index.feature_to_terms.count("F4"), 0u);
    EXPECT_EQ(data.index.feature_to_terms.count("F5"), 0u);
    EXPECT_EQ(data.index.feature_to_terms.size(), 3u);
}

TEST(AnnotationIndex, MapsAreMutualInverses) {
    std::vector<FeatureRecord> records = make_synthetic_genome();
    records.push_back(make_feature("F6", {{"GO", {{"GO:0001", "test process"},
                                                  {"GO:0002", "second"},
                                                  {"GO:9999", "other"}}}}));
    auto data = build_annotation_index(records);

    std::set<std::pair<std::string, std::string>> forward;
    for (const auto& [feature, terms] : data.index.feature_to_terms) {
        EXPECT_FALSE(terms.empty());
        for (const auto& term : terms) forward.emplace(feature, term);
    }

    std::set<std::pair<std::string, std::string>> backward;
    for (const auto& [term, features] : data.index.term_to_features) {
        EXPECT_FALSE(features.empty());
        for (const auto& feature : features) backward.emplace(feature, term);
    }

    EXPECT_EQ(forward, backward);
    EXPECT_EQ(data.index.pair_count(), forward.size());

    // Every indexed term has a label entry
    for (const auto& [term, features] : data.index.term_to_features) {
        EXPECT_EQ(data.index.term_labels.count(term), 1u) << term;
    }
}

TEST(AnnotationIndex, NonGoTermsDropped) {
    std::vector<FeatureRecord> records;
    records.push_back(make_feature("F1", {{"GO", {{"GO:0001", "process"}}},
                                          {"EC", {{"EC:1.1.1.1", "alcohol dehydrogenase"}}},
                                          {"SSO", {{"SSO:000000123", "subsystem"}}}}));
    records.push_back(make_feature("F2", {{"EC", {{"EC:2.7.11.1", "kinase"}}}}));

    auto data = build_annotation_index(records);

    EXPECT_EQ(data.index.term_to_features.size(), 1u);
    EXPECT_EQ(data.index.term_to_features.count("EC:1.1.1.1"), 0u);
    EXPECT_EQ(data.index.term_to_features.count("EC:2.7.11.1"), 0u);
    EXPECT_EQ(data.index.term_labels.count("EC:1.1.1.1"), 0u);
    EXPECT_EQ(data.index.feature_to_terms.count("F2"), 0u);
    EXPECT_EQ(data.universe.size(), 2u);
}

TEST(AnnotationIndex, FilterIsByIdNotNamespace) {
    // A non-GO id filed under "GO" is dropped; a GO id filed elsewhere is kept
    std::vector<FeatureRecord> records;
    records.push_back(make_feature("F1", {{"GO", {{"EC:1.1.1.1", "misfiled"}}},
                                          {"gene_ontology", {{"GO:0003674", "molecular_function"}}}}));

    auto data = build_annotation_index(records);

    EXPECT_EQ(data.index.term_to_features.count("EC:1.1.1.1"), 0u);
    EXPECT_EQ(data.index.term_to_features.count("GO:0003674"), 1u);
}

TEST(AnnotationIndex, LowercasePrefixKept) {
    std::vector<FeatureRecord> records;
    records.push_back(make_feature("F1", {{"go", {{"go:0005634", "nucleus"}}}}));

    auto data = build_annotation_index(records);
    EXPECT_EQ(data.index.term_to_features.count("go:0005634"), 1u);
}

TEST(AnnotationIndex, ConflictingLabelsKeepOne) {
    std::vector<FeatureRecord> records;
    records.push_back(make_feature("F1", {{"GO", {{"GO:0001", "first label"}}}}));
    records.push_back(make_feature("F2", {{"GO", {{"GO:0001", "second label"}}}}));

    auto data = build_annotation_index(records);

    EXPECT_EQ(data.index.term_labels.size(), 1u);
    EXPECT_EQ(data.index.get_label("GO:0001"), "second label");
    EXPECT_EQ(data.index.term_to_features.at("GO:0001").size(), 2u);
}

TEST(AnnotationIndex, DuplicateFeatureRecordsMerge) {
    std::vector<FeatureRecord> records;
    records.push_back(make_feature("F1", {{"GO", {{"GO:0001", "a"}}}}));
    records.push_back(make_feature("F1", {{"GO", {{"GO:0001", "a"}, {"GO:0002", "b"}}}}, "CDS"));

    auto data = build_annotation_index(records);

    EXPECT_EQ(data.universe.size(), 1u);
    EXPECT_EQ(data.index.feature_to_terms.at("F1"),
              (std::set<std::string>{"GO:0001", "GO:0002"}));
    EXPECT_EQ(data.index.term_to_features.at("GO:0001").size(), 1u);
    EXPECT_EQ(data.feature_info.at("F1").feature_type, "CDS");
}

TEST(AnnotationIndex, UnknownTermLabelIsEmpty) {
    auto data = build_annotation_index(make_synthetic_genome());
    EXPECT_EQ(data.index.get_label("GO:0000000"), "");
}

TEST(AnnotationIndex, EmptyInput) {
    auto data = build_annotation_index({});
    EXPECT_TRUE(data.universe.empty());
    EXPECT_TRUE(data.index.term_to_features.empty());
    EXPECT_TRUE(data.index.feature_to_terms.empty());
}

// ============================================================================
// Validation
// ============================================================================

TEST(AnnotationIndex, MissingFeatureIdThrows) {
    std::vector<FeatureRecord> records = make_synthetic_genome();
    records.push_back(make_feature("", {{"GO", {{"GO:0001", "test process"}}}}));

    EXPECT_THROW(build_annotation_index(records), ValidationError);
}

TEST(AnnotationIndex, ValidationErrorIsRuntimeError) {
    FeatureRecord record;
    try {
        build_annotation_index({record});
        FAIL() << "expected ValidationError";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("feature identifier"), std::string::npos);
    }
}

// ============================================================================
// Feature metadata
// ============================================================================

TEST(AnnotationData, FeatureInfoKept) {
    auto data = build_annotation_index(make_synthetic_genome());

    ASSERT_EQ(data.feature_info.size(), 5u);
    ASSERT_TRUE(data.feature_info.at("F4").function.has_value());
    EXPECT_EQ(*data.feature_info.at("F4").function, "hypothetical protein");
    EXPECT_FALSE(data.feature_info.at("F1").function.has_value());
    EXPECT_EQ(data.feature_info.at("F5").feature_type, "CDS");
}

TEST(AnnotationData, FeatureTypeCounts) {
    auto data = build_annotation_index(make_synthetic_genome());
    auto counts = data.feature_type_counts();

    EXPECT_EQ(counts["gene"], 4);
    EXPECT_EQ(counts["CDS"], 1);
}

TEST(AnnotationData, StatsString) {
    auto data = build_annotation_index(make_synthetic_genome());
    std::string stats = data.get_stats();

    EXPECT_NE(stats.find("Features: 5"), std::string::npos);
    EXPECT_NE(stats.find("Features with GO terms: 3"), std::string::npos);
    EXPECT_NE(stats.find("Distinct GO terms: 2"), std::string::npos);
}
