// ============= test/test_identity_matcher.cpp =============
/**
 * @file test_identity_matcher.cpp
 * @brief Tests del matching global <-> clusters de album
 *
 * Valida:
 * - parseo de referencias "<global_id>" / "<album>:<idx>"
 * - link estricto (sim > link_threshold), links colgantes descartados
 * - find: match por umbral, top_k candidatos, clusters enlazados fusionados
 * - rename de globales y de clusters sin enlazar
 */

#include <gtest/gtest.h>
#include "matching/identity_matcher.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

using namespace photorank_test;

namespace {

PersonCluster make_cluster(int index, const std::vector<float>& emb) {
    PersonCluster c;
    c.cluster_index = index;
    c.representative = FaceRef{"img_" + std::to_string(index) + ".jpg", 0};
    c.representative_embedding = emb;
    c.representative_bbox = BoundingBox{0, 0, 50, 50};
    c.members.insert(c.representative);
    return c;
}

AlbumView make_album(const std::string& id, std::vector<PersonCluster> clusters) {
    AlbumView view;
    view.album_id = id;
    view.metadata = std::make_shared<const AlbumMetadata>();
    view.clusters = std::move(clusters);
    return view;
}

} // namespace

class IdentityMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage.data_dir = data.str();
        registry = std::make_unique<PersonRegistry>(storage);
        registry->load();
        matcher = std::make_unique<IdentityMatcher>(*registry, MatchingConfig{});
    }

    TempDir data;
    StorageConfig storage;
    std::unique_ptr<PersonRegistry> registry;
    std::unique_ptr<IdentityMatcher> matcher;
};

// ==================== PersonRef ====================

TEST(PersonRefParse, GlobalAndClusterForms) {
    PersonRef g = PersonRef::parse("abc123");
    EXPECT_EQ(g.kind, PersonRef::Kind::Global);
    EXPECT_EQ(g.global_id, "abc123");

    PersonRef c = PersonRef::parse("boda:2024:3");
    EXPECT_EQ(c.kind, PersonRef::Kind::AlbumCluster);
    EXPECT_EQ(c.album_id, "boda:2024");
    EXPECT_EQ(c.cluster_index, 3);
    EXPECT_EQ(c.to_string(), "boda:2024:3");
}

TEST(PersonRefParse, MalformedReferencesThrow) {
    EXPECT_THROW(PersonRef::parse(""), photorank::PersonNotFoundError);
    EXPECT_THROW(PersonRef::parse("album:"), photorank::PersonNotFoundError);
    EXPECT_THROW(PersonRef::parse(":3"), photorank::PersonNotFoundError);
    EXPECT_THROW(PersonRef::parse("album:x1"), photorank::PersonNotFoundError);
}

// ==================== LINK ====================

TEST_F(IdentityMatcherTest, LinksClusterAboveThreshold) {
    GlobalPerson alice = registry->add("Alice", axis(0));

    std::vector<PersonCluster> clusters = {make_cluster(0, blend(0, 1, 0.8f)), make_cluster(1, axis(2))};
    EXPECT_EQ(matcher->link(clusters), 1);

    EXPECT_EQ(clusters[0].global_id, alice.id);
    EXPECT_FALSE(clusters[1].global_id.has_value());
}

TEST_F(IdentityMatcherTest, LinkThresholdIsStrict) {
    registry->add("Alice", axis(0));

    std::vector<PersonCluster> clusters = {make_cluster(0, blend(0, 1, Config::LINK_THRESHOLD))};
    EXPECT_EQ(matcher->link(clusters), 0);
    EXPECT_FALSE(clusters[0].global_id.has_value());
}

TEST_F(IdentityMatcherTest, LinkTieGoesToEarliestPerson) {
    GlobalPerson first = registry->add("First", axis(0));
    registry->add("Second", axis(0));

    std::vector<PersonCluster> clusters = {make_cluster(0, axis(0))};
    matcher->link(clusters);

    EXPECT_EQ(clusters[0].global_id, first.id);
}

TEST_F(IdentityMatcherTest, DanglingLinkIsDroppedAndRelinked) {
    GlobalPerson alice = registry->add("Alice", axis(0));

    std::vector<PersonCluster> clusters = {make_cluster(0, axis(0)), make_cluster(1, axis(3))};
    clusters[0].global_id = "gone000000000000";
    clusters[1].global_id = "gone000000000001";

    matcher->link(clusters);

    EXPECT_EQ(clusters[0].global_id, alice.id);
    EXPECT_FALSE(clusters[1].global_id.has_value());
}

// ==================== FIND ====================

TEST_F(IdentityMatcherTest, MatchesBestCandidateAboveThreshold) {
    GlobalPerson alice = registry->add("Alice", axis(0));
    registry->add("Bob", axis(1));

    // 0.81 contra Alice, 0.28 contra Bob; umbral 0.28
    std::vector<float> query(EMB_DIM, 0.0f);
    query[0] = 0.81f;
    query[1] = 0.28f;
    query[2] = std::sqrt(1.0f - 0.81f * 0.81f - 0.28f * 0.28f);

    MatchResult result = matcher->find(query, 0.28f, 3, {});

    ASSERT_TRUE(result.matched);
    EXPECT_EQ(result.match->global_id, alice.id);
    EXPECT_EQ(result.match->name, "Alice");
    EXPECT_NEAR(result.best_similarity, 0.81f, 1e-5f);
    EXPECT_TRUE(result.candidates.empty());

    MatchResult strict = matcher->find(query, 0.9f, 3, {});
    EXPECT_FALSE(strict.matched);
    ASSERT_EQ(strict.candidates.size(), 2u);
    EXPECT_EQ(strict.candidates[0].global_id, alice.id);
    EXPECT_GE(strict.candidates[0].similarity, strict.candidates[1].similarity);
}

TEST_F(IdentityMatcherTest, UnmatchedReturnsTopKSortedCandidates) {
    registry->add("A", blend(0, 5, 0.3f));
    std::vector<AlbumView> albums = {
        make_album("zoo", {make_cluster(0, blend(0, 5, 0.2f))}),
        make_album("boda", {make_cluster(0, blend(0, 5, 0.4f)), make_cluster(1, blend(0, 5, 0.1f))}),
    };

    MatchResult result = matcher->find(axis(0), 0.45f, 3, albums);

    EXPECT_FALSE(result.matched);
    ASSERT_EQ(result.candidates.size(), 3u);
    EXPECT_EQ(result.candidates[0].ref, "boda:0");
    EXPECT_EQ(result.candidates[0].name, "boda #0");
    EXPECT_EQ(result.candidates[1].name, "A");
    EXPECT_EQ(result.candidates[2].ref, "zoo:0");
    EXPECT_NEAR(result.best_similarity, 0.4f, 1e-5f);
}

TEST_F(IdentityMatcherTest, LinkedClustersMergeIntoGlobalCandidate) {
    GlobalPerson alice = registry->add("Alice", blend(0, 1, 0.6f));

    PersonCluster linked = make_cluster(0, blend(0, 2, 0.7f));
    linked.global_id = alice.id;
    std::vector<AlbumView> albums = {make_album("boda", {linked})};

    MatchResult result = matcher->find(axis(0), 0.99f, 10, albums);

    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].global_id, alice.id);
    EXPECT_NEAR(result.candidates[0].similarity, 0.7f, 1e-5f);
}

TEST_F(IdentityMatcherTest, EqualSimilarityKeepsDeterministicOrder) {
    GlobalPerson g = registry->add("G", axis(1));
    std::vector<AlbumView> albums = {
        make_album("b", {make_cluster(0, axis(1))}),
        make_album("a", {make_cluster(0, axis(1))}),
    };

    MatchResult result = matcher->find(axis(0), 0.5f, 5, albums);

    ASSERT_EQ(result.candidates.size(), 3u);
    EXPECT_EQ(result.candidates[0].ref, g.id);
    EXPECT_EQ(result.candidates[1].ref, "a:0");
    EXPECT_EQ(result.candidates[2].ref, "b:0");
}

TEST_F(IdentityMatcherTest, EmptyIndexNeverMatches) {
    MatchResult result = matcher->find(axis(0), 0.0f, 3, {});
    EXPECT_FALSE(result.matched);
    EXPECT_TRUE(result.candidates.empty());
}

// ==================== RENAME ====================

TEST_F(IdentityMatcherTest, RenamingUnlinkedClusterCreatesPerson) {
    AlbumView album = make_album("boda", {make_cluster(0, axis(0))});

    GlobalPerson p = matcher->rename(PersonRef::cluster("boda", 0), "Alice", &album);

    EXPECT_EQ(p.name, "Alice");
    EXPECT_EQ(album.clusters[0].global_id, p.id);
    EXPECT_TRUE(registry->contains(p.id));

    // segundo rename sobre el mismo cluster -> renombra la global
    GlobalPerson again = matcher->rename(PersonRef::cluster("boda", 0), "Alicia", &album);
    EXPECT_EQ(again.id, p.id);
    EXPECT_EQ(registry->size(), 1u);
    EXPECT_EQ(registry->get(p.id)->name, "Alicia");
}

TEST_F(IdentityMatcherTest, RenamingUnknownReferencesThrows) {
    AlbumView album = make_album("boda", {make_cluster(0, axis(0))});

    EXPECT_THROW(matcher->rename(PersonRef::cluster("boda", 7), "X", &album), photorank::PersonNotFoundError);
    EXPECT_THROW(matcher->rename(PersonRef::cluster("otro", 0), "X", &album), photorank::PersonNotFoundError);
    EXPECT_THROW(matcher->rename(PersonRef::global("nope"), "X", nullptr), photorank::PersonNotFoundError);
}

TEST(IdentityMatcherQuery, LargestFaceIsSelected) {
    std::vector<DetectedFace> faces = {face(0, 0, 40, axis(0)), face(50, 0, 90, axis(1)), face(200, 0, 60, axis(2))};

    EXPECT_EQ(IdentityMatcher::select_query_face(faces), 1u);
    EXPECT_FALSE(IdentityMatcher::select_query_face({}).has_value());
}
