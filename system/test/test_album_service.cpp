// ============= test/test_album_service.cpp =============
/**
 * @file test_album_service.cpp
 * @brief Tests end-to-end del servicio de albums con proveedores falsos
 *
 * Valida:
 * - pipeline completo: sync -> clusters -> personas -> ranking
 * - un solo pipeline por album (segundo trigger rechazado)
 * - fallo del pipeline -> status error, vista y cache anteriores intactos
 * - nombrar / buscar / resolver / olvidar personas entre albums
 * - ranking en vivo == ranking desde cache (lista completa, scores incluidos)
 */

#include <gtest/gtest.h>
#include "service/album_service.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

using namespace photorank_test;

class AlbumServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.storage.data_dir = root.str();
        config.storage.albums_dir = root.file("albums");
        config.service.worker_threads = 2;

        analyzer = std::make_shared<FakeFaceAnalyzer>();
        extractor = std::make_shared<QualityExtractor>(analyzer, std::make_shared<FakeEmotionScorer>(0.7f),
                                                       config.extractor);
    }

    // 10 imagenes: 7 con la persona `person_axis`, 3 sin rostros
    void make_album(const std::string& id, int width_base, int person_axis) {
        fs::path dir = fs::path(config.storage.albums_dir) / id;
        fs::create_directories(dir);
        for (int i = 0; i < 10; ++i) {
            int width = width_base + i;
            write_image((dir / ("img_" + std::to_string(i) + ".png")).string(), width, 240, true, 3 + i);
            if (i < 7) {
                analyzer->set(width, {face(20, 20, 60 + i, blend(person_axis, person_axis + 1, 0.92f))});
            }
        }
    }

    // Una foto por entrada; width_base separa los albums en el analizador falso
    void make_photos(const std::string& id, int width_base,
                     const std::vector<std::pair<std::string, DetectedFace>>& photos) {
        fs::path dir = fs::path(config.storage.albums_dir) / id;
        fs::create_directories(dir);
        int width = width_base;
        for (const auto& [name, detected] : photos) {
            write_image((dir / name).string(), width, 240, true, width);
            analyzer->set(width, {detected});
            ++width;
        }
    }

    static void expect_same_ranking(const std::vector<RankedPhoto>& live,
                                    const std::vector<RankedPhoto>& cached) {
        ASSERT_EQ(live.size(), cached.size());
        for (size_t i = 0; i < cached.size(); ++i) {
            EXPECT_EQ(live[i].filename, cached[i].filename) << "posicion " << i;
            EXPECT_NEAR(live[i].score, cached[i].score, 1e-5f) << cached[i].filename;
            EXPECT_EQ(live[i].target_face_index, cached[i].target_face_index);
        }
    }

    std::string album_path(const std::string& id) const {
        return (fs::path(config.storage.albums_dir) / id).string();
    }

    TempDir root;
    RankingConfig config;
    std::shared_ptr<FakeFaceAnalyzer> analyzer;
    std::shared_ptr<QualityExtractor> extractor;
};

TEST_F(AlbumServiceTest, NewAlbumSyncBuildsOnePerson) {
    make_album("boda", 200, 0);
    AlbumService service(config, extractor);

    AlbumStatus s = service.run_sync("boda");

    EXPECT_EQ(s.status, SyncStatus::Done);
    ASSERT_TRUE(s.last_report.has_value());
    EXPECT_EQ(s.last_report->updated.size(), 10u);
    EXPECT_TRUE(s.last_report->removed.empty());
    EXPECT_EQ(s.image_count, 10u);
    EXPECT_EQ(s.people_count, 1u);

    auto people = service.list_people("boda");
    ASSERT_EQ(people.size(), 1u);
    EXPECT_EQ(people[0].face_count, 7u);
    EXPECT_EQ(people[0].photo_count, 7u);
    EXPECT_EQ(people[0].ref, "boda:0");
    EXPECT_EQ(people[0].name, "boda #0");
    EXPECT_TRUE(fs::exists(people[0].crop_path));

    auto ranked = service.ranked_photos("boda", "boda:0", 0);
    EXPECT_EQ(ranked.size(), 7u);
}

TEST_F(AlbumServiceTest, ResyncWithoutChangesReusesCache) {
    make_album("boda", 200, 0);
    AlbumService service(config, extractor);
    service.run_sync("boda");
    int calls = analyzer->calls.load();

    AlbumStatus s = service.run_sync("boda");

    EXPECT_EQ(s.status, SyncStatus::Done);
    EXPECT_EQ(s.last_report->updated.size(), 0u);
    EXPECT_EQ(analyzer->calls.load(), calls);
}

TEST_F(AlbumServiceTest, SecondTriggerWhileRunningIsRejected) {
    make_album("boda", 200, 0);
    analyzer->delay_ms = 30;
    AlbumService service(config, extractor);

    EXPECT_TRUE(service.trigger_sync("boda"));
    EXPECT_FALSE(service.trigger_sync("boda"));
    EXPECT_THROW(service.run_sync("boda"), photorank::PipelineError);

    service.wait_idle();
    EXPECT_EQ(service.status("boda").status, SyncStatus::Done);
    EXPECT_TRUE(service.trigger_sync("boda"));
    service.wait_idle();
}

TEST_F(AlbumServiceTest, PipelineFailureKeepsPreviousState) {
    make_album("boda", 200, 0);
    AlbumService service(config, extractor);
    service.run_sync("boda");

    std::string cache = (fs::path(album_path("boda")) / config.storage.cache_filename).string();
    auto before = read_bytes(cache);

    write_image((fs::path(album_path("boda")) / "new.png").string(), 260);
    analyzer->set_unavailable(true);

    AlbumStatus s = service.run_sync("boda");

    EXPECT_EQ(s.status, SyncStatus::Error);
    EXPECT_FALSE(s.message.empty());
    EXPECT_EQ(s.image_count, 10u);
    EXPECT_EQ(read_bytes(cache), before);
    EXPECT_EQ(service.list_people("boda").size(), 1u);
}

TEST_F(AlbumServiceTest, NewServiceServesCommittedCache) {
    make_album("boda", 200, 0);
    {
        AlbumService service(config, extractor);
        service.run_sync("boda");
    }

    AlbumService reader(config, nullptr);
    EXPECT_EQ(reader.status("boda").status, SyncStatus::Done);
    EXPECT_EQ(reader.list_people("boda").size(), 1u);

    // sin modelos el pipeline falla, pero la vista confirmada sigue disponible
    AlbumStatus s = reader.run_sync("boda");
    EXPECT_EQ(s.status, SyncStatus::Error);
    EXPECT_EQ(s.people_count, 1u);
}

TEST_F(AlbumServiceTest, UnknownAlbumIsRejected) {
    fs::create_directories(config.storage.albums_dir);
    AlbumService service(config, extractor);

    EXPECT_THROW(service.status("nope"), photorank::AlbumNotFoundError);
    EXPECT_THROW(service.trigger_sync("../boda"), photorank::AlbumNotFoundError);
    EXPECT_THROW(service.list_people(".hidden"), photorank::AlbumNotFoundError);
}

TEST_F(AlbumServiceTest, ListsAlbumsSorted) {
    make_album("zoo", 200, 0);
    make_album("boda", 300, 2);
    AlbumService service(config, extractor);

    EXPECT_EQ(service.list_albums(), (std::vector<std::string>{"boda", "zoo"}));
}

TEST_F(AlbumServiceTest, NamedPersonIsFoundAndResolvedAcrossAlbums) {
    make_album("boda", 200, 0);
    make_album("viaje", 300, 0);
    make_album("otros", 400, 4);

    AlbumService service(config, extractor);
    service.run_sync("boda");

    GlobalPerson alice = service.rename_person("boda:0", "Alice");
    EXPECT_EQ(service.list_people("boda")[0].name, "Alice");
    EXPECT_EQ(service.list_people("boda")[0].global_id, alice.id);

    // el segundo album enlaza con la persona ya nombrada
    service.run_sync("viaje");
    service.run_sync("otros");
    EXPECT_EQ(service.list_people("viaje")[0].global_id, alice.id);
    EXPECT_TRUE(service.list_people("otros")[0].global_id.empty());

    PersonResolution res = service.resolve(alice.id);
    EXPECT_EQ(res.name, "Alice");
    ASSERT_EQ(res.appearances.size(), 2u);
    EXPECT_EQ(res.appearances[0].album_id, "boda");
    EXPECT_EQ(res.appearances[1].album_id, "viaje");
    EXPECT_EQ(res.appearances[0].photos.size(), 7u);

    analyzer->set(999, {face(10, 10, 80, blend(0, 1, 0.9f))});
    MatchResult found = service.find_person(make_image(999), 0.45f, 3);
    ASSERT_TRUE(found.matched);
    EXPECT_EQ(found.match->global_id, alice.id);

    // ranking de la global = todas sus fotos del album
    EXPECT_EQ(service.ranked_photos("viaje", alice.id, 0).size(), 7u);
    EXPECT_EQ(service.ranked_photos("viaje", "viaje:0", 3).size(), 3u);
}

TEST_F(AlbumServiceTest, FindWithoutFaceThrows) {
    make_album("boda", 200, 0);
    AlbumService service(config, extractor);
    service.run_sync("boda");

    EXPECT_THROW(service.find_person(make_image(777), 0.45f, 3), photorank::NoFaceFoundError);
}

TEST_F(AlbumServiceTest, UnmatchedFindListsAlbumClusters) {
    make_album("boda", 200, 0);
    AlbumService service(config, extractor);
    service.run_sync("boda");

    analyzer->set(999, {face(10, 10, 80, axis(6))});
    MatchResult found = service.find_person(make_image(999), 0.45f, 3);

    EXPECT_FALSE(found.matched);
    ASSERT_EQ(found.candidates.size(), 1u);
    EXPECT_EQ(found.candidates[0].ref, "boda:0");
}

TEST_F(AlbumServiceTest, FacesInPhotoReportAssignments) {
    make_album("boda", 200, 0);
    AlbumService service(config, extractor);
    service.run_sync("boda");

    auto faces = service.faces_in_photo("boda", "img_0.png");
    ASSERT_EQ(faces.size(), 1u);
    EXPECT_EQ(faces[0].cluster_index, 0);
    EXPECT_EQ(faces[0].ref, "boda:0");

    EXPECT_TRUE(service.faces_in_photo("boda", "img_9.png").empty());
    EXPECT_TRUE(service.faces_in_photo("boda", "missing.png").empty());
}

TEST_F(AlbumServiceTest, ForgettingPersonUnlinksClusters) {
    make_album("boda", 200, 0);
    AlbumService service(config, extractor);
    service.run_sync("boda");
    GlobalPerson alice = service.rename_person("boda:0", "Alice");

    service.remove_person(alice.id);

    EXPECT_TRUE(service.list_people("boda")[0].global_id.empty());
    EXPECT_THROW(service.resolve(alice.id), photorank::PersonNotFoundError);
    EXPECT_THROW(service.remove_person(alice.id), photorank::PersonNotFoundError);
}

TEST_F(AlbumServiceTest, LiveRankingNeedsExtractor) {
    make_album("boda", 200, 0);
    {
        AlbumService service(config, extractor);
        service.run_sync("boda");

        auto live = service.ranked_photos("boda", "boda:0", 0, false);
        auto cached = service.ranked_photos("boda", "boda:0", 0, true);
        ASSERT_EQ(cached.size(), 7u);
        expect_same_ranking(live, cached);
    }

    AlbumService reader(config, nullptr);
    EXPECT_THROW(reader.ranked_photos("boda", "boda:0", 0, false), photorank::ModelUnavailableError);
}

TEST_F(AlbumServiceTest, LiveRankingKeepsMembersWhenRepresentativeShifts) {
    // c (el mas grande) termina como representante; b queda ortogonal a c
    // pero pertenece al cluster porque entro cuando el representante era a
    std::vector<float> c(EMB_DIM, 0.0f);
    c[0] = 0.5f;
    c[1] = -0.288675f;
    c[2] = 0.816497f;
    make_photos("playa", 500, {{"a.png", face(10, 10, 100, axis(0))},
                               {"b.png", face(10, 10, 50, blend(0, 1, 0.5f))},
                               {"c.png", face(10, 10, 200, c)}});
    config.clustering.threshold = 0.45f;

    AlbumService service(config, extractor);
    service.run_sync("playa");
    auto people = service.list_people("playa");
    ASSERT_EQ(people.size(), 1u);
    ASSERT_EQ(people[0].face_count, 3u);

    auto cached = service.ranked_photos("playa", "playa:0", 0, true);
    auto live = service.ranked_photos("playa", "playa:0", 0, false);

    ASSERT_EQ(cached.size(), 3u);
    expect_same_ranking(live, cached);
}

TEST_F(AlbumServiceTest, LiveRankingCoversEveryClusterOfLinkedPerson) {
    // Dos clusters (cos 0.7 < 0.8) que enlazan a la misma persona (0.7 > 0.5)
    make_photos("fiesta", 600, {{"x0.png", face(20, 20, 80, axis(0), 0.95f, true, 0.0f)},
                                {"x1.png", face(20, 20, 70, axis(0), 0.95f, true, 20.0f)},
                                {"y0.png", face(20, 20, 60, blend(0, 1, 0.7f), 0.95f, true, 5.0f)},
                                {"y1.png", face(20, 20, 90, blend(0, 1, 0.7f), 0.95f, true, 30.0f)},
                                {"z0.png", face(20, 20, 60, axis(4))}});
    config.clustering.threshold = 0.8f;
    config.matching.link_threshold = 0.5f;

    AlbumService service(config, extractor);
    service.run_sync("fiesta");
    ASSERT_EQ(service.list_people("fiesta").size(), 3u);

    GlobalPerson ana = service.rename_person("fiesta:0", "Ana");
    service.run_sync("fiesta");

    auto people = service.list_people("fiesta");
    int linked = 0;
    for (const auto& p : people) {
        if (p.global_id == ana.id) ++linked;
    }
    ASSERT_EQ(linked, 2);

    auto cached = service.ranked_photos("fiesta", ana.id, 0, true);
    auto live = service.ranked_photos("fiesta", ana.id, 0, false);

    ASSERT_EQ(cached.size(), 4u);
    expect_same_ranking(live, cached);
    for (const auto& photo : live) {
        EXPECT_NE(photo.filename, "z0.png");
    }

    // por ref de cluster enlazado se rankea la persona completa
    expect_same_ranking(service.ranked_photos("fiesta", "fiesta:1", 0, false), cached);
}
