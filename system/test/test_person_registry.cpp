// ============= test/test_person_registry.cpp =============
/**
 * @file test_person_registry.cpp
 * @brief Tests del registry de personas globales
 *
 * Valida:
 * - ids aleatorios de 16 caracteres [a-z0-9], unicos
 * - persistencia entre instancias (people.db)
 * - snapshots inmutables para los lectores
 * - rename / remove con PersonNotFoundError
 * - archivo corrupto -> registry vacio
 */

#include <gtest/gtest.h>
#include "matching/person_registry.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"
#include <cctype>
#include <set>
#include <stdexcept>
#include <thread>

using namespace photorank_test;

class PersonRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage.data_dir = data.str();
        storage.albums_dir = data.file("albums");
    }

    TempDir data;
    StorageConfig storage;
};

TEST(PersonRegistryIds, GeneratedIdsAreLowercaseAlphanumeric) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        std::string id = PersonRegistry::generate_id();
        ASSERT_EQ(id.size(), 16u);
        for (char c : id) {
            EXPECT_TRUE(std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)));
        }
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(PersonRegistryNames, BlankNamesBecomeUnnamed) {
    EXPECT_EQ(PersonRegistry::normalize_name("  Ana  "), "Ana");
    EXPECT_EQ(PersonRegistry::normalize_name("   "), "Unnamed");
    EXPECT_EQ(PersonRegistry::normalize_name(""), "Unnamed");
}

TEST_F(PersonRegistryTest, MissingFileLoadsEmpty) {
    PersonRegistry registry(storage);
    EXPECT_TRUE(registry.load());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(PersonRegistryTest, AddedPeoplePersistAcrossInstances) {
    std::string alice_id;
    {
        PersonRegistry registry(storage);
        registry.load();
        alice_id = registry.add("Alice", axis(0)).id;
        registry.add("Bob", axis(1));
    }

    PersonRegistry reloaded(storage);
    ASSERT_TRUE(reloaded.load());
    ASSERT_EQ(reloaded.size(), 2u);

    auto alice = reloaded.get(alice_id);
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->name, "Alice");
    EXPECT_EQ(alice->representative_embedding, axis(0));

    // la secuencia continua despues de recargar
    GlobalPerson carol = reloaded.add("Carol", axis(2));
    EXPECT_GT(carol.created_seq, alice->created_seq);
    EXPECT_EQ(carol.created_seq, 3);
}

TEST_F(PersonRegistryTest, EmbeddingIsNormalizedAndZeroRejected) {
    PersonRegistry registry(storage);
    registry.load();

    std::vector<float> scaled = axis(2);
    for (auto& v : scaled) v *= 4.0f;
    EXPECT_FLOAT_EQ(registry.add("X", scaled).representative_embedding[2], 1.0f);

    EXPECT_THROW(registry.add("Y", std::vector<float>(EMB_DIM, 0.0f)), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(PersonRegistryTest, SnapshotsAreImmutable) {
    PersonRegistry registry(storage);
    registry.load();
    registry.add("Alice", axis(0));

    auto before = registry.snapshot();
    registry.add("Bob", axis(1));

    EXPECT_EQ(before->size(), 1u);
    EXPECT_EQ(registry.snapshot()->size(), 2u);
}

TEST_F(PersonRegistryTest, RenameUpdatesNameAndPersists) {
    std::string id;
    {
        PersonRegistry registry(storage);
        registry.load();
        id = registry.add("", axis(0)).id;
        EXPECT_EQ(registry.get(id)->name, "Unnamed");
        EXPECT_EQ(registry.rename(id, "Alice").name, "Alice");
    }

    PersonRegistry reloaded(storage);
    reloaded.load();
    EXPECT_EQ(reloaded.get(id)->name, "Alice");
}

TEST_F(PersonRegistryTest, UnknownIdsThrow) {
    PersonRegistry registry(storage);
    registry.load();

    EXPECT_THROW(registry.rename("doesnotexist0000", "X"), photorank::PersonNotFoundError);
    EXPECT_THROW(registry.remove("doesnotexist0000"), photorank::PersonNotFoundError);
}

TEST_F(PersonRegistryTest, CropIsCopiedAndRemovedWithPerson) {
    write_image(data.file("rep.jpg"), 64, 64);

    PersonRegistry registry(storage);
    registry.load();
    GlobalPerson p = registry.add("Alice", axis(0), data.file("rep.jpg"));

    ASSERT_FALSE(p.crop_ref.empty());
    EXPECT_TRUE(fs::exists(p.crop_ref));
    EXPECT_EQ(fs::path(p.crop_ref).filename().string(), p.id + ".jpg");

    registry.remove(p.id);
    EXPECT_FALSE(fs::exists(p.crop_ref));
    EXPECT_FALSE(registry.contains(p.id));
}

TEST_F(PersonRegistryTest, CorruptFileStartsEmpty) {
    write_garbage(data.file(Config::REGISTRY_FILENAME), std::string(4096, 'z'));

    PersonRegistry registry(storage);
    EXPECT_FALSE(registry.load());
    EXPECT_EQ(registry.size(), 0u);

    // se puede volver a escribir sobre el archivo corrupto
    registry.add("Alice", axis(0));
    PersonRegistry reloaded(storage);
    EXPECT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.size(), 1u);
}

TEST_F(PersonRegistryTest, ConcurrentAddsAreSerialized) {
    PersonRegistry registry(storage);
    registry.load();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < 5; ++i) {
                registry.add("p" + std::to_string(t) + "_" + std::to_string(i), axis(t + i));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(registry.size(), 20u);

    std::set<int64_t> seqs;
    for (const auto& p : *registry.snapshot()) seqs.insert(p.created_seq);
    EXPECT_EQ(seqs.size(), 20u);

    PersonRegistry reloaded(storage);
    reloaded.load();
    EXPECT_EQ(reloaded.size(), 20u);
}
