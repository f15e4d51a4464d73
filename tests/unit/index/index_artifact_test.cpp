#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "kb_core/errors.hpp"
#include "kb_core/index/index_artifact.hpp"

using namespace kb_core;
using kb_tests::TestUtilities;

class IndexArtifactTest : public kb_tests::IndexTestBase {
 protected:
  // Builds a consistent artifact of `count` chunks in 8 dimensions.
  std::shared_ptr<IndexArtifact> make_artifact(size_t count) {
    VectorIndex vectors(true);
    MetadataStore metadata;
    std::vector<std::vector<float>> batch;
    for (size_t i = 0; i < count; ++i) {
      batch.push_back(TestUtilities::unit_vector(8, i % 8));
      Chunk chunk;
      chunk.text = "chunk " + std::to_string(i);
      chunk.chunk_index = static_cast<int>(i);
      chunk.url = "/doc/" + std::to_string(i);
      metadata.append(std::move(chunk));
    }
    vectors.add(batch);

    IndexManifest manifest;
    manifest.dimension = 8;
    manifest.num_vectors = count;
    manifest.model_name = "hashing-embed";
    manifest.chunk_size = 800;
    manifest.chunk_overlap = 100;
    manifest.num_documents = count;
    return std::make_shared<IndexArtifact>(std::move(vectors), std::move(metadata),
                                           std::move(manifest));
  }
};

TEST_F(IndexArtifactTest, PersistWritesAllThreeFiles) {
  make_artifact(4)->persist(config_);

  EXPECT_TRUE(std::filesystem::exists(config_.vector_path()));
  EXPECT_TRUE(std::filesystem::exists(config_.metadata_path()));
  EXPECT_TRUE(std::filesystem::exists(config_.manifest_path()));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "index.staging"));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "index.previous"));
}

TEST_F(IndexArtifactTest, LoadReproducesPersistedArtifact) {
  auto original = make_artifact(5);
  original->persist(config_);

  auto loaded = IndexArtifact::load(config_);

  ASSERT_EQ(loaded->vectors().size(), 5u);
  EXPECT_EQ(loaded->manifest().dimension, 8u);
  EXPECT_EQ(loaded->manifest().model_name, "hashing-embed");
  EXPECT_EQ(loaded->metadata().to_json(), original->metadata().to_json());
  for (Ordinal i = 0; i < 5; ++i) {
    EXPECT_EQ(loaded->vectors().reconstruct(i), original->vectors().reconstruct(i));
  }
}

TEST_F(IndexArtifactTest, PersistReplacesPreviousIndex) {
  make_artifact(3)->persist(config_);
  make_artifact(6)->persist(config_);

  EXPECT_EQ(IndexArtifact::load(config_)->manifest().num_vectors, 6u);
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "index.previous"));
}

TEST_F(IndexArtifactTest, ConstructorRejectsCountMismatch) {
  VectorIndex vectors;
  vectors.add({TestUtilities::unit_vector(4, 0)});
  MetadataStore metadata;
  metadata.append(Chunk{});
  metadata.append(Chunk{});
  IndexManifest manifest;
  manifest.dimension = 4;
  manifest.num_vectors = 2;
  manifest.model_name = "m";

  EXPECT_THROW(IndexArtifact(std::move(vectors), std::move(metadata), std::move(manifest)),
               CorruptArtifactError);
}

TEST_F(IndexArtifactTest, LoadRejectsMoreMetadataThanVectors) {
  // Arrange: 9 vector rows on disk, then 10 metadata entries and a manifest claiming 10
  make_artifact(9)->persist(config_);
  nlohmann::json entries = nlohmann::json::parse(TestUtilities::read_file(config_.metadata_path()));
  entries.push_back({{"text", "extra"}, {"url", "/doc/9"}});
  TestUtilities::write_file(config_.metadata_path(), entries.dump(2));

  nlohmann::json manifest = nlohmann::json::parse(TestUtilities::read_file(config_.manifest_path()));
  manifest["num_vectors"] = 10;
  TestUtilities::write_file(config_.manifest_path(), manifest.dump(2));

  // Act / Assert
  EXPECT_THROW(IndexArtifact::load(config_), CorruptArtifactError);
}

TEST_F(IndexArtifactTest, LoadRejectsManifestCountMismatch) {
  make_artifact(9)->persist(config_);
  nlohmann::json manifest = nlohmann::json::parse(TestUtilities::read_file(config_.manifest_path()));
  manifest["num_vectors"] = 10;
  TestUtilities::write_file(config_.manifest_path(), manifest.dump(2));

  EXPECT_THROW(IndexArtifact::load(config_), CorruptArtifactError);
}

TEST_F(IndexArtifactTest, LoadRejectsDimensionMismatch) {
  make_artifact(2)->persist(config_);
  nlohmann::json manifest = nlohmann::json::parse(TestUtilities::read_file(config_.manifest_path()));
  manifest["dimension"] = 16;
  TestUtilities::write_file(config_.manifest_path(), manifest.dump(2));

  EXPECT_THROW(IndexArtifact::load(config_), CorruptArtifactError);
}

TEST_F(IndexArtifactTest, LoadReportsMissingDirectory) {
  EXPECT_THROW(IndexArtifact::load(config_), MissingArtifactError);
}

TEST_F(IndexArtifactTest, LoadReportsEveryMissingFile) {
  make_artifact(2)->persist(config_);
  std::filesystem::remove(config_.vector_path());
  std::filesystem::remove(config_.manifest_path());

  try {
    IndexArtifact::load(config_);
    FAIL() << "Expected MissingArtifactError";
  } catch (const MissingArtifactError &e) {
    const std::string message = e.what();
    EXPECT_NE(message.find(config_.vector_file), std::string::npos);
    EXPECT_NE(message.find(config_.manifest_file), std::string::npos);
    EXPECT_EQ(message.find(config_.metadata_file), std::string::npos);
  }
}

TEST_F(IndexArtifactTest, LoadRejectsManifestWithoutModel) {
  make_artifact(2)->persist(config_);
  TestUtilities::write_file(config_.manifest_path(), R"({"dimension": 8, "num_vectors": 2})");

  EXPECT_THROW(IndexArtifact::load(config_), CorruptArtifactError);
}

TEST_F(IndexArtifactTest, PersistAcceptsTrailingSlashInIndexDir) {
  auto config = TestUtilities::create_test_config(index_dir_.string() + "/");
  make_artifact(3)->persist(config);
  make_artifact(4)->persist(config);

  EXPECT_EQ(IndexArtifact::load(config)->manifest().num_vectors, 4u);
  EXPECT_FALSE(std::filesystem::exists(index_dir_ / ".staging"));
  EXPECT_FALSE(std::filesystem::exists(index_dir_ / ".previous"));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "index.staging"));
}

TEST_F(IndexArtifactTest, NormalizedDirDropsTrailingSeparator) {
  EXPECT_EQ(IndexArtifact::normalized_dir("./database/"), std::filesystem::path("database"));
  EXPECT_EQ(IndexArtifact::normalized_dir("/data/idx"), std::filesystem::path("/data/idx"));
  EXPECT_EQ(IndexArtifact::normalized_dir("/data/idx//"), std::filesystem::path("/data/idx"));
}

TEST_F(IndexArtifactTest, FailedReplaceRestoresLiveIndex) {
  // Arrange: a live index, and a staging directory that is not there
  make_artifact(5)->persist(config_);
  const auto missing_staging = temp_dir_ / "never-written.staging";

  // Act
  EXPECT_THROW(IndexArtifact::replace_directory(missing_staging, index_dir_), IoError);

  // Assert
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "index.previous"));
  EXPECT_EQ(IndexArtifact::load(config_)->manifest().num_vectors, 5u);
}

TEST_F(IndexArtifactTest, ReplaceDirectoryInstallsStaging) {
  make_artifact(2)->persist(config_);

  auto other_config = TestUtilities::create_test_config(temp_dir_ / "other");
  make_artifact(7)->persist(other_config);
  IndexArtifact::replace_directory(temp_dir_ / "other", index_dir_);

  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "other"));
  EXPECT_EQ(IndexArtifact::load(config_)->manifest().num_vectors, 7u);
}
