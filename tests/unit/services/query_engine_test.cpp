#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "kb_core/errors.hpp"
#include "kb_core/services/index_builder.hpp"
#include "kb_core/services/query_engine.hpp"

using namespace kb_core;
using kb_tests::HashingEmbeddingProvider;
using kb_tests::MockEmbeddingProvider;
using kb_tests::TestUtilities;
using testing::_;
using testing::NiceMock;
using testing::Return;

class QueryEngineTest : public kb_tests::IndexTestBase {
 protected:
  std::vector<Document> shop_corpus() {
    return {TestUtilities::leather_wallet_document(), TestUtilities::blue_shirt_document()};
  }

  std::shared_ptr<const IndexArtifact> build(const std::vector<Document> &documents) {
    return IndexBuilder(config_, provider_).build(documents);
  }
};

TEST_F(QueryEngineTest, PriceQueryFindsBlueShirt) {
  // Arrange
  IndexBuilder(config_, provider_).build_and_persist(shop_corpus());
  QueryEngine engine(config_, provider_);
  engine.load();

  // Act
  auto top = engine.query("price of blue shirt", 1);
  auto all = engine.query("price of blue shirt", 2);

  // Assert
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].title, "Blue Shirt");
  EXPECT_EQ(top[0].url, "https://shop.example.com/products/blue-shirt");
  EXPECT_EQ(top[0].text, TestUtilities::blue_shirt_document().content);
  EXPECT_EQ(top[0].page_type, PageType::Product);
  EXPECT_EQ(top[0].product_info["variants"][0]["price"], "19.99");

  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].title, "Blue Shirt");
  EXPECT_GT(all[0].score, all[1].score);
}

TEST_F(QueryEngineTest, TopKLargerThanIndexReturnsEverything) {
  QueryEngine engine(config_, provider_);
  engine.swap(build(TestUtilities::create_test_corpus(3)));

  EXPECT_EQ(engine.query("document", 10).size(), 3u);
}

TEST_F(QueryEngineTest, RejectsBlankQuery) {
  QueryEngine engine(config_, provider_);
  engine.swap(build(shop_corpus()));

  EXPECT_THROW(engine.query("", 5), InvalidArgumentError);
  EXPECT_THROW(engine.query(" \t\n", 5), InvalidArgumentError);
}

TEST_F(QueryEngineTest, RejectsNonPositiveTopK) {
  QueryEngine engine(config_, provider_);
  engine.swap(build(shop_corpus()));

  EXPECT_THROW(engine.query("shirt", 0), InvalidArgumentError);
  EXPECT_THROW(engine.query("shirt", -3), InvalidArgumentError);
}

TEST_F(QueryEngineTest, QueryBeforeLoadFails) {
  QueryEngine engine(config_, provider_);

  EXPECT_FALSE(engine.is_loaded());
  EXPECT_THROW(engine.query("shirt", 5), NotLoadedError);
}

TEST_F(QueryEngineTest, LoadWithoutArtifactFailsAndStaysUnloaded) {
  QueryEngine engine(config_, provider_);

  EXPECT_THROW(engine.load(), MissingArtifactError);
  EXPECT_FALSE(engine.is_loaded());
}

TEST_F(QueryEngineTest, StrictModeRejectsDifferentModel) {
  auto other = std::make_shared<HashingEmbeddingProvider>("other-model");
  QueryEngine engine(config_, other);
  engine.swap(build(shop_corpus()));

  EXPECT_THROW(engine.query("blue shirt", 1), ProviderMismatchError);
}

TEST_F(QueryEngineTest, LenientModeWarnsAndAnswers) {
  auto config = TestUtilities::create_test_config(index_dir_, {{"strict_provider_check", false}});
  auto other = std::make_shared<HashingEmbeddingProvider>("other-model");
  QueryEngine engine(config, other);
  engine.swap(build(shop_corpus()));

  auto results = engine.query("blue shirt", 1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].title, "Blue Shirt");
}

TEST_F(QueryEngineTest, ProviderReturningWrongCountFails) {
  auto mock = std::make_shared<NiceMock<MockEmbeddingProvider>>("hashing-embed");
  EXPECT_CALL(*mock, embed(_))
      .WillOnce(Return(std::vector<std::vector<float>>{TestUtilities::unit_vector(256, 0),
                                                       TestUtilities::unit_vector(256, 1)}));
  QueryEngine engine(config_, mock);
  engine.swap(build(shop_corpus()));

  EXPECT_THROW(engine.query("shirt", 1), ProviderError);
}

TEST_F(QueryEngineTest, QueryOfWrongDimensionFails) {
  auto narrow = std::make_shared<HashingEmbeddingProvider>("hashing-embed", 64);
  QueryEngine engine(config_, narrow);
  engine.swap(build(shop_corpus()));

  EXPECT_THROW(engine.query("shirt", 1), DimensionMismatchError);
}

TEST_F(QueryEngineTest, SwapInstallsNewArtifact) {
  QueryEngine engine(config_, provider_);
  engine.swap(build({TestUtilities::leather_wallet_document()}));
  auto old_snapshot = engine.current();

  engine.swap(build(shop_corpus()));

  EXPECT_EQ(engine.query("blue shirt", 5).size(), 2u);
  // A snapshot taken before the swap still answers from the old data.
  EXPECT_EQ(old_snapshot->vectors().size(), 1u);
  EXPECT_EQ(old_snapshot->metadata().get(0).title, "Leather Wallet");
}

TEST_F(QueryEngineTest, ReloadPicksUpRebuiltIndex) {
  IndexBuilder(config_, provider_).build_and_persist({TestUtilities::leather_wallet_document()});
  QueryEngine engine(config_, provider_);
  engine.load();
  ASSERT_EQ(engine.query("blue shirt", 5).size(), 1u);

  IndexBuilder(config_, provider_).build_and_persist(shop_corpus());
  engine.load();

  EXPECT_EQ(engine.query("blue shirt", 5).size(), 2u);
}

TEST_F(QueryEngineTest, SwapRejectsNullArtifact) {
  QueryEngine engine(config_, provider_);
  EXPECT_THROW(engine.swap(nullptr), InvalidArgumentError);
}

TEST_F(QueryEngineTest, QueriesRunWhileArtifactIsSwapped) {
  QueryEngine engine(config_, provider_);
  auto small = build({TestUtilities::blue_shirt_document()});
  auto large = build(shop_corpus());
  engine.swap(small);

  std::atomic<bool> stop{false};
  std::atomic<int> failures{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&]() {
      while (!stop) {
        auto results = engine.query("price of blue shirt", 1);
        if (results.size() != 1 || results[0].title != "Blue Shirt") {
          ++failures;
        }
      }
    });
  }

  for (int i = 0; i < 200; ++i) {
    engine.swap(i % 2 == 0 ? large : small);
  }
  stop = true;
  for (auto &reader : readers) {
    reader.join();
  }

  EXPECT_EQ(failures.load(), 0);
}

TEST_F(QueryEngineTest, JoinSkipsOrdinalsMissingFromMetadata) {
  MetadataStore metadata;
  Chunk first;
  first.text = "first chunk";
  first.url = "/first";
  metadata.append(first);
  Chunk second;
  second.text = "second chunk";
  second.url = "/second";
  metadata.append(second);

  std::vector<ScoredOrdinal> hits = {{1, 0.9f}, {5, 0.8f}, {0, 0.7f}};
  auto results = QueryEngine::join_metadata(metadata, hits);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].url, "/second");
  EXPECT_FLOAT_EQ(results[0].score, 0.9f);
  EXPECT_EQ(results[1].url, "/first");
  EXPECT_FLOAT_EQ(results[1].score, 0.7f);
}
