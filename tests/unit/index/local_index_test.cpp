#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/index/local_index.hpp"

namespace sage_tests {

using MockUtilities::create_test_record;

class LocalIndexTest : public ::testing::Test {
 protected:
  sage_core::LocalIndex index_{3};

  std::vector<std::string> ids_of(const std::vector<sage_core::SearchResult> &results) {
    std::vector<std::string> ids;
    for (const auto &result : results) {
      ids.push_back(result.id);
    }
    return ids;
  }
};

TEST_F(LocalIndexTest, RejectsZeroDimension) {
  EXPECT_THROW(sage_core::LocalIndex(0), sage_core::ConfigurationError);
}

TEST_F(LocalIndexTest, SearchOnEmptyIndexReturnsEmpty) {
  EXPECT_TRUE(index_.search({1.0f, 0.0f, 0.0f}, 5).empty());
  EXPECT_TRUE(index_.query({1.0f, 0.0f, 0.0f}, 5).empty());
}

TEST_F(LocalIndexTest, RanksByCosineSimilarity) {
  index_.insert_many({create_test_record("A", {1.0f, 0.0f, 0.0f}),
                      create_test_record("B", {0.0f, 1.0f, 0.0f}),
                      create_test_record("C", {0.9f, 0.1f, 0.0f})});

  auto results = index_.search({1.0f, 0.0f, 0.0f}, 2);

  ASSERT_EQ(ids_of(results), (std::vector<std::string>{"A", "C"}));
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
  EXPECT_NEAR(results[1].score, 0.9f / std::sqrt(0.82f), 1e-5);
  EXPECT_EQ(results[0].text, "text of A");
}

TEST_F(LocalIndexTest, StoredVectorIsItsOwnBestMatch) {
  index_.insert_many({create_test_record("x", {0.3f, -2.0f, 5.0f}),
                      create_test_record("y", {1.0f, 1.0f, 1.0f}),
                      create_test_record("z", {-4.0f, 0.5f, 0.0f})});

  for (const std::string id : {"x", "y", "z"}) {
    auto results = index_.search(index_.find(id)->vector, 1);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].id, id);
    EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
  }
}

TEST_F(LocalIndexTest, ScoresStayWithinCosineRange) {
  index_.insert_many({create_test_record("same", {2.0f, 2.0f, 2.0f}),
                      create_test_record("opposite", {-1.0f, -1.0f, -1.0f})});

  auto results = index_.search({1.0f, 1.0f, 1.0f}, 2);

  ASSERT_EQ(results.size(), 2);
  for (const auto &result : results) {
    EXPECT_LE(result.score, 1.0f);
    EXPECT_GE(result.score, -1.0f);
  }
  EXPECT_EQ(results[1].id, "opposite");
  EXPECT_NEAR(results[1].score, -1.0f, 1e-5);
}

TEST_F(LocalIndexTest, EqualScoresKeepInsertionOrder) {
  index_.insert(create_test_record("first", {1.0f, 0.0f, 0.0f}));
  index_.insert(create_test_record("second", {2.0f, 0.0f, 0.0f}));
  index_.insert(create_test_record("other", {0.0f, 1.0f, 0.0f}));

  auto results = index_.search({3.0f, 0.0f, 0.0f}, 3);

  EXPECT_EQ(ids_of(results), (std::vector<std::string>{"first", "second", "other"}));
}

TEST_F(LocalIndexTest, TopKLargerThanIndexReturnsEverything) {
  index_.insert(create_test_record("only", {0.0f, 0.0f, 1.0f}));

  EXPECT_EQ(index_.search({0.0f, 1.0f, 1.0f}, 10).size(), 1);
  EXPECT_TRUE(index_.search({0.0f, 1.0f, 1.0f}, 0).empty());
}

TEST_F(LocalIndexTest, RejectsDimensionMismatchWithoutMutation) {
  EXPECT_THROW(index_.insert(create_test_record("bad", {1.0f, 0.0f})),
               sage_core::ConfigurationError);
  EXPECT_EQ(index_.size(), 0);

  index_.insert(create_test_record("good", {1.0f, 0.0f, 0.0f}));
  EXPECT_THROW(index_.search({1.0f, 0.0f}, 1), sage_core::ConfigurationError);
}

TEST_F(LocalIndexTest, RejectsZeroAndNonFiniteVectors) {
  EXPECT_THROW(index_.insert(create_test_record("zero", {0.0f, 0.0f, 0.0f})),
               sage_core::ConfigurationError);
  EXPECT_THROW(index_.insert(create_test_record(
                   "nan", {std::numeric_limits<float>::quiet_NaN(), 1.0f, 0.0f})),
               sage_core::ConfigurationError);
  EXPECT_EQ(index_.size(), 0);
}

TEST_F(LocalIndexTest, BatchInsertIsAllOrNothing) {
  EXPECT_THROW(index_.insert_many({create_test_record("ok", {1.0f, 0.0f, 0.0f}),
                                   create_test_record("short", {1.0f})}),
               sage_core::ConfigurationError);

  EXPECT_EQ(index_.size(), 0);
  EXPECT_FALSE(index_.contains("ok"));
  EXPECT_TRUE(index_.search({1.0f, 0.0f, 0.0f}, 1).empty());
}

TEST_F(LocalIndexTest, RejectsDuplicateAndEmptyIds) {
  index_.insert(create_test_record("dup", {1.0f, 0.0f, 0.0f}));

  EXPECT_THROW(index_.insert(create_test_record("dup", {0.0f, 1.0f, 0.0f})),
               sage_core::ConfigurationError);
  EXPECT_THROW(index_.insert_many({create_test_record("twice", {0.0f, 1.0f, 0.0f}),
                                   create_test_record("twice", {0.0f, 0.0f, 1.0f})}),
               sage_core::ConfigurationError);
  EXPECT_THROW(index_.insert(create_test_record("", {0.0f, 1.0f, 0.0f})),
               sage_core::ConfigurationError);
  EXPECT_EQ(index_.size(), 1);
}

TEST_F(LocalIndexTest, FindReturnsStoredRecord) {
  index_.insert(create_test_record("doc", {0.0f, 3.0f, 4.0f}, "hello", {{"source", "notes"}}));

  const sage_core::VectorRecord *record = index_.find("doc");
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->text, "hello");
  EXPECT_EQ(record->metadata.at("source"), "notes");
  // Stored vectors keep their original magnitude
  EXPECT_EQ(record->vector, (std::vector<float>{0.0f, 3.0f, 4.0f}));
  EXPECT_EQ(index_.find("missing"), nullptr);
}

TEST_F(LocalIndexTest, ClearEmptiesIndex) {
  index_.insert_many({create_test_record("a", {1.0f, 0.0f, 0.0f}),
                      create_test_record("b", {0.0f, 1.0f, 0.0f})});

  index_.clear();

  EXPECT_EQ(index_.size(), 0);
  EXPECT_FALSE(index_.contains("a"));
  EXPECT_TRUE(index_.search({1.0f, 0.0f, 0.0f}, 2).empty());

  index_.insert(create_test_record("a", {1.0f, 0.0f, 0.0f}));
  EXPECT_EQ(ids_of(index_.search({1.0f, 0.0f, 0.0f}, 2)), (std::vector<std::string>{"a"}));
}

TEST_F(LocalIndexTest, WorksThroughBackendInterface) {
  sage_core::IndexBackend &backend = index_;
  backend.add({create_test_record("a", {1.0f, 0.0f, 0.0f}),
               create_test_record("b", {0.0f, 1.0f, 0.0f})});

  auto hits = backend.query({0.0f, 1.0f, 0.0f}, 1);

  ASSERT_EQ(hits.size(), 1);
  EXPECT_EQ(hits[0].id, "b");
  EXPECT_EQ(backend.name(), "local");
}

}  // namespace sage_tests
