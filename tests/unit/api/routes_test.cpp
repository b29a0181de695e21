#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "sage_api/routes.hpp"
#include "sage_api/server.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/services/retriever.hpp"
#include "sage_core/vector_store.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace sage_tests {

TEST(RoutesTest, ShortDocumentsPassThroughWithChunkIndex) {
  sage_core::TextChunker chunker(20, 5, 100);

  auto batch = sage_api::Routes::expand_documents(
      {"Gravity pulls.", "Light bends."}, {{{"source", "a.txt"}}, {{"source", "b.txt"}}},
      chunker, true);

  ASSERT_EQ(batch.texts, (std::vector<std::string>{"Gravity pulls.", "Light bends."}));
  ASSERT_EQ(batch.metadatas.size(), 2);
  EXPECT_EQ(batch.metadatas[0].at("source"), "a.txt");
  EXPECT_EQ(batch.metadatas[0].at("chunk_index"), "0");
  EXPECT_EQ(batch.metadatas[1].at("source"), "b.txt");
}

TEST(RoutesTest, LongDocumentsAreSplitAndInheritMetadata) {
  sage_core::TextChunker chunker(20, 5, 30);
  const std::string text = "Sentence one. Sentence two. Sentence three.";

  auto batch = sage_api::Routes::expand_documents({text}, {{{"source", "long.txt"}}}, chunker,
                                                  true);

  ASSERT_EQ(batch.texts.size(), 4);
  EXPECT_EQ(batch.texts[0], "Sentence one.");
  for (size_t i = 0; i < batch.metadatas.size(); ++i) {
    EXPECT_EQ(batch.metadatas[i].at("source"), "long.txt");
    EXPECT_EQ(batch.metadatas[i].at("chunk_index"), std::to_string(i));
  }
}

TEST(RoutesTest, SplittingCanBeDisabled) {
  sage_core::TextChunker chunker(20, 5, 30);
  const std::string text = "Sentence one. Sentence two. Sentence three.";

  auto batch = sage_api::Routes::expand_documents({text, ""}, {}, chunker, false);

  ASSERT_EQ(batch.texts, (std::vector<std::string>{text}));
  EXPECT_EQ(batch.metadatas[0].at("chunk_index"), "0");
  EXPECT_EQ(batch.metadatas[0].size(), 1);
}

TEST(RoutesTest, BlankDocumentsAreDroppedWhenSplittingIsDisabled) {
  sage_core::TextChunker chunker(20, 5, 30);

  auto batch = sage_api::Routes::expand_documents({"  \n\t ", "  Light bends.  "},
                                                  {{{"source", "blank"}}, {{"source", "b.txt"}}},
                                                  chunker, false);

  ASSERT_EQ(batch.texts, (std::vector<std::string>{"Light bends."}));
  ASSERT_EQ(batch.metadatas.size(), 1);
  EXPECT_EQ(batch.metadatas[0].at("source"), "b.txt");
}

TEST(RoutesTest, MetadataCountMismatchIsRejected) {
  sage_core::TextChunker chunker;

  std::vector<sage_core::Metadata> one_entry(1);

  EXPECT_THROW(sage_api::Routes::expand_documents({"a", "b"}, one_entry, chunker, true),
               sage_core::ConfigurationError);
}

TEST(RoutesTest, MetadataFromJsonStringifiesValues) {
  nlohmann::json json_metadata = {{"source", "notes.md"}, {"page", 3}, {"draft", false}};

  auto metadata = sage_api::Routes::metadata_from_json(json_metadata);

  EXPECT_EQ(metadata.at("source"), "notes.md");
  EXPECT_EQ(metadata.at("page"), "3");
  EXPECT_EQ(metadata.at("draft"), "false");
}

TEST(RoutesTest, MetadataFromJsonAcceptsNullAndRejectsNonObjects) {
  EXPECT_TRUE(sage_api::Routes::metadata_from_json(nullptr).empty());
  EXPECT_THROW(sage_api::Routes::metadata_from_json(nlohmann::json::array({1, 2})),
               sage_core::ConfigurationError);
  EXPECT_THROW(sage_api::Routes::metadata_from_json("source"), sage_core::ConfigurationError);
}

TEST(RoutesTest, MetadataToJsonBuildsObject) {
  auto json_metadata = sage_api::Routes::metadata_to_json({{"source", "a.txt"}});

  EXPECT_TRUE(json_metadata.is_object());
  EXPECT_EQ(json_metadata["source"], "a.txt");
  EXPECT_TRUE(sage_api::Routes::metadata_to_json({}).is_object());
}

// Drives the registered handlers through Crow's router without opening a socket.
class RoutesHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    generator_ = std::make_shared<NiceMock<MockAnswerGenerator>>();
    store_ = std::make_shared<sage_core::VectorStore>(MockEmbeddingProvider::DIMENSION);
    retriever_ = std::make_shared<sage_core::Retriever>(provider_, store_, generator_);

    server_ = std::make_unique<sage_api::Server>("127.0.0.1", 0, 1);
    routes_ = std::make_unique<sage_api::Routes>(retriever_, sage_core::TextChunker(50, 10, 200),
                                                 3);
    routes_->register_routes(*server_);
    server_->get_app().validate();
  }

  crow::response send(crow::HTTPMethod method, const std::string &url,
                      const std::string &body = "") {
    crow::request req;
    req.method = method;
    req.url = url;
    req.body = body;
    crow::response res;
    server_->get_app().handle_full(req, res);
    return res;
  }

  crow::response post(const std::string &url, const nlohmann::json &body) {
    return send(crow::HTTPMethod::Post, url, body.dump());
  }

  static nlohmann::json body_of(const crow::response &res) {
    return nlohmann::json::parse(res.body);
  }

  std::shared_ptr<NiceMock<MockEmbeddingProvider>> provider_;
  std::shared_ptr<NiceMock<MockAnswerGenerator>> generator_;
  std::shared_ptr<sage_core::VectorStore> store_;
  std::shared_ptr<sage_core::Retriever> retriever_;
  std::unique_ptr<sage_api::Server> server_;
  std::unique_ptr<sage_api::Routes> routes_;
};

TEST_F(RoutesHandlerTest, HealthCheckReportsHealthy) {
  auto res = send(crow::HTTPMethod::Get, "/");

  EXPECT_EQ(res.code, 200);
  EXPECT_EQ(body_of(res)["status"], "healthy");
}

TEST_F(RoutesHandlerTest, AddKnowledgeStoresDocumentsWithMetadata) {
  nlohmann::json metadatas = {{{"source", "physics.txt"}}, {{"source", "blank"}}};
  auto res = post("/knowledge", {{"texts", {"gravity keeps planets in orbit", "   "}},
                                 {"metadatas", metadatas}});

  ASSERT_EQ(res.code, 200);
  auto body = body_of(res);
  EXPECT_EQ(body["success"], true);
  EXPECT_EQ(body["data"]["documents"], 2);
  EXPECT_EQ(body["data"]["chunks"], 1);
  EXPECT_EQ(body["data"]["ids"].size(), 1);
  EXPECT_EQ(store_->size(), 1);
}

TEST_F(RoutesHandlerTest, AddKnowledgeWithoutTextsIsBadRequest) {
  auto res = post("/knowledge", {{"documents", {"gravity"}}});

  EXPECT_EQ(res.code, 400);
  EXPECT_EQ(body_of(res)["success"], false);
  EXPECT_EQ(store_->size(), 0);
}

TEST_F(RoutesHandlerTest, MalformedJsonIsBadRequest) {
  auto res = send(crow::HTTPMethod::Post, "/knowledge", "{\"texts\": [");

  EXPECT_EQ(res.code, 400);
  EXPECT_EQ(body_of(res)["success"], false);
}

TEST_F(RoutesHandlerTest, MismatchedMetadataIsBadRequest) {
  auto res = post("/knowledge", {{"texts", {"gravity", "photosynthesis"}},
                                 {"metadatas", {{{"source", "only one"}}}}});

  EXPECT_EQ(res.code, 400);
  EXPECT_EQ(store_->size(), 0);
}

TEST_F(RoutesHandlerTest, EmbeddingFailureIsBadGateway) {
  EXPECT_CALL(*provider_, embed_many(_))
      .WillOnce(Throw(sage_core::ProviderError("model offline")));

  auto res = post("/knowledge", {{"texts", {"gravity keeps planets in orbit"}}});

  EXPECT_EQ(res.code, 502);
  auto body = body_of(res);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["error"], "model offline");
  EXPECT_EQ(store_->size(), 0);
}

TEST_F(RoutesHandlerTest, QueryReturnsRankedResults) {
  retriever_->add_knowledge(
      {"photosynthesis turns light into sugar", "gravity keeps planets in orbit"},
      {{{"source", "bio.txt"}}, {{"source", "physics.txt"}}});

  auto res = post("/query", {{"query", "what is gravity"}, {"top_k", 1}});

  ASSERT_EQ(res.code, 200);
  auto results = body_of(res)["results"];
  ASSERT_EQ(results.size(), 1);
  EXPECT_EQ(results[0]["text"], "gravity keeps planets in orbit");
  EXPECT_EQ(results[0]["metadata"]["source"], "physics.txt");
  EXPECT_NEAR(results[0]["score"].get<double>(), 1.0, 1e-5);
}

TEST_F(RoutesHandlerTest, QueryWithoutTopKUsesDefault) {
  retriever_->add_knowledge({"photosynthesis", "gravity", "algorithm", "gravity again"});

  auto res = post("/query", {{"query", "gravity"}});

  ASSERT_EQ(res.code, 200);
  EXPECT_EQ(body_of(res)["results"].size(), 3);
}

TEST_F(RoutesHandlerTest, NonPositiveTopKIsBadRequest) {
  EXPECT_EQ(post("/query", {{"query", "gravity"}, {"top_k", 0}}).code, 400);
  EXPECT_EQ(post("/answer", {{"query", "gravity"}, {"top_k", -2}}).code, 400);
}

TEST_F(RoutesHandlerTest, EmptyQueryIsBadRequest) {
  auto res = post("/query", {{"query", ""}});

  EXPECT_EQ(res.code, 400);
  EXPECT_EQ(body_of(res)["success"], false);
}

TEST_F(RoutesHandlerTest, QueryEmbeddingFailureIsBadGateway) {
  EXPECT_CALL(*provider_, embed_one(_)).WillOnce(Throw(sage_core::ProviderError("timeout")));

  EXPECT_EQ(post("/query", {{"query", "gravity"}}).code, 502);
}

TEST_F(RoutesHandlerTest, AnswerUsesGenerator) {
  retriever_->add_knowledge({"gravity keeps planets in orbit"});
  EXPECT_CALL(*generator_, generate("why do planets orbit?", _))
      .WillOnce(Return("Gravity holds them."));

  auto res = post("/answer", {{"query", "why do planets orbit?"}});

  ASSERT_EQ(res.code, 200);
  auto body = body_of(res);
  EXPECT_EQ(body["query"], "why do planets orbit?");
  EXPECT_EQ(body["answer"], "Gravity holds them.");
}

TEST_F(RoutesHandlerTest, AnswerOnEmptyKnowledgeIsInsufficient) {
  EXPECT_CALL(*generator_, generate(_, _)).Times(0);

  auto res = post("/answer", {{"query", "anything?"}});

  ASSERT_EQ(res.code, 200);
  EXPECT_EQ(body_of(res)["answer"], sage_core::Retriever::INSUFFICIENT_INFORMATION_MESSAGE);
}

TEST_F(RoutesHandlerTest, GenerationFailureIsBadGateway) {
  retriever_->add_knowledge({"gravity keeps planets in orbit"});
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(Throw(sage_core::ProviderError("crashed")));

  EXPECT_EQ(post("/answer", {{"query", "gravity"}}).code, 502);
}

TEST_F(RoutesHandlerTest, StatsDescribesKnowledgeBase) {
  retriever_->add_knowledge({"gravity", "photosynthesis"});

  auto res = send(crow::HTTPMethod::Get, "/stats");

  ASSERT_EQ(res.code, 200);
  auto body = body_of(res);
  EXPECT_EQ(body["count"], 2);
  EXPECT_EQ(body["dimension"], MockEmbeddingProvider::DIMENSION);
  EXPECT_EQ(body["backend"], "local");
  EXPECT_EQ(body["backend_info"]["document_count"], 2);
}

TEST_F(RoutesHandlerTest, ClearKnowledgeEmptiesStore) {
  retriever_->add_knowledge({"gravity", "photosynthesis"});

  auto res = send(crow::HTTPMethod::Post, "/knowledge/clear");

  ASSERT_EQ(res.code, 200);
  EXPECT_EQ(body_of(res)["success"], true);
  EXPECT_EQ(store_->size(), 0);
}

}  // namespace sage_tests
