#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

#include "common/utilities_test.hpp"
#include "docrag_core/services/indexing_service.hpp"
#include "docrag_core/services/question_service.hpp"

namespace docrag_core {

using docrag_tests::TestUtilities;
using ::testing::_;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class QuestionServiceTest : public docrag_tests::IndexStoreTestBase {
 protected:
  void SetUp() override {
    IndexStoreTestBase::SetUp();
    judge_ = std::make_shared<RelevanceJudge>(mock_ollama_client_);
    question_service_ =
        std::make_unique<QuestionService>(index_store_, mock_ollama_client_, judge_);

    // Stored order differs from relevance order so positions must be mapped
    // back to chunk indices.
    index_store_->save("lease",
                       TestUtilities::create_test_index(
                           {"gamma clause", "beta clause", "alpha clause", "alpha clause again"},
                           {3, 2, 1, 1},
                           {{0.0f, 0.0f, 1.0f},
                            {0.6f, 0.8f, 0.0f},
                            {1.0f, 0.0f, 0.0f},
                            {0.99f, 0.14f, 0.0f}}));
    EXPECT_CALL(*mock_ollama_client_, get_embedding("What about alpha?"))
        .WillRepeatedly(Return(std::vector<float>{2.0f, 0.0f, 0.0f}));
  }

  static std::vector<size_t> indices_of(const std::vector<QuestionService::RetrievedChunk>& chunks) {
    std::vector<size_t> out;
    for (const auto& c : chunks) {
      out.push_back(c.index);
    }
    return out;
  }

  static QueryOptions options(int k, RetrievalStrategy strategy, bool rerank = false) {
    QueryOptions opts;
    opts.k = k;
    opts.strategy = strategy;
    opts.use_llm_rerank = rerank;
    return opts;
  }

  std::shared_ptr<RelevanceJudge> judge_;
  std::unique_ptr<QuestionService> question_service_;
};

TEST_F(QuestionServiceTest, CosineStrategyReturnsTopK) {
  DocumentIndex index = index_store_->load("lease");

  auto chosen =
      question_service_->retrieve(index, "What about alpha?", options(2, RetrievalStrategy::Cosine));

  EXPECT_EQ(indices_of(chosen), (std::vector<size_t>{2, 3}));
  EXPECT_EQ(chosen[0].page, 1);
  EXPECT_NEAR(chosen[0].score, 1.0f, 1e-5);
  EXPECT_GT(chosen[0].score, chosen[1].score);
}

TEST_F(QuestionServiceTest, MmrStrategySkipsNearDuplicates) {
  DocumentIndex index = index_store_->load("lease");

  auto chosen =
      question_service_->retrieve(index, "What about alpha?", options(2, RetrievalStrategy::Mmr));

  EXPECT_EQ(indices_of(chosen), (std::vector<size_t>{2, 0}));
  EXPECT_EQ(chosen[1].page, 3);
}

TEST_F(QuestionServiceTest, KLargerThanIndexReturnsEveryChunkOnce) {
  DocumentIndex index = index_store_->load("lease");

  auto cosine =
      question_service_->retrieve(index, "What about alpha?", options(25, RetrievalStrategy::Cosine));
  auto mmr =
      question_service_->retrieve(index, "What about alpha?", options(25, RetrievalStrategy::Mmr));

  EXPECT_EQ(indices_of(cosine), (std::vector<size_t>{2, 3, 1, 0}));
  auto mmr_indices = indices_of(mmr);
  std::sort(mmr_indices.begin(), mmr_indices.end());
  EXPECT_EQ(mmr_indices, (std::vector<size_t>{0, 1, 2, 3}));
}

TEST_F(QuestionServiceTest, RerankAppliesJudgeOrder) {
  EXPECT_CALL(*mock_ollama_client_, chat(_, ResponseFormat::Json)).WillOnce(Return("[1, 0]"));
  DocumentIndex index = index_store_->load("lease");

  auto chosen = question_service_->retrieve(index, "What about alpha?",
                                            options(2, RetrievalStrategy::Cosine, true));

  EXPECT_EQ(indices_of(chosen), (std::vector<size_t>{3, 2}));
}

TEST_F(QuestionServiceTest, FailingJudgeKeepsRetrievalOrder) {
  EXPECT_CALL(*mock_ollama_client_, chat(_, ResponseFormat::Json))
      .WillOnce(Throw(OllamaError("timeout")));
  DocumentIndex index = index_store_->load("lease");

  auto chosen = question_service_->retrieve(index, "What about alpha?",
                                            options(2, RetrievalStrategy::Cosine, true));

  EXPECT_EQ(indices_of(chosen), (std::vector<size_t>{2, 3}));
}

TEST_F(QuestionServiceTest, SingleResultSkipsJudge) {
  DocumentIndex index = index_store_->load("lease");

  auto chosen = question_service_->retrieve(index, "What about alpha?",
                                            options(1, RetrievalStrategy::Cosine, true));

  EXPECT_EQ(indices_of(chosen), (std::vector<size_t>{2}));
}

TEST_F(QuestionServiceTest, AnswerSendsCitedContext) {
  std::vector<ChatMessage> sent;
  EXPECT_CALL(*mock_ollama_client_, chat(_, ResponseFormat::Text))
      .WillOnce(DoAll(SaveArg<0>(&sent), Return("Alpha is on page 1 (p.1).")));

  auto result = question_service_->answer("lease", "What about alpha?",
                                          options(2, RetrievalStrategy::Cosine));

  EXPECT_EQ(result.answer, "Alpha is on page 1 (p.1).");
  EXPECT_EQ(indices_of(result.sources), (std::vector<size_t>{2, 3}));
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[1].content,
            "Question: What about alpha?\n\nCONTEXTS:\n(p.1) alpha clause\n\n(p.1) alpha clause again");
}

TEST_F(QuestionServiceTest, RerankedAnswerUsesJudgeThenGenerator) {
  InSequence seq;
  EXPECT_CALL(*mock_ollama_client_, chat(_, ResponseFormat::Json)).WillOnce(Return(R"({"order": [1]})"));
  std::vector<ChatMessage> sent;
  EXPECT_CALL(*mock_ollama_client_, chat(_, ResponseFormat::Text))
      .WillOnce(DoAll(SaveArg<0>(&sent), Return("answer")));

  auto result = question_service_->answer("lease", "What about alpha?",
                                          options(2, RetrievalStrategy::Mmr, true));

  EXPECT_EQ(indices_of(result.sources), (std::vector<size_t>{0, 2}));
  EXPECT_THAT(sent[1].content, HasSubstr("CONTEXTS:\n(p.3) gamma clause\n\n(p.1) alpha clause"));
}

TEST_F(QuestionServiceTest, UnindexedDocumentUsesNoIndexFraming) {
  std::vector<ChatMessage> sent;
  EXPECT_CALL(*mock_ollama_client_, chat(_, ResponseFormat::Text))
      .WillOnce(DoAll(SaveArg<0>(&sent), Return("Please upload a readable PDF.")));

  auto result = question_service_->answer("unknown-doc", "What is the rent?");

  EXPECT_EQ(result.answer, "Please upload a readable PDF.");
  EXPECT_TRUE(result.sources.empty());
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[1].content, "Document has no readable index. Question: What is the rent?");
}

TEST_F(QuestionServiceTest, EmptyDocumentEndToEnd) {
  IndexingService indexing(index_store_);
  indexing.index_document("blank", {"", "   "});
  std::vector<ChatMessage> sent;
  EXPECT_CALL(*mock_ollama_client_, chat(_, ResponseFormat::Text))
      .WillOnce(DoAll(SaveArg<0>(&sent), Return("No readable text.")));

  auto result = question_service_->answer("blank", "Who signed?");

  EXPECT_EQ(result.answer, "No readable text.");
  EXPECT_THAT(sent[0].content, HasSubstr("no indexed text"));
}

TEST_F(QuestionServiceTest, EmbeddingFailureIsReported) {
  EXPECT_CALL(*mock_ollama_client_, get_embedding("Who pays?"))
      .WillOnce(Throw(OllamaError("connection refused")));

  EXPECT_THROW(question_service_->answer("lease", "Who pays?"), QuestionServiceError);
}

TEST_F(QuestionServiceTest, RejectsInvalidOptions) {
  EXPECT_THROW(question_service_->answer("lease", "q", options(0, RetrievalStrategy::Mmr)),
               QuestionServiceError);
  EXPECT_THROW(question_service_->answer("lease", "q", options(26, RetrievalStrategy::Mmr)),
               QuestionServiceError);

  QueryOptions bad_lambda;
  bad_lambda.mmr_lambda = 1.5f;
  EXPECT_THROW(QuestionService::validate(bad_lambda), QuestionServiceError);
  EXPECT_NO_THROW(QuestionService::validate(QueryOptions{}));
}

TEST_F(QuestionServiceTest, RejectsEmptyQuestion) {
  EXPECT_THROW(question_service_->answer("lease", "   "), QuestionServiceError);
}

}  // namespace docrag_core
