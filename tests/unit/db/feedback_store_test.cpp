#include <gtest/gtest.h>

#include <fstream>
#include <thread>
#include <vector>

#include "common/utilities_test.hpp"
#include "docrag_core/db/feedback_store.hpp"

namespace docrag_core {

using docrag_tests::TestUtilities;

class FeedbackStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir("docrag_feedback");
    feedback_file_ = temp_dir_ / "feedback" / "relevance.jsonl";
    feedback_store_ = std::make_unique<FeedbackStore>(feedback_file_);
  }

  void TearDown() override {
    feedback_store_.reset();
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  FeedbackRecord sample_record() {
    FeedbackRecord record;
    record.doc_id = "lease";
    record.query = "When is rent due?";
    record.positive_chunk_ids = {2, 5};
    record.negative_chunk_ids = {0};
    record.answer_quality = 4;
    record.notes = "Missed the late fee clause";
    return record;
  }

  std::vector<std::string> read_lines() {
    std::vector<std::string> lines;
    std::ifstream in(feedback_file_);
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
    return lines;
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path feedback_file_;
  std::unique_ptr<FeedbackStore> feedback_store_;
};

TEST_F(FeedbackStoreTest, CreatesParentDirectory) {
  EXPECT_TRUE(std::filesystem::is_directory(temp_dir_ / "feedback"));
}

TEST_F(FeedbackStoreTest, AppendWritesOneJsonLine) {
  feedback_store_->append(sample_record());

  auto lines = read_lines();
  ASSERT_EQ(lines.size(), 1u);
  auto record = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(record["doc_id"], "lease");
  EXPECT_EQ(record["query"], "When is rent due?");
  EXPECT_EQ(record["positive_chunk_ids"], nlohmann::json::array({2, 5}));
  EXPECT_EQ(record["negative_chunk_ids"], nlohmann::json::array({0}));
  EXPECT_EQ(record["answer_quality"], 4);
  EXPECT_EQ(record["notes"], "Missed the late fee clause");
  EXPECT_TRUE(record["ts"].is_string());
}

TEST_F(FeedbackStoreTest, AppendKeepsEarlierRecords) {
  feedback_store_->append(sample_record());
  FeedbackRecord second;
  second.doc_id = "invoice";
  second.query = "Total amount?";
  feedback_store_->append(second);

  auto records = feedback_store_->records();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0]["doc_id"], "lease");
  EXPECT_EQ(records[1]["doc_id"], "invoice");
  EXPECT_TRUE(records[1]["answer_quality"].is_null());
  EXPECT_TRUE(records[1]["positive_chunk_ids"].empty());
  EXPECT_EQ(records[1]["notes"], "");
}

TEST_F(FeedbackStoreTest, ReturnsLineAsWritten) {
  auto written = feedback_store_->append(sample_record());
  auto records = feedback_store_->records();

  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], written);
}

TEST_F(FeedbackStoreTest, TimestampIsUtcIso8601) {
  std::string ts = FeedbackStore::utc_timestamp();

  ASSERT_EQ(ts.size(), 27u);  // 2024-05-01T12:00:00.000123Z
  EXPECT_EQ(ts[4], '-');
  EXPECT_EQ(ts[10], 'T');
  EXPECT_EQ(ts[19], '.');
  EXPECT_EQ(ts.back(), 'Z');
}

TEST_F(FeedbackStoreTest, RejectsQualityOutsideOneToFive) {
  FeedbackRecord record = sample_record();
  record.answer_quality = 0;
  EXPECT_THROW(feedback_store_->append(record), FeedbackStoreError);
  record.answer_quality = 6;
  EXPECT_THROW(feedback_store_->append(record), FeedbackStoreError);

  EXPECT_FALSE(std::filesystem::exists(feedback_file_));
}

TEST_F(FeedbackStoreTest, AcceptsBoundaryQualities) {
  FeedbackRecord record = sample_record();
  record.answer_quality = 1;
  EXPECT_NO_THROW(feedback_store_->append(record));
  record.answer_quality = 5;
  EXPECT_NO_THROW(feedback_store_->append(record));
  EXPECT_EQ(feedback_store_->records().size(), 2u);
}

TEST_F(FeedbackStoreTest, RejectsMissingDocumentAndNegativeIds) {
  FeedbackRecord no_doc = sample_record();
  no_doc.doc_id.clear();
  EXPECT_THROW(feedback_store_->append(no_doc), FeedbackStoreError);

  FeedbackRecord bad_id = sample_record();
  bad_id.negative_chunk_ids = {-1};
  EXPECT_THROW(feedback_store_->append(bad_id), FeedbackStoreError);
}

TEST_F(FeedbackStoreTest, MissingFileHasNoRecords) {
  EXPECT_TRUE(feedback_store_->records().empty());
}

TEST_F(FeedbackStoreTest, MalformedLineIsReported) {
  feedback_store_->append(sample_record());
  {
    std::ofstream out(feedback_file_, std::ios::app);
    out << "{ truncated\n";
  }
  EXPECT_THROW(feedback_store_->records(), FeedbackStoreError);
}

TEST_F(FeedbackStoreTest, ConcurrentAppendsKeepWholeLines) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < 25; ++i) {
        feedback_store_->append(sample_record());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(feedback_store_->records().size(), 100u);
}

}  // namespace docrag_core
