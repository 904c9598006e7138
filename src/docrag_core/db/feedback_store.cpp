#include "docrag_core/db/feedback_store.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace docrag_core {

FeedbackStore::FeedbackStore(const std::filesystem::path &feedback_file)
    : feedback_file_(feedback_file) {
  if (feedback_file_.empty()) {
    throw FeedbackStoreError("Feedback file path cannot be empty");
  }
  if (feedback_file_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(feedback_file_.parent_path(), ec);
    if (ec) {
      throw FeedbackStoreError("Could not create feedback directory " +
                               feedback_file_.parent_path().string() + ": " + ec.message());
    }
  }
}

void FeedbackStore::validate(const FeedbackRecord &record) {
  if (record.doc_id.empty()) {
    throw FeedbackStoreError("Feedback requires a document id");
  }
  if (record.answer_quality &&
      (*record.answer_quality < FeedbackRecord::MIN_QUALITY ||
       *record.answer_quality > FeedbackRecord::MAX_QUALITY)) {
    throw FeedbackStoreError("answer_quality must be between 1 and 5, got " +
                             std::to_string(*record.answer_quality));
  }
  for (int id : record.positive_chunk_ids) {
    if (id < 0) {
      throw FeedbackStoreError("Chunk ids cannot be negative: " + std::to_string(id));
    }
  }
  for (int id : record.negative_chunk_ids) {
    if (id < 0) {
      throw FeedbackStoreError("Chunk ids cannot be negative: " + std::to_string(id));
    }
  }
}

// ISO 8601 with microseconds, e.g. 2024-05-01T12:00:00.000123Z
std::string FeedbackStore::utc_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
      1000000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(6) << std::setfill('0')
      << micros << "Z";
  return out.str();
}

nlohmann::json FeedbackStore::append(const FeedbackRecord &record) {
  validate(record);

  nlohmann::json line = {
      {"doc_id", record.doc_id},
      {"query", record.query},
      {"positive_chunk_ids", record.positive_chunk_ids},
      {"negative_chunk_ids", record.negative_chunk_ids},
      {"answer_quality", nullptr},
      {"notes", record.notes},
      {"ts", utc_timestamp()},
  };
  if (record.answer_quality) {
    line["answer_quality"] = *record.answer_quality;
  }
  const std::string payload = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard<std::mutex> lock(write_mutex_);
  std::ofstream out(feedback_file_, std::ios::binary | std::ios::app);
  if (!out.is_open()) {
    throw FeedbackStoreError("Could not open feedback file: " + feedback_file_.string());
  }
  out << payload << '\n';
  out.flush();
  if (!out) {
    throw FeedbackStoreError("Failed to write feedback file: " + feedback_file_.string());
  }
  std::cout << "[Feedback] Recorded feedback for document " << record.doc_id << std::endl;
  return line;
}

std::vector<nlohmann::json> FeedbackStore::records() const {
  std::vector<nlohmann::json> result;
  std::error_code ec;
  if (!std::filesystem::exists(feedback_file_, ec) && !ec) {
    return result;
  }
  std::ifstream in(feedback_file_, std::ios::binary);
  if (ec || !in.is_open()) {
    throw FeedbackStoreError("Could not open feedback file: " + feedback_file_.string());
  }

  std::string text;
  size_t line_number = 0;
  while (std::getline(in, text)) {
    ++line_number;
    if (text.empty()) {
      continue;
    }
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
      throw FeedbackStoreError("Malformed feedback line " + std::to_string(line_number) + " in " +
                               feedback_file_.string());
    }
    result.push_back(std::move(parsed));
  }
  return result;
}

}  // namespace docrag_core
