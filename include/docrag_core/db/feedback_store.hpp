#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docrag_core {

class FeedbackStoreError : public std::exception {
 public:
  explicit FeedbackStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Relevance judgement on one answered query. Chunk ids are indices into the
// document's index.
struct FeedbackRecord {
  static constexpr int MIN_QUALITY = 1;
  static constexpr int MAX_QUALITY = 5;

  std::string doc_id;
  std::string query;
  std::vector<int> positive_chunk_ids;
  std::vector<int> negative_chunk_ids;
  std::optional<int> answer_quality;
  std::string notes;
};

/**
 * @brief Append-only JSON Lines log of relevance feedback.
 *
 * Each record becomes one line with a UTC "ts" added. Lines are only ever
 * appended, so the file can be tailed or replayed later.
 */
class FeedbackStore {
 public:
  explicit FeedbackStore(const std::filesystem::path &feedback_file);

  FeedbackStore(const FeedbackStore &) = delete;
  FeedbackStore &operator=(const FeedbackStore &) = delete;

  // Validates and appends the record; returns the line as written.
  nlohmann::json append(const FeedbackRecord &record);

  // Every stored line, oldest first. A missing file has no records.
  std::vector<nlohmann::json> records() const;

  static void validate(const FeedbackRecord &record);
  static std::string utc_timestamp();

  const std::filesystem::path &feedback_file() const {
    return feedback_file_;
  }

 private:
  std::filesystem::path feedback_file_;
  std::mutex write_mutex_;
};

}  // namespace docrag_core
