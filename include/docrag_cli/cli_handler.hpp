#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docrag_cli/config.hpp"
#include "docrag_core/db/feedback_store.hpp"
#include "docrag_core/services/indexing_service.hpp"
#include "docrag_core/services/question_service.hpp"

namespace docrag_cli
{

  enum class Command
  {
    Ingest,
    Overview,
    Ask,
    Remove,
    Feedback,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path;
    std::string doc_id;
    std::string pages_path;
    std::string query;
    docrag_core::QueryOptions query_options;
    bool show_sources = false;

    // Feedback
    std::vector<int> positive_chunk_ids;
    std::vector<int> negative_chunk_ids;
    std::optional<int> answer_quality;
    std::string notes;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  // Parses arguments that are needed before the config is known.
  std::string find_config_path(int argc, char *argv[]);

  class CliHandler
  {
  public:
    explicit CliHandler(const Config &config);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments; query options start from the config defaults
    CliOptions parse_arguments(int argc, char *argv[]) const;

    // Execute command
    void execute_command(const CliOptions &options);

  private:
    Config config_;
    std::shared_ptr<docrag_core::IndexStore> index_store_;
    std::unique_ptr<docrag_core::IndexingService> indexing_service_;
    std::unique_ptr<docrag_core::QuestionService> question_service_;
    std::unique_ptr<docrag_core::FeedbackStore> feedback_store_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_overview_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_remove_command(const CliOptions &options);
    void handle_feedback_command(const CliOptions &options);
    void print_help() const;

    std::vector<std::string> read_pages(const std::string &path) const;
  };

} // namespace docrag_cli
