#include "docrag_cli/cli_handler.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "docrag_core/extractors/paged_text_extractor.hpp"
#include "docrag_core/llm/ollama_client.hpp"
#include "docrag_core/llm/ollama_connection.hpp"
#include "docrag_core/services/relevance_judge.hpp"

namespace docrag_cli {

namespace {

std::string require_value(int argc, char *argv[], int &i, const std::string &flag) {
  if (i + 1 >= argc) {
    throw CliError("Missing value for " + flag);
  }
  return argv[++i];
}

int parse_int(const std::string &value, const std::string &flag) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

float parse_float(const std::string &value, const std::string &flag) {
  try {
    size_t consumed = 0;
    float parsed = std::stof(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

// "3,7,12" -> {3, 7, 12}
std::vector<int> parse_int_list(const std::string &value, const std::string &flag) {
  std::vector<int> ids;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (item.empty()) {
      continue;
    }
    ids.push_back(parse_int(item, flag));
  }
  return ids;
}

}  // namespace

std::string find_config_path(int argc, char *argv[]) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config" || std::string(argv[i]) == "-c") {
      return argv[i + 1];
    }
  }
  return "";
}

CliHandler::CliHandler(const Config &config) : config_(config) {
  auto connection = std::make_shared<docrag_core::OllamaConnection>(
      config_.ollama_url, std::chrono::seconds(config_.request_timeout_seconds));
  auto ollama_client = std::make_shared<docrag_core::OllamaClient>(
      connection, config_.embedding_model, config_.chat_model, config_.model_options(),
      config_.retry_policy());

  index_store_ = std::make_shared<docrag_core::IndexStore>(config_.index_dir, ollama_client);
  indexing_service_ = std::make_unique<docrag_core::IndexingService>(
      index_store_,
      docrag_core::PageChunker(static_cast<size_t>(config_.chunk_max_chars),
                               static_cast<size_t>(config_.chunk_overlap)));
  auto judge = std::make_shared<docrag_core::RelevanceJudge>(
      ollama_client, static_cast<size_t>(config_.judge_preview_chars));
  question_service_ = std::make_unique<docrag_core::QuestionService>(
      index_store_, ollama_client, judge, static_cast<size_t>(config_.mmr_pool_multiplier));
  feedback_store_ = std::make_unique<docrag_core::FeedbackStore>(config_.feedback_file);
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) const {
  CliOptions options;
  options.query_options = config_.query_options();

  // A global --config may come before the command.
  int first = 1;
  while (first < argc &&
         (std::string(argv[first]) == "--config" || std::string(argv[first]) == "-c")) {
    options.config_path = require_value(argc, argv, first, argv[first]);
    ++first;
  }

  if (first >= argc) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[first];
  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
  } else if (command == "overview" || command == "o") {
    options.command = Command::Overview;
  } else if (command == "ask" || command == "a") {
    options.command = Command::Ask;
  } else if (command == "remove" || command == "rm") {
    options.command = Command::Remove;
  } else if (command == "feedback" || command == "fb") {
    options.command = Command::Feedback;
  } else if (command == "help" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command + ". Run 'help' for usage.");
  }

  for (int i = first + 1; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--config" || flag == "-c") {
      options.config_path = require_value(argc, argv, i, flag);
    } else if (flag == "--doc" || flag == "-d") {
      options.doc_id = require_value(argc, argv, i, flag);
    } else if (flag == "--pages" || flag == "-p") {
      options.pages_path = require_value(argc, argv, i, flag);
    } else if (flag == "--query" || flag == "-q") {
      options.query = require_value(argc, argv, i, flag);
    } else if (flag == "--top-k" || flag == "-k") {
      options.query_options.k = parse_int(require_value(argc, argv, i, flag), flag);
    } else if (flag == "--strategy" || flag == "-s") {
      try {
        options.query_options.strategy =
            docrag_core::retrieval_strategy_from_string(require_value(argc, argv, i, flag));
      } catch (const std::invalid_argument &e) {
        throw CliError(e.what());
      }
    } else if (flag == "--lambda" || flag == "-l") {
      options.query_options.mmr_lambda = parse_float(require_value(argc, argv, i, flag), flag);
    } else if (flag == "--rerank" || flag == "-r") {
      options.query_options.use_llm_rerank = true;
    } else if (flag == "--sources") {
      options.show_sources = true;
    } else if (flag == "--positive") {
      options.positive_chunk_ids = parse_int_list(require_value(argc, argv, i, flag), flag);
    } else if (flag == "--negative") {
      options.negative_chunk_ids = parse_int_list(require_value(argc, argv, i, flag), flag);
    } else if (flag == "--quality") {
      options.answer_quality = parse_int(require_value(argc, argv, i, flag), flag);
    } else if (flag == "--notes") {
      options.notes = require_value(argc, argv, i, flag);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  switch (options.command) {
    case Command::Ingest:
      if (options.doc_id.empty() || options.pages_path.empty()) {
        throw CliError("Ingest requires a document id and a pages file. Usage: ingest --doc <id> --pages <file.txt>");
      }
      break;
    case Command::Overview:
      if (options.pages_path.empty()) {
        throw CliError("Overview requires a pages file. Usage: overview --pages <file.txt>");
      }
      break;
    case Command::Ask:
      if (options.doc_id.empty() || options.query.empty()) {
        throw CliError("Ask requires a document id and a query. Usage: ask --doc <id> --query <question>");
      }
      break;
    case Command::Remove:
      if (options.doc_id.empty()) {
        throw CliError("Remove requires a document id. Usage: remove --doc <id>");
      }
      break;
    case Command::Feedback:
      if (options.doc_id.empty() || options.query.empty()) {
        throw CliError("Feedback requires a document id and the query it rates. Usage: feedback --doc <id> --query <question> [--positive 1,2] [--negative 3] [--quality 1-5]");
      }
      if (options.answer_quality && (*options.answer_quality < docrag_core::FeedbackRecord::MIN_QUALITY ||
                                     *options.answer_quality > docrag_core::FeedbackRecord::MAX_QUALITY)) {
        throw CliError("--quality must be between 1 and 5");
      }
      break;
    default:
      break;
  }
  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Overview:
      handle_overview_command(options);
      break;
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Remove:
      handle_remove_command(options);
      break;
    case Command::Feedback:
      handle_feedback_command(options);
      break;
    case Command::Help:
    default:
      print_help();
      break;
  }
}

std::vector<std::string> CliHandler::read_pages(const std::string &path) const {
  docrag_core::PagedTextExtractor extractor;
  return extractor.read_pages(path);
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  auto pages = read_pages(options.pages_path);
  auto result = indexing_service_->index_document(options.doc_id, pages);
  std::cout << "Indexed " << result.doc_id << ": " << pages.size() << " pages, "
            << result.chunks << " chunks" << std::endl;
}

void CliHandler::handle_overview_command(const CliOptions &options) {
  auto pages = read_pages(options.pages_path);
  auto overview = indexing_service_->overview(pages);
  std::cout << pages.size() << " pages, " << overview.chunks << " chunks" << std::endl;
  for (const auto &entry : overview.entries) {
    std::cout << "  p." << entry.page << ": " << entry.preview << std::endl;
  }
}

void CliHandler::handle_ask_command(const CliOptions &options) {
  auto result = question_service_->answer(options.doc_id, options.query, options.query_options);
  std::cout << result.answer << std::endl;

  if (options.show_sources && !result.sources.empty()) {
    std::cout << "\nSources:" << std::endl;
    for (const auto &source : result.sources) {
      std::cout << "  chunk " << source.index << " (p." << source.page << ")  score "
                << std::fixed << std::setprecision(3) << source.score << std::endl;
    }
  }
}

void CliHandler::handle_remove_command(const CliOptions &options) {
  if (index_store_->remove(options.doc_id)) {
    std::cout << "Removed index for " << options.doc_id << std::endl;
  } else {
    std::cout << "No index found for " << options.doc_id << std::endl;
  }
}

void CliHandler::handle_feedback_command(const CliOptions &options) {
  docrag_core::FeedbackRecord record;
  record.doc_id = options.doc_id;
  record.query = options.query;
  record.positive_chunk_ids = options.positive_chunk_ids;
  record.negative_chunk_ids = options.negative_chunk_ids;
  record.answer_quality = options.answer_quality;
  record.notes = options.notes;

  feedback_store_->append(record);
  std::cout << "Feedback saved to " << feedback_store_->feedback_file().string() << std::endl;
}

void CliHandler::print_help() const {
  std::cout << "docrag - grounded question answering over indexed documents\n\n"
            << "Usage: docrag <command> [options]\n\n"
            << "Commands:\n"
            << "  ingest   (i)   --doc <id> --pages <file.txt>   Chunk, embed and store a document\n"
            << "  overview (o)   --pages <file.txt>              Preview chunking without embedding\n"
            << "  ask      (a)   --doc <id> --query <question>   Answer a question from the index\n"
            << "  remove   (rm)  --doc <id>                      Delete a document's index\n"
            << "  feedback (fb)  --doc <id> --query <question>   Record relevance feedback\n"
            << "  help                                           Show this message\n\n"
            << "Ask options:\n"
            << "  --top-k, -k <n>          Number of passages (1-25, default " << config_.top_k << ")\n"
            << "  --strategy, -s <name>    cosine or mmr (default " << config_.strategy << ")\n"
            << "  --lambda, -l <x>         MMR relevance weight in [0, 1] (default " << config_.mmr_lambda << ")\n"
            << "  --rerank, -r             Let the chat model reorder the passages\n"
            << "  --sources                Print the cited chunks\n\n"
            << "Feedback options:\n"
            << "  --positive <ids>         Helpful chunk ids, comma separated\n"
            << "  --negative <ids>         Unhelpful chunk ids, comma separated\n"
            << "  --quality <1-5>          Answer quality\n"
            << "  --notes <text>           Free-form notes\n\n"
            << "Global options:\n"
            << "  --config, -c <file>      JSON config (or set DOCRAG_CONFIG)\n\n"
            << "Pages files hold one page per form feed, as written by pdftotext." << std::endl;
}

}  // namespace docrag_cli
