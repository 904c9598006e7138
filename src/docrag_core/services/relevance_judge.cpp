#include "docrag_core/services/relevance_judge.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "docrag_core/extractors/text_utils.hpp"

namespace docrag_core {

namespace {

const char *const JUDGE_SYSTEM_PROMPT =
    "You rank document excerpts by how well they help answer a question. "
    "Reply with JSON only, in the form {\"ranking\": [<index>, ...]}, "
    "most relevant excerpt first. Use the 0-based indices shown in brackets.";

const char *const RANKING_KEYS[] = {"ranking", "order", "indices"};

// Returns the first balanced [...] span in `text`, or an empty string.
std::string first_bracketed_array(const std::string &text) {
  const size_t open = text.find('[');
  if (open == std::string::npos) {
    return "";
  }
  int depth = 0;
  for (size_t i = open; i < text.size(); ++i) {
    if (text[i] == '[') {
      ++depth;
    } else if (text[i] == ']') {
      if (--depth == 0) {
        return text.substr(open, i - open + 1);
      }
    }
  }
  return "";
}

const nlohmann::json *find_ranking_array(const nlohmann::json &parsed) {
  if (parsed.is_array()) {
    return &parsed;
  }
  if (parsed.is_object()) {
    for (const char *key : RANKING_KEYS) {
      auto it = parsed.find(key);
      if (it != parsed.end() && it->is_array()) {
        return &(*it);
      }
    }
  }
  return nullptr;
}

}  // namespace

RelevanceJudge::RelevanceJudge(std::shared_ptr<OllamaClient> ollama_client, size_t preview_chars)
    : ollama_client_(std::move(ollama_client)), preview_chars_(preview_chars) {}

std::vector<size_t> RelevanceJudge::identity(size_t k) {
  std::vector<size_t> order(k);
  for (size_t i = 0; i < k; ++i) {
    order[i] = i;
  }
  return order;
}

std::string RelevanceJudge::preview(const std::string &text) const {
  return textutil::single_line(textutil::truncate_chars(textutil::to_valid_utf8(text), preview_chars_));
}

std::vector<ChatMessage> RelevanceJudge::build_messages(const std::string &question,
                                                        const std::vector<std::string> &candidates,
                                                        size_t k) const {
  std::ostringstream user;
  user << "Question: " << question << "\n\nExcerpts:\n";
  for (size_t i = 0; i < candidates.size(); ++i) {
    user << "[" << i << "] " << preview(candidates[i]) << "\n\n";
  }
  user << "Return the indices of the " << k << " most relevant excerpts.";

  return {{"system", JUDGE_SYSTEM_PROMPT}, {"user", user.str()}};
}

RelevanceJudge::RankingParse RelevanceJudge::parse_ranking(const std::string &response,
                                                           size_t candidate_count) {
  RankingParse result;

  nlohmann::json parsed = nlohmann::json::parse(response, nullptr, false);
  const nlohmann::json *ranking = parsed.is_discarded() ? nullptr : find_ranking_array(parsed);
  if (ranking == nullptr) {
    const std::string embedded = first_bracketed_array(response);
    if (embedded.empty()) {
      return result;
    }
    parsed = nlohmann::json::parse(embedded, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
      return result;
    }
    ranking = &parsed;
  }

  std::vector<bool> seen(candidate_count, false);
  for (const auto &entry : *ranking) {
    if (!entry.is_number_integer()) {
      continue;
    }
    const long long idx = entry.get<long long>();
    if (idx < 0 || static_cast<unsigned long long>(idx) >= candidate_count) {
      continue;
    }
    if (seen[static_cast<size_t>(idx)]) {
      continue;
    }
    seen[static_cast<size_t>(idx)] = true;
    result.value.push_back(static_cast<size_t>(idx));
  }
  result.ok = !result.value.empty();
  return result;
}

std::vector<size_t> RelevanceJudge::rerank(const std::string &question,
                                           const std::vector<std::string> &candidates,
                                           size_t k) const {
  k = std::min(k, candidates.size());
  if (k == 0) {
    return {};
  }
  if (!ollama_client_) {
    return identity(k);
  }

  RankingParse parsed;
  try {
    const std::string response =
        ollama_client_->chat(build_messages(question, candidates, k), ResponseFormat::Json);
    parsed = parse_ranking(response, candidates.size());
  } catch (const std::exception &e) {
    std::cerr << "[RelevanceJudge] Rerank failed, keeping original order: " << e.what()
              << std::endl;
    return identity(k);
  }

  if (!parsed.ok) {
    std::cerr << "[RelevanceJudge] No usable ranking in response, keeping original order"
              << std::endl;
    return identity(k);
  }

  std::vector<size_t> order = std::move(parsed.value);
  if (order.size() > k) {
    order.resize(k);
  }
  // Fill up with unmentioned candidates in their original order.
  std::vector<bool> used(candidates.size(), false);
  for (size_t idx : order) {
    used[idx] = true;
  }
  for (size_t i = 0; i < candidates.size() && order.size() < k; ++i) {
    if (!used[i]) {
      order.push_back(i);
    }
  }
  return order;
}

}  // namespace docrag_core
