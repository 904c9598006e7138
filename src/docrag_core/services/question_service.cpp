#include "docrag_core/services/question_service.hpp"

#include <algorithm>
#include <iostream>

#include "docrag_core/extractors/text_utils.hpp"
#include "docrag_core/retrieval/mmr_diversifier.hpp"
#include "docrag_core/retrieval/similarity_ranker.hpp"
#include "docrag_core/services/context_assembler.hpp"

namespace docrag_core {

QuestionService::QuestionService(std::shared_ptr<IndexStore> index_store,
                                 std::shared_ptr<OllamaClient> ollama_client,
                                 std::shared_ptr<RelevanceJudge> judge,
                                 size_t mmr_pool_multiplier)
    : index_store_(std::move(index_store)),
      ollama_client_(std::move(ollama_client)),
      judge_(std::move(judge)),
      mmr_pool_multiplier_(std::max<size_t>(1, mmr_pool_multiplier)) {}

void QuestionService::validate(const QueryOptions &options) {
  if (options.k < QueryOptions::MIN_K || options.k > QueryOptions::MAX_K) {
    throw QuestionServiceError("k must be between " + std::to_string(QueryOptions::MIN_K) +
                               " and " + std::to_string(QueryOptions::MAX_K) + ", got " +
                               std::to_string(options.k));
  }
  if (!(options.mmr_lambda >= 0.0f && options.mmr_lambda <= 1.0f)) {
    throw QuestionServiceError("mmr_lambda must be within [0, 1], got " +
                               std::to_string(options.mmr_lambda));
  }
}

std::vector<QuestionService::RetrievedChunk> QuestionService::retrieve(
    const DocumentIndex &index, const std::string &question, const QueryOptions &options) {
  validate(options);
  std::vector<RetrievedChunk> chosen;
  if (index.empty()) {
    return chosen;
  }

  const std::vector<float> query = retrieval::normalize(ollama_client_->get_embedding(question));
  retrieval::SimilarityRanker ranker(index);
  const std::vector<retrieval::ScoredIndex> ranked = ranker.rank(query);

  const size_t k = std::min(static_cast<size_t>(options.k), ranked.size());
  if (options.strategy == RetrievalStrategy::Cosine) {
    for (size_t i = 0; i < k; ++i) {
      chosen.push_back({ranked[i].index, index.pages[ranked[i].index], ranked[i].score});
    }
  } else {
    // MMR over the top of the cosine ranking; positions map back through
    // `ranked` exactly once.
    const size_t pool = std::min(ranked.size(), k * mmr_pool_multiplier_);
    std::vector<std::vector<float>> candidates;
    candidates.reserve(pool);
    for (size_t i = 0; i < pool; ++i) {
      candidates.push_back(ranker.normalized_vectors()[ranked[i].index]);
    }
    retrieval::MmrDiversifier mmr(options.mmr_lambda);
    for (size_t pos : mmr.select(candidates, query, k)) {
      chosen.push_back({ranked[pos].index, index.pages[ranked[pos].index], ranked[pos].score});
    }
  }

  if (options.use_llm_rerank && judge_ && chosen.size() > 1) {
    std::vector<std::string> texts;
    texts.reserve(chosen.size());
    for (const auto &c : chosen) {
      texts.push_back(index.texts[c.index]);
    }
    std::vector<RetrievedChunk> reordered;
    reordered.reserve(chosen.size());
    for (size_t pos : judge_->rerank(question, texts, chosen.size())) {
      reordered.push_back(chosen[pos]);
    }
    chosen = std::move(reordered);
  }
  return chosen;
}

QuestionService::AnswerResult QuestionService::answer(const std::string &doc_id,
                                                      const std::string &question,
                                                      const QueryOptions &options) {
  validate(options);
  if (textutil::trim(question).empty()) {
    throw QuestionServiceError("Question cannot be empty");
  }

  try {
    const DocumentIndex index = index_store_->load(doc_id);
    if (index.empty()) {
      std::cout << "[Question] Document " << doc_id << " has no indexed content" << std::endl;
      return {ollama_client_->chat(ContextAssembler::build_no_index_messages(question),
                                   ResponseFormat::Text),
              {}};
    }

    std::vector<RetrievedChunk> sources = retrieve(index, question, options);
    std::vector<size_t> selected;
    selected.reserve(sources.size());
    for (const auto &s : sources) {
      selected.push_back(s.index);
    }

    std::cout << "[Question] Answering from " << selected.size() << " of " << index.size()
              << " chunks (" << to_string(options.strategy)
              << (options.use_llm_rerank ? ", reranked" : "") << ")" << std::endl;
    const std::string context = ContextAssembler::render_context(index, selected);
    std::string answer_text = ollama_client_->chat(
        ContextAssembler::build_answer_messages(question, context), ResponseFormat::Text);
    return {std::move(answer_text), std::move(sources)};

  } catch (const QuestionServiceError &) {
    throw;
  } catch (const std::exception &e) {
    throw QuestionServiceError("Failed to answer question: " + std::string(e.what()));
  }
}

}  // namespace docrag_core
