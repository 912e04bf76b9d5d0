#include "ragline_core/services/answering_pipeline.hpp"

#include <utf8.h>

#include <cstddef>
#include <iostream>

#include "ragline_core/errors.hpp"

namespace ragline_core {

AnsweringPipeline::AnsweringPipeline(std::shared_ptr<const Retriever> retriever,
                                     std::shared_ptr<GenerationProvider> generator,
                                     AnsweringOptions options)
    : retriever_(std::move(retriever)), generator_(std::move(generator)), options_(options) {
  if (!retriever_ || !generator_) {
    throw InvalidConfiguration("AnsweringPipeline requires a retriever and a generator");
  }
  if (options_.top_k <= 0) {
    throw InvalidConfiguration("top_k must be greater than 0");
  }
}

std::string AnsweringPipeline::assemble_context(const RetrievalResult &fragments,
                                                size_t max_chars,
                                                size_t *used) {
  std::string context;
  size_t remaining = max_chars;
  size_t count = 0;

  for (size_t i = 0; i < fragments.size() && remaining > 0; ++i) {
    // Adopted indexes may hold text that never went through the fragmenter.
    std::string piece = (i == 0 ? "" : "\n\n") + ("[" + std::to_string(i + 1) + "] ") +
                        utf8::replace_invalid(fragments[i].fragment.text);
    const size_t length = static_cast<size_t>(utf8::distance(piece.begin(), piece.end()));
    ++count;
    if (length <= remaining) {
      context += piece;
      remaining -= length;
      continue;
    }
    auto cut = piece.begin();
    utf8::advance(cut, remaining, piece.end());
    context.append(piece.begin(), cut);
    remaining = 0;
  }

  if (used) {
    *used = count;
  }
  return context;
}

std::string AnsweringPipeline::answer(const std::string &question) const {
  return answer_with_sources(question).answer;
}

AnswerResult AnsweringPipeline::answer_with_sources(const std::string &question,
                                                    const MetadataFilter &filter) const {
  RetrievalResult ranked;
  try {
    ranked = retriever_->retrieve(question, options_.top_k, filter);
  } catch (const EmptyIndex &) {
    std::cout << "Index is empty; answering without context" << std::endl;
  }

  size_t used = 0;
  Prompt prompt;
  prompt.instruction = options_.instruction;
  prompt.context = assemble_context(ranked, options_.max_context_chars, &used);
  prompt.question = question;
  ranked.erase(ranked.begin() + static_cast<std::ptrdiff_t>(used), ranked.end());

  AnswerResult result;
  try {
    result.answer = generator_->generate(prompt);
  } catch (const ProviderError &e) {
    throw GenerationUnavailable(e.what(), e.retryable());
  } catch (const std::exception &e) {
    throw GenerationUnavailable(std::string("Generation provider failed: ") + e.what(), false);
  }
  result.sources = std::move(ranked);
  return result;
}

}  // namespace ragline_core
