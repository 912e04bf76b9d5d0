#pragma once

#include <memory>
#include <string>

#include "ragline_core/llm/provider.hpp"
#include "ragline_core/services/metadata_filter.hpp"
#include "ragline_core/services/retriever.hpp"

namespace ragline_core {

struct AnsweringOptions {
  static constexpr const char *DEFAULT_INSTRUCTION =
      "You are a concise assistant. Answer the question using only the provided context. "
      "Cite the fragments you used as [n]. If the context does not contain the answer, say "
      "that there is not enough information.";

  int top_k = Retriever::DEFAULT_TOP_K;
  // Budget for the assembled context, in characters (code points).
  size_t max_context_chars = 4000;
  std::string instruction = DEFAULT_INSTRUCTION;
};

struct AnswerResult {
  std::string answer;
  // Fragments that made it into the context, in ranked order.
  RetrievalResult sources;
};

/**
 * @class AnsweringPipeline
 * @brief Retriever -> bounded context -> GenerationProvider.
 *
 * Generation is invoked even when nothing was retrieved; the generator is
 * expected to say it lacks information. Provider failures surface as
 * GenerationUnavailable.
 */
class AnsweringPipeline {
 public:
  AnsweringPipeline(std::shared_ptr<const Retriever> retriever,
                    std::shared_ptr<GenerationProvider> generator,
                    AnsweringOptions options = {});

  std::string answer(const std::string &question) const;
  AnswerResult answer_with_sources(const std::string &question,
                                   const MetadataFilter &filter = MetadataFilter()) const;

  /**
   * @brief Numbers fragments as "[n] text", separated by blank lines, and cuts
   *        the result at max_chars code points.
   * @param used Set to the number of fragments that appear in the context.
   */
  static std::string assemble_context(const RetrievalResult &fragments,
                                      size_t max_chars,
                                      size_t *used = nullptr);

  const AnsweringOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<const Retriever> retriever_;
  std::shared_ptr<GenerationProvider> generator_;
  AnsweringOptions options_;
};

}  // namespace ragline_core
