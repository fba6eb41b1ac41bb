/**
 * @file SummarizationService.hpp
 * @brief Interface for text summarization backed by a language model.
 */

#pragma once

#include <string>

namespace localscribe::domain {

class SummarizationService {
public:
    virtual ~SummarizationService() = default;

    /**
     * @brief Produces a concise summary of the given text.
     * @param text Arbitrary text. No length limit is enforced locally.
     * @return The generated summary; never empty as a substitute for an error.
     * @throws ApiError when the model service cannot produce a summary.
     */
    virtual std::string summarize(const std::string& text) = 0;
};

} // namespace localscribe::domain
