/**
 * @file DiffEngine.hpp
 * @brief Sentence-level diff between two document texts.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include "../DocumentComparison.hpp"
#include "../CancellationToken.hpp"

namespace clausetrail::domain::versioning {

enum class DiffOpType {
    Equal,
    Addition,
    Deletion,
    Modification
};

/**
 * @struct DiffOperation
 * @brief One step of the alignment between two sentence sequences.
 *
 * Equal/Addition/Deletion carry `text`; Modification carries
 * `originalText` and `newText`.
 */
struct DiffOperation {
    DiffOpType type = DiffOpType::Equal;
    std::string text;
    std::string originalText;
    std::string newText;
};

/**
 * @class DiffEngine
 * @brief Stateless domain service. Safe to call from any number of threads.
 *
 * Texts are segmented into sentences, aligned with an LCS table where two
 * sentences match when their word-set Jaccard similarity exceeds
 * kEquivalenceThreshold, and the non-equal steps become DocumentChanges.
 */
class DiffEngine {
public:
    static constexpr double kEquivalenceThreshold = 0.8;
    static constexpr size_t kDescriptionLength = 100;

    /**
     * @brief Splits on end punctuation followed by whitespace and a capital,
     * blank lines, numbered markers ("12. ") and lettered items ("(a) ").
     * @return Trimmed, non-empty segments in document order.
     */
    static std::vector<std::string> splitIntoSentences(const std::string& text);

    /**
     * @brief Case-insensitive Jaccard similarity of the whitespace-separated word sets.
     * @return Value in [0, 1]; two empty texts are identical (1).
     */
    static double textSimilarity(const std::string& a, const std::string& b);

    /**
     * @brief Aligns two sentence sequences.
     * @throws OperationCancelled if the token fires mid-computation.
     */
    static std::vector<DiffOperation> computeDiff(const std::vector<std::string>& original,
                                                  const std::vector<std::string>& compared,
                                                  const CancellationToken& token = CancellationToken());

    /** @brief Keyword lookup, first table that matches wins. Never fails. */
    static Severity assessSeverity(const std::string& text);

    /**
     * @brief Locates searchText in fullText; falls back to a position
     * proportional to approximateIndex when it is not a literal substring.
     */
    static TextLocation calculateTextLocation(const std::string& fullText,
                                              const std::string& searchText,
                                              size_t approximateIndex);

    /** @brief Cuts to maxLength bytes (on a UTF-8 boundary) and appends "...". */
    static std::string truncateText(const std::string& text, size_t maxLength);

    /**
     * @brief Full pipeline: segment, align and materialize the changes.
     * @param nextId Supplies the id of each emitted change.
     */
    static std::vector<DocumentChange> detectChanges(const std::string& originalText,
                                                     const std::string& comparedText,
                                                     const std::function<std::string()>& nextId,
                                                     const CancellationToken& token = CancellationToken());
};

} // namespace clausetrail::domain::versioning
