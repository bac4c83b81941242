/**
 * @file DiffEngine.cpp
 * @brief Implementation of DiffEngine.
 */

#include "domain/versioning/services/DiffEngine.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace clausetrail::domain::versioning {

namespace {

using WordSet = std::unordered_set<std::string>;

const std::array<const char*, 13> kHighRiskKeywords = {
    "liability", "penalty", "termination", "breach", "damages", "indemnify",
    "payment", "fee", "cost", "price", "amount", "obligation", "responsibility"
};

const std::array<const char*, 9> kMediumRiskKeywords = {
    "notice", "consent", "approval", "right", "privilege", "access",
    "confidential", "proprietary", "intellectual property"
};

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string toLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

WordSet wordSet(const std::string& text) {
    WordSet words;
    std::string lower = toLower(text);
    size_t i = 0;
    while (i < lower.size()) {
        while (i < lower.size() && isSpace(lower[i])) ++i;
        size_t start = i;
        while (i < lower.size() && !isSpace(lower[i])) ++i;
        if (i > start) words.insert(lower.substr(start, i - start));
    }
    return words;
}

double jaccard(const WordSet& a, const WordSet& b) {
    if (a.empty() && b.empty()) return 1.0;
    size_t intersection = 0;
    for (const auto& w : a) {
        if (b.count(w)) ++intersection;
    }
    size_t unionSize = a.size() + b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

// Tries every boundary rule at position q. Returns the end of the separator
// (equal to q for zero-width boundaries) or npos when no rule applies.
size_t matchBoundary(const std::string& s, size_t q) {
    const size_t n = s.size();

    // ". Next" : punctuation, whitespace run, capital letter. Whitespace is consumed.
    if (q > 0 && (s[q - 1] == '.' || s[q - 1] == '!' || s[q - 1] == '?') && q < n && isSpace(s[q])) {
        size_t r = q;
        while (r < n && isSpace(s[r])) ++r;
        if (r < n && s[r] >= 'A' && s[r] <= 'Z') return r;
    }
    // blank line
    if (q >= 2 && s[q - 1] == '\n' && s[q - 2] == '\n') return q;
    // "12. "
    if (q >= 3 && isSpace(s[q - 1]) && s[q - 2] == '.' &&
        std::isdigit(static_cast<unsigned char>(s[q - 3]))) {
        return q;
    }
    // "(a) "
    if (q >= 4 && isSpace(s[q - 1]) && s[q - 2] == ')' &&
        s[q - 3] >= 'a' && s[q - 3] <= 'z' && s[q - 4] == '(') {
        return q;
    }
    return std::string::npos;
}

} // namespace

std::vector<std::string> DiffEngine::splitIntoSentences(const std::string& text) {
    std::vector<std::string> raw;
    const size_t n = text.size();
    size_t p = 0;
    size_t q = 0;
    while (q < n) {
        size_t e = matchBoundary(text, q);
        if (e == std::string::npos || e == p) {
            ++q;
            continue;
        }
        raw.push_back(text.substr(p, q - p));
        p = e;
        q = p;
    }
    raw.push_back(text.substr(p));

    std::vector<std::string> sentences;
    for (const auto& piece : raw) {
        std::string trimmed = trim(piece);
        if (!trimmed.empty()) sentences.push_back(std::move(trimmed));
    }
    return sentences;
}

double DiffEngine::textSimilarity(const std::string& a, const std::string& b) {
    return jaccard(wordSet(a), wordSet(b));
}

std::vector<DiffOperation> DiffEngine::computeDiff(const std::vector<std::string>& original,
                                                   const std::vector<std::string>& compared,
                                                   const CancellationToken& token) {
    const size_t n = original.size();
    const size_t m = compared.size();

    std::vector<WordSet> originalWords;
    std::vector<WordSet> comparedWords;
    originalWords.reserve(n);
    comparedWords.reserve(m);
    for (const auto& s : original) originalWords.push_back(wordSet(s));
    for (const auto& s : compared) comparedWords.push_back(wordSet(s));

    // Equivalence is evaluated once per cell and reused by the backtrack.
    std::vector<unsigned char> equivalent(n * m, 0);
    std::vector<int> dp((n + 1) * (m + 1), 0);
    auto cell = [m](size_t i, size_t j) { return i * (m + 1) + j; };

    for (size_t i = 1; i <= n; ++i) {
        token.throwIfCancelled();
        for (size_t j = 1; j <= m; ++j) {
            if (jaccard(originalWords[i - 1], comparedWords[j - 1]) > kEquivalenceThreshold) {
                equivalent[(i - 1) * m + (j - 1)] = 1;
                dp[cell(i, j)] = dp[cell(i - 1, j - 1)] + 1;
            } else {
                dp[cell(i, j)] = std::max(dp[cell(i - 1, j)], dp[cell(i, j - 1)]);
            }
        }
    }

    std::vector<DiffOperation> reversed;
    size_t i = n;
    size_t j = m;
    size_t steps = 0;
    while (i > 0 || j > 0) {
        if (++steps % 1024 == 0) token.throwIfCancelled();

        DiffOperation op;
        if (i > 0 && j > 0 && equivalent[(i - 1) * m + (j - 1)]) {
            if (original[i - 1] == compared[j - 1]) {
                op.type = DiffOpType::Equal;
                op.text = original[i - 1];
            } else {
                op.type = DiffOpType::Modification;
                op.originalText = original[i - 1];
                op.newText = compared[j - 1];
            }
            --i;
            --j;
        } else if (i > 0 && (j == 0 || dp[cell(i - 1, j)] >= dp[cell(i, j - 1)])) {
            op.type = DiffOpType::Deletion;
            op.text = original[i - 1];
            --i;
        } else {
            op.type = DiffOpType::Addition;
            op.text = compared[j - 1];
            --j;
        }
        reversed.push_back(std::move(op));
    }

    return std::vector<DiffOperation>(reversed.rbegin(), reversed.rend());
}

Severity DiffEngine::assessSeverity(const std::string& text) {
    std::string lower = toLower(text);
    for (const char* keyword : kHighRiskKeywords) {
        if (lower.find(keyword) != std::string::npos) return Severity::High;
    }
    for (const char* keyword : kMediumRiskKeywords) {
        if (lower.find(keyword) != std::string::npos) return Severity::Medium;
    }
    return Severity::Low;
}

TextLocation DiffEngine::calculateTextLocation(const std::string& fullText,
                                               const std::string& searchText,
                                               size_t approximateIndex) {
    size_t start = fullText.find(searchText);
    if (start == std::string::npos) {
        // Proportional estimate: operation index as a percentage of the text.
        start = static_cast<size_t>((static_cast<double>(approximateIndex) / 100.0) *
                                    static_cast<double>(fullText.size()));
        start = std::min(start, fullText.size());
    }
    return TextLocation{start, start + searchText.size()};
}

std::string DiffEngine::truncateText(const std::string& text, size_t maxLength) {
    if (text.size() <= maxLength) {
        return text;
    }
    size_t cut = maxLength;
    // Do not split a multi-byte UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

std::vector<DocumentChange> DiffEngine::detectChanges(const std::string& originalText,
                                                      const std::string& comparedText,
                                                      const std::function<std::string()>& nextId,
                                                      const CancellationToken& token) {
    std::vector<DocumentChange> changes;

    auto originalSentences = splitIntoSentences(originalText);
    auto comparedSentences = splitIntoSentences(comparedText);
    auto operations = computeDiff(originalSentences, comparedSentences, token);

    size_t originalIndex = 0;
    size_t comparedIndex = 0;

    for (const auto& op : operations) {
        DocumentChange change;
        switch (op.type) {
            case DiffOpType::Deletion:
                change.id = nextId();
                change.type = ChangeType::Deletion;
                change.originalText = op.text;
                change.location = calculateTextLocation(originalText, op.text, originalIndex);
                change.severity = assessSeverity(op.text);
                change.description = "Deleted text: \"" + truncateText(op.text, kDescriptionLength) + "\"";
                changes.push_back(std::move(change));
                ++originalIndex;
                break;

            case DiffOpType::Addition:
                change.id = nextId();
                change.type = ChangeType::Addition;
                change.newText = op.text;
                change.location = calculateTextLocation(comparedText, op.text, comparedIndex);
                change.severity = assessSeverity(op.text);
                change.description = "Added text: \"" + truncateText(op.text, kDescriptionLength) + "\"";
                changes.push_back(std::move(change));
                ++comparedIndex;
                break;

            case DiffOpType::Modification:
                change.id = nextId();
                change.type = ChangeType::Modification;
                change.originalText = op.originalText;
                change.newText = op.newText;
                change.location = calculateTextLocation(comparedText, op.newText, comparedIndex);
                change.severity = assessSeverity(op.newText);
                change.description = "Modified text from \"" +
                                     truncateText(op.originalText, kDescriptionLength / 2) + "\" to \"" +
                                     truncateText(op.newText, kDescriptionLength / 2) + "\"";
                changes.push_back(std::move(change));
                ++originalIndex;
                ++comparedIndex;
                break;

            case DiffOpType::Equal:
                ++originalIndex;
                ++comparedIndex;
                break;
        }
    }

    return changes;
}

} // namespace clausetrail::domain::versioning
