#include "core/TextAnalysis.hpp"
#include "core/Lexicon.hpp"

#include <algorithm>

namespace presence_mcp {

namespace {

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_word_byte(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c >= 0x80;
}

char lower_ascii(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

} // namespace

std::string TextAnalysis::normalize_whitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (char c : text) {
        if (is_space(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

std::string TextAnalysis::to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), lower_ascii);
    return result;
}

std::vector<std::string> TextAnalysis::tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        auto first = current.find_first_not_of('-');
        auto last = current.find_last_not_of('-');
        if (first != std::string::npos) {
            tokens.push_back(current.substr(first, last - first + 1));
        }
        current.clear();
    };

    for (char c : text) {
        if (is_word_byte(static_cast<unsigned char>(c))) {
            current.push_back(lower_ascii(c));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

int TextAnalysis::stable_score(std::string_view text) {
    unsigned long sum = 0;
    for (char c : text) {
        sum += static_cast<unsigned char>(c);
    }
    return 40 + static_cast<int>(sum % 51);
}

std::size_t TextAnalysis::count_matches(const std::vector<std::string>& tokens,
                                        const std::set<std::string>& terms) {
    return static_cast<std::size_t>(std::count_if(tokens.begin(), tokens.end(),
        [&terms](const std::string& token) { return terms.count(token) > 0; }));
}

std::size_t TextAnalysis::distinct_content_words(const std::vector<std::string>& tokens) {
    const auto& stop = Lexicon::stopwords();
    const auto& generic = Lexicon::generic_terms();

    std::set<std::string> distinct;
    for (const auto& token : tokens) {
        if (stop.count(token) == 0 && generic.count(token) == 0) {
            distinct.insert(token);
        }
    }
    return distinct.size();
}

bool TextAnalysis::contains_phrase(std::string_view haystack, std::string_view needle) {
    std::string normalized_needle = to_lower(normalize_whitespace(needle));
    if (normalized_needle.empty()) {
        return false;
    }
    std::string normalized_haystack = to_lower(normalize_whitespace(haystack));
    return normalized_haystack.find(normalized_needle) != std::string::npos;
}

std::string TextAnalysis::strength_band(int score, int strong_above, int moderate_above) {
    if (score > strong_above) {
        return "Strong";
    } else if (score > moderate_above) {
        return "Moderate";
    }
    return "Weak";
}

int TextAnalysis::clamp_score(int score) {
    return std::clamp(score, 0, 100);
}

int TextAnalysis::percentage(std::size_t part, std::size_t total) {
    if (total == 0) {
        return 0;
    }
    return static_cast<int>((part * 100) / total);
}

} // namespace presence_mcp
