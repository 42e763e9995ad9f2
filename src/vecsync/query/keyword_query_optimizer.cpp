#include "vecsync/query/query_optimizer.h"

#include <algorithm>
#include <cctype>

namespace vecsync {
namespace query {

namespace {

std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n?!.,:;\"'";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool starts_with_word(const std::string& lower, const std::string& prefix) {
    if (lower.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return lower.size() == prefix.size() || !std::isalnum(static_cast<unsigned char>(lower[prefix.size()]));
}

bool ends_with_word(const std::string& lower, const std::string& suffix) {
    if (lower.size() < suffix.size() ||
        lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    size_t pos = lower.size() - suffix.size();
    return pos == 0 || !std::isalnum(static_cast<unsigned char>(lower[pos - 1]));
}

} // namespace

KeywordQueryOptimizer::KeywordQueryOptimizer()
    // Longest phrases first so "give me the document that talks about" wins
    // over "give me".
    : lead_phrases_{
          "give me the document that talks about",
          "give me the file that talks about",
          "there is a document that talks about",
          "i need to find information about",
          "i am looking for a document about",
          "find the document that talks about",
          "find me the document about",
          "find documents about",
          "search for documents about",
          "show me documents about",
          "looking for",
          "search for",
          "find me",
          "show me",
          "give me",
          "find",
      },
      tail_phrases_{
          "give it to me",
          "in the documents",
          "in my files",
          "please",
      },
      filler_words_{"the", "a", "an", "about", "some"} {
}

std::string KeywordQueryOptimizer::optimize(const std::string& query) const {
    std::string current = trim(query);
    if (current.empty()) {
        return query;
    }

    bool changed = true;
    while (changed) {
        changed = false;
        std::string lower = to_lower(current);

        for (const auto& phrase : lead_phrases_) {
            if (starts_with_word(lower, phrase)) {
                current = trim(current.substr(phrase.size()));
                changed = true;
                break;
            }
        }
        if (changed) {
            continue;
        }

        for (const auto& phrase : tail_phrases_) {
            if (ends_with_word(lower, phrase)) {
                current = trim(current.substr(0, current.size() - phrase.size()));
                changed = true;
                break;
            }
        }
        if (changed) {
            continue;
        }

        for (const auto& word : filler_words_) {
            if (starts_with_word(lower, word) && lower.size() > word.size()) {
                current = trim(current.substr(word.size()));
                changed = true;
                break;
            }
        }
    }

    if (current.empty()) {
        return query;
    }
    return current;
}

} // namespace query
} // namespace vecsync
