// EN: Shared CacheStore behavior - glob translation and default bulk removal.
// FR: Comportement partagé de CacheStore - traduction glob et suppression groupée par défaut.

#include "cache/cache_store.hpp"

#include <stdexcept>

namespace MDC {

namespace {

// EN: Translate a glob into an ECMAScript regex. Unterminated classes are taken literally.
// FR: Traduit un glob en regex ECMAScript. Les classes non terminées sont prises littéralement.
std::string globToRegex(const std::string& pattern) {
    static const std::string kRegexSpecials = R"(\^$.|+(){}[]*?)";

    std::string regex;
    regex.reserve(pattern.size() * 2);

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '*') {
            regex += ".*";
        } else if (c == '?') {
            regex += '.';
        } else if (c == '[') {
            const size_t close = pattern.find(']', i + 1);
            if (close == std::string::npos || close == i + 1) {
                regex += "\\[";
                continue;
            }
            std::string body = pattern.substr(i + 1, close - i - 1);
            if (body[0] == '!') {
                body[0] = '^';
            }
            std::string escaped;
            for (char b : body) {
                if (b == '\\' || b == ']') {
                    escaped += '\\';
                }
                escaped += b;
            }
            regex += "[" + escaped + "]";
            i = close;
        } else if (c == '\\' && i + 1 < pattern.size()) {
            ++i;
            if (kRegexSpecials.find(pattern[i]) != std::string::npos) {
                regex += '\\';
            }
            regex += pattern[i];
        } else {
            if (kRegexSpecials.find(c) != std::string::npos) {
                regex += '\\';
            }
            regex += c;
        }
    }
    return regex;
}

} // namespace

std::regex compileGlob(const std::string& pattern) {
    try {
        return std::regex(globToRegex(pattern));
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid glob pattern '" + pattern + "': " + e.what());
    }
}

bool globMatch(const std::string& pattern, const std::string& text) {
    return std::regex_match(text, compileGlob(pattern));
}

size_t CacheStore::removeMatching(const std::string& pattern) {
    size_t removed = 0;
    for (const auto& key : keysMatching(pattern)) {
        if (remove(key)) {
            removed++;
        }
    }
    return removed;
}

} // namespace MDC
