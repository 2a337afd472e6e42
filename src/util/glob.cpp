#include <treecopy/glob.hpp>

namespace treecopy {

namespace {

enum class ClassMatch { Hit, Miss, Unterminated };

// Evaluate the bracket expression starting at pat[start] == '['.
// On Hit/Miss, `end` is set to the index just past the closing ']'.
ClassMatch match_class(const std::string& pat, size_t start, char c, size_t& end) {
    size_t i = start + 1;
    bool negate = false;
    if (i < pat.size() && pat[i] == '!') {
        negate = true;
        i++;
    }

    // A ']' right after '[' or '[!' is a member, not the terminator
    size_t close = i;
    if (close < pat.size() && pat[close] == ']') close++;
    while (close < pat.size() && pat[close] != ']') close++;
    if (close >= pat.size()) return ClassMatch::Unterminated;

    auto uc = static_cast<unsigned char>(c);
    bool hit = false;
    for (size_t k = i; k < close;) {
        if (k + 2 < close && pat[k + 1] == '-') {
            auto lo = static_cast<unsigned char>(pat[k]);
            auto hi = static_cast<unsigned char>(pat[k + 2]);
            if (lo <= uc && uc <= hi) hit = true;
            k += 3;
        } else {
            if (pat[k] == c) hit = true;
            k++;
        }
    }

    end = close + 1;
    return hit != negate ? ClassMatch::Hit : ClassMatch::Miss;
}

} // namespace

bool glob_match(const std::string& pattern, const std::string& candidate) {
    size_t p = 0;
    size_t s = 0;
    // Resume point of the most recent '*': pattern index after it and the
    // candidate index it is currently assumed to have consumed up to.
    size_t star_p = std::string::npos;
    size_t star_s = 0;

    while (s < candidate.size()) {
        if (p < pattern.size()) {
            char pc = pattern[p];

            if (pc == '*') {
                while (p < pattern.size() && pattern[p] == '*') p++;
                if (p == pattern.size()) return true;
                star_p = p;
                star_s = s;
                continue;
            }

            if (pc == '?') {
                p++;
                s++;
                continue;
            }

            if (pc == '[') {
                size_t end = 0;
                auto m = match_class(pattern, p, candidate[s], end);
                if (m == ClassMatch::Hit) {
                    p = end;
                    s++;
                    continue;
                }
                if (m == ClassMatch::Unterminated && candidate[s] == '[') {
                    p++;
                    s++;
                    continue;
                }
            } else if (pc == candidate[s]) {
                p++;
                s++;
                continue;
            }
        }

        // Mismatch: let the last '*' swallow one more character
        if (star_p == std::string::npos) return false;
        p = star_p;
        s = ++star_s;
    }

    while (p < pattern.size() && pattern[p] == '*') p++;
    return p == pattern.size();
}

bool glob_match_any(const std::set<std::string>& patterns,
                    const std::string& candidate) {
    for (const auto& pat : patterns) {
        if (glob_match(pat, candidate)) return true;
    }
    return false;
}

} // namespace treecopy
