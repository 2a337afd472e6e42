#include <treecopy/ignore_rules.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace treecopy {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

// Structural UTF-8 check: lead/continuation byte layout, no overlongs,
// no surrogates, nothing above U+10FFFF.
static bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) { i++; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; k++) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

void IgnoreRules::add_line(const std::string& raw) {
    std::string pattern = trim(raw);
    if (pattern.empty() || pattern[0] == '#') return;

    if (pattern[0] == '/') pattern.erase(0, 1);

    if (!pattern.empty() && pattern.back() == '/') {
        pattern.pop_back();
        directory_patterns_.insert(std::move(pattern));
    } else {
        patterns_.insert(std::move(pattern));
    }
}

IgnoreRules IgnoreRules::parse(const std::vector<std::string>& lines) {
    IgnoreRules rules;
    for (const auto& line : lines) {
        rules.add_line(line);
    }
    return rules;
}

IgnoreRules IgnoreRules::parse_text(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
    }
    return parse(lines);
}

Result<IgnoreRules> IgnoreRules::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return TreecopyError{TreecopyError::IO,
            "marker file is not a regular file: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return TreecopyError{TreecopyError::IO,
            "cannot open marker file: " + path.string()};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return TreecopyError{TreecopyError::IO,
            "error reading marker file: " + path.string()};
    }

    std::string text = ss.str();
    if (!is_valid_utf8(text)) {
        return TreecopyError{TreecopyError::Parse,
            "marker file is not valid UTF-8: " + path.string()};
    }

    return Result<IgnoreRules>::ok(parse_text(text));
}

void IgnoreRules::merge(const IgnoreRules& other) {
    patterns_.insert(other.patterns_.begin(), other.patterns_.end());
    directory_patterns_.insert(other.directory_patterns_.begin(),
                               other.directory_patterns_.end());
}

} // namespace treecopy
