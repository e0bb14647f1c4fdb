#include "path/GlobName.hpp"

namespace {

constexpr auto npos = std::string_view::npos;

// Matches the single non-star token at glob[idx] against ch. Returns the index
// just past the token, or npos when ch is rejected.
auto match_token(std::string_view glob, std::size_t idx, char ch) -> std::size_t {
    char const token = glob[idx];
    if (token == '?') {
        return idx + 1;
    }
    if (token == '\\') {
        if (idx + 1 < glob.size()) {
            return glob[idx + 1] == ch ? idx + 2 : npos;
        }
        return ch == '\\' ? idx + 1 : npos; // trailing backslash is literal
    }
    if (token == '[') {
        auto pos    = idx + 1;
        bool invert = false;
        if (pos < glob.size() && glob[pos] == '!') {
            invert = true;
            ++pos;
        }

        bool matched = false;
        bool first   = true; // a leading ']' is a member, not the terminator
        while (pos < glob.size() && (first || glob[pos] != ']')) {
            first        = false;
            char const lo = glob[pos];
            if (pos + 2 < glob.size() && glob[pos + 1] == '-' && glob[pos + 2] != ']') {
                char const hi = glob[pos + 2];
                if (ch >= lo && ch <= hi) {
                    matched = true;
                }
                pos += 3;
            } else {
                if (ch == lo) {
                    matched = true;
                }
                ++pos;
            }
        }

        if (pos >= glob.size()) {
            // Unterminated class, treat '[' literally
            return ch == '[' ? idx + 1 : npos;
        }
        if (matched == invert) {
            return npos;
        }
        return pos + 1;
    }
    return token == ch ? idx + 1 : npos;
}

} // namespace

namespace RP {

auto is_glob(std::string_view const& strv) -> bool {
    bool previousCharWasEscape = false;
    for (auto const& ch : strv) {
        if (ch == '\\' && !previousCharWasEscape) {
            previousCharWasEscape = true;
            continue;
        }
        if (previousCharWasEscape) {
            previousCharWasEscape = false;
            continue;
        }
        if (ch == '*' || ch == '?' || ch == '[' || ch == ']') {
            return true;
        }
    }
    return false;
}

GlobName::GlobName(char const* const ptr)
    : name(ptr) {
}

GlobName::GlobName(std::string_view view)
    : name(view) {
}

auto GlobName::match(std::string_view const& str) const -> bool {
    std::size_t globIdx  = 0;
    std::size_t strIdx   = 0;
    std::size_t starGlob = npos;
    std::size_t starStr  = 0;

    while (strIdx < str.size()) {
        if (globIdx < this->name.size() && this->name[globIdx] == '*') {
            starGlob = globIdx++;
            starStr  = strIdx;
            continue;
        }
        if (globIdx < this->name.size()) {
            auto const next = match_token(this->name, globIdx, str[strIdx]);
            if (next != npos) {
                globIdx = next;
                ++strIdx;
                continue;
            }
        }
        if (starGlob != npos) {
            // Let the last '*' swallow one more character and retry
            globIdx = starGlob + 1;
            strIdx  = ++starStr;
            continue;
        }
        return false;
    }

    // Skip any remaining wildcards
    while (globIdx < this->name.size() && this->name[globIdx] == '*') {
        globIdx++;
    }

    return globIdx == this->name.size();
}

auto GlobName::isGlob() const -> bool {
    return is_glob(this->name);
}

auto GlobName::isRecursive() const -> bool {
    return this->name == "**";
}

} // namespace RP
