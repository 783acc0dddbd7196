// schedule/pattern_match.h - Prioritisation patterns (exact names and globs)
// Part of the depwave deployment-wave library (C++20)
//
// A pattern without '*' or '?' is an exact object name: brackets in it
// are literal, so names such as "[dbo].[Orders]" work unquoted.  Any
// other pattern is a shell-style glob:
//   *        any sequence, including empty
//   ?        any single character
//   [seq]    one character in seq (ranges a-z allowed)
//   [!seq]   one character not in seq
// A ']' directly after '[' or '[!' is a member, not the terminator.
// Matching is case-sensitive and works on code points: names and
// patterns are decoded from UTF-8, so '?' matches one character whatever
// its encoded length.
//
// Patterns are compiled once, up front.  An empty pattern, or a glob
// with an unterminated '[' class or a reversed range, raises
// malformed_pattern_error before any partitioning work starts.

#ifndef DEPWAVE_SCHEDULE_PATTERN_MATCH_H
#define DEPWAVE_SCHEDULE_PATTERN_MATCH_H

#include <depwave/core/errors.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace depwave::schedule {

/// True if text contains a glob wildcard ('*' or '?').
[[nodiscard]] inline bool has_wildcard(std::string_view text) noexcept {
    return text.find_first_of("*?") != std::string_view::npos;
}

namespace detail {

/// Decode UTF-8 into code points.  A byte that does not begin a valid,
/// shortest-form sequence decodes to U+DC00 + byte on its own, so any
/// byte string decodes and distinct inputs stay distinct.
[[nodiscard]] inline std::u32string decode_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    auto const n = text.size();
    while (i < n) {
        auto const lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        }

        std::size_t len = 0;
        char32_t cp = 0;
        char32_t shortest = 0;
        if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; shortest = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; shortest = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; shortest = 0x10000;
        }

        bool ok = len != 0 && i + len <= n;
        for (std::size_t k = 1; ok && k < len; ++k) {
            auto const b = static_cast<unsigned char>(text[i + k]);
            if ((b & 0xC0) != 0x80) {
                ok = false;
            } else {
                cp = (cp << 6) | (b & 0x3F);
            }
        }
        if (ok && (cp < shortest || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            ok = false;
        }

        if (ok) {
            out.push_back(cp);
            i += len;
        } else {
            out.push_back(char32_t{0xDC00} + lead);
            ++i;
        }
    }
    return out;
}

/// Encode one code point produced by decode_utf8() back to UTF-8.
[[nodiscard]] inline std::string encode_utf8(char32_t cp) {
    std::string out;
    if (cp >= 0xDC80 && cp <= 0xDCFF) {
        out.push_back(static_cast<char>(cp - 0xDC00));
    } else if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

} // namespace detail

/// A compiled shell-style glob.
///
/// Pattern and names are UTF-8.  '?', literals and class members each
/// stand for one code point; ranges compare code point values.
class glob_pattern {
public:
    explicit glob_pattern(std::string text) : text_(std::move(text)) {
        compile();
    }

    [[nodiscard]] std::string const& text() const noexcept { return text_; }

    /// Whole-string match of a UTF-8 name against the glob.
    [[nodiscard]] bool matches(std::string_view name) const {
        return matches(std::u32string_view(detail::decode_utf8(name)));
    }

    /// Whole-string match of an already decoded name.
    [[nodiscard]] bool matches(std::u32string_view name) const {
        constexpr std::size_t none = static_cast<std::size_t>(-1);
        std::size_t t = 0;
        std::size_t s = 0;
        std::size_t star_t = none;
        std::size_t star_s = 0;

        while (s < name.size()) {
            if (t < tokens_.size() && tokens_[t].kind == token_kind::any_sequence) {
                star_t = t++;
                star_s = s;
                continue;
            }
            if (t < tokens_.size() && matches_one(tokens_[t], name[s])) {
                ++t;
                ++s;
                continue;
            }
            if (star_t != none) {
                // Let the last '*' swallow one more character.
                t = star_t + 1;
                s = ++star_s;
                continue;
            }
            return false;
        }
        while (t < tokens_.size() && tokens_[t].kind == token_kind::any_sequence) {
            ++t;
        }
        return t == tokens_.size();
    }

private:
    enum class token_kind : std::uint8_t { literal, any_char, any_sequence, char_class };

    struct char_range {
        char32_t lo;
        char32_t hi;
    };

    struct token {
        token_kind kind;
        char32_t ch = 0;           // literal
        bool negated = false;      // char_class
        std::vector<char_range> ranges{};
    };

    [[nodiscard]] static bool matches_one(token const& tk, char32_t c) {
        switch (tk.kind) {
        case token_kind::literal:
            return tk.ch == c;
        case token_kind::any_char:
            return true;
        case token_kind::char_class: {
            bool in = false;
            for (auto const& r : tk.ranges) {
                if (r.lo <= c && c <= r.hi) {
                    in = true;
                    break;
                }
            }
            return in != tk.negated;
        }
        case token_kind::any_sequence:
            break;
        }
        return false;
    }

    void compile() {
        if (text_.empty()) {
            throw malformed_pattern_error(text_, "empty pattern");
        }
        auto const cps = detail::decode_utf8(text_);
        std::size_t i = 0;
        auto const n = cps.size();
        while (i < n) {
            char32_t const c = cps[i];
            if (c == U'*') {
                // Consecutive stars are equivalent to one.
                if (tokens_.empty() || tokens_.back().kind != token_kind::any_sequence) {
                    tokens_.push_back(token{token_kind::any_sequence});
                }
                ++i;
            } else if (c == U'?') {
                tokens_.push_back(token{token_kind::any_char});
                ++i;
            } else if (c == U'[') {
                i = compile_class(cps, i);
            } else {
                tokens_.push_back(token{token_kind::literal, c});
                ++i;
            }
        }
    }

    /// Compile the class starting at cps[open] == '['.  Returns the
    /// position after the closing ']'.  Positions count code points.
    std::size_t compile_class(std::u32string const& cps, std::size_t open) {
        auto const n = cps.size();
        std::size_t j = open + 1;
        token tk{token_kind::char_class};
        if (j < n && cps[j] == U'!') {
            tk.negated = true;
            ++j;
        }
        std::size_t const body = j;
        if (j < n && cps[j] == U']') {
            ++j;
        }
        while (j < n && cps[j] != U']') {
            ++j;
        }
        if (j >= n) {
            throw malformed_pattern_error(text_,
                "unterminated '[' at position " + std::to_string(open));
        }

        for (std::size_t k = body; k < j; ++k) {
            char32_t const lo = cps[k];
            if (k + 2 < j && cps[k + 1] == U'-') {
                char32_t const hi = cps[k + 2];
                if (lo > hi) {
                    throw malformed_pattern_error(text_,
                        "reversed range '" + detail::encode_utf8(lo) + '-'
                        + detail::encode_utf8(hi) + "'");
                }
                tk.ranges.push_back(char_range{lo, hi});
                k += 2;
            } else {
                tk.ranges.push_back(char_range{lo, lo});
            }
        }
        tokens_.push_back(std::move(tk));
        return j + 1;
    }

    std::string text_;
    std::vector<token> tokens_{};
};

/// Ordered list of prioritisation patterns.
///
/// matches() checks exact names first, then globs in list order.
///
/// Example:
/// ```cpp
/// priority_patterns p({"PKG_*", "dbo.Orders"});
/// p.matches("PKG_LOAD");     // true (glob)
/// p.matches("dbo.Orders");   // true (exact)
/// p.matches("dbo.Order");    // false
/// ```
class priority_patterns {
public:
    priority_patterns() = default;

    explicit priority_patterns(std::vector<std::string> const& patterns) {
        for (auto const& p : patterns) {
            if (p.empty()) {
                throw malformed_pattern_error(p, "empty pattern");
            }
            if (has_wildcard(p)) {
                globs_.emplace_back(p);
            } else {
                exact_.insert(p);
            }
        }
    }

    [[nodiscard]] bool empty() const noexcept {
        return exact_.empty() && globs_.empty();
    }

    [[nodiscard]] bool matches(std::string_view name) const {
        if (!exact_.empty() && exact_.count(std::string(name)) != 0) {
            return true;
        }
        if (globs_.empty()) {
            return false;
        }
        auto const decoded = detail::decode_utf8(name);
        for (auto const& g : globs_) {
            if (g.matches(std::u32string_view(decoded))) return true;
        }
        return false;
    }

private:
    std::unordered_set<std::string> exact_{};
    std::vector<glob_pattern> globs_{};
};

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_PATTERN_MATCH_H
