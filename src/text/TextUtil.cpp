#include "text/TextUtil.hpp"
#include <cctype>
#include <cstring>

namespace textutil {

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool is_open_punct(char c) {
    return std::strchr("\"([{`", c) != nullptr;
}

static bool is_close_punct(char c) {
    return std::strchr("\")]},;:?!", c) != nullptr;
}

static bool ends_with_ci(const std::string& s, const char* suffix) {
    const size_t n = std::strlen(suffix);
    if (s.size() <= n) return false; // need at least one char before the suffix
    for (size_t i = 0; i < n; ++i) {
        unsigned char a = static_cast<unsigned char>(s[s.size() - n + i]);
        if (std::tolower(a) != suffix[i]) return false;
    }
    return true;
}

// "don't" -> "do" "n't", "she's" -> "she" "'s"
static void push_word(std::vector<std::string>& out, const std::string& w) {
    static const char* kClitics[] = {"'s", "'re", "'ve", "'ll", "'d", "'m"};

    if (ends_with_ci(w, "n't")) {
        out.push_back(w.substr(0, w.size() - 3));
        out.push_back(w.substr(w.size() - 3));
        return;
    }
    for (const char* c : kClitics) {
        if (ends_with_ci(w, c)) {
            const size_t n = std::strlen(c);
            out.push_back(w.substr(0, w.size() - n));
            out.push_back(w.substr(w.size() - n));
            return;
        }
    }
    out.push_back(w);
}

std::string lower(const std::string& s) {
    std::string out = s;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) ch = static_cast<char>(std::tolower(c));
    }
    return out;
}

std::vector<std::string> tokenize_treebank(const std::string& text) {
    // chunk on whitespace first
    std::vector<std::string> chunks;
    std::string cur;
    for (char c : text) {
        if (is_ws(c)) {
            if (!cur.empty()) {
                chunks.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) chunks.push_back(cur);

    std::vector<std::string> tokens;
    tokens.reserve(chunks.size() * 2);

    for (size_t ci = 0; ci < chunks.size(); ++ci) {
        const std::string& chunk = chunks[ci];
        const bool last_chunk = (ci + 1 == chunks.size());

        size_t b = 0;
        size_t e = chunk.size();

        while (b < e && is_open_punct(chunk[b])) {
            tokens.emplace_back(1, chunk[b]);
            ++b;
        }

        // trailing punctuation is collected back-to-front
        std::vector<std::string> tail;
        while (b < e) {
            if (e - b >= 3 && chunk.compare(e - 3, 3, "...") == 0) {
                tail.emplace_back("...");
                e -= 3;
            } else if (is_close_punct(chunk[e - 1])) {
                tail.emplace_back(1, chunk[e - 1]);
                --e;
            } else if (last_chunk && chunk[e - 1] == '.') {
                // only the sentence-final period is split off ("U.S." stays whole mid-text)
                tail.emplace_back(".");
                --e;
            } else {
                break;
            }
        }

        if (b < e) push_word(tokens, chunk.substr(b, e - b));

        for (auto it = tail.rbegin(); it != tail.rend(); ++it) tokens.push_back(*it);
    }

    return tokens;
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;

    auto flush = [&]() {
        size_t b = 0, e = cur.size();
        while (b < e && is_ws(cur[b])) ++b;
        while (e > b && is_ws(cur[e - 1])) --e;
        if (e > b) out.push_back(cur.substr(b, e - b));
        cur.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        cur.push_back(c);
        if (c == '.' || c == '?' || c == '!') {
            if (i + 1 == text.size() || is_ws(text[i + 1])) flush();
        }
    }
    flush();
    return out;
}

}
