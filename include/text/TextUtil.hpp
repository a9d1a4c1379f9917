#pragma once
#include <string>
#include <vector>

namespace textutil {

// ASCII lowercase; bytes >= 0x80 pass through untouched
std::string lower(const std::string& s);

// Treebank-style word tokenizer: splits on whitespace, peels punctuation off
// word edges and separates English contractions ("don't" -> "do", "n't").
std::vector<std::string> tokenize_treebank(const std::string& text);

// sentence splitter used when a corpus is trained sentence-by-sentence
std::vector<std::string> split_sentences(const std::string& text);

}
