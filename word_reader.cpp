#include "word_reader.hpp"

#include <cctype>

namespace {

bool word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '\'';
}

void push_word(std::vector<std::string> &words, std::string &word) {
  size_t first = word.find_first_not_of('\'');
  if (first != std::string::npos) {
    size_t last = word.find_last_not_of('\'');
    words.push_back(word.substr(first, last - first + 1));
  }
  word.clear();
}

} // namespace

std::vector<std::string> split_words(std::string_view text) {
  std::vector<std::string> words;
  std::string word;
  for (char c : text) {
    if (word_char(c)) {
      word.push_back(
          static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else if (!word.empty()) {
      push_word(words, word);
    }
  }
  if (!word.empty())
    push_word(words, word);
  return words;
}
