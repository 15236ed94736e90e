#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

// Splits text into lower-cased words. A word is a maximal run of letters,
// digits or apostrophes; apostrophes at either end of a run are dropped.
std::vector<std::string> split_words(std::string_view text);

// reads the stream line by line and hands every word to the callback
template <typename Fn> size_t read_words(std::istream &in, Fn &&fn) {
  size_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    for (std::string &word : split_words(line)) {
      fn(word);
      count++;
    }
  }
  return count;
}
