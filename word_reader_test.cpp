#include "freq_table/freq_table.hpp"
#include "word_reader.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

void test_split_words() {
  std::vector<std::string> words =
      split_words("Hello, world! It's a 'quoted' word... 42x");
  std::vector<std::string> expected = {"hello", "world",  "it's", "a",
                                       "quoted", "word", "42x"};
  assert(words == expected);

  assert(split_words("").empty());
  assert(split_words("  --  ,,, ").empty());
  assert(split_words("''").empty());
  assert(split_words("CAT") == std::vector<std::string>{"cat"});
}

void test_read_words_into_table() {
  std::istringstream in("The cat and the dog.\nThe CAT again\n\nend");
  freq_table table;
  size_t count =
      read_words(in, [&table](const std::string &word) { table.insert(word); });

  assert(count == 9);
  assert(table.frequency_of("the") == 3);
  assert(table.frequency_of("cat") == 2);
  assert(table.frequency_of("dog") == 1);
  assert(table.frequency_of("end") == 1);
  assert(table.size() == 6);
  assert(table.load_factor() <= MAX_LOAD_FACTOR);
}

int main() {
  test_split_words();
  test_read_words_into_table();

  std::cout << "All tests passed!" << std::endl;
  return 0;
}
