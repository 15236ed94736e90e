#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "freq_table/freq_table.hpp"
#include "word_reader.hpp"

namespace {

const int EXIT_IO_ERROR = 1;
const int EXIT_USAGE = 2;

struct options {
  size_t capacity = DEFAULT_CAPACITY;
  bool verbose = false;
  bool print_table = false;
  std::vector<std::string> queries;
  std::vector<std::string> files;
};

void usage() {
  std::cerr << "usage: wordfreq [-c capacity] [-v] [-t] [-q word]... [file...]"
            << std::endl;
}

size_t parse_capacity(const std::string &arg) {
  if (arg.empty() || arg.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("capacity must be a positive integer: " + arg);
  }
  // stoul throws out_of_range for values that do not fit
  return std::stoul(arg);
}

bool parse_args(int argc, char **argv, options &opts) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "-c" || arg == "-q") {
      if (i + 1 >= argc) {
        std::cerr << "wordfreq: " << arg << " needs an argument" << std::endl;
        return false;
      }
      std::string value = argv[++i];
      if (arg == "-c") {
        opts.capacity = parse_capacity(value);
      } else {
        opts.queries.push_back(value);
      }
    } else if (arg == "-v") {
      opts.verbose = true;
    } else if (arg == "-t") {
      opts.print_table = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "wordfreq: unknown option " << arg << std::endl;
      return false;
    } else {
      opts.files.push_back(arg);
    }
  }
  return true;
}

size_t count_stream(std::istream &in, freq_table &table) {
  return read_words(in, [&table](const std::string &word) { table.insert(word); });
}

void print_summary(const freq_table &table, size_t words) {
  std::cout << "words: " << words << std::endl;
  std::cout << "distinct: " << table.size() << std::endl;
  std::cout << "capacity: " << table.capacity() << std::endl;
  std::cout << "collisions: " << table.collision_count() << std::endl;
  std::cout << "load factor: " << std::fixed << std::setprecision(3)
            << table.load_factor() << std::endl;
}

int run(const options &opts) {
  freq_table table(opts.capacity);
  table.set_verbose(opts.verbose);

  size_t words = 0;
  if (opts.files.empty()) {
    words += count_stream(std::cin, table);
  }
  for (const std::string &file : opts.files) {
    if (file == "-") {
      words += count_stream(std::cin, table);
      continue;
    }
    std::ifstream in(file);
    if (!in) {
      std::cerr << "wordfreq: cannot open " << file << std::endl;
      return EXIT_IO_ERROR;
    }
    words += count_stream(in, table);
  }

  if (opts.print_table) {
    std::cout << table.display() << std::endl;
  }
  for (const std::string &query : opts.queries) {
    std::cout << query << ": " << table.frequency_of(query) << " (hash "
              << table.hash_of(query) << ")" << std::endl;
  }
  print_summary(table, words);
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
  options opts;
  try {
    if (!parse_args(argc, argv, opts)) {
      usage();
      return EXIT_USAGE;
    }
    return run(opts);
  } catch (const std::invalid_argument &e) {
    std::cerr << "wordfreq: " << e.what() << std::endl;
    usage();
    return EXIT_USAGE;
  } catch (const std::out_of_range &e) {
    std::cerr << "wordfreq: " << e.what() << std::endl;
    usage();
    return EXIT_USAGE;
  } catch (const std::exception &e) {
    std::cerr << "wordfreq: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
