#include "freq_table.hpp"
#include "primes.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

// 'a' maps to 1, anything below the displacement is folded back to positive
size_t char_value(char c) {
  int v = static_cast<unsigned char>(c) - CHAR_DISPLACEMENT;
  return static_cast<size_t>(v >= 0 ? v : -v);
}

} // namespace

freq_table::freq_table() : freq_table(DEFAULT_CAPACITY) {}

freq_table::freq_table(size_t capacity)
    : live(0), occupied(0), collisions(0), verbose(false) {
  if (capacity < 1) {
    throw std::invalid_argument("Initial capacity cannot be less than one");
  }
  slots.resize(capacity);
}

size_t freq_table::hash(std::string_view key) const {
  // first character is the innermost Horner term
  size_t h = 0;
  for (char c : key) {
    h = (char_value(c) + HASH_RADIX * h) % slots.size();
  }
  return h;
}

std::optional<size_t> freq_table::search(std::string_view key) const {
  if (key.empty())
    return std::nullopt;

  size_t index = hash(key);
  while (slots[index].state != EMPTY) {
    if (slots[index].live() && slots[index].key == key)
      return index;
    index = (index + 1) % slots.size();
  }
  return std::nullopt;
}

size_t freq_table::count_collisions(std::string_view key) const {
  if (key.empty())
    return 0;

  size_t count = 0;
  size_t origin = hash(key);
  size_t index = origin;
  while (slots[index].state != EMPTY) {
    const slot &s = slots[index];
    if (s.live() && s.key != key && hash(s.key) == origin)
      count++;
    index = (index + 1) % slots.size();
  }
  return count;
}

void freq_table::insert(const std::string &key) { insert_one(key, true); }

void freq_table::insert_one(const std::string &key, bool allow_resize) {
  if (key.empty())
    return;

  if (auto found = search(key)) {
    slots[*found].frequency++;
    return;
  }

  // counted before placement so the key does not collide with itself
  size_t new_collisions = count_collisions(key);

  size_t index = hash(key);
  while (slots[index].live()) {
    index = (index + 1) % slots.size();
  }

  // a reused tombstone is already part of the occupied count
  if (slots[index].state == EMPTY)
    occupied++;
  slots[index] = slot(key, 1);
  live++;
  collisions += new_collisions;

  if (allow_resize && load_factor() > MAX_LOAD_FACTOR) {
    resize();
  }
}

std::optional<std::string> freq_table::remove(const std::string &key) {
  auto found = search(key);
  if (!found)
    return std::nullopt;

  slot &s = slots[*found];
  if (s.frequency > 1) {
    s.frequency--;
    return s.key;
  }

  size_t lost_collisions = count_collisions(key);
  std::string removed = std::move(s.key);
  s = slot();
  s.state = TOMBSTONE;

  // occupied stays: the tombstone still lengthens probe sequences
  live--;
  collisions -= lost_collisions;
  return removed;
}

void freq_table::resize() {
  size_t new_capacity = next_prime(slots.size() * 2 + 1);
  if (verbose) {
    std::cerr << "Rehashing " << live << " items, new size is "
              << new_capacity << std::endl;
  }

  std::vector<slot> old_slots(new_capacity);
  old_slots.swap(slots);
  live = 0;
  occupied = 0;
  collisions = 0;

  // frequencies are rebuilt one unit at a time so collisions are recounted
  // against the new capacity
  for (const slot &s : old_slots) {
    if (!s.live())
      continue;
    for (size_t n = s.frequency; n > 0; n--) {
      insert_one(s.key, false);
    }
  }
}

bool freq_table::contains(const std::string &key) const {
  return search(key).has_value();
}

size_t freq_table::frequency_of(const std::string &key) const {
  auto found = search(key);
  if (!found)
    return 0;
  return slots[*found].frequency;
}

int64_t freq_table::hash_of(const std::string &key) const {
  if (key.empty())
    return INVALID_HASH;
  return static_cast<int64_t>(hash(key));
}

const slot &freq_table::slot_at(size_t index) const {
  if (index >= slots.size()) {
    throw std::out_of_range("Slot index " + std::to_string(index) +
                            " out of range for capacity " +
                            std::to_string(slots.size()));
  }
  return slots[index];
}

std::vector<std::string> freq_table::keys() const {
  std::vector<std::string> result;
  result.reserve(live);
  for (const slot &s : slots) {
    if (s.live())
      result.push_back(s.key);
  }
  return result;
}

void freq_table::for_each(
    const std::function<void(const std::string &, size_t)> &fn) const {
  for (const slot &s : slots) {
    if (s.live())
      fn(s.key, s.frequency);
  }
}

std::string freq_table::display() const {
  std::ostringstream os;
  os << "Table: ";
  for (const slot &s : slots) {
    switch (s.state) {
    case EMPTY:
      os << "** ";
      break;
    case TOMBSTONE:
      os << "#DEL# ";
      break;
    case OCCUPIED:
      os << "[" << s.key << ", " << s.frequency << "] ";
      break;
    }
  }
  return os.str();
}
