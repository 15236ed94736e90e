#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

const size_t DEFAULT_CAPACITY = 10;
const double MAX_LOAD_FACTOR = 0.5;

// Horner's rule radix, and the displacement that maps 'a' to 1
const size_t HASH_RADIX = 27;
const int CHAR_DISPLACEMENT = 96;

// returned by hash_of for keys that can never be stored
const int64_t INVALID_HASH = -1;

enum slot_state { EMPTY, TOMBSTONE, OCCUPIED };

struct slot {
  slot_state state;
  std::string key;
  size_t frequency;

  slot() : state(EMPTY), frequency(0) {}
  slot(std::string key, size_t frequency)
      : state(OCCUPIED), key(std::move(key)), frequency(frequency) {}

  bool live() const { return state == OCCUPIED; }
};

/*
 * Counts occurrences of strings in an open addressing table.
 *
 * Collisions are resolved by linear probing. Removed entries leave a tombstone
 * behind, which keeps later probe sequences intact and still counts towards the
 * load factor: load factor = (live + tombstoned slots) / capacity. When an
 * insertion pushes the load factor above MAX_LOAD_FACTOR the table grows to the
 * smallest prime >= 2 * capacity + 1 and every live key is inserted again.
 *
 * The table also keeps the number of collisions between distinct live keys that
 * share a hash value.
 */
class freq_table {
private:
  std::vector<slot> slots;
  size_t live;
  size_t occupied;
  size_t collisions;
  bool verbose;

  size_t hash(std::string_view key) const;
  std::optional<size_t> search(std::string_view key) const;
  size_t count_collisions(std::string_view key) const;

  // places a new key, or bumps an existing one; resizes only if allowed
  void insert_one(const std::string &key, bool allow_resize);
  void resize();

public:
  freq_table();
  explicit freq_table(size_t capacity);

  void insert(const std::string &key);

  // the removed key, or nullopt if the key was not present
  std::optional<std::string> remove(const std::string &key);

  bool contains(const std::string &key) const;
  size_t frequency_of(const std::string &key) const;
  int64_t hash_of(const std::string &key) const;

  size_t size() const { return live; }
  bool empty() const { return live == 0; }
  size_t capacity() const { return slots.size(); }
  size_t occupied_count() const { return occupied; }
  size_t collision_count() const { return collisions; }
  double load_factor() const {
    return static_cast<double>(occupied) / static_cast<double>(slots.size());
  }

  const slot &slot_at(size_t index) const;
  std::vector<std::string> keys() const;
  void for_each(
      const std::function<void(const std::string &, size_t)> &fn) const;

  std::string display() const;

  // log resizes to stderr
  void set_verbose(bool on) { verbose = on; }
};
