#include "freq_table.hpp"
#include "primes.hpp"
#include <cassert>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

// Counters must agree with what is actually stored in the slots, and no key
// may be stored twice.
void check_invariants(const freq_table &table) {
  size_t live = 0;
  size_t occupied = 0;
  std::set<std::string> seen;
  for (size_t i = 0; i < table.capacity(); ++i) {
    const slot &s = table.slot_at(i);
    if (s.state == OCCUPIED) {
      live++;
      assert(s.frequency > 0);
      assert(seen.insert(s.key).second);
    }
    if (s.state != EMPTY)
      occupied++;
  }
  assert(live == table.size());
  assert(occupied == table.occupied_count());
  assert(table.size() <= table.occupied_count());
  assert(table.occupied_count() <= table.capacity());
}

void test_construction() {
  freq_table table;
  assert(table.capacity() == DEFAULT_CAPACITY);
  assert(table.empty());
  assert(table.collision_count() == 0);
  assert(table.occupied_count() == 0);

  freq_table sized(37);
  assert(sized.capacity() == 37);

  try {
    freq_table bad(0);
    assert(false); // Should not reach here
  } catch (const std::invalid_argument &) {
    // Expected behavior.
  }
}

void test_basic_operations() {
  freq_table table;
  table.insert("cat");
  table.insert("dog");
  table.insert("cat");

  assert(table.size() == 2);
  assert(table.frequency_of("cat") == 2);
  assert(table.frequency_of("dog") == 1);
  assert(table.contains("cat"));
  assert(table.contains("dog"));
  assert(!table.contains("cow"));
  assert(table.frequency_of("cow") == 0);
  check_invariants(table);
}

void test_repeat_insert_uses_one_slot() {
  freq_table table;
  for (int i = 0; i < 25; ++i) {
    table.insert("echo");
  }
  assert(table.frequency_of("echo") == 25);
  assert(table.size() == 1);
  assert(table.occupied_count() == 1);
  assert(table.capacity() == DEFAULT_CAPACITY);
  check_invariants(table);
}

void test_hash_values() {
  freq_table table;
  // 'a' maps to 1, so a one-letter key hashes to its alphabet position
  assert(table.hash_of("a") == 1);
  assert(table.hash_of("k") == 1);
  assert(table.hash_of("j") == 0);
  // c=3, a=1, t=20: ((3 * 27 + 1) * 27 + 20) mod 10, reduced at every step
  assert(table.hash_of("cat") == 4);
  assert(table.hash_of("dog") == 8);
  assert(table.hash_of("") == INVALID_HASH);

  // characters below 'a' are folded back to a positive value
  assert(table.hash_of("A") == 1);
  assert(table.hash_of("!#") == 2);

  std::string long_key(5000, 'z');
  long_key += "Q!~";
  int64_t h = table.hash_of(long_key);
  assert(h >= 0 && h < static_cast<int64_t>(table.capacity()));

  // hashes follow the capacity
  freq_table wide(1000);
  assert(wide.hash_of("cat") == 2234 % 1000);
}

void test_empty_keys_are_ignored() {
  freq_table table;
  table.insert("");
  assert(table.size() == 0);
  assert(table.occupied_count() == 0);
  assert(!table.remove("").has_value());
  assert(!table.contains(""));
  assert(table.frequency_of("") == 0);
  check_invariants(table);
}

void test_remove() {
  freq_table table;
  table.insert("cat");
  table.insert("cat");
  table.insert("dog");

  // partial removal only decrements
  auto removed = table.remove("cat");
  assert(removed.has_value() && *removed == "cat");
  assert(table.frequency_of("cat") == 1);
  assert(table.size() == 2);

  removed = table.remove("dog");
  assert(removed.has_value() && *removed == "dog");
  assert(!table.contains("dog"));
  assert(table.frequency_of("dog") == 0);
  assert(table.size() == 1);
  assert(table.occupied_count() == 2);

  // already gone
  assert(!table.remove("dog").has_value());
  assert(!table.remove("never").has_value());
  check_invariants(table);
}

void test_tombstone() {
  freq_table table;
  table.insert("x");
  size_t index = static_cast<size_t>(table.hash_of("x"));
  assert(index == 4);

  auto removed = table.remove("x");
  assert(removed.has_value() && *removed == "x");
  assert(table.slot_at(index).state == TOMBSTONE);
  assert(table.display() == "Table: ** ** ** ** #DEL# ** ** ** ** ** ");
  assert(table.size() == 0);
  assert(table.occupied_count() == 1);

  // the tombstone is reused without growing the occupied count
  table.insert("x");
  assert(table.slot_at(index).state == OCCUPIED);
  assert(table.occupied_count() == 1);
  assert(table.frequency_of("x") == 1);
  check_invariants(table);
}

void test_search_skips_tombstones() {
  freq_table table;
  table.insert("a");
  table.insert("k"); // same bucket, probes to the next slot
  assert(table.slot_at(2).key == "k");

  table.remove("a");
  assert(table.slot_at(1).state == TOMBSTONE);
  assert(table.contains("k"));
  assert(table.frequency_of("k") == 1);

  table.insert("k");
  assert(table.frequency_of("k") == 2);
  assert(table.occupied_count() == 2);
  check_invariants(table);
}

void test_collision_accounting() {
  freq_table table;
  assert(table.hash_of("a") == table.hash_of("k"));

  table.insert("a");
  assert(table.collision_count() == 0);
  table.insert("k");
  assert(table.collision_count() == 1);

  // repeats do not collide again
  table.insert("k");
  table.insert("a");
  assert(table.collision_count() == 1);

  // different bucket
  table.insert("b");
  assert(table.collision_count() == 1);

  // partial removal keeps the entry, and its collisions
  table.remove("k");
  assert(table.collision_count() == 1);
  table.remove("k");
  assert(table.collision_count() == 0);

  // the key comes back through the tombstone left by itself
  table.insert("k");
  assert(table.collision_count() == 1);
  table.remove("a");
  table.remove("a");
  assert(table.collision_count() == 0);
  check_invariants(table);
}

void test_three_way_collision() {
  freq_table table(20);
  // 'a' = 1, 'u' = 21, "ba" = 2 * 27 + 1 = 55: all 1 mod 20 except "ba"
  assert(table.hash_of("a") == 1);
  assert(table.hash_of("u") == 1);
  assert(table.hash_of("ba") == 15);

  table.insert("a");
  table.insert("u");
  assert(table.collision_count() == 1);

  freq_table crowded(10);
  crowded.insert("a");
  crowded.insert("k");
  crowded.insert("u");
  // u collides with both a and k
  assert(crowded.collision_count() == 3);
  crowded.remove("k");
  assert(crowded.collision_count() == 1);
  check_invariants(crowded);
}

void test_resize() {
  freq_table table;
  const char *keys[] = {"a", "b", "c", "d", "e"};
  for (const char *key : keys) {
    table.insert(key);
  }
  // 5 / 10 is not above the limit
  assert(table.capacity() == 10);

  table.insert("f");
  assert(table.capacity() == 23);
  assert(table.size() == 6);
  assert(table.occupied_count() == 6);
  for (const char *key : keys) {
    assert(table.contains(key));
  }
  assert(table.contains("f"));
  check_invariants(table);
}

void test_resize_keeps_frequencies_and_drops_tombstones() {
  freq_table table;
  table.insert("a");
  table.insert("a");
  table.insert("a");
  table.insert("gone");
  table.remove("gone");
  table.insert("b");
  table.insert("c");
  table.insert("d");
  assert(table.capacity() == 10);
  assert(table.occupied_count() == 5);

  table.insert("e");
  assert(table.capacity() == 23);
  assert(table.size() == 5);
  // the tombstone does not survive the rebuild
  assert(table.occupied_count() == 5);
  assert(table.frequency_of("a") == 3);
  assert(!table.contains("gone"));
  check_invariants(table);
}

void test_resize_recounts_collisions() {
  freq_table table;
  table.insert("a");
  table.insert("k");
  table.insert("b");
  table.insert("c");
  table.insert("d");
  assert(table.collision_count() == 1);

  table.insert("e");
  assert(table.capacity() == 23);
  // a -> 1 and k -> 11 once the capacity is 23
  assert(table.hash_of("a") != table.hash_of("k"));
  assert(table.collision_count() == 0);
  check_invariants(table);
}

void test_load_factor_bound() {
  freq_table table(1);
  for (int i = 0; i < 500; ++i) {
    table.insert("word" + std::to_string(i));
    assert(table.load_factor() <= MAX_LOAD_FACTOR);
    assert(is_prime(table.capacity()) || table.capacity() == 1);
  }
  assert(table.size() == 500);
  for (int i = 0; i < 500; i += 2) {
    table.remove("word" + std::to_string(i));
  }
  assert(table.size() == 250);
  check_invariants(table);
  for (int i = 1; i < 500; i += 2) {
    assert(table.frequency_of("word" + std::to_string(i)) == 1);
  }
}

void test_capacity_one() {
  freq_table table(1);
  table.insert("a");
  assert(table.capacity() == 3);
  table.insert("b");
  assert(table.capacity() == 7);
  assert(table.size() == 2);
  check_invariants(table);
}

void test_display() {
  freq_table table;
  table.insert("cat");
  table.insert("dog");
  table.insert("cat");
  assert(table.display() ==
         "Table: ** ** ** ** [cat, 2] ** ** ** [dog, 1] ** ");
}

void test_observers() {
  freq_table table;
  table.insert("dog");
  table.insert("cat");
  table.insert("cat");

  // slot order, not insertion order
  std::vector<std::string> keys = table.keys();
  assert(keys.size() == 2);
  assert(keys[0] == "cat");
  assert(keys[1] == "dog");

  size_t total = 0;
  table.for_each([&total](const std::string &, size_t frequency) {
    total += frequency;
  });
  assert(total == 3);

  try {
    table.slot_at(table.capacity());
    assert(false); // Should not reach here
  } catch (const std::out_of_range &) {
    // Expected behavior.
  }
}

void test_verbose_logging() {
  std::ostringstream captured;
  std::streambuf *old = std::cerr.rdbuf(captured.rdbuf());

  freq_table table;
  table.insert("a");
  table.set_verbose(true);
  for (const char *key : {"b", "c", "d", "e", "f"}) {
    table.insert(key);
  }
  std::cerr.rdbuf(old);

  assert(captured.str() == "Rehashing 6 items, new size is 23\n");

  // quiet by default
  captured.str("");
  old = std::cerr.rdbuf(captured.rdbuf());
  freq_table quiet;
  for (const char *key : {"a", "b", "c", "d", "e", "f"}) {
    quiet.insert(key);
  }
  std::cerr.rdbuf(old);
  assert(captured.str().empty());
}

void test_primes() {
  assert(!is_prime(0));
  assert(!is_prime(1));
  assert(is_prime(2));
  assert(is_prime(3));
  assert(!is_prime(4));
  assert(is_prime(23));
  assert(!is_prime(25));
  assert(next_prime(21) == 23);
  assert(next_prime(23) == 23);
  assert(next_prime(3) == 3);
  assert(next_prime(47) == 47);
  assert(next_prime(48) == 53);
}

int main() {
  test_construction();
  test_basic_operations();
  test_repeat_insert_uses_one_slot();
  test_hash_values();
  test_empty_keys_are_ignored();
  test_remove();
  test_tombstone();
  test_search_skips_tombstones();
  test_collision_accounting();
  test_three_way_collision();
  test_resize();
  test_resize_keeps_frequencies_and_drops_tombstones();
  test_resize_recounts_collisions();
  test_load_factor_bound();
  test_capacity_one();
  test_display();
  test_observers();
  test_verbose_logging();
  test_primes();

  std::cout << "All tests passed!" << std::endl;
  return 0;
}
