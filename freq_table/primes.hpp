#pragma once

#include <cstddef>

// trial division up to n/2, table sizes stay small enough for this
inline bool is_prime(size_t n) {
  if (n < 2)
    return false;
  for (size_t i = 2; i <= n / 2; i++) {
    if (n % i == 0)
      return false;
  }
  return true;
}

// smallest prime >= n
inline size_t next_prime(size_t n) {
  while (!is_prime(n))
    n++;
  return n;
}
