#ifndef STRING_HASH_H_INCLUDED
#define STRING_HASH_H_INCLUDED

#include <cstdint>
#include <string>

typedef std::uint64_t hash_t;

constexpr hash_t prime = 0x100000001B3ull;
constexpr hash_t basis = 0xCBF29CE484222325ull;

inline hash_t hash_(const std::string &str) {
  hash_t ret{basis};
  for (char c : str) {
    ret ^= static_cast<unsigned char>(c);
    ret *= prime;
  }
  return ret;
}

constexpr hash_t hash_compile_time(const char *str, hash_t last_value = basis) {
  return *str ? hash_compile_time(
                    str + 1,
                    (last_value ^ static_cast<unsigned char>(*str)) * prime)
              : last_value;
}

constexpr hash_t operator"" _hash(const char *p, size_t) {
  return hash_compile_time(p);
}

#endif // STRING_HASH_H_INCLUDED
