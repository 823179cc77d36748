/// @file shared_context.cpp
/// @brief TestDataGenerator implementation.

#include "workload/shared_context.hpp"

#include <array>

namespace surge {

namespace {

constexpr std::array<const char *, 12> kFirstNames = {
    "alice", "bob",  "carol", "dave",  "erin", "frank",
    "grace", "heidi", "ivan", "judy", "mallory", "oscar",
};

constexpr std::array<const char *, 10> kLastNames = {
    "smith", "jones", "garcia", "miller", "davis",
    "lopez", "wilson", "moore", "taylor", "clark",
};

constexpr std::array<const char *, 4> kDomains = {
    "example.com", "example.org", "test.local", "mail.test",
};

constexpr std::string_view kAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

} // namespace

TestDataGenerator::TestDataGenerator(std::optional<std::uint64_t> seed)
    : engine_{seed.value_or(std::random_device{}())} {}

auto TestDataGenerator::integer(std::int64_t lo, std::int64_t hi)
    -> std::int64_t {
  std::uniform_int_distribution<std::int64_t> d(lo, hi);
  std::lock_guard lock(mutex_);
  return d(engine_);
}

auto TestDataGenerator::real(double lo, double hi) -> double {
  std::uniform_real_distribution<double> d(lo, hi);
  std::lock_guard lock(mutex_);
  return d(engine_);
}

auto TestDataGenerator::chance(double probability) -> bool {
  if (probability <= 0.0) {
    return false;
  }
  if (probability >= 1.0) {
    return true;
  }
  std::bernoulli_distribution d(probability);
  std::lock_guard lock(mutex_);
  return d(engine_);
}

auto TestDataGenerator::token(std::size_t length) -> std::string {
  std::uniform_int_distribution<std::size_t> d(0, kAlphabet.size() - 1);
  std::string out;
  out.reserve(length);
  std::lock_guard lock(mutex_);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(kAlphabet[d(engine_)]);
  }
  return out;
}

auto TestDataGenerator::first_name() -> std::string {
  return kFirstNames[static_cast<std::size_t>(
      integer(0, static_cast<std::int64_t>(kFirstNames.size()) - 1))];
}

auto TestDataGenerator::last_name() -> std::string {
  return kLastNames[static_cast<std::size_t>(
      integer(0, static_cast<std::int64_t>(kLastNames.size()) - 1))];
}

auto TestDataGenerator::email() -> std::string {
  auto domain = kDomains[static_cast<std::size_t>(
      integer(0, static_cast<std::int64_t>(kDomains.size()) - 1))];
  return first_name() + "." + last_name() + std::to_string(integer(1, 999)) +
         "@" + domain;
}

auto TestDataGenerator::uuid() -> std::string {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::uniform_int_distribution<int> d(0, 15);
  std::string out;
  out.reserve(36);
  std::lock_guard lock(mutex_);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) {
      out.push_back('-');
    }
    int nibble = d(engine_);
    if (i == 12) {
      nibble = 4; // version
    } else if (i == 16) {
      nibble = 8 | (nibble & 0x3); // variant 10xx
    }
    out.push_back(kHex[static_cast<std::size_t>(nibble)]);
  }
  return out;
}

} // namespace surge
