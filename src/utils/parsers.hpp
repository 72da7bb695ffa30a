/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string_view>
#include <utility>

#include "types/fraction.hpp"

namespace light::util {

  /**
   * Case-insensitive comparison of two string views.
   *
   * @param lhs First string view
   * @param rhs Second string view
   * @return true if strings are equal ignoring case, false otherwise
   */
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  inline std::string_view trim(std::string_view input) {
    auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) {
      return {};
    }
    auto last = input.find_last_not_of(" \t\n\r");
    return input.substr(first, last - first + 1);
  }

  inline std::optional<uint64_t> parseUnsigned(std::string_view input) {
    uint64_t number = 0;
    auto [ptr, ec] =
        std::from_chars(input.data(), input.data() + input.size(), number);
    if (ec != std::errc() or ptr != input.data() + input.size()) {
      return std::nullopt;
    }
    return number;
  }

  /**
   * Parses a string representing a time duration (e.g., "500ms", "336h",
   * "14 days") and converts it to nanoseconds.
   *
   * Recognized suffixes (case-insensitive): ns, us, ms, s, m, h, d, w and
   * their long forms. A number without suffix is seconds.
   *
   * @param input string representation of duration
   * @return duration if parsing succeeded, std::nullopt otherwise
   */
  inline std::optional<std::chrono::nanoseconds> parseTimeDuration(
      std::string_view input) {
    input = trim(input);

    size_t i = 0;
    while (i < input.size()
           && std::isdigit(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    if (i == 0) {
      return std::nullopt;
    }

    auto number = parseUnsigned(input.substr(0, i));
    if (not number.has_value()) {
      return std::nullopt;
    }
    auto suffix = trim(input.substr(i));

    constexpr uint64_t kSec = 1'000'000'000;
    struct Entry {
      std::string_view suffix;
      uint64_t multiplier;
    };
    static constexpr Entry suffixes[] = {
        {"", kSec},
        {"ns", 1},
        {"us", 1'000},
        {"ms", 1'000'000},
        {"s", kSec},
        {"sec", kSec},
        {"second", kSec},
        {"seconds", kSec},
        {"m", 60 * kSec},
        {"min", 60 * kSec},
        {"minute", 60 * kSec},
        {"minutes", 60 * kSec},
        {"h", 3600 * kSec},
        {"hour", 3600 * kSec},
        {"hours", 3600 * kSec},
        {"d", 86400 * kSec},
        {"day", 86400 * kSec},
        {"days", 86400 * kSec},
        {"w", 604800 * kSec},
        {"week", 604800 * kSec},
        {"weeks", 604800 * kSec},
    };

    for (const auto &[table_suffix, multiplier] : suffixes) {
      if (iequals(table_suffix, suffix)) {
        // Result must fit into signed nanoseconds
        if (*number > static_cast<uint64_t>(INT64_MAX) / multiplier) {
          return std::nullopt;
        }
        return std::chrono::nanoseconds{
            static_cast<std::chrono::nanoseconds::rep>(*number * multiplier)};
      }
    }

    return std::nullopt;
  }

  /**
   * Parses a fraction written as "numerator/denominator", e.g. "1/3".
   * Range is not checked here.
   */
  inline std::optional<Fraction> parseFraction(std::string_view input) {
    input = trim(input);
    auto slash = input.find('/');
    if (slash == std::string_view::npos) {
      return std::nullopt;
    }
    auto numerator = parseUnsigned(trim(input.substr(0, slash)));
    auto denominator = parseUnsigned(trim(input.substr(slash + 1)));
    if (not numerator.has_value() or not denominator.has_value()) {
      return std::nullopt;
    }
    return Fraction{.numerator = *numerator, .denominator = *denominator};
  }

}  // namespace light::util
