/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <boost/optional.hpp>
#include <string_view>

namespace vegam::common {
  template <typename Enumeration, size_t Number>
  using ConversionTable =
      std::array<std::pair<Enumeration, std::string_view>, Number>;

  /**
   * Conversion table is found by ADL, the enum owner declares
   * `auto &class_conversion_table(Enum &&)` in the enum's namespace.
   */
  template <typename T>
  auto &conversion_table() {
    return class_conversion_table(T{});
  }

  /**
   * @brief Convert enum class value as string
   * @tparam Enumeration - enum type
   * @param value - to convert
   * @return string value of enum or none if the table has no entry
   */
  template <typename Enumeration>
  boost::optional<std::string_view> to_string(Enumeration const value) {
    for (auto &[enumerator, str] : conversion_table<Enumeration>()) {
      if (enumerator == value) {
        return str;
      }
    }
    return boost::none;
  }

  /**
   * @brief Convert string to a enum value
   * @tparam Enumeration - enum type
   * @param value - to convert
   * @return enum value or none if the string is unknown
   */
  template <typename Enumeration>
  boost::optional<Enumeration> from_string(const std::string_view value) {
    for (auto &[enumerator, str] : conversion_table<Enumeration>()) {
      if (str == value) {
        return enumerator;
      }
    }
    return boost::none;
  }
}  // namespace vegam::common
