/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef JSON_WRITER_HPP
#define JSON_WRITER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/core.h>
#include <yajl/yajl_gen.h>

#include "authgate/output_buffer.hpp"
#include "authgate/output_writer.hpp"

/**
 * nice(ish) interface to writing a JSON response body.
 *
 * Output is held in the yajl buffer until flush() is called, so a body
 * which is abandoned half way never reaches the client.
 */
class json_writer : public output_writer {
public:
  json_writer(const json_writer &) = delete;
  json_writer& operator=(const json_writer &) = delete;

  explicit json_writer(output_buffer &out);

  // frees the generator. anything not flushed is discarded.
  ~json_writer() override;

  void start_object();
  void object_key(std::string_view sv);
  void end_object();

  void entry(bool b);

  template<typename TInteger, std::enable_if_t<std::is_integral_v<TInteger> &&
                                               !std::is_same_v<TInteger, bool>, bool> = true>
  void entry(TInteger i) {
    const auto s = fmt::format("{:d}", i);
    check(yajl_gen_number(gen, s.c_str(), s.size()));
  }

  template <typename T,
            std::enable_if_t<std::is_convertible_v<T&&, std::string_view>,
                             bool> = true>
  void entry(T&& s)
  {
    auto sv = std::string_view(s);
    check(yajl_gen_string(gen, reinterpret_cast<const unsigned char *>(sv.data()), sv.size()));
  }

  template <typename TKey, typename TValue>
  void property(TKey&& key, TValue&& val) {
    object_key(std::forward<TKey>(key));
    entry(std::forward<TValue>(val));
  }

  void flush() override;

private:
  static void check(yajl_gen_status status);

  yajl_gen gen;
  output_buffer& out;
};

#endif /* JSON_WRITER_HPP */
