/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of authgate.
 *
 * Copyright (C) 2024 by the authgate developer community.
 * For a full list of authors see the git log.
 */

#ifndef JSON_PAYLOAD_HPP
#define JSON_PAYLOAD_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <yajl/yajl_tree.h>

/**
 * A parsed JSON request body. The top level value must be an object;
 * anything else is rejected with http::bad_request.
 */
class json_payload {
public:
  explicit json_payload(const std::string &body);

  // value of a top level string member, or nothing if the member is
  // missing or of another type.
  [[nodiscard]] std::optional<std::string> get_string(const char *key) const;

  [[nodiscard]] std::optional<bool> get_bool(const char *key) const;

private:
  struct tree_deleter {
    void operator()(yajl_val v) const { yajl_tree_free(v); }
  };

  yajl_val member(const char *key) const;

  std::unique_ptr<std::remove_pointer_t<yajl_val>, tree_deleter> m_root;
};

#endif /* JSON_PAYLOAD_HPP */
