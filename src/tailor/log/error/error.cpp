/* Tailor
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "tailor/log/error/error.hpp"
#include <string>

namespace tailor::log::error
{

namespace
{

/// The `"tailor/log"` error category: name and per-Code message.
class Category :
  public boost::system::error_category
{
public:
  /// The singleton.
  static const Category S_CATEGORY;

  /**
   * `"tailor/log"`.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Message for Code `val`.
   * @param val
   *        A Code as `int`.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  /// Only #S_CATEGORY.
  Category() = default;
}; // class Category

const Category Category::S_CATEGORY{};

const char* Category::name() const noexcept // Virtual.
{
  return "tailor/log";
}

std::string Category::message(int val) const // Virtual.
{
  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_SEVERITY:
    return "Verbosity spec names a severity that is neither a log::Sev name nor a log::Sev number.";
  case Code::S_UNKNOWN_COMPONENT:
    return "Verbosity spec names a component that was not registered with the log::Config.";
  case Code::S_MALFORMED_VERBOSITY_SPEC:
    return "Verbosity spec token is neither `sev` nor `component:sev`.";
  }
  return "Unknown tailor/log error code [" + std::to_string(val) + "].";
}

} // namespace (anon)

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

} // namespace tailor::log::error
