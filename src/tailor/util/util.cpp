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
#include "tailor/util/util_fwd.hpp"
#include <string>

namespace tailor::util
{

// Implementations.

std::string get_where_am_i_str(String_view file, String_view function, unsigned int line)
{
  std::string where(file);
  where += ':';
  where += function;
  where += '(';
  where += std::to_string(line);
  where += ')';
  return where;
}

std::ostream& operator<<(std::ostream& os, Builder_semantics val)
{
  switch (val)
  {
  case Builder_semantics::S_REFERENCE:
    return os << "ref";
  case Builder_semantics::S_VALUE:
    return os << "val";
  case Builder_semantics::S_NONE:
    break;
  }
  return os << "none";
}

} // namespace tailor::util
