/* Ordo
 * Copyright 2026 The Ordo Authors
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
#include "ordo/map/error/error.hpp"
#include <boost/system/error_code.hpp>
#include <cassert>

namespace ordo::map::error
{

// Types.

/**
 * The boost.system category for errors returned by the ordo::map module.  Think of it as the polymorphic
 * counterpart of error::Code; it kicks in when, for `ordo::Error_code ec`, something like `ec.message()` is
 * invoked, or when `ec` is compared against a generic `boost::system::errc` condition.
 *
 * This class's declaration is not available outside this translation unit; its logic is accessed indirectly
 * through standard boost.system machinery.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements superclass API: returns a `static` string naming this category.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements superclass API: given the integer value of an error::Code, returns its description.
   *
   * @param val
   *        Error code of a Category error (an error::Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * Implements superclass API: maps each error::Code onto the generic condition it is an instance of.
   *
   * @param val
   *        Error code of a Category error.
   * @return `errc::operation_not_supported` or `errc::invalid_argument`.
   */
  boost::system::error_condition default_error_condition(int val) const noexcept override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "ordo_map";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_UNMODIFIABLE_VIEW:
    return "Attempted to modify a map, or remove via an iterator, through an unmodifiable view.";
  case Code::S_IMMUTABLE_MAP:
    return "Attempted to modify a frozen (immutable) map.";
  case Code::S_KEY_OUT_OF_RANGE:
    return "Attempted to modify a sub-map with a key outside its range.";
  case Code::S_NULL_KEY:
    return "A null key was given; keys are never null.";
  case Code::S_INVALID_RANGE:
    return "Sub-map range lower bound compares greater than its upper bound.";
  case Code::S_ENTRY_NOT_IN_MAP:
    return "Entry handle given does not (or no longer does) belong to the map.";
  }
  assert(false);
  return "";
} // Category::message()

boost::system::error_condition Category::default_error_condition(int val) const noexcept // Virtual.
{
  using boost::system::errc::make_error_condition;
  using boost::system::errc::operation_not_supported;
  using boost::system::errc::invalid_argument;

  switch (static_cast<Code>(val))
  {
  case Code::S_UNMODIFIABLE_VIEW:
  case Code::S_IMMUTABLE_MAP:
  case Code::S_KEY_OUT_OF_RANGE:
    return make_error_condition(operation_not_supported);
  case Code::S_NULL_KEY:
  case Code::S_INVALID_RANGE:
  case Code::S_ENTRY_NOT_IN_MAP:
    return make_error_condition(invalid_argument);
  }
  return boost::system::error_condition(val, *this);
}

} // namespace ordo::map::error
