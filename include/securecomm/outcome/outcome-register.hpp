/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

/**
 * Registration of error enums as std::error_code sources.
 *
 * In a header:
 * @code
 * namespace securecomm::foo { enum class FooError { BAR = 1 }; }
 * OUTCOME_HPP_DECLARE_ERROR(securecomm::foo, FooError)
 * @endcode
 *
 * In exactly one source file:
 * @code
 * OUTCOME_CPP_DEFINE_CATEGORY(securecomm::foo, FooError, e) {
 *   using securecomm::foo::FooError;
 *   switch (e) {
 *     case FooError::BAR:
 *       return "bar happened";
 *   }
 *   return "unknown FooError code";
 * }
 * @endcode
 */

#define OUTCOME_UNIQUE BOOST_OUTCOME_TRY_UNIQUE_NAME

#define OUTCOME_HPP_DECLARE_ERROR_2(Namespace, Enum) \
  namespace Namespace {                              \
    std::error_code make_error_code(Enum e);         \
  }                                                  \
  namespace std {                                    \
    template <>                                      \
    struct is_error_code_enum<Namespace::Enum> : true_type {}; \
  }

#define OUTCOME_HPP_DECLARE_ERROR_1(Enum)                   \
  std::error_code make_error_code(Enum e);                  \
  namespace std {                                           \
    template <>                                             \
    struct is_error_code_enum<Enum> : true_type {};         \
  }

#define OUTCOME_GET_DECLARE_MACRO(_1, _2, NAME, ...) NAME
#define OUTCOME_HPP_DECLARE_ERROR(...)                       \
  OUTCOME_GET_DECLARE_MACRO(__VA_ARGS__,                     \
                            OUTCOME_HPP_DECLARE_ERROR_2,     \
                            OUTCOME_HPP_DECLARE_ERROR_1)     \
  (__VA_ARGS__)

#define OUTCOME_CPP_DEFINE_CATEGORY(Namespace, Enum, Name)             \
  namespace {                                                          \
    class Enum##_Category final : public std::error_category {         \
     public:                                                           \
      const char *name() const noexcept override {                     \
        return #Namespace "::" #Enum;                                  \
      }                                                                \
                                                                       \
      std::string message(int c) const override {                      \
        return toString(static_cast<Namespace::Enum>(c));              \
      }                                                                \
                                                                       \
      static std::string toString(Namespace::Enum Name);               \
    };                                                                 \
  }                                                                    \
                                                                       \
  std::error_code Namespace::make_error_code(Namespace::Enum e) {      \
    static const Enum##_Category category{};                           \
    return {static_cast<int>(e), category};                            \
  }                                                                    \
                                                                       \
  std::string Enum##_Category::toString(Namespace::Enum Name)
