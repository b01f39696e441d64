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
 * Registers an error enum as a std::error_code source.
 *
 * Header:
 *   OUTCOME_HPP_DECLARE_ERROR(dds::storage, StorageError)
 * Source:
 *   OUTCOME_CPP_DEFINE_CATEGORY(dds::storage, StorageError, e) {
 *     switch (e) { ... }
 *   }
 */

#define OUTCOME_HPP_DECLARE_ERROR_2(ns, Enum)                 \
  namespace std {                                             \
    template <>                                               \
    struct is_error_code_enum<ns::Enum> : std::true_type {};  \
  }                                                           \
  namespace ns {                                              \
    std::error_code make_error_code(Enum e);                  \
  }

#define OUTCOME_HPP_DECLARE_ERROR_1(Enum)                  \
  namespace std {                                          \
    template <>                                            \
    struct is_error_code_enum<Enum> : std::true_type {};   \
  }                                                        \
  std::error_code make_error_code(Enum e);

#define OUTCOME_DECLARE_GET_MACRO(_1, _2, NAME, ...) NAME
#define OUTCOME_HPP_DECLARE_ERROR(...)                           \
  OUTCOME_DECLARE_GET_MACRO(__VA_ARGS__,                         \
                            OUTCOME_HPP_DECLARE_ERROR_2,         \
                            OUTCOME_HPP_DECLARE_ERROR_1)         \
  (__VA_ARGS__)

#define OUTCOME_CPP_DEFINE_CATEGORY_3(ns, Enum, Name)                  \
  namespace ns {                                                       \
    static std::string outcomeMessageOf##Enum(Enum);                   \
    namespace {                                                        \
      struct Enum##Category final : std::error_category {              \
        const char *name() const noexcept override {                   \
          return #ns "::" #Enum;                                       \
        }                                                              \
        std::string message(int c) const override {                    \
          return outcomeMessageOf##Enum(static_cast<Enum>(c));         \
        }                                                              \
      };                                                               \
    }                                                                  \
    std::error_code make_error_code(Enum e) {                          \
      static const Enum##Category category{};                          \
      return {static_cast<int>(e), category};                          \
    }                                                                  \
  }                                                                    \
  std::string ns::outcomeMessageOf##Enum(ns::Enum Name)

#define OUTCOME_CPP_DEFINE_CATEGORY_2(Enum, Name)                  \
  static std::string outcomeMessageOf##Enum(Enum);                 \
  namespace {                                                      \
    struct Enum##Category final : std::error_category {            \
      const char *name() const noexcept override {                 \
        return #Enum;                                              \
      }                                                            \
      std::string message(int c) const override {                  \
        return outcomeMessageOf##Enum(static_cast<Enum>(c));       \
      }                                                            \
    };                                                             \
  }                                                                \
  std::error_code make_error_code(Enum e) {                        \
    static const Enum##Category category{};                        \
    return {static_cast<int>(e), category};                        \
  }                                                                \
  std::string outcomeMessageOf##Enum(Enum Name)

#define OUTCOME_DEFINE_GET_MACRO(_1, _2, _3, NAME, ...) NAME
#define OUTCOME_CPP_DEFINE_CATEGORY(...)                           \
  OUTCOME_DEFINE_GET_MACRO(__VA_ARGS__,                            \
                           OUTCOME_CPP_DEFINE_CATEGORY_3,          \
                           OUTCOME_CPP_DEFINE_CATEGORY_2)          \
  (__VA_ARGS__)
