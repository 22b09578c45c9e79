/*
 * Tencent is pleased to support the open source community by making 3TS available.
 *
 * Copyright (C) 2020 THL A29 Limited, a Tencent company.  All rights reserved. The below software
 * in this distribution may have been modified by THL A29 Limited ("Tencent Modifications"). All
 * Tencent Modifications are Copyright (C) THL A29 Limited.
 *
 */

// Reflection for enums declared with ENUM_BEGIN/ENUM_MEMBER/ENUM_END in the file named by
// ENUM_FILE. Include this header inside the namespace the enums belong to:
//
//   #define ENUM_FILE "./my_header.h"
//   #include "extend_enum.h"
//
// Each enum gets Count<E>(), ToString(e), Members<E>(), FromString<E>(s) and operator<<.

#ifndef SERCHECK_UTIL_EXTEND_ENUM_H
#define SERCHECK_UTIL_EXTEND_ENUM_H

template <typename EnumType, typename = std::enable_if_t<std::is_enum_v<EnumType>>>
constexpr uint32_t Count();
template <typename EnumType, typename = std::enable_if_t<std::is_enum_v<EnumType>>>
const char* ToString(const EnumType e);
template <typename EnumType, typename = std::enable_if_t<std::is_enum_v<EnumType>>>
const std::array<EnumType, Count<EnumType>()>& Members();

template <typename EnumType, typename = std::enable_if_t<std::is_enum_v<EnumType>>>
std::optional<EnumType> FromString(const std::string& s) {
  for (const EnumType e : Members<EnumType>()) {
    if (s == ToString(e)) {
      return e;
    }
  }
  return std::nullopt;
}

#endif

#ifdef ENUM_FILE

#define ENUM_BEGIN(name) enum class name : uint32_t {
#define ENUM_MEMBER(_, member) member,
#define ENUM_END(name)                                      \
  name##_MAX                                                \
  };                                                        \
  template <>                                               \
  constexpr uint32_t Count<name>() {                        \
    return static_cast<uint32_t>(name::name##_MAX);         \
  }

#include ENUM_FILE

#undef ENUM_BEGIN
#undef ENUM_MEMBER
#undef ENUM_END

#define ENUM_BEGIN(name)                                    \
  template <>                                               \
  inline const char* ToString<name>(const name e) {         \
    static const std::array<const char*, Count<name>()> strings {
#define ENUM_MEMBER(_, member) #member,
#define ENUM_END(name)                                      \
  };                                                        \
  return strings.at(static_cast<uint32_t>(e));              \
  }                                                         \
  inline std::ostream& operator<<(std::ostream& os, const name e) { return os << ToString(e); }

#include ENUM_FILE

#undef ENUM_BEGIN
#undef ENUM_MEMBER
#undef ENUM_END

#define ENUM_BEGIN(name)                                    \
  template <>                                               \
  inline const std::array<name, Count<name>()>& Members<name>() { \
    static const std::array<name, Count<name>()> members {
#define ENUM_MEMBER(name, member) name::member,
#define ENUM_END(_)                                         \
  };                                                        \
  return members;                                           \
  }

#include ENUM_FILE

#undef ENUM_BEGIN
#undef ENUM_MEMBER
#undef ENUM_END

#undef ENUM_FILE
#endif
