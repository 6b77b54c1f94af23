#ifndef SNAPFETCH_JSONPARSE_HPP
#define SNAPFETCH_JSONPARSE_HPP

#include "Common.hpp"

#include <string.h>

namespace sf
{

struct MemAllocLinear;

struct JsonValue
{
  enum Type
  {
    kNull,
    kBoolean,
    kObject,
    kArray,
    kString,
    kNumber
  };

  Type      m_Type;

  const struct JsonBooleanValue* AsBoolean() const;
  const struct JsonObjectValue* AsObject() const;
  const struct JsonNumberValue* AsNumber() const;
  const struct JsonStringValue* AsString() const;
  const struct JsonArrayValue* AsArray() const;

  // Returns nullptr unless this is an object with a string member named key.
  const char* FindString(const char* key) const;

  const JsonValue* Find(const char* key) const;
};

struct JsonBooleanValue : JsonValue
{
  bool m_Boolean;
};

struct JsonNumberValue : JsonValue
{
  double m_Number;
};

struct JsonStringValue : JsonValue
{
  const char* m_String;
};

struct JsonArrayValue : JsonValue
{
  size_t              m_Count;
  const JsonValue**   m_Values;
};

struct JsonObjectValue : JsonValue
{
  size_t              m_Count;
  const char**        m_Names;
  const JsonValue**   m_Values;
};

inline const JsonBooleanValue* JsonValue::AsBoolean() const
{
  return kBoolean == m_Type ? static_cast<const JsonBooleanValue*>(this) : nullptr;
}

inline const JsonObjectValue* JsonValue::AsObject() const
{
  return kObject == m_Type ? static_cast<const JsonObjectValue*>(this) : nullptr;
}

inline const JsonArrayValue* JsonValue::AsArray() const
{
  return kArray == m_Type ? static_cast<const JsonArrayValue*>(this) : nullptr;
}

inline const JsonStringValue* JsonValue::AsString() const
{
  return kString == m_Type ? static_cast<const JsonStringValue*>(this) : nullptr;
}

inline const JsonNumberValue* JsonValue::AsNumber() const
{
  return kNumber == m_Type ? static_cast<const JsonNumberValue*>(this) : nullptr;
}

inline const JsonValue* JsonValue::Find(const char* key) const
{
  const JsonObjectValue* obj = AsObject();
  if (!obj)
    return nullptr;

  for (size_t i = 0, count = obj->m_Count; i < count; ++i)
  {
    if (0 == strcmp(obj->m_Names[i], key))
      return obj->m_Values[i];
  }

  return nullptr;
}

inline const char* JsonValue::FindString(const char* key) const
{
  const JsonValue* value = Find(key);
  const JsonStringValue* str = value ? value->AsString() : nullptr;
  return str ? str->m_String : nullptr;
}

// Parse a JSON document in place. String data is unescaped into `buffer`, so it
// must stay alive as long as the returned values. Values are allocated from
// `allocator`, temporary lists from `scratch`. Returns nullptr and fills in
// error_message on failure.
const JsonValue* JsonParse(
    char *buffer,
    MemAllocLinear* allocator,
    MemAllocLinear* scratch,
    char (&error_message)[1024]);

}

#endif
