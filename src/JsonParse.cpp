#include "JsonParse.hpp"
#include "MemAllocLinear.hpp"
#include "Stats.hpp"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>

namespace sf
{

static JsonBooleanValue s_TrueValue;
static JsonBooleanValue s_FalseValue;
static const JsonValue s_NullValue = { JsonValue::kNull };

// Nesting limit; the documents we read are two levels deep.
static const int kMaxJsonDepth = 64;

struct JsonParser
{
  char           *m_Cursor;
  int             m_LineNumber;
  int             m_Depth;
  MemAllocLinear *m_Allocator;
  MemAllocLinear *m_Scratch;
  char            m_Error[1024];
};

// Singly linked list of parsed members, built in scratch memory while the
// element count is still unknown.
struct JsonMember
{
  const char      *m_Name;
  const JsonValue *m_Value;
  JsonMember      *m_Next;
};

static const JsonValue* JsonFail(JsonParser* p, const char* error)
{
  if (!p->m_Error[0])
    snprintf(p->m_Error, sizeof p->m_Error, "line %d: %s", p->m_LineNumber, error);
  return nullptr;
}

// Arena exhaustion is reported as a parse failure; the caller decides what an
// oversized document means.
template <typename T>
static T* JsonAllocate(JsonParser* p, MemAllocLinear* allocator, size_t count = 1)
{
  T* result = static_cast<T*>(LinearTryAllocate(allocator, sizeof(T) * count, ALIGNOF(T)));
  if (!result)
    JsonFail(p, "document too large");
  return result;
}

static char SkipWhitespace(JsonParser* p)
{
  char* ptr = p->m_Cursor;
  while (*ptr && isspace((unsigned char) *ptr))
  {
    if ('\n' == *ptr)
      ++p->m_LineNumber;
    ++ptr;
  }
  p->m_Cursor = ptr;
  return *ptr;
}

static char* EncodeUtf8(char* out, uint32_t code)
{
  if (code < 0x80)
  {
    *out++ = char(code);
  }
  else if (code < 0x800)
  {
    *out++ = char(0xc0 | (code >> 6));
    *out++ = char(0x80 | (code & 0x3f));
  }
  else
  {
    *out++ = char(0xe0 | (code >> 12));
    *out++ = char(0x80 | ((code >> 6) & 0x3f));
    *out++ = char(0x80 | (code & 0x3f));
  }
  return out;
}

// Unescapes the string at the cursor in place. The result is never longer
// than the escaped source text.
static const char* ParseString(JsonParser* p)
{
  char* rptr = p->m_Cursor + 1;
  char* wptr = p->m_Cursor;
  char* result = wptr;

  for (;;)
  {
    char ch = *rptr++;

    if ('\0' == ch)
    {
      JsonFail(p, "end of file inside string");
      return nullptr;
    }

    if ('"' == ch)
      break;

    if ('\n' == ch)
      ++p->m_LineNumber;

    if ('\\' != ch)
    {
      *wptr++ = ch;
      continue;
    }

    switch (char esc = *rptr++)
    {
      case '\\': case '"': case '/': *wptr++ = esc; break;
      case 'b': *wptr++ = '\b'; break;
      case 'f': *wptr++ = '\f'; break;
      case 'n': *wptr++ = '\n'; break;
      case 'r': *wptr++ = '\r'; break;
      case 't': *wptr++ = '\t'; break;
      case 'u':
      {
        uint32_t code = 0;
        for (int i = 0; i < 4; ++i)
        {
          char digit = *rptr++;
          if (!isxdigit((unsigned char) digit))
          {
            JsonFail(p, "expected hex digit in \\u escape");
            return nullptr;
          }
          int lc = tolower((unsigned char) digit);
          code = (code << 4) | uint32_t(lc >= 'a' ? lc - 'a' + 10 : lc - '0');
        }
        // \uXXXX takes six source bytes and at most three output bytes.
        wptr = EncodeUtf8(wptr, code);
        break;
      }
      default:
        JsonFail(p, "unsupported escape code");
        return nullptr;
    }
  }

  *wptr = '\0';
  p->m_Cursor = rptr;
  return result;
}

static const JsonValue* ParseValue(JsonParser* p);

static const JsonValue* ParseObject(JsonParser* p)
{
  MemAllocLinearScope scratch_scope(p->m_Scratch);

  ++p->m_Cursor; // '{'

  JsonMember *head = nullptr, *tail = nullptr;
  size_t count = 0;

  if ('}' == SkipWhitespace(p))
  {
    ++p->m_Cursor;
  }
  else
  {
    for (;;)
    {
      if ('"' != SkipWhitespace(p))
        return JsonFail(p, "expected key name");

      const char* name = ParseString(p);
      if (!name)
        return nullptr;

      if (':' != SkipWhitespace(p))
        return JsonFail(p, "expected ':'");
      ++p->m_Cursor;

      const JsonValue* value = ParseValue(p);
      if (!value)
        return nullptr;

      JsonMember* member = JsonAllocate<JsonMember>(p, p->m_Scratch);
      if (!member)
        return nullptr;
      member->m_Name  = name;
      member->m_Value = value;
      member->m_Next  = nullptr;
      if (tail)
        tail->m_Next = member;
      else
        head = member;
      tail = member;
      ++count;

      char ch = SkipWhitespace(p);
      ++p->m_Cursor;
      if ('}' == ch)
        break;
      if (',' != ch)
        return JsonFail(p, "expected ',' or '}'");
    }
  }

  JsonObjectValue* result = JsonAllocate<JsonObjectValue>(p, p->m_Allocator);
  const char** names      = JsonAllocate<const char*>(p, p->m_Allocator, count);
  const JsonValue** values = JsonAllocate<const JsonValue*>(p, p->m_Allocator, count);
  if (!result || !names || !values)
    return nullptr;

  result->m_Type   = JsonValue::kObject;
  result->m_Count  = count;
  result->m_Names  = names;
  result->m_Values = values;

  size_t index = 0;
  for (JsonMember* m = head; m; m = m->m_Next, ++index)
  {
    result->m_Names[index]  = m->m_Name;
    result->m_Values[index] = m->m_Value;
  }

  return result;
}

static const JsonValue* ParseArray(JsonParser* p)
{
  MemAllocLinearScope scratch_scope(p->m_Scratch);

  ++p->m_Cursor; // '['

  JsonMember *head = nullptr, *tail = nullptr;
  size_t count = 0;

  if (']' == SkipWhitespace(p))
  {
    ++p->m_Cursor;
  }
  else
  {
    for (;;)
    {
      const JsonValue* value = ParseValue(p);
      if (!value)
        return nullptr;

      JsonMember* elem = JsonAllocate<JsonMember>(p, p->m_Scratch);
      if (!elem)
        return nullptr;
      elem->m_Name  = nullptr;
      elem->m_Value = value;
      elem->m_Next  = nullptr;
      if (tail)
        tail->m_Next = elem;
      else
        head = elem;
      tail = elem;
      ++count;

      char ch = SkipWhitespace(p);
      ++p->m_Cursor;
      if (']' == ch)
        break;
      if (',' != ch)
        return JsonFail(p, "expected ',' or ']'");
    }
  }

  JsonArrayValue* result = JsonAllocate<JsonArrayValue>(p, p->m_Allocator);
  const JsonValue** values = JsonAllocate<const JsonValue*>(p, p->m_Allocator, count);
  if (!result || !values)
    return nullptr;

  result->m_Type   = JsonValue::kArray;
  result->m_Count  = count;
  result->m_Values = values;

  size_t index = 0;
  for (JsonMember* m = head; m; m = m->m_Next, ++index)
    result->m_Values[index] = m->m_Value;

  return result;
}

static bool MatchLiteral(JsonParser* p, const char* literal)
{
  size_t len = strlen(literal);
  if (0 != strncmp(p->m_Cursor, literal, len) || isalnum((unsigned char) p->m_Cursor[len]))
    return false;
  p->m_Cursor += len;
  return true;
}

static const JsonValue* ParseValue(JsonParser* p)
{
  if (++p->m_Depth > kMaxJsonDepth)
    return JsonFail(p, "document nested too deeply");

  const JsonValue* result = nullptr;
  char ch = SkipWhitespace(p);

  switch (ch)
  {
    case '{':
      result = ParseObject(p);
      break;

    case '[':
      result = ParseArray(p);
      break;

    case '"':
      if (const char* str = ParseString(p))
      {
        JsonStringValue* sv = JsonAllocate<JsonStringValue>(p, p->m_Allocator);
        if (!sv)
          return nullptr;
        sv->m_Type   = JsonValue::kString;
        sv->m_String = str;
        result       = sv;
      }
      break;

    case '-':
    case '0': case '1': case '2': case '3': case '4':
    case '5': case '6': case '7': case '8': case '9':
    {
      char* end = nullptr;
      double number = strtod(p->m_Cursor, &end);
      if (end == p->m_Cursor)
        return JsonFail(p, "bad number");
      p->m_Cursor = end;

      JsonNumberValue* nv = JsonAllocate<JsonNumberValue>(p, p->m_Allocator);
      if (!nv)
        return nullptr;
      nv->m_Type   = JsonValue::kNumber;
      nv->m_Number = number;
      result       = nv;
      break;
    }

    case '\0':
      return JsonFail(p, "unexpected end of file");

    default:
      if (MatchLiteral(p, "true"))
        result = &s_TrueValue;
      else if (MatchLiteral(p, "false"))
        result = &s_FalseValue;
      else if (MatchLiteral(p, "null"))
        result = &s_NullValue;
      else
        return JsonFail(p, "invalid literal, expected one of false, true or null");
      break;
  }

  --p->m_Depth;
  return result;
}

const JsonValue* JsonParse(
    char *buffer,
    MemAllocLinear* allocator,
    MemAllocLinear* scratch,
    char (&error_message)[1024])
{
  TimingScope timing_scope(nullptr, &g_Stats.m_JsonParseTimeCycles);

  // Setup statics. Harmless to do multiple times.
  s_TrueValue.m_Type     = JsonValue::kBoolean;
  s_TrueValue.m_Boolean  = true;
  s_FalseValue.m_Type    = JsonValue::kBoolean;
  s_FalseValue.m_Boolean = false;

  JsonParser parser;
  parser.m_Cursor     = buffer;
  parser.m_LineNumber = 1;
  parser.m_Depth      = 0;
  parser.m_Allocator  = allocator;
  parser.m_Scratch    = scratch;
  parser.m_Error[0]   = '\0';

  const JsonValue* root = ParseValue(&parser);

  if (root && '\0' != SkipWhitespace(&parser))
    root = JsonFail(&parser, "data after document");

  if (root)
    error_message[0] = '\0';
  else
    CopyString(error_message, sizeof error_message, parser.m_Error);

  return root;
}

}
