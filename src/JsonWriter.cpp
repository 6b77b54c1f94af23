#include "JsonWriter.hpp"

#include <stdio.h>

namespace sf
{

void JsonWriteInit(JsonWriter* writer, MemAllocHeap* heap)
{
  writer->m_Heap         = heap;
  writer->m_Depth        = 0;
  writer->m_PrependComma = false;
  BufferInit(&writer->m_Text);
}

void JsonWriteDestroy(JsonWriter* writer)
{
  BufferDestroy(&writer->m_Text, writer->m_Heap);
}

static void JsonWrite(JsonWriter* writer, const char* text, size_t count)
{
  BufferAppend(&writer->m_Text, writer->m_Heap, text, count);
}

static void JsonWriteChar(JsonWriter* writer, char ch)
{
  BufferAppendOne(&writer->m_Text, writer->m_Heap, ch);
}

static void JsonWriteNewline(JsonWriter* writer)
{
  JsonWriteChar(writer, '\n');
  for (int i = 0; i < writer->m_Depth; ++i)
    JsonWrite(writer, "  ", 2);
}

// Separates a new value from its predecessor at the same level.
static void JsonWriteSeparator(JsonWriter* writer)
{
  if (writer->m_PrependComma)
    JsonWriteChar(writer, ',');
}

static void JsonWriteOpen(JsonWriter* writer, char ch)
{
  JsonWriteSeparator(writer);
  JsonWriteChar(writer, ch);
  ++writer->m_Depth;
  writer->m_PrependComma = false;
}

static void JsonWriteClose(JsonWriter* writer, char ch)
{
  bool empty = !writer->m_PrependComma;
  --writer->m_Depth;
  if (!empty)
    JsonWriteNewline(writer);
  JsonWriteChar(writer, ch);
  writer->m_PrependComma = true;
}

void JsonWriteStartObject(JsonWriter* writer)
{
  JsonWriteOpen(writer, '{');
}

void JsonWriteEndObject(JsonWriter* writer)
{
  JsonWriteClose(writer, '}');
}

static void JsonWriteQuoted(JsonWriter* writer, const char* value)
{
  JsonWriteChar(writer, '"');

  while (char ch = *value++)
  {
    switch (ch)
    {
      case '"':  JsonWrite(writer, "\\\"", 2); break;
      case '\\': JsonWrite(writer, "\\\\", 2); break;
      case '\n': JsonWrite(writer, "\\n", 2); break;
      case '\r': JsonWrite(writer, "\\r", 2); break;
      case '\t': JsonWrite(writer, "\\t", 2); break;
      case '\f': JsonWrite(writer, "\\f", 2); break;
      case '\b': JsonWrite(writer, "\\b", 2); break;
      default:
        if ((unsigned char) ch < 0x20)
        {
          char esc[8];
          snprintf(esc, sizeof esc, "\\u%04x", (unsigned int) ch);
          JsonWrite(writer, esc, 6);
        }
        else
        {
          JsonWriteChar(writer, ch);
        }
        break;
    }
  }

  JsonWriteChar(writer, '"');
}

void JsonWriteKeyName(JsonWriter* writer, const char* keyName)
{
  JsonWriteSeparator(writer);
  JsonWriteNewline(writer);
  JsonWriteQuoted(writer, keyName);
  JsonWrite(writer, ": ", 2);
  writer->m_PrependComma = false;
}

void JsonWriteValueString(JsonWriter* writer, const char* value)
{
  JsonWriteSeparator(writer);
  JsonWriteQuoted(writer, value);
  writer->m_PrependComma = true;
}

bool JsonWriteToFile(JsonWriter* writer, const char* filename)
{
  JsonWriteChar(writer, '\n');
  return WriteFileAtomic(filename, writer->m_Text.m_Storage, writer->m_Text.m_Size);
}

}
