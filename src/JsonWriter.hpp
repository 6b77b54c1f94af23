#ifndef SNAPFETCH_JSONWRITER_HPP
#define SNAPFETCH_JSONWRITER_HPP

#include "Common.hpp"
#include "Buffer.hpp"

namespace sf
{

struct MemAllocHeap;

// Streaming JSON emitter. Objects are written one member per line so the
// persisted documents stay diffable.
struct JsonWriter
{
  MemAllocHeap* m_Heap;
  Buffer<char>  m_Text;
  int           m_Depth;
  bool          m_PrependComma;
};

void JsonWriteInit(JsonWriter* writer, MemAllocHeap* heap);
void JsonWriteDestroy(JsonWriter* writer);

void JsonWriteStartObject(JsonWriter* writer);
void JsonWriteEndObject(JsonWriter* writer);

void JsonWriteKeyName(JsonWriter* writer, const char* keyName);

void JsonWriteValueString(JsonWriter* writer, const char* value);

// Atomically replace `filename` with the document written so far.
bool JsonWriteToFile(JsonWriter* writer, const char* filename);

}

#endif
