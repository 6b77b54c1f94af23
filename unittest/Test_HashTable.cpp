#include "TestHarness.hpp"
#include "HashTable.hpp"

#include <stdio.h>
#include <vector>
#include <string>

using namespace sf;

class HashTableTest : public ::testing::Test
{
protected:
  MemAllocHeap heap;
  // Keys aren't copied by the table.
  std::vector<std::string> keys;

protected:
  void SetUp() override
  {
    HeapInit(&heap);

    for (int i = 0; i < 2048; ++i)
    {
      char str[128];
      snprintf(str, sizeof str, "pruned.tar.part%04d", i);
      keys.push_back(str);
    }
  }

  void TearDown() override
  {
    HeapDestroy(&heap);
  }
};

TEST_F(HashTableTest, Empty)
{
  HashTable<int, kFlagCaseSensitive> tbl;
  HashTableInit(&tbl, &heap);
  EXPECT_EQ(0u, tbl.m_RecordCount);
  EXPECT_EQ(nullptr, HashTableLookup(&tbl, Djb2Hash("foo"), "foo"));
  HashTableDestroy(&tbl);
}

TEST_F(HashTableTest, Single)
{
  HashTable<int, kFlagCaseSensitive> tbl;
  HashTableInit(&tbl, &heap);
  HashTableInsert(&tbl, 1, "foo", 15);
  EXPECT_EQ(1u, tbl.m_RecordCount);
  int* ptr = HashTableLookup(&tbl, 1, "foo");
  ASSERT_NE(nullptr, ptr);
  ASSERT_EQ(15, *ptr);
  HashTableDestroy(&tbl);
}

TEST_F(HashTableTest, SameHashDifferentStrings)
{
  HashTable<int, kFlagCaseSensitive> tbl;
  HashTableInit(&tbl, &heap);
  HashTableInsert(&tbl, 7, "a", 1);
  HashTableInsert(&tbl, 7, "b", 2);

  ASSERT_EQ(1, *HashTableLookup(&tbl, 7, "a"));
  ASSERT_EQ(2, *HashTableLookup(&tbl, 7, "b"));
  ASSERT_EQ(nullptr, HashTableLookup(&tbl, 7, "c"));
  HashTableDestroy(&tbl);
}

TEST_F(HashTableTest, MultiDistinct)
{
  HashTable<int, kFlagCaseSensitive> tbl;
  HashTableInit(&tbl, &heap);

  for (int i = 0; i < 2048; ++i)
    HashTableInsert(&tbl, Djb2Hash(keys[i].c_str()), keys[i].c_str(), i);

  EXPECT_EQ(2048u, tbl.m_RecordCount);

  for (int i = 0; i < 2048; ++i)
  {
    std::string key = keys[i];
    int* ptr = HashTableLookup(&tbl, Djb2Hash(key.c_str()), key.c_str());
    ASSERT_NE(nullptr, ptr);
    EXPECT_EQ(i, *ptr);
  }
  HashTableDestroy(&tbl);
}

TEST_F(HashTableTest, MultiDistinctCaseFolded)
{
  HashTable<int, kFlagCaseInsensitive> tbl;
  HashTableInit(&tbl, &heap);

  for (int i = 0; i < 2048; ++i)
    HashTableInsert(&tbl, Djb2HashNoCase(keys[i].c_str()), keys[i].c_str(), i);

  EXPECT_EQ(2048u, tbl.m_RecordCount);

  for (int i = 0; i < 2048; ++i)
  {
    char str[128];
    snprintf(str, sizeof str, "PRUNED.tar.Part%04d", i);
    int* ptr = HashTableLookup(&tbl, Djb2HashNoCase(str), str);
    ASSERT_NE(nullptr, ptr);
    EXPECT_EQ(i, *ptr);
  }
  HashTableDestroy(&tbl);
}

TEST_F(HashTableTest, WalkVisitsEveryRecordOnce)
{
  HashTable<int, kFlagCaseSensitive> tbl;
  HashTableInit(&tbl, &heap);

  for (int i = 0; i < 300; ++i)
    HashTableInsert(&tbl, Djb2Hash(keys[i].c_str()), keys[i].c_str(), i);

  std::vector<int> seen(300, 0);
  uint32_t visited = 0;

  HashTableWalk(&tbl, [&](uint32_t index, uint32_t, const char* key, const int& value)
  {
    EXPECT_EQ(visited, index);
    EXPECT_EQ(keys[value], key);
    ++seen[value];
    ++visited;
  });

  EXPECT_EQ(300u, visited);
  for (int count : seen)
    EXPECT_EQ(1, count);

  HashTableDestroy(&tbl);
}
