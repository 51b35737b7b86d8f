#pragma once

#include <stddef.h>
#include <stdint.h>

namespace config {

constexpr size_t kMaxEntries = 32;
constexpr size_t kMaxKeyLength = 64;
constexpr size_t kMaxValueLength = 128;

struct Entry {
    char key[kMaxKeyLength];
    char value[kMaxValueLength];
};

struct Table {
    Entry entries[kMaxEntries];
    size_t count;
};

void init(Table& table);
bool parse(const char* data, size_t length, Table& table);
const char* get(const Table& table, const char* key);
bool get(const Table& table, const char* key, const char*& value_out);

// Decimal or 0x-prefixed hex. False when the key is missing or the value is
// not a number that fits in 64 bits.
bool get_u64(const Table& table, const char* key, uint64_t& value_out);

}  // namespace config

