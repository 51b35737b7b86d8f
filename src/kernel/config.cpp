#include "config.hpp"

#include "lib/mem.hpp"
#include "string_util.hpp"

namespace config {
namespace {

// Non-terminated slice of the input text.
struct Span {
    const char* data;
    size_t length;
};

bool is_space(char ch) {
    return ch == ' ' || ch == '\t';
}

Span trim(Span span) {
    while (span.length > 0 && is_space(span.data[0])) {
        ++span.data;
        --span.length;
    }
    while (span.length > 0 && is_space(span.data[span.length - 1])) {
        --span.length;
    }
    return span;
}

Entry* find_entry(Table& table, Span key) {
    for (size_t i = 0; i < table.count; ++i) {
        if (string_util::equals_n(table.entries[i].key, key.data,
                                  key.length)) {
            return &table.entries[i];
        }
    }
    return nullptr;
}

// Blank and comment lines count as parsed.
bool parse_line(Span line, Table& table) {
    line = trim(line);
    if (line.length == 0 || line.data[0] == '#' || line.data[0] == ';') {
        return true;
    }

    size_t colon = 0;
    while (colon < line.length && line.data[colon] != ':') {
        ++colon;
    }
    if (colon == line.length) {
        return false;
    }

    Span key = trim(Span{line.data, colon});
    Span value = trim(Span{line.data + colon + 1, line.length - colon - 1});
    if (key.length == 0) {
        return false;
    }

    Entry* entry = find_entry(table, key);
    if (entry == nullptr) {
        if (table.count >= kMaxEntries) {
            return false;
        }
        entry = &table.entries[table.count];
        if (!string_util::copy_exact(entry->key, kMaxKeyLength, key.data,
                                     key.length)) {
            return false;
        }
        ++table.count;
    }

    return string_util::copy_exact(entry->value, kMaxValueLength, value.data,
                                   value.length);
}

int digit_value(char ch, uint64_t base) {
    int value = -1;
    if (ch >= '0' && ch <= '9') {
        value = ch - '0';
    } else if (base == 16 && ch >= 'a' && ch <= 'f') {
        value = ch - 'a' + 10;
    } else if (base == 16 && ch >= 'A' && ch <= 'F') {
        value = ch - 'A' + 10;
    }
    return value;
}

bool parse_u64(const char* text, uint64_t& value_out) {
    uint64_t base = 10;
    if (text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text += 2;
    }
    if (*text == '\0') {
        return false;
    }

    uint64_t value = 0;
    for (; *text != '\0'; ++text) {
        int digit = digit_value(*text, base);
        if (digit < 0) {
            return false;
        }
        if (value > (UINT64_MAX - static_cast<uint64_t>(digit)) / base) {
            return false;
        }
        value = value * base + static_cast<uint64_t>(digit);
    }
    value_out = value;
    return true;
}

}  // namespace

void init(Table& table) {
    memset(&table, 0, sizeof(Table));
}

bool parse(const char* data, size_t length, Table& table) {
    if (data == nullptr) {
        return false;
    }

    init(table);
    bool success = true;
    size_t cursor = 0;
    while (cursor < length) {
        size_t end = cursor;
        while (end < length && data[end] != '\n' && data[end] != '\r') {
            ++end;
        }
        if (!parse_line(Span{data + cursor, end - cursor}, table)) {
            success = false;
        }

        cursor = end;
        while (cursor < length &&
               (data[cursor] == '\n' || data[cursor] == '\r')) {
            ++cursor;
        }
    }
    return success;
}

const char* get(const Table& table, const char* key) {
    if (key == nullptr) {
        return nullptr;
    }
    for (size_t i = 0; i < table.count; ++i) {
        if (string_util::equals(table.entries[i].key, key)) {
            return table.entries[i].value;
        }
    }
    return nullptr;
}

bool get(const Table& table, const char* key, const char*& value_out) {
    const char* value = get(table, key);
    if (value == nullptr) {
        return false;
    }
    value_out = value;
    return true;
}

bool get_u64(const Table& table, const char* key, uint64_t& value_out) {
    const char* value = get(table, key);
    if (value == nullptr) {
        return false;
    }
    return parse_u64(value, value_out);
}

}  // namespace config
