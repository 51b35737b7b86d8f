#include <assert.h>
#include <stdio.h>
#include <string.h>

#include "kernel/config.hpp"

namespace {

bool parse_text(const char* text, config::Table& table) {
    return config::parse(text, strlen(text), table);
}

void test_parse_and_get() {
    config::Table table;
    assert(parse_text("# comment\n"
                      "  kernel :  EFI\\BOOT\\kernel.sys  \r\n"
                      "; another comment\n"
                      "\n"
                      "max_width: 1280\n",
                      table));
    assert(table.count == 2);
    assert(strcmp(config::get(table, "kernel"), "EFI\\BOOT\\kernel.sys") == 0);

    const char* value = nullptr;
    assert(config::get(table, "max_width", value));
    assert(strcmp(value, "1280") == 0);
    assert(!config::get(table, "missing", value));
    assert(config::get(table, "missing") == nullptr);
    assert(config::get(table, nullptr) == nullptr);
}

void test_later_keys_replace_earlier() {
    config::Table table;
    assert(parse_text("log_level: info\nlog_level: debug\n", table));
    assert(table.count == 1);
    assert(strcmp(config::get(table, "log_level"), "debug") == 0);
}

void test_malformed_lines_are_reported() {
    config::Table table;
    assert(!parse_text("no separator here\nkey: value\n: empty key\n", table));
    assert(table.count == 1);
    assert(strcmp(config::get(table, "key"), "value") == 0);
    assert(!config::parse(nullptr, 0, table));
}

void test_empty_value() {
    config::Table table;
    assert(parse_text("kernel:\n", table));
    assert(strcmp(config::get(table, "kernel"), "") == 0);
}

void test_get_u64() {
    config::Table table;
    assert(parse_text("dec: 4096\n"
                      "hex: 0x1F000\n"
                      "upper: 0XFF\n"
                      "max: 18446744073709551615\n"
                      "overflow: 18446744073709551616\n"
                      "word: eight\n"
                      "prefix: 0x\n"
                      "mixed: 12ab\n",
                      table));

    uint64_t value = 0;
    assert(config::get_u64(table, "dec", value) && value == 4096);
    assert(config::get_u64(table, "hex", value) && value == 0x1F000);
    assert(config::get_u64(table, "upper", value) && value == 0xFF);
    assert(config::get_u64(table, "max", value) && value == UINT64_MAX);

    value = 7;
    assert(!config::get_u64(table, "overflow", value));
    assert(!config::get_u64(table, "word", value));
    assert(!config::get_u64(table, "prefix", value));
    assert(!config::get_u64(table, "mixed", value));
    assert(!config::get_u64(table, "absent", value));
    assert(value == 7);
}

void test_table_capacity() {
    char text[config::kMaxEntries * 16 + 64];
    size_t length = 0;
    for (size_t i = 0; i < config::kMaxEntries + 1; ++i) {
        length += static_cast<size_t>(
            snprintf(text + length, sizeof(text) - length, "k%zu: %zu\n", i, i));
    }

    config::Table table;
    assert(!config::parse(text, length, table));
    assert(table.count == config::kMaxEntries);
    assert(strcmp(config::get(table, "k0"), "0") == 0);
    assert(config::get(table, "k32") == nullptr);
}

}  // namespace

int main() {
    test_parse_and_get();
    test_later_keys_replace_earlier();
    test_malformed_lines_are_reported();
    test_empty_value();
    test_get_u64();
    test_table_capacity();

    puts("config_test: ok");
    return 0;
}
