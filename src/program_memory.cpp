#include "program_memory.hpp"

#include <errno.h>
#include <memory>
#include <stdexcept>
#include <stdio.h>
#include <string.h>
#include <string>

using Error = std::runtime_error;

static int
hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static Error
record_error(size_t line, const char* reason)
{
    char buffer[96];
    snprintf(buffer, sizeof(buffer), "Line %zu: %s", line, reason);
    return Error(buffer);
}

void ProgramMemory::load_hex(const char* path)
{
    struct Closer { void operator()(FILE* p) { fclose(p); }};
    auto fp = std::unique_ptr<FILE, Closer>(fopen(path, "r"));

    if (fp == nullptr)
        throw Error(strerror(errno));

    Image image = blank();
    u12 config_word = ERASED;

    // Words are assembled from two bytes, low byte first
    uint32_t upper = 0;
    bool end_of_file = false;

    char text[600];
    size_t line = 0;

    while (!end_of_file && fgets(text, sizeof(text), fp.get())) {
        line++;

        size_t len = strcspn(text, "\r\n");
        if (len == 0)
            continue;

        if (text[0] != ':' || len < 11 || (len - 1) % 2 != 0)
            throw record_error(line, "Malformed record");

        uint8_t bytes[300];
        size_t count = (len - 1) / 2;
        for (size_t i = 0; i < count; i++) {
            int hi = hex_digit(text[1 + 2*i]);
            int lo = hex_digit(text[2 + 2*i]);
            if (hi < 0 || lo < 0)
                throw record_error(line, "Invalid hex digit");
            bytes[i] = uint8_t(hi << 4 | lo);
        }

        uint8_t length = bytes[0];
        if (count != size_t(length) + 5)
            throw record_error(line, "Record length mismatch");

        uint8_t sum = 0;
        for (size_t i = 0; i < count; i++)
            sum += bytes[i];
        if (sum != 0)
            throw record_error(line, "Checksum mismatch");

        uint32_t offset = uint32_t(bytes[1]) << 8 | bytes[2];
        const uint8_t* data = &bytes[4];

        switch (bytes[3]) {
            case 0x00:
                for (size_t i = 0; i < length; i++) {
                    uint32_t byte_address = upper + offset + i;
                    uint32_t word_address = byte_address / 2;
                    bool high = byte_address & 1;

                    u12* word;
                    if (word_address < SIZE)
                        word = &image[word_address];
                    else if (word_address == CONFIG_ADDRESS)
                        word = &config_word;
                    else
                        throw record_error(line, "Address outside program memory");

                    if (high)
                        *word = u12((word->get() & 0x0ff) | uint16_t(data[i]) << 8);
                    else
                        *word = u12((word->get() & 0xf00) | data[i]);
                }
                break;
            case 0x01:
                end_of_file = true;
                break;
            case 0x02:
                if (length != 2)
                    throw record_error(line, "Bad segment address record");
                upper = (uint32_t(data[0]) << 8 | data[1]) << 4;
                break;
            case 0x04:
                if (length != 2)
                    throw record_error(line, "Bad linear address record");
                upper = (uint32_t(data[0]) << 8 | data[1]) << 16;
                break;
            case 0x03:
            case 0x05:
                // start address records carry nothing for this core
                break;
            default:
                throw record_error(line, "Unknown record type");
        }
    }

    if (ferror(fp.get()))
        throw Error(strerror(errno));

    if (!end_of_file)
        throw Error("Missing end-of-file record");

    words = image;
    config = config_word;
}
