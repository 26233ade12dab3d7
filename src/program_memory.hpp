#pragma once
#include <stdint.h>
#include <array>

#include "uint_n.hpp"

struct ProgramMemory {
    static constexpr size_t SIZE = 0x200;
    using Image = std::array<u12, SIZE>;

    // Holds MOVLW <OSCCAL> from the factory, must not be overwritten
    static constexpr u9 OSCCAL_LOAD_ADDRESS = u9(0x0ff);
    static constexpr u9 RESET_VECTOR = u9(0x000);

    // Configuration word lives outside the program space
    static constexpr uint32_t CONFIG_ADDRESS = 0xfff;
    static constexpr u12 ERASED = u12(0xfff);

    Image words = blank();
    u12 config = ERASED;

    u12 fetch(u9 address) const { return words[address.get()]; }
    void write(u9 address, u12 word) { words[address.get()] = word; }
    void flash(const Image& new_program) { words = new_program; }

    static Image blank() {
        Image image;
        image.fill(ERASED);
        return image;
    }

    // Intel HEX (INHX8M/INHX32) with byte addresses and little-endian words.
    // Throws on failure.
    void load_hex(const char* path);
};
