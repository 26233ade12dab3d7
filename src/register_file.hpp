#pragma once
#include <stdint.h>
#include <array>

#include "uint_n.hpp"

// Power-on reset values, datasheet table 4-1
static constexpr uint8_t PCL_POR_VALUE = 0xff;
static constexpr uint8_t STATUS_POR_VALUE = 0x18;
static constexpr uint8_t FSR_POR_VALUE = 0xe0;
static constexpr uint8_t OSCCAL_POR_VALUE = 0xfe;
static constexpr uint8_t CMCON0_POR_VALUE = 0xff;
static constexpr uint8_t TRIS_POR_VALUE = 0x0f;
static constexpr uint8_t OPTION_POR_VALUE = 0xff;

struct RegisterFile {
    static constexpr size_t SIZE = 0x20;

    enum SpecialPurposeRegisters : uint8_t {
        INDF,
        TMR0,
        PCL,
        STATUS,
        FSR,
        OSCCAL,
        GPIO,
        CMCON0,
    };

    enum Status : uint8_t {
        C = 1U << 0,
        DC = 1U << 1,
        Z = 1U << 2,
        PD = 1U << 3,
        TO = 1U << 4,
    };

    static constexpr uint8_t GPR_BASE = 0x10;

    std::array<uint8_t, SIZE> registers{};

    // not addressable
    uint8_t tris = TRIS_POR_VALUE;
    uint8_t option = OPTION_POR_VALUE;

    // Writes to GPIO land here, registers[GPIO] holds the pin levels
    uint8_t gpio_latch = 0;

    // INDF is resolved through FSR
    u5 resolve(u5 address) const;
    uint8_t read(u5 address) const;
    void write(u5 address, uint8_t value);

    void flash();

    // Direct access to the STATUS bits, bypassing INDF
    bool status(Status flag) const { return registers[STATUS] & flag; }
    void set_status(Status flag, bool on) {
        registers[STATUS] = on ? (registers[STATUS] | flag) : (registers[STATUS] & ~flag);
    }
};
