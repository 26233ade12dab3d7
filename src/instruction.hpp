#pragma once
#include <stdint.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "uint_n.hpp"

enum class Category : uint8_t {
    Miscellaneous,
    ALUOperation,
    BitOperation,
    ControlTransfer,
    OperationsWithW,
};

enum class Mnemonic : uint8_t {
    // byte-oriented file register operations
    ADDWF,
    ANDWF,
    CLR, // CLRW (d=0) and CLRF (d=1)
    COMF,
    DECF,
    DECFSZ,
    INCF,
    INCFSZ,
    IORWF,
    MOVF,
    MOVWF,
    NOP,
    RLF,
    RRF,
    SUBWF,
    SWAPF,
    XORWF,

    // bit-oriented file register operations
    BCF,
    BSF,
    BTFSC,
    BTFSS,

    // literal and control operations
    ANDLW,
    CALL,
    CLRWDT,
    GOTO,
    IORLW,
    MOVLW,
    OPTION,
    RETLW,
    SLEEP,
    TRIS,
    XORLW,

    // no encoding on this part
    MOVLB,
    RETFIE,
    RETURN,

    UND,
};

// Fixed bits of an instruction: the top `width` bits of the word equal `pattern`
struct Opcode {
    unsigned width;
    uint16_t pattern;
    Mnemonic mnemonic;
    const char* name;
};

struct Instruction {
    u12 raw{};
    Mnemonic mnemonic = Mnemonic::NOP;

    Instruction() = default;
    explicit Instruction(u12 word);

    // Word layouts, least significant field first

    struct FileInsn {
        uint16_t f: 5;
        uint16_t d: 1;
        uint16_t opcode: 4;
        uint16_t category: 2;
        uint16_t unused: 4;
    };

    struct BitInsn {
        uint16_t f: 5;
        uint16_t b: 3;
        uint16_t opcode: 2;
        uint16_t category: 2;
        uint16_t unused: 4;
    };

    struct LiteralInsn {
        uint16_t k: 8;
        uint16_t opcode: 2;
        uint16_t category: 2;
        uint16_t unused: 4;
    };

    struct GotoInsn {
        uint16_t k: 9;
        uint16_t b101: 3;
        uint16_t unused: 4;
    };

    Category category() const;

    u8 literal() const;     // k, bits 7:0
    u1 destination() const; // d, bit 5
    // f, bits 4:0. Every file operand on the baseline core is 5 bits, the
    // 7-bit form belongs to cores with banked 128-byte files.
    u5 file() const;
    u3 bit() const;         // b, bits 7:5
    u9 target() const;      // GOTO k, bits 8:0
    u3 bank() const;        // MOVLB k, bits 2:0
    u2 port() const;        // TRIS f, bits 1:0
};

struct InvalidOperand : std::runtime_error {
    InvalidOperand(Mnemonic mnemonic, std::optional<uint16_t> operand);

    Mnemonic mnemonic;
    std::optional<uint16_t> operand; // empty when the operand was missing
};

struct UnsupportedMnemonic : std::runtime_error {
    explicit UnsupportedMnemonic(Mnemonic mnemonic);

    Mnemonic mnemonic;
};

std::span<const Opcode> opcode_table();

Category classify(u12 raw);

// Table-driven decode: first descriptor whose aligned pattern matches
Mnemonic decode(u12 raw);

// Category-first decode, must agree with decode() on every word
Mnemonic decode_by_category(u12 raw);

// Operands: first is f or k, second is d (ALU) or b (bit operations).
// Throws InvalidOperand or UnsupportedMnemonic.
u12 encode(
    Mnemonic mnemonic,
    std::optional<uint16_t> first = std::nullopt,
    std::optional<uint16_t> second = std::nullopt);

const char* mnemonic_name(Mnemonic mnemonic);
std::optional<Mnemonic> mnemonic_from_name(std::string_view name);

std::string disassemble(const Instruction& instruction);
