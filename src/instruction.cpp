#include "instruction.hpp"

#include <bit>
#include <cstdint>
#include <iterator>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <utility>

using enum Mnemonic;

#define unreachable __builtin_trap

// Opcode Descriptors

static constexpr Opcode OPCODES[] = {
    // Miscellaneous, matched on the whole word
    { 12, 0b0000'0000'0000, NOP,    "NOP"    },
    { 12, 0b0000'0000'0010, OPTION, "OPTION" },
    { 12, 0b0000'0000'0011, SLEEP,  "SLEEP"  },
    { 12, 0b0000'0000'0100, CLRWDT, "CLRWDT" },
    { 11, 0b0000'0000'011,  TRIS,   "TRIS"   },

    // ALU operations
    { 7, 0b0000'001, MOVWF,  "MOVWF"  },
    { 6, 0b0000'01,  CLR,    "CLR"    },
    { 6, 0b0000'10,  SUBWF,  "SUBWF"  },
    { 6, 0b0000'11,  DECF,   "DECF"   },
    { 6, 0b0001'00,  IORWF,  "IORWF"  },
    { 6, 0b0001'01,  ANDWF,  "ANDWF"  },
    { 6, 0b0001'10,  XORWF,  "XORWF"  },
    { 6, 0b0001'11,  ADDWF,  "ADDWF"  },
    { 6, 0b0010'00,  MOVF,   "MOVF"   },
    { 6, 0b0010'01,  COMF,   "COMF"   },
    { 6, 0b0010'10,  INCF,   "INCF"   },
    { 6, 0b0010'11,  DECFSZ, "DECFSZ" },
    { 6, 0b0011'00,  RRF,    "RRF"    },
    { 6, 0b0011'01,  RLF,    "RLF"    },
    { 6, 0b0011'10,  SWAPF,  "SWAPF"  },
    { 6, 0b0011'11,  INCFSZ, "INCFSZ" },

    // Bit operations
    { 4, 0b0100, BCF,   "BCF"   },
    { 4, 0b0101, BSF,   "BSF"   },
    { 4, 0b0110, BTFSC, "BTFSC" },
    { 4, 0b0111, BTFSS, "BTFSS" },

    // Control transfer
    { 4, 0b1000, RETLW, "RETLW" },
    { 4, 0b1001, CALL,  "CALL"  },
    { 3, 0b101,  GOTO,  "GOTO"  },

    // Operations with W
    { 4, 0b1100, MOVLW, "MOVLW" },
    { 4, 0b1101, IORLW, "IORLW" },
    { 4, 0b1110, ANDLW, "ANDLW" },
    { 4, 0b1111, XORLW, "XORLW" },
};

static constexpr uint16_t
aligned_pattern(const Opcode& op)
{
    return uint16_t(op.pattern << (12 - op.width)) & 0xfff;
}

static constexpr uint16_t
aligned_mask(const Opcode& op)
{
    return uint16_t(0xfff << (12 - op.width)) & 0xfff;
}

// Two descriptors overlap when they agree on the top bits they both fix
static constexpr bool
opcode_table_is_unambiguous()
{
    for (size_t i = 0; i < std::size(OPCODES); i++) {
        for (size_t j = i + 1; j < std::size(OPCODES); j++) {
            auto common = aligned_mask(OPCODES[i]) & aligned_mask(OPCODES[j]);
            if ((aligned_pattern(OPCODES[i]) & common) == (aligned_pattern(OPCODES[j]) & common))
                return false;
        }
    }
    return true;
}

static_assert(opcode_table_is_unambiguous(), "Opcode table has overlapping patterns");

static constexpr const char* NAMES[] = {
    "ADDWF", "ANDWF", "CLR", "COMF", "DECF", "DECFSZ", "INCF", "INCFSZ",
    "IORWF", "MOVF", "MOVWF", "NOP", "RLF", "RRF", "SUBWF", "SWAPF", "XORWF",
    "BCF", "BSF", "BTFSC", "BTFSS",
    "ANDLW", "CALL", "CLRWDT", "GOTO", "IORLW", "MOVLW", "OPTION", "RETLW",
    "SLEEP", "TRIS", "XORLW",
    "MOVLB", "RETFIE", "RETURN",
    "UND",
};

static_assert(std::size(NAMES) == size_t(UND) + 1);

std::span<const Opcode> opcode_table()
{
    return OPCODES;
}

const char* mnemonic_name(Mnemonic mnemonic)
{
    return NAMES[size_t(mnemonic)];
}

std::optional<Mnemonic> mnemonic_from_name(std::string_view name)
{
    std::string s{name};

    if (strcasecmp(s.c_str(), "CLRW") == 0 || strcasecmp(s.c_str(), "CLRF") == 0)
        return CLR;

    for (size_t i = 0; i < std::size(NAMES); i++) {
        if (strcasecmp(s.c_str(), NAMES[i]) == 0)
            return Mnemonic(i);
    }
    return std::nullopt;
}

// Decoding

Category classify(u12 raw)
{
    switch (raw.get() >> 10) {
        case 0b00:
            // MOVWF and up set at least one of bits 9:5
            return (raw.get() & 0x3e0) ? Category::ALUOperation : Category::Miscellaneous;
        case 0b01: return Category::BitOperation;
        case 0b10: return Category::ControlTransfer;
        case 0b11: return Category::OperationsWithW;
    }
    unreachable();
}

Mnemonic decode(u12 raw)
{
    for (auto& op : OPCODES) {
        if ((raw.get() & aligned_mask(op)) == aligned_pattern(op))
            return op.mnemonic;
    }
    return UND;
}

Mnemonic decode_by_category(u12 raw)
{
    struct MiscellaneousLiteral {
        uint8_t low_byte;
        Mnemonic mnemonic;
    };

    static constexpr MiscellaneousLiteral miscellaneous[] = {
        { 0x00, NOP },
        { 0x02, OPTION },
        { 0x03, SLEEP },
        { 0x04, CLRWDT },
        { 0x06, TRIS },
        { 0x07, TRIS },
    };

    static constexpr Mnemonic alu[16] = {
        MOVWF, CLR, SUBWF, DECF, IORWF, ANDWF, XORWF, ADDWF,
        MOVF, COMF, INCF, DECFSZ, RRF, RLF, SWAPF, INCFSZ,
    };

    static constexpr Mnemonic bit_ops[4] = { BCF, BSF, BTFSC, BTFSS };
    static constexpr Mnemonic w_ops[4] = { MOVLW, IORLW, ANDLW, XORLW };

    switch (classify(raw)) {
        case Category::Miscellaneous:
            for (auto& m : miscellaneous) {
                if ((raw.get() & 0xff) == m.low_byte)
                    return m.mnemonic;
            }
            return UND;

        case Category::ALUOperation:
            return alu[std::bit_cast<Instruction::FileInsn>(raw.get()).opcode];

        case Category::BitOperation:
            return bit_ops[std::bit_cast<Instruction::BitInsn>(raw.get()).opcode];

        case Category::ControlTransfer:
            switch (raw.get() >> 8) {
                case 0x8:         return RETLW;
                case 0x9:         return CALL;
                case 0xa ... 0xb: return GOTO;
            }
            unreachable();

        case Category::OperationsWithW:
            return w_ops[std::bit_cast<Instruction::LiteralInsn>(raw.get()).opcode];
    }
    unreachable();
}

// Instruction

Instruction::Instruction(u12 word)
    : raw(word), mnemonic(decode(word))
{
}

Category Instruction::category() const
{
    return classify(raw);
}

u8 Instruction::literal() const
{
    return u8(std::bit_cast<LiteralInsn>(raw.get()).k);
}

u1 Instruction::destination() const
{
    return u1(std::bit_cast<FileInsn>(raw.get()).d);
}

u5 Instruction::file() const
{
    return u5(std::bit_cast<FileInsn>(raw.get()).f);
}

u3 Instruction::bit() const
{
    return u3(std::bit_cast<BitInsn>(raw.get()).b);
}

u9 Instruction::target() const
{
    return u9(std::bit_cast<GotoInsn>(raw.get()).k);
}

u3 Instruction::bank() const
{
    return u3(raw.get());
}

u2 Instruction::port() const
{
    return u2(raw.get());
}

// Encoding

static std::string
operand_message(Mnemonic mnemonic, std::optional<uint16_t> operand)
{
    char buffer[64];
    if (operand)
        snprintf(buffer, sizeof(buffer), "Invalid operand 0x%x for %s", *operand, mnemonic_name(mnemonic));
    else
        snprintf(buffer, sizeof(buffer), "Missing operand for %s", mnemonic_name(mnemonic));
    return buffer;
}

InvalidOperand::InvalidOperand(Mnemonic mnemonic, std::optional<uint16_t> operand)
    : std::runtime_error(operand_message(mnemonic, operand)),
      mnemonic(mnemonic), operand(operand)
{
}

UnsupportedMnemonic::UnsupportedMnemonic(Mnemonic mnemonic)
    : std::runtime_error(std::string("No encoding for ") + mnemonic_name(mnemonic)),
      mnemonic(mnemonic)
{
}

static const Opcode*
find_opcode(Mnemonic mnemonic)
{
    for (auto& op : OPCODES) {
        if (op.mnemonic == mnemonic)
            return &op;
    }
    return nullptr;
}

u12 encode(Mnemonic mnemonic, std::optional<uint16_t> first, std::optional<uint16_t> second)
{
    auto op = find_opcode(mnemonic);
    if (op == nullptr)
        throw UnsupportedMnemonic(mnemonic);

    auto require = [&](std::optional<uint16_t> operand, uint16_t max) -> uint16_t {
        if (!operand || *operand > max)
            throw InvalidOperand(mnemonic, operand);
        return *operand;
    };

    auto reject = [&](std::optional<uint16_t> operand) {
        if (operand)
            throw InvalidOperand(mnemonic, operand);
    };

    uint16_t base = aligned_pattern(*op);

    switch (mnemonic) {
        case NOP:
        case OPTION:
        case SLEEP:
        case CLRWDT:
            reject(first);
            reject(second);
            return u12(base);

        case TRIS: {
            auto f = require(first, 7);
            if (f < 6)
                throw InvalidOperand(mnemonic, first);
            reject(second);
            return u12(base | f);
        }

        case MOVWF: {
            auto insn = std::bit_cast<Instruction::FileInsn>(base);
            insn.f = require(first, u5::MASK);
            reject(second);
            return u12(std::bit_cast<uint16_t>(insn));
        }

        case ADDWF: case ANDWF: case CLR: case COMF: case DECF: case DECFSZ:
        case INCF: case INCFSZ: case IORWF: case MOVF: case RLF: case RRF:
        case SUBWF: case SWAPF: case XORWF: {
            auto insn = std::bit_cast<Instruction::FileInsn>(base);
            insn.f = require(first, u5::MASK);
            insn.d = require(second, u1::MASK);
            return u12(std::bit_cast<uint16_t>(insn));
        }

        case BCF: case BSF: case BTFSC: case BTFSS: {
            auto insn = std::bit_cast<Instruction::BitInsn>(base);
            insn.f = require(first, u5::MASK);
            insn.b = require(second, u3::MASK);
            return u12(std::bit_cast<uint16_t>(insn));
        }

        case GOTO: {
            auto insn = std::bit_cast<Instruction::GotoInsn>(base);
            insn.k = require(first, u9::MASK);
            reject(second);
            return u12(std::bit_cast<uint16_t>(insn));
        }

        case CALL: case RETLW:
        case MOVLW: case IORLW: case ANDLW: case XORLW: {
            auto insn = std::bit_cast<Instruction::LiteralInsn>(base);
            insn.k = require(first, u8::MASK);
            reject(second);
            return u12(std::bit_cast<uint16_t>(insn));
        }

        case MOVLB:
        case RETFIE:
        case RETURN:
        case UND:
            break;
    }
    throw UnsupportedMnemonic(mnemonic);
}

// Disassembly

std::string disassemble(const Instruction& instruction)
{
    char buffer[32];
    auto name = mnemonic_name(instruction.mnemonic);
    auto f = instruction.file().get();
    auto dest = instruction.destination().get() ? 'F' : 'W';

    switch (instruction.mnemonic) {
        case NOP: case OPTION: case SLEEP: case CLRWDT:
            return name;

        case TRIS:
            snprintf(buffer, sizeof(buffer), "TRIS %u", instruction.raw.get() & 7);
            break;

        case MOVWF:
            snprintf(buffer, sizeof(buffer), "MOVWF 0x%02x", f);
            break;

        case CLR:
            if (instruction.destination().get() == 0)
                return "CLRW";
            snprintf(buffer, sizeof(buffer), "CLRF 0x%02x", f);
            break;

        case ADDWF: case ANDWF: case COMF: case DECF: case DECFSZ:
        case INCF: case INCFSZ: case IORWF: case MOVF: case RLF: case RRF:
        case SUBWF: case SWAPF: case XORWF:
            snprintf(buffer, sizeof(buffer), "%s 0x%02x,%c", name, f, dest);
            break;

        case BCF: case BSF: case BTFSC: case BTFSS:
            snprintf(buffer, sizeof(buffer), "%s 0x%02x,%u", name, f, instruction.bit().get());
            break;

        case GOTO:
            snprintf(buffer, sizeof(buffer), "GOTO 0x%03x", instruction.target().get());
            break;

        case CALL: case RETLW:
        case MOVLW: case IORLW: case ANDLW: case XORLW:
            snprintf(buffer, sizeof(buffer), "%s 0x%02x", name, instruction.literal().get());
            break;

        case MOVLB:
            snprintf(buffer, sizeof(buffer), "MOVLB %u", instruction.bank().get());
            break;

        case RETFIE:
        case RETURN:
            return name;

        case UND:
            snprintf(buffer, sizeof(buffer), "UND 0x%03x", instruction.raw.get());
            break;
    }
    return buffer;
}

#ifdef INSTRUCTIONTEST

static int failures{};

#define CHECK(cond, ...) \
    do { if (!(cond)) { failures++; printf(__VA_ARGS__); putchar('\n'); } } while (0)

template <unsigned N>
static void test_uint_masking_width()
{
    for (uint32_t v = 0; v <= 0xffff; v++) {
        if (UInt<N>(v).get() != (v & ((1U << N) - 1))) {
            CHECK(false, "UInt<%u>(%04x) not masked", N, v);
            return;
        }
    }
}

template <unsigned... N>
static void test_uint_masking(std::integer_sequence<unsigned, N...>)
{
    (test_uint_masking_width<N + 1>(), ...);
}

static void test_uint()
{
    test_uint_masking(std::make_integer_sequence<unsigned, 16>{});

    CHECK(u9(0x1ff) + u9(1) == u9(0), "u9 overflow does not wrap");
    CHECK(u8(0) - u8(1) == u8(0xff), "u8 underflow does not wrap");
    CHECK((u8(0x81) << 1) == u8(0x02), "u8 shift does not truncate");
    CHECK((~u5(0)) == u5::max(), "u5 complement");
    CHECK(u3::max().get() == 7, "u3 max");
    CHECK(UInt<16>::max().get() == 0xffff, "u16 max");
    CHECK(u1::max().get() == 1, "u1 max");

    CHECK(u5(0x13) == u12(0xf33), "low bits of different widths compare equal");
    CHECK(!(u5(0x13) == u12(0xf32)), "low bits of different widths compare unequal");
    CHECK(u5(0x13).compare_lower_bits(u8(0xf3)), "compare_lower_bits");
    CHECK(u4(0b0111).compare_upper_bits(u12(0x007)), "compare_upper_bits 4 vs 12");
    CHECK(u4(0b0111).compare_upper_bits(u12(0xf87)), "compare_upper_bits ignores bits above 4");
    CHECK(!u4(0b0111).compare_upper_bits(u12(0x7f8)), "compare_upper_bits mismatch");
    CHECK(u12(0x1c4).compare_upper_bits(UInt<6>(0b000100)), "compare_upper_bits 12 vs 6");
    CHECK(u4(0b0111).compare_upper_bits(u12(0x007)) == u4(0b0111).compare_lower_bits(u12(0x007)),
        "compare_upper_bits and compare_lower_bits disagree");
    CHECK(u9(5) < u9(6), "ordering");

    printf("UInt failures so far %i\n", failures);
}

static void test_scenarios()
{
    struct TestCase {
        Mnemonic mnemonic;
        std::optional<uint16_t> first, second;
        uint16_t expected;
    };

    static const TestCase tests[] = {
        { MOVLW, 0x55, {}, 0xc55 },
        { ADDWF, 0x04, 0, 0x1c4 },
        { ADDWF, 0x04, 1, 0x1e4 },
        { BSF, 0x03, 2, 0x543 },
        { GOTO, 0x01a, {}, 0xa1a },
        { GOTO, 0x1ff, {}, 0xbff },
        { CALL, 0x20, {}, 0x920 },
        { RETLW, 0x00, {}, 0x800 },
        { IORLW, 0x0f, {}, 0xd0f },
        { CLR, 0, 0, 0x040 },
        { CLR, 0x10, 1, 0x070 },
        { MOVWF, 0x06, {}, 0x026 },
        { TRIS, 6, {}, 0x006 },
        { NOP, {}, {}, 0x000 },
        { SLEEP, {}, {}, 0x003 },
        { BTFSS, 0x03, 2, 0x743 },
    };

    int successes{};
    for (auto& test : tests) {
        try {
            auto word = encode(test.mnemonic, test.first, test.second);
            if (word.get() != test.expected) {
                printf(
                    "Encode test fail\n\t%s expected %03x actual %03x\n",
                    mnemonic_name(test.mnemonic), test.expected, word.get());
                failures++;
            } else if (decode(word) != test.mnemonic) {
                printf(
                    "Decode test fail\n\t%03x expected %s actual %s\n",
                    word.get(), mnemonic_name(test.mnemonic), mnemonic_name(decode(word)));
                failures++;
            } else {
                successes++;
            }
        } catch (std::exception& e) {
            printf("Encode test fail (exception thrown)\n\t%s %s\n", mnemonic_name(test.mnemonic), e.what());
            failures++;
        }
    }

    Instruction movlw{u12(0xc55)};
    CHECK(movlw.mnemonic == MOVLW && movlw.literal() == u8(0x55), "MOVLW 0x55 fields");
    CHECK(Instruction{u12(0x000)}.mnemonic == NOP, "0x000 is NOP");
    CHECK(Instruction{u12(0x001)}.mnemonic == UND, "0x001 is UND");
    CHECK(Instruction{u12(0x005)}.mnemonic == UND, "0x005 is UND");
    CHECK(Instruction{u12(0x010)}.mnemonic == UND, "0x010 is UND");

    printf("Scenario count %zu success %i\n", std::size(tests), successes);
}

static void test_fields()
{
    Instruction bsf{u12(0x543)};
    CHECK(bsf.file() == u5(0x03) && bsf.bit() == u3(2), "BSF fields");

    Instruction addwf{u12(0x1e4)};
    CHECK(addwf.file() == u5(0x04) && addwf.destination() == u1(1), "ADDWF fields");

    Instruction go{u12(0xbff)};
    CHECK(go.target() == u9(0x1ff), "GOTO target");

    Instruction tris{u12(0x006)};
    CHECK(tris.port() == u2(2), "TRIS port");

    Instruction movlb{u12(0x015)};
    CHECK(movlb.mnemonic == UND && movlb.bank() == u3(5), "MOVLB bank field");

    CHECK(addwf.category() == Category::ALUOperation, "ADDWF category");
    CHECK(bsf.category() == Category::BitOperation, "BSF category");
    CHECK(go.category() == Category::ControlTransfer, "GOTO category");
    CHECK(Instruction{u12(0xf00)}.category() == Category::OperationsWithW, "XORLW category");
    CHECK(tris.category() == Category::Miscellaneous, "TRIS category");
    CHECK(Instruction{u12(0x020)}.category() == Category::ALUOperation, "MOVWF category");
}

static void test_round_trip()
{
    for (auto& op : opcode_table()) {
        std::optional<uint16_t> first, second;
        switch (op.mnemonic) {
            case NOP: case OPTION: case SLEEP: case CLRWDT: break;
            case TRIS: first = 7; break;
            case MOVWF: first = 0x1f; break;
            case BCF: case BSF: case BTFSC: case BTFSS: first = 0x1f; second = 7; break;
            case GOTO: first = 0x1ff; break;
            case CALL: case RETLW: case MOVLW: case IORLW: case ANDLW: case XORLW: first = 0xff; break;
            default: first = 0x1f; second = 1; break;
        }
        try {
            auto word = encode(op.mnemonic, first, second);
            CHECK(decode(word) == op.mnemonic, "Round trip fail for %s (%03x)", op.name, word.get());
        } catch (std::exception& e) {
            CHECK(false, "Round trip fail for %s: %s", op.name, e.what());
        }
    }
}

static void test_decoders_agree()
{
    int disagreements{};
    for (uint16_t w = 0; w <= 0xfff; w++) {
        auto table = decode(u12(w));
        auto category = decode_by_category(u12(w));
        if (table != category) {
            if (disagreements++ < 8)
                printf("Decoders disagree on %03x: %s vs %s\n", w, mnemonic_name(table), mnemonic_name(category));
        }
    }
    CHECK(disagreements == 0, "%i words decode differently", disagreements);
}

static void test_encode_errors()
{
    struct TestCase {
        Mnemonic mnemonic;
        std::optional<uint16_t> first, second;
        bool unsupported;
    };

    static const TestCase tests[] = {
        { ADDWF, 0x20, 0, false },
        { ADDWF, 0x04, 2, false },
        { ADDWF, 0x04, {}, false },
        { ADDWF, {}, {}, false },
        { BSF, 0x03, 8, false },
        { GOTO, 0x200, {}, false },
        { CALL, 0x100, {}, false },
        { MOVLW, {}, {}, false },
        { MOVLW, 0x55, 1, false },
        { NOP, 1, {}, false },
        { TRIS, 5, {}, false },
        { TRIS, 8, {}, false },
        { MOVLB, 1, {}, true },
        { RETFIE, {}, {}, true },
        { RETURN, {}, {}, true },
        { UND, {}, {}, true },
    };

    for (auto& test : tests) {
        try {
            auto word = encode(test.mnemonic, test.first, test.second);
            CHECK(false, "Encode of %s did not fail (%03x)", mnemonic_name(test.mnemonic), word.get());
        } catch (InvalidOperand& e) {
            CHECK(!test.unsupported, "%s: unexpected InvalidOperand", mnemonic_name(test.mnemonic));
            CHECK(e.mnemonic == test.mnemonic, "%s: InvalidOperand carries wrong mnemonic", mnemonic_name(test.mnemonic));
        } catch (UnsupportedMnemonic& e) {
            CHECK(test.unsupported, "%s: unexpected UnsupportedMnemonic", mnemonic_name(test.mnemonic));
            CHECK(e.mnemonic == test.mnemonic, "%s: UnsupportedMnemonic carries wrong mnemonic", mnemonic_name(test.mnemonic));
        }
    }

    try {
        encode(GOTO, 0x200);
    } catch (InvalidOperand& e) {
        CHECK(e.operand == uint16_t(0x200), "InvalidOperand carries wrong operand");
    }
}

static void test_disassemble()
{
    struct TestCase {
        uint16_t word;
        const char* text;
    };

    static constexpr TestCase tests[] = {
        { 0x1c4, "ADDWF 0x04,W" },
        { 0x1e4, "ADDWF 0x04,F" },
        { 0x543, "BSF 0x03,2" },
        { 0xa1a, "GOTO 0x01a" },
        { 0x040, "CLRW" },
        { 0x070, "CLRF 0x10" },
        { 0x006, "TRIS 6" },
        { 0xc55, "MOVLW 0x55" },
        { 0x026, "MOVWF 0x06" },
        { 0x004, "CLRWDT" },
        { 0x001, "UND 0x001" },
    };

    for (auto& test : tests) {
        auto text = disassemble(Instruction{u12(test.word)});
        CHECK(text == test.text, "Disassembly of %03x: expected '%s' actual '%s'", test.word, test.text, text.c_str());
    }

    CHECK(mnemonic_from_name("movlw") == MOVLW, "Name lookup MOVLW");
    CHECK(mnemonic_from_name("CLRF") == CLR, "Name lookup CLRF");
    CHECK(mnemonic_from_name("CLRW") == CLR, "Name lookup CLRW");
    CHECK(!mnemonic_from_name("LDA"), "Name lookup of unknown mnemonic");
}

int main()
{
    test_uint();
    test_scenarios();
    test_fields();
    test_round_trip();
    test_decoders_agree();
    test_encode_errors();
    test_disassemble();

    printf("Instruction tests failures %i\n", failures);
    return failures ? 1 : 0;
}

#endif
