#include "pic10.hpp"

using enum Mnemonic;
using SFR = RegisterFile::SpecialPurposeRegisters;

// TO and PD are only changed by CLRWDT, SLEEP and reset
static constexpr uint8_t STATUS_READ_ONLY = RegisterFile::TO | RegisterFile::PD;

// TRIS 6 selects GPIO, only f<1:0> are decoded so it shows up as port 2
static constexpr u2 TRIS_GPIO = u2(0b10);

// Control flow

// The next fetch increments PCL, so it is left one before the target
static void
jump(PIC10F200& pic, u9 address)
{
    auto before = (address & u9(0x0ff)) - u9(1);
    pic.data_memory.write(u5(SFR::PCL), uint8_t(before.get()));
    pic.pipeline_flush = true;
}

// Register access made by instructions

static void
write_file(PIC10F200& pic, u5 address, uint8_t value)
{
    auto target = pic.data_memory.resolve(address);

    // Computed jump, PC<8> is cleared
    if (target == u5(SFR::PCL)) {
        jump(pic, u9(value));
        return;
    }

    if (target == u5(SFR::STATUS)) {
        uint8_t current = pic.data_memory.registers[SFR::STATUS];
        value = (value & ~STATUS_READ_ONLY) | (current & STATUS_READ_ONLY);
    }

    pic.data_memory.write(address, value);
}

static void
store(PIC10F200& pic, const Instruction& insn, uint8_t value)
{
    if (insn.destination().get())
        write_file(pic, insn.file(), value);
    else
        pic.w_register = value;
}

// PCL reads as the address of the next instruction, as on the chip
static uint8_t
read_file(PIC10F200& pic, const Instruction& insn)
{
    if (pic.data_memory.resolve(insn.file()) == u5(SFR::PCL))
        return uint8_t(pic.program_counter.get() + 1);
    return pic.data_memory.read(insn.file());
}

static void
set_zero(PIC10F200& pic, uint8_t result)
{
    pic.data_memory.set_status(RegisterFile::Z, result == 0);
}

static u9
return_address(const PIC10F200& pic)
{
    return (pic.program_counter + u9(1)) & u9(0x0ff);
}

static void
skip(PIC10F200& pic)
{
    jump(pic, pic.program_counter + u9(2));
}

static void
push(PIC10F200& pic, u9 address)
{
    pic.stack[1] = pic.stack[0];
    pic.stack[0] = address;
}

static u9
pop(PIC10F200& pic)
{
    auto address = pic.stack[0];
    pic.stack[0] = pic.stack[1];
    return address;
}

// Byte-oriented file register operations

static void
execute_alu(PIC10F200& pic, Mnemonic op, const Instruction& insn)
{
    uint8_t w = pic.w_register;
    uint8_t f = read_file(pic, insn);

    switch (op) {
        case ADDWF: {
            uint16_t result = w + f;
            store(pic, insn, result);
            pic.data_memory.set_status(RegisterFile::C, result > 0xff);
            pic.data_memory.set_status(RegisterFile::DC, (w & 0xf) + (f & 0xf) > 0xf);
            set_zero(pic, result);
            break;
        }
        case SUBWF: {
            uint8_t result = f - w;
            store(pic, insn, result);
            // C and DC are inverted borrows
            pic.data_memory.set_status(RegisterFile::C, f >= w);
            pic.data_memory.set_status(RegisterFile::DC, (f & 0xf) >= (w & 0xf));
            set_zero(pic, result);
            break;
        }
        case ANDWF: {
            uint8_t result = w & f;
            store(pic, insn, result);
            set_zero(pic, result);
            break;
        }
        case IORWF: {
            uint8_t result = w | f;
            store(pic, insn, result);
            set_zero(pic, result);
            break;
        }
        case XORWF: {
            uint8_t result = w ^ f;
            store(pic, insn, result);
            set_zero(pic, result);
            break;
        }
        case CLR:
            store(pic, insn, 0);
            set_zero(pic, 0);
            break;
        case COMF: {
            uint8_t result = ~f;
            store(pic, insn, result);
            set_zero(pic, result);
            break;
        }
        case DECF: {
            uint8_t result = f - 1;
            store(pic, insn, result);
            set_zero(pic, result);
            break;
        }
        case INCF: {
            uint8_t result = f + 1;
            store(pic, insn, result);
            set_zero(pic, result);
            break;
        }
        case DECFSZ: {
            uint8_t result = f - 1;
            store(pic, insn, result);
            if (result == 0)
                skip(pic);
            break;
        }
        case INCFSZ: {
            uint8_t result = f + 1;
            store(pic, insn, result);
            if (result == 0)
                skip(pic);
            break;
        }
        case MOVF:
            store(pic, insn, f);
            set_zero(pic, f);
            break;
        case MOVWF:
            write_file(pic, insn.file(), w);
            break;
        case RLF: {
            bool carry_in = pic.data_memory.status(RegisterFile::C);
            uint8_t result = uint8_t(f << 1) | carry_in;
            store(pic, insn, result);
            pic.data_memory.set_status(RegisterFile::C, f & 0x80);
            break;
        }
        case RRF: {
            bool carry_in = pic.data_memory.status(RegisterFile::C);
            uint8_t result = (f >> 1) | (carry_in << 7);
            store(pic, insn, result);
            pic.data_memory.set_status(RegisterFile::C, f & 0x01);
            break;
        }
        case SWAPF:
            store(pic, insn, uint8_t(f << 4 | f >> 4));
            break;
        default:
            __builtin_trap();
    }
}

// Bit-oriented file register operations

static void
execute_bit(PIC10F200& pic, Mnemonic op, const Instruction& insn)
{
    uint8_t mask = 1U << insn.bit().get();
    uint8_t f = read_file(pic, insn);

    switch (op) {
        case BCF:
            write_file(pic, insn.file(), f & ~mask);
            break;
        case BSF:
            write_file(pic, insn.file(), f | mask);
            break;
        case BTFSC:
            if (!(f & mask))
                skip(pic);
            break;
        case BTFSS:
            if (f & mask)
                skip(pic);
            break;
        default:
            __builtin_trap();
    }
}

// Literal and control operations

static void
execute_literal(PIC10F200& pic, Mnemonic op, const Instruction& insn)
{
    uint8_t k = insn.literal().get();

    switch (op) {
        case MOVLW:
            pic.w_register = k;
            break;
        case IORLW:
            pic.w_register |= k;
            set_zero(pic, pic.w_register);
            break;
        case ANDLW:
            pic.w_register &= k;
            set_zero(pic, pic.w_register);
            break;
        case XORLW:
            pic.w_register ^= k;
            set_zero(pic, pic.w_register);
            break;
        case RETLW:
            pic.w_register = k;
            jump(pic, pop(pic));
            break;
        case CALL:
            // only 8 bits of the target are encoded, PC<8> is cleared
            push(pic, return_address(pic));
            jump(pic, u9(k));
            break;
        case GOTO:
            jump(pic, insn.target());
            break;
        default:
            __builtin_trap();
    }
}

static void
execute_miscellaneous(PIC10F200& pic, Mnemonic op, const Instruction& insn)
{
    switch (op) {
        case NOP:
            break;
        case CLRWDT:
            pic.data_memory.set_status(RegisterFile::TO, true);
            pic.data_memory.set_status(RegisterFile::PD, true);
            break;
        case SLEEP:
            pic.data_memory.set_status(RegisterFile::TO, true);
            pic.data_memory.set_status(RegisterFile::PD, false);
            pic.state = PIC10F200::State::Sleeping;
            break;
        case OPTION:
            pic.data_memory.option = pic.w_register;
            break;
        case TRIS:
            // Only GPIO has a direction register, TRIS 7 is reserved
            if (insn.port() == TRIS_GPIO)
                pic.data_memory.tris = pic.w_register;
            break;
        default:
            __builtin_trap();
    }
}

static void
halt(PIC10F200& pic)
{
    pic.state = PIC10F200::State::Halted;
}

void PIC10F200::execute()
{
    auto& insn = instruction_register;
    auto op = decode();

    switch (op) {
        case ADDWF: case ANDWF: case CLR: case COMF: case DECF: case DECFSZ:
        case INCF: case INCFSZ: case IORWF: case MOVF: case MOVWF: case RLF:
        case RRF: case SUBWF: case SWAPF: case XORWF:
            execute_alu(*this, op, insn);
            break;

        case BCF: case BSF: case BTFSC: case BTFSS:
            execute_bit(*this, op, insn);
            break;

        case ANDLW: case CALL: case GOTO: case IORLW: case MOVLW:
        case RETLW: case XORLW:
            execute_literal(*this, op, insn);
            break;

        case NOP: case CLRWDT: case OPTION: case SLEEP: case TRIS:
            execute_miscellaneous(*this, op, insn);
            break;

        // never decoded on this part
        case MOVLB: case RETFIE: case RETURN:
        case UND:
            halt(*this);
            break;
    }
}
