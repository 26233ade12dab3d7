#include "pic10.hpp"

#include <cstdint>
#include <stdexcept>
#include <stdio.h>

using Error = std::runtime_error;
using SFR = RegisterFile::SpecialPurposeRegisters;

const char* state_name(PIC10F200::State state)
{
    switch (state) {
        case PIC10F200::State::PoweredOff: return "off";
        case PIC10F200::State::Running:    return "running";
        case PIC10F200::State::Sleeping:   return "sleeping";
        case PIC10F200::State::Halted:     return "halted";
    }
    __builtin_trap();
}

void PIC10F200::program_chip(const ProgramMemory::Image& new_program)
{
    program_memory.flash(new_program);
    data_memory.flash();
}

void PIC10F200::load_file(const char* path)
{
    program_memory.load_hex(path);
    data_memory.flash();
}

void PIC10F200::power_on_initialize()
{
    // Factory calibration word, MOVLW <OSCCAL> at the top of program memory
    program_memory.write(ProgramMemory::OSCCAL_LOAD_ADDRESS, encode(Mnemonic::MOVLW, OSCCAL_POR_VALUE));

    // INDF, TMR0 and GPIO are undefined at power on
    data_memory.write(u5(SFR::PCL), PCL_POR_VALUE);
    data_memory.write(u5(SFR::STATUS), STATUS_POR_VALUE);
    data_memory.write(u5(SFR::FSR), FSR_POR_VALUE);
    data_memory.write(u5(SFR::OSCCAL), OSCCAL_POR_VALUE);
    data_memory.write(u5(SFR::CMCON0), CMCON0_POR_VALUE);
    data_memory.tris = TRIS_POR_VALUE;
    data_memory.option = OPTION_POR_VALUE;

    program_counter = u9(PCL_POR_VALUE);
    instruction_register = Instruction{};
    stack = {};
    w_register = 0;
    cycles = 0;
    pipeline_flush = false;
    state = State::Running;

    io_pins = {};
    drive_outputs();
}

// PCL holds the address of the instruction being executed. A jump leaves
// PCL one short of its target so the next fetch lands on it.
void PIC10F200::fetch()
{
    auto pcl = u9(data_memory.read(u5(SFR::PCL)));

    // Q1 increments PC, PC<8> always reads back cleared
    program_counter = (pcl + u9(1)) & u9(0x0ff);
    data_memory.write(u5(SFR::PCL), uint8_t(program_counter.get()));

    instruction_register = Instruction{program_memory.fetch(program_counter)};
    pipeline_flush = false;
}

u9 PIC10F200::next_address() const
{
    return (u9(data_memory.read(u5(SFR::PCL))) + u9(1)) & u9(0x0ff);
}

bool PIC10F200::tick()
{
    if (state == State::PoweredOff)
        throw Error("Tick before power-on");

    if (state != State::Running)
        return false;

    fetch();
    sample_inputs();
    execute();
    drive_outputs();

    cycles += pipeline_flush ? 2 : 1;

    return state == State::Running;
}

// GPIO

bool PIC10F200::is_output(unsigned pin) const
{
    if (pin == 2 && (data_memory.option & T0CS))
        return false;
    return !(data_memory.tris & (1U << pin));
}

void PIC10F200::set_input(unsigned pin, bool level)
{
    if (pin >= PIN_COUNT)
        throw Error("No such pin");

    input_levels[pin] = level;
    if (!is_output(pin)) {
        io_pins[pin] = level;
        data_memory.registers[SFR::GPIO] = port_levels();
    }
}

// Output pins read back the latch, input pins their external level
uint8_t PIC10F200::port_levels() const
{
    uint8_t gpio = 0;
    for (unsigned pin = 0; pin < PIN_COUNT; pin++) {
        bool level = is_output(pin) ? (data_memory.gpio_latch & (1U << pin)) : input_levels[pin];
        gpio |= level << pin;
    }
    return gpio;
}

void PIC10F200::sample_inputs()
{
    data_memory.registers[SFR::GPIO] = port_levels();
}

void PIC10F200::drive_outputs()
{
    for (unsigned pin = 0; pin < PIN_COUNT; pin++) {
        if (!is_output(pin)) {
            io_pins[pin] = input_levels[pin];
            continue;
        }

        bool level = data_memory.gpio_latch & (1U << pin);
        if (io_pins[pin] != level) {
            io_pins[pin] = level;
            gpio_output(pin, level);
        }
    }

    data_memory.registers[SFR::GPIO] = port_levels();
}

void PIC10F200::print(std::span<char, PRINT_LENGTH> out) const
{
    auto& r = data_memory.registers;
    auto flag = [&](RegisterFile::Status f, char c) { return data_memory.status(f) ? c : '.'; };
    auto pin = [&](unsigned p) { return io_pins[p] ? '1' : '0'; };

    snprintf(
        out.data(), out.size(),
        "  pc %03x    w %02x   status %02x\n"
        " fsr %02x  tris %02x   option %02x\n"
        "stack %03x %03x  gpio %02x latch %02x\n"
        "pins %c%c%c   flags %c%c%c%c%c\n"
        "%-8s  cycles %llu\n",
        program_counter.get(), w_register, r[SFR::STATUS],
        data_memory.read(u5(SFR::FSR)), data_memory.tris, data_memory.option,
        stack[0].get(), stack[1].get(), r[SFR::GPIO], data_memory.gpio_latch,
        pin(2), pin(1), pin(0),
        flag(RegisterFile::TO, 'T'), flag(RegisterFile::PD, 'P'),
        flag(RegisterFile::Z, 'Z'), flag(RegisterFile::DC, 'D'), flag(RegisterFile::C, 'C'),
        state_name(state), (unsigned long long)cycles);
}

#ifdef PIC10TEST

#include <initializer_list>
#include <iterator>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <vector>

using enum Mnemonic;

struct PinChange {
    unsigned pin;
    bool level;
};

static std::vector<PinChange> pin_changes{};

void PIC10F200::gpio_output(unsigned pin, bool level) {
    pin_changes.push_back({ pin, level });
}

static int failures{};

#define CHECK(cond, ...) \
    do { if (!(cond)) { failures++; printf(__VA_ARGS__); putchar('\n'); } } while (0)

struct Line {
    Mnemonic op;
    std::optional<uint16_t> first, second;
};

// Assembles from address 0 and powers on, the first tick runs address 0
static void
start(PIC10F200& pic, std::initializer_list<Line> program)
{
    auto image = ProgramMemory::blank();
    uint16_t address = 0;
    for (auto& line : program)
        image[address++] = encode(line.op, line.first, line.second);

    pic.program_chip(image);
    pic.power_on_initialize();
}

static void test_power_on()
{
    PIC10F200 pic{};

    try {
        pic.tick();
        CHECK(false, "Tick before power-on did not throw");
    } catch (std::runtime_error&) {
    }

    auto image = ProgramMemory::blank();
    image[0x000] = encode(MOVLW, 0x55);
    pic.program_chip(image);
    pic.power_on_initialize();

    auto& r = pic.data_memory.registers;
    CHECK(r[SFR::PCL] == 0xff, "POR PCL %02x", r[SFR::PCL]);
    CHECK(r[SFR::STATUS] == 0x18, "POR STATUS %02x", r[SFR::STATUS]);
    CHECK(r[SFR::FSR] == 0xe0, "POR FSR %02x", r[SFR::FSR]);
    CHECK(r[SFR::OSCCAL] == 0xfe, "POR OSCCAL %02x", r[SFR::OSCCAL]);
    CHECK(r[SFR::CMCON0] == 0xff, "POR CMCON0 %02x", r[SFR::CMCON0]);
    CHECK(pic.data_memory.tris == 0x0f && pic.data_memory.option == 0xff, "POR TRIS/OPTION");
    CHECK(pic.program_memory.fetch(u9(0x0ff)) == u12(0xcfe), "Calibration load not installed");
    CHECK(pic.state == PIC10F200::State::Running, "Not running after power-on");

    // PCL starts at 0xff, so the first fetch wraps to address 0
    CHECK(pic.next_address() == u9(0), "First fetch address %03x", pic.next_address().get());
    pic.tick();
    CHECK(pic.instruction_register.raw == u12(0xc55), "First word executed %03x", pic.instruction_register.raw.get());
    CHECK(pic.w_register == 0x55, "W after first tick %02x", pic.w_register);
    CHECK(pic.program_counter == u9(0), "PC after first tick %03x", pic.program_counter.get());
    CHECK(r[SFR::PCL] == 0x00, "PCL after first tick %02x", r[SFR::PCL]);
    CHECK(pic.cycles == 1, "Cycles after first tick %llu", (unsigned long long)pic.cycles);
}

static void test_fetch()
{
    PIC10F200 pic{};
    auto image = ProgramMemory::blank();
    for (uint16_t address = 0; address < ProgramMemory::SIZE; address++)
        image[address] = encode(MOVLW, address & 0xff);
    image[0x005] = encode(MOVLW, 0x05);
    image[0x006] = encode(MOVLW, 0x06);
    pic.program_chip(image);
    pic.power_on_initialize();

    // The word latched is the one at the incremented address
    pic.data_memory.write(u5(SFR::PCL), 0x05);
    pic.fetch();
    CHECK(pic.program_counter == u9(0x006), "Fetch after PCL 05 gave PC %03x", pic.program_counter.get());
    CHECK(pic.instruction_register.literal() == u8(0x06), "Fetch after PCL 05 latched MOVLW 0x%02x",
        pic.instruction_register.literal().get());
    CHECK(pic.data_memory.registers[SFR::PCL] == 0x06, "PCL after fetch %02x", pic.data_memory.registers[SFR::PCL]);

    for (unsigned pcl = 0; pcl <= 0xff; pcl++) {
        pic.data_memory.write(u5(SFR::PCL), pcl);
        pic.fetch();
        unsigned expected = (pcl + 1) & 0xff;
        if (pic.program_counter.bit(8) || pic.program_counter.get() != expected
                || pic.instruction_register.raw != pic.program_memory.fetch(u9(expected))) {
            CHECK(false, "Fetch after PCL %02x gave PC %03x", pcl, pic.program_counter.get());
            return;
        }
    }
}

static void test_alu()
{
    static constexpr uint8_t C = RegisterFile::C, DC = RegisterFile::DC, Z = RegisterFile::Z;
    static constexpr uint8_t FILE = 0x10;

    struct TestCase {
        Mnemonic op;
        uint8_t d;
        uint8_t w, f, flags;
        uint8_t expected, flags_out;
    };

    static constexpr TestCase tests[] = {
        { ADDWF, 1, 0x01, 0x01, 0, 0x02, 0 },
        { ADDWF, 1, 0x0f, 0x01, 0, 0x10, DC },
        { ADDWF, 0, 0xff, 0x01, 0, 0x00, C|DC|Z },
        { ADDWF, 1, 0x80, 0x80, 0, 0x00, C|Z },
        { SUBWF, 1, 0x01, 0x02, 0, 0x01, C|DC },
        { SUBWF, 1, 0x02, 0x02, 0, 0x00, C|DC|Z },
        { SUBWF, 0, 0x02, 0x01, C|DC|Z, 0xff, 0 },
        { SUBWF, 1, 0x01, 0x10, 0, 0x0f, C },
        { ANDWF, 1, 0xf0, 0x0f, 0, 0x00, Z },
        { IORWF, 0, 0xf0, 0x0f, Z, 0xff, 0 },
        { XORWF, 1, 0xff, 0xff, 0, 0x00, Z },
        { COMF, 1, 0x00, 0xff, 0, 0x00, Z },
        { DECF, 1, 0x00, 0x01, C, 0x00, C|Z },
        { INCF, 0, 0x00, 0xff, C, 0x00, C|Z },
        { MOVF, 0, 0x33, 0x00, 0, 0x00, Z },
        { MOVF, 1, 0x33, 0x44, Z, 0x44, 0 },
        { RLF, 1, 0x00, 0x80, 0, 0x00, C },
        { RLF, 1, 0x00, 0x01, C, 0x03, 0 },
        { RRF, 1, 0x00, 0x01, 0, 0x00, C },
        { RRF, 0, 0x00, 0x00, C|Z, 0x80, Z },
        { SWAPF, 1, 0x00, 0xa5, DC, 0x5a, DC },
        { CLR, 1, 0x12, 0x34, 0, 0x00, Z },
        { CLR, 0, 0x12, 0x34, 0, 0x00, Z },
        { DECFSZ, 1, 0x00, 0x05, Z, 0x04, Z },
        { INCFSZ, 0, 0x00, 0x05, 0, 0x06, 0 },
        { MOVWF, 1, 0x42, 0x00, Z, 0x42, Z },
    };

    int successes{};
    for (auto& test : tests) {
        PIC10F200 pic{};
        if (test.op == MOVWF)
            start(pic, { { test.op, FILE, {} } });
        else
            start(pic, { { test.op, FILE, test.d } });

        pic.w_register = test.w;
        pic.data_memory.registers[FILE] = test.f;
        pic.data_memory.registers[SFR::STATUS] = (STATUS_POR_VALUE & ~(C|DC|Z)) | test.flags;

        pic.tick();

        uint8_t actual = test.d ? pic.data_memory.registers[FILE] : pic.w_register;
        uint8_t flags_out = pic.data_memory.registers[SFR::STATUS] & (C|DC|Z);

        if (actual != test.expected) {
            printf(
                "ALU test fail (result mismatch)\n"
                "\t%s w %02x f %02x d %i expected %02x actual %02x\n",
                mnemonic_name(test.op), test.w, test.f, test.d, test.expected, actual);
            failures++;
        } else if (flags_out != test.flags_out) {
            printf(
                "ALU test fail (flags mismatch)\n"
                "\t%s w %02x f %02x expected %02x actual %02x\n",
                mnemonic_name(test.op), test.w, test.f, test.flags_out, flags_out);
            failures++;
        } else {
            successes++;
        }
    }

    printf("ALU count %zu success %i\n", std::size(tests), successes);
}

static void test_literal()
{
    PIC10F200 pic{};
    start(pic, {
        { MOVLW, 0x0f },
        { IORLW, 0xf0 },
        { ANDLW, 0x3c },
        { XORLW, 0x3c },
    });

    pic.tick();
    CHECK(pic.w_register == 0x0f, "MOVLW W %02x", pic.w_register);
    pic.tick();
    CHECK(pic.w_register == 0xff && !pic.data_memory.status(RegisterFile::Z), "IORLW W %02x", pic.w_register);
    pic.tick();
    CHECK(pic.w_register == 0x3c, "ANDLW W %02x", pic.w_register);
    pic.tick();
    CHECK(pic.w_register == 0x00 && pic.data_memory.status(RegisterFile::Z), "XORLW W %02x", pic.w_register);
}

static void test_skips()
{
    {
        PIC10F200 pic{};
        start(pic, {
            { DECFSZ, 0x10, 1 },
            { MOVLW, 0x01 },
            { MOVLW, 0x02 },
        });
        pic.data_memory.registers[0x10] = 1;

        pic.tick();
        CHECK(pic.next_address() == u9(2), "DECFSZ did not skip, next %03x", pic.next_address().get());
        CHECK(pic.cycles == 2, "Skip took %llu cycles", (unsigned long long)pic.cycles);
        pic.tick();
        CHECK(pic.w_register == 0x02, "Instruction after skip W %02x", pic.w_register);
    }

    struct TestCase {
        Mnemonic op;
        uint8_t f;
        uint8_t bit;
        uint16_t next;
    };

    static constexpr TestCase tests[] = {
        { BTFSC, 0x00, 3, 2 },
        { BTFSC, 0x08, 3, 1 },
        { BTFSS, 0x08, 3, 2 },
        { BTFSS, 0xf7, 3, 1 },
        { INCFSZ, 0xff, 0, 2 },
        { INCFSZ, 0xfe, 0, 1 },
    };

    for (auto& test : tests) {
        PIC10F200 pic{};
        if (test.op == INCFSZ)
            start(pic, { { test.op, 0x10, 1 } });
        else
            start(pic, { { test.op, 0x10, test.bit } });
        pic.data_memory.registers[0x10] = test.f;
        pic.tick();
        CHECK(
            pic.next_address() == u9(test.next),
            "%s f %02x: next %03x expected %03x",
            mnemonic_name(test.op), test.f, pic.next_address().get(), test.next);
    }
}

static void test_bit_operations()
{
    PIC10F200 pic{};
    start(pic, {
        { BSF, 0x10, 7 },
        { BCF, 0x10, 0 },
    });
    pic.data_memory.registers[0x10] = 0x01;

    pic.tick();
    CHECK(pic.data_memory.registers[0x10] == 0x81, "BSF result %02x", pic.data_memory.registers[0x10]);
    pic.tick();
    CHECK(pic.data_memory.registers[0x10] == 0x80, "BCF result %02x", pic.data_memory.registers[0x10]);
}

static void test_call_return()
{
    PIC10F200 pic{};
    auto image = ProgramMemory::blank();
    image[0x00] = encode(CALL, 0x10);
    image[0x01] = encode(GOTO, 0x01);
    image[0x10] = encode(CALL, 0x20);
    image[0x11] = encode(RETLW, 0x11);
    image[0x20] = encode(CALL, 0x30);
    image[0x21] = encode(RETLW, 0x21);
    image[0x30] = encode(RETLW, 0x42);
    pic.program_chip(image);
    pic.power_on_initialize();

    pic.tick();
    CHECK(pic.next_address() == u9(0x10) && pic.stack[0] == u9(0x01), "CALL did not push");
    CHECK(pic.cycles == 2, "CALL took %llu cycles", (unsigned long long)pic.cycles);

    // Third level overwrites the oldest return address
    pic.tick();
    pic.tick();
    CHECK(pic.stack[0] == u9(0x21) && pic.stack[1] == u9(0x11), "Stack after overflow %03x %03x",
        pic.stack[0].get(), pic.stack[1].get());

    pic.tick();
    CHECK(pic.w_register == 0x42 && pic.next_address() == u9(0x21), "RETLW 0x42 returned to %03x",
        pic.next_address().get());
    pic.tick();
    CHECK(pic.w_register == 0x21 && pic.next_address() == u9(0x11), "RETLW 0x21 returned to %03x",
        pic.next_address().get());
    pic.tick();
    CHECK(pic.program_counter == u9(0x11), "RETLW 0x21 did not land on 0x11");
    CHECK(pic.w_register == 0x11 && pic.next_address() == u9(0x11), "RETLW 0x11 returned to %03x",
        pic.next_address().get());
}

static void test_jumps()
{
    {
        PIC10F200 pic{};
        start(pic, { { GOTO, 0x1ff } });
        pic.tick();
        CHECK(pic.next_address() == u9(0x0ff), "GOTO 0x1ff goes to %03x", pic.next_address().get());
        pic.tick();
        CHECK(pic.program_counter == u9(0x0ff), "GOTO 0x1ff landed at %03x", pic.program_counter.get());
        CHECK(pic.w_register == 0xfe, "Calibration load at 0x0ff gave W %02x", pic.w_register);
    }
    {
        PIC10F200 pic{};
        start(pic, { { GOTO, 0x000 } });
        pic.tick();
        pic.tick();
        CHECK(pic.program_counter == u9(0x000), "GOTO 0 landed at %03x", pic.program_counter.get());
    }
    {
        PIC10F200 pic{};
        start(pic, {
            { MOVLW, 0x20 },
            { MOVWF, SFR::PCL },
        });
        pic.tick();
        pic.tick();
        CHECK(pic.next_address() == u9(0x20), "MOVWF PCL jumps to %03x", pic.next_address().get());
        CHECK(pic.cycles == 3, "Computed jump cycles %llu", (unsigned long long)pic.cycles);
    }
    {
        // Table lookup: PCL reads as the address after ADDWF
        PIC10F200 pic{};
        start(pic, {
            { ADDWF, SFR::PCL, 1 },
            { RETLW, 0x10 },
            { RETLW, 0x11 },
            { RETLW, 0x12 },
        });
        pic.w_register = 2;
        pic.tick();
        CHECK(pic.next_address() == u9(3), "ADDWF PCL jumps to %03x", pic.next_address().get());
        pic.tick();
        CHECK(pic.w_register == 0x12, "Table lookup returned %02x", pic.w_register);
    }
}

static void test_indirect()
{
    PIC10F200 pic{};
    start(pic, {
        { MOVLW, 0x12 },
        { MOVWF, SFR::FSR },
        { MOVLW, 0x55 },
        { MOVWF, SFR::INDF },
        { MOVF, SFR::INDF, 0 },
    });

    for (int i = 0; i < 4; i++)
        pic.tick();
    CHECK(pic.data_memory.registers[0x12] == 0x55, "Indirect write %02x", pic.data_memory.registers[0x12]);
    CHECK(pic.data_memory.read(u5(SFR::FSR)) == 0xf2, "FSR reads %02x", pic.data_memory.read(u5(SFR::FSR)));

    pic.w_register = 0;
    pic.tick();
    CHECK(pic.w_register == 0x55, "Indirect read %02x", pic.w_register);

    pic.data_memory.write(u5(SFR::FSR), SFR::INDF);
    CHECK(pic.data_memory.read(u5(SFR::INDF)) == 0, "INDF through INDF is not 0");
    CHECK(pic.data_memory.read(u5(0x08)) == 0, "Unimplemented register is not 0");
}

static void test_status_protection()
{
    PIC10F200 pic{};
    start(pic, { { CLR, SFR::STATUS, 1 } });
    pic.tick();
    CHECK(pic.data_memory.registers[SFR::STATUS] == 0x1c, "CLRF STATUS gave %02x", pic.data_memory.registers[SFR::STATUS]);
}

static void test_undefined_halts()
{
    PIC10F200 pic{};
    auto image = ProgramMemory::blank();
    image[0] = u12(0x001);
    pic.program_chip(image);
    pic.power_on_initialize();
    pic.w_register = 0x5a;

    pic.fetch();
    CHECK(pic.decode() == UND, "0x001 decoded as %s", mnemonic_name(pic.decode()));

    auto registers = pic.data_memory.registers;
    auto pc = pic.program_counter;
    pic.execute();

    CHECK(pic.state == PIC10F200::State::Halted, "Undefined instruction did not halt");
    CHECK(registers == pic.data_memory.registers, "Undefined instruction changed registers");
    CHECK(pic.w_register == 0x5a && pic.program_counter == pc, "Undefined instruction changed W or PC");

    CHECK(!pic.tick(), "Tick on halted core returned true");
    CHECK(pic.program_counter == pc, "Halted core advanced");
}

static void test_sleep()
{
    PIC10F200 pic{};
    start(pic, {
        { CLRWDT },
        { SLEEP },
        { MOVLW, 0x01 },
    });

    CHECK(pic.tick(), "CLRWDT stopped the core");
    CHECK(!pic.tick(), "SLEEP did not stop the core");
    CHECK(pic.state == PIC10F200::State::Sleeping, "State after SLEEP %s", state_name(pic.state));
    CHECK(pic.data_memory.status(RegisterFile::TO) && !pic.data_memory.status(RegisterFile::PD), "TO/PD after SLEEP");
    CHECK(!pic.tick() && pic.w_register == 0, "Sleeping core executed");
}

static void test_gpio()
{
    {
        // Latch written while every pin is an input, then all made outputs
        pin_changes.clear();

        PIC10F200 pic{};
        start(pic, {
            { MOVLW, 0x07 },
            { MOVWF, SFR::GPIO },
            { MOVLW, 0x00 },
            { TRIS, SFR::GPIO },
        });
        pic.data_memory.option = 0xdf;

        pic.tick();
        pic.tick();
        CHECK(pic.data_memory.gpio_latch == 0x07, "GPIO latch %02x", pic.data_memory.gpio_latch);
        CHECK(pin_changes.empty(), "Input pins reported %zu changes", pin_changes.size());
        CHECK(pic.data_memory.registers[SFR::GPIO] == 0x00, "GPIO reads %02x with inputs low",
            pic.data_memory.registers[SFR::GPIO]);

        pic.tick();
        pic.tick();
        CHECK(pic.io_pins[0] && pic.io_pins[1] && pic.io_pins[2], "Pins %i%i%i after TRIS",
            pic.io_pins[2], pic.io_pins[1], pic.io_pins[0]);
        CHECK(pin_changes.size() == 3, "%zu pin changes reported", pin_changes.size());
        CHECK(pic.data_memory.registers[SFR::GPIO] == 0x07, "GPIO reads %02x with outputs high",
            pic.data_memory.registers[SFR::GPIO]);
    }

    pin_changes.clear();

    PIC10F200 pic{};
    start(pic, {
        { MOVLW, 0xdf },
        { OPTION },
        { MOVLW, 0x05 },
        { MOVWF, SFR::GPIO },
        { MOVLW, 0x08 },
        { TRIS, SFR::GPIO },
        { MOVLW, 0x0e },
        { TRIS, SFR::GPIO },
        { MOVF, SFR::GPIO, 0 },
    });

    pic.tick();
    pic.tick();
    CHECK(pic.data_memory.option == 0xdf, "OPTION gave %02x", pic.data_memory.option);
    pic.tick();
    pic.tick();
    CHECK(!pic.io_pins[0] && !pic.io_pins[2] && pin_changes.empty(), "Latch drove input pins");
    pic.tick();
    pic.tick();
    CHECK(pic.data_memory.tris == 0x08, "TRIS gave %02x", pic.data_memory.tris);
    CHECK(pic.io_pins[0] && !pic.io_pins[1] && pic.io_pins[2], "Pins %i%i%i", pic.io_pins[2], pic.io_pins[1], pic.io_pins[0]);
    CHECK(pin_changes.size() == 2, "%zu pin changes reported", pin_changes.size());
    if (pin_changes.size() == 2) {
        CHECK(pin_changes[0].pin == 0 && pin_changes[0].level, "First change pin %u", pin_changes[0].pin);
        CHECK(pin_changes[1].pin == 2 && pin_changes[1].level, "Second change pin %u", pin_changes[1].pin);
    }

    // GP1..GP3 back to inputs, GP1 driven high from outside
    pic.tick();
    pic.tick();
    pic.set_input(1, true);
    pic.set_input(2, false);
    CHECK(!pic.io_pins[2] && pic.io_pins[1], "Input pins %i%i", pic.io_pins[2], pic.io_pins[1]);
    pic.tick();
    CHECK((pic.w_register & 0x07) == 0x03, "GPIO read %02x", pic.w_register);
    CHECK(pic.data_memory.gpio_latch == 0x05, "Input levels leaked into the latch %02x", pic.data_memory.gpio_latch);

    // T0CS takes GP2 away from the port regardless of TRIS
    pic.data_memory.tris = 0x00;
    pic.data_memory.option = 0xff;
    CHECK(!pic.is_output(2) && pic.is_output(1), "T0CS does not override GP2");
}

static void test_tris()
{
    PIC10F200 pic{};
    start(pic, {
        { MOVLW, 0x00 },
        { TRIS, 7 },
        { TRIS, 6 },
    });

    pic.tick();
    pic.tick();
    CHECK(pic.data_memory.tris == TRIS_POR_VALUE, "TRIS 7 changed TRIS to %02x", pic.data_memory.tris);
    pic.tick();
    CHECK(pic.data_memory.tris == 0x00, "TRIS 6 gave %02x", pic.data_memory.tris);
}

static void write_text(const char* path, const char* text)
{
    FILE* f = fopen(path, "w");
    if (!f) {
        CHECK(false, "Cannot create %s", path);
        return;
    }
    fputs(text, f);
    fclose(f);
}

static void test_load_hex()
{
    char path[] = "/tmp/pic10testXXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        CHECK(false, "mkstemp failed");
        return;
    }
    close(fd);

    write_text(path,
        ":04000000550C000A91\n"
        ":021FFE00EA0FE8\n"
        ":00000001FF\n");

    PIC10F200 pic{};
    try {
        pic.load_file(path);
        CHECK(pic.program_memory.fetch(u9(0)) == u12(0xc55), "Word 0 is %03x", pic.program_memory.fetch(u9(0)).get());
        CHECK(pic.program_memory.fetch(u9(1)) == u12(0xa00), "Word 1 is %03x", pic.program_memory.fetch(u9(1)).get());
        CHECK(pic.program_memory.fetch(u9(2)) == ProgramMemory::ERASED, "Word 2 is not erased");
        CHECK(pic.program_memory.config == u12(0xfea), "Config word %03x", pic.program_memory.config.get());

        pic.power_on_initialize();
        pic.tick();
        CHECK(pic.w_register == 0x55, "Loaded program W %02x", pic.w_register);
    } catch (std::exception& e) {
        CHECK(false, "Loading hex failed: %s", e.what());
    }

    static const char* bad_files[] = {
        ":04000000550C000A92\n:00000001FF\n",
        ":04000000550C000A91\n",
        "04000000550C000A91\n:00000001FF\n",
        ":0200000400F00A\n:02000000000AF4\n:00000001FF\n",
    };

    for (auto text : bad_files) {
        write_text(path, text);
        try {
            pic.load_file(path);
            CHECK(false, "Bad hex file loaded:\n%s", text);
        } catch (std::runtime_error&) {
        }
    }

    unlink(path);

    try {
        pic.load_file("/nonexistent/file.hex");
        CHECK(false, "Missing file loaded");
    } catch (std::runtime_error&) {
    }
}

static void test_print()
{
    PIC10F200 pic{};
    pic.program_chip(ProgramMemory::blank());
    pic.power_on_initialize();
    auto text = pic.print_array();
    CHECK(strstr(text.data(), "pc 0ff") != nullptr, "Print output:\n%s", text.data());
    CHECK(strstr(text.data(), "running") != nullptr, "Print output:\n%s", text.data());
}

int main()
{
    test_power_on();
    test_fetch();
    test_alu();
    test_literal();
    test_skips();
    test_bit_operations();
    test_call_return();
    test_jumps();
    test_indirect();
    test_status_protection();
    test_undefined_halts();
    test_sleep();
    test_gpio();
    test_tris();
    test_load_hex();
    test_print();

    printf("PIC10F200 tests failures %i\n", failures);
    return failures ? 1 : 0;
}

#endif
