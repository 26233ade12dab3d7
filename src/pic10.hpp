#pragma once
#include <stdint.h>
#include <array>
#include <span>

#include "instruction.hpp"
#include "program_memory.hpp"
#include "register_file.hpp"
#include "uint_n.hpp"

struct PIC10F200 {
    static constexpr unsigned PIN_COUNT = 3;

    enum class State : uint8_t {
        PoweredOff,
        Running,
        Sleeping,
        Halted,
    };

    enum Option : uint8_t {
        T0CS = 1U << 5, // GP2 becomes T0CKI, overrides TRIS
    };

    RegisterFile data_memory{};
    ProgramMemory program_memory{};

    u9 program_counter{}; // address of instruction_register
    Instruction instruction_register{};
    std::array<u9, 2> stack{};

    // these registers are not part of the data memory file register (not addressable)
    uint8_t w_register = 0;
    std::array<bool, PIN_COUNT> io_pins{};

    State state = State::PoweredOff;
    uint64_t cycles = 0;

    // Set by the executor when the prefetched word is discarded (2-cycle instructions)
    bool pipeline_flush = false;

    void program_chip(const ProgramMemory::Image& new_program);
    void load_file(const char* path); // Throws on failure

    void power_on_initialize();
    void fetch();
    Mnemonic decode() const { return instruction_register.mnemonic; }
    void execute();

    // Where the next fetch will read from
    u9 next_address() const;

    // One fetch and one execute; returns false once the core stops advancing.
    // Throws if the chip has not been powered on.
    bool tick();

    void set_input(unsigned pin, bool level);
    bool is_output(unsigned pin) const;

    static constexpr size_t PRINT_LENGTH = 192;

    void print(std::span<char, PRINT_LENGTH> out) const;
    auto print_array() const {
        std::array<char, PRINT_LENGTH> arr{};
        print(arr);
        return arr;
    }

    // IO for output pin changes - user implementation required
    static void gpio_output(unsigned pin, bool level);

private:
    std::array<bool, PIN_COUNT> input_levels{};

    uint8_t port_levels() const;
    void sample_inputs();
    void drive_outputs();
};

const char* state_name(PIC10F200::State state);
