#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include "clock.hpp"
#include "pic10.hpp"

void PIC10F200::gpio_output(unsigned pin, bool level) {
    printf("[gpio] GP%u=%i\n", pin, level);
}

static void usage(const char* name)
{
    fprintf(stderr, "Usage: %s [-t] [-n steps] [-f hz] <file.hex>\n", name);
}

static void trace(const PIC10F200& pic)
{
    fprintf(stderr, "%03x  %-16s w=%02x status=%02x\n",
        pic.program_counter.get(),
        disassemble(pic.instruction_register).c_str(),
        pic.w_register,
        pic.data_memory.registers[RegisterFile::STATUS]);
}

int main(int argc, char** argv)
{
    bool tracing = false;
    size_t max_steps = 0;
    uint32_t frequency = 0;

    int opt;
    while ((opt = getopt(argc, argv, "tn:f:h")) != -1) {
        switch (opt) {
            case 't':
                tracing = true;
                break;
            case 'n':
                max_steps = strtoull(optarg, nullptr, 0);
                break;
            case 'f':
                frequency = strtoul(optarg, nullptr, 0);
                break;
            default:
                usage(argv[0]);
                return opt == 'h' ? 0 : 1;
        }
    }

    if (optind >= argc) {
        usage(argv[0]);
        return 0;
    }

    const char* path = argv[optind];

    puts("=== pic10emu-cli ===");

    PIC10F200 pic{};

    try {
        pic.load_file(path);
    } catch (std::exception& e) {
        fprintf(stderr, "Failed to load file '%s', reason: %s\n", path, e.what());
        return 1;
    }

    pic.power_on_initialize();

    size_t instruction_counter = 0;

    Clock clock{[&] {
        pic.tick();
        instruction_counter++;
        if (tracing)
            trace(pic);
    }, frequency};

    try {
        clock.run([&] {
            if (max_steps && instruction_counter >= max_steps)
                return false;
            return pic.state == PIC10F200::State::Running;
        });
    } catch (std::exception& e) {
        fprintf(
            stderr, "Terminated after %zu steps\nReason: %s\nState:\n%s\n",
            instruction_counter, e.what(), pic.print_array().data()
        );
        return 1;
    }

    const char* reason = "step limit reached";
    if (pic.state == PIC10F200::State::Halted)
        reason = "undefined instruction";
    else if (pic.state == PIC10F200::State::Sleeping)
        reason = "SLEEP executed";

    fprintf(
        stderr, "Terminated after %zu steps\nReason: %s\nState:\n%s\n",
        instruction_counter, reason, pic.print_array().data()
    );

    return pic.state == PIC10F200::State::Halted ? 1 : 0;
}
