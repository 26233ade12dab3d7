#include "pic10.hpp"
#include <string>

#define TB_IMPL
#include <termbox2.h>

static std::string pin_log{};
static PIC10F200 pic{};
static std::array<bool, PIC10F200::PIN_COUNT> input_levels{};

void PIC10F200::gpio_output(unsigned pin, bool level) {
    char change[16];
    snprintf(change, sizeof(change), "GP%u=%i ", pin, level);
    pin_log += change;
    if (pin_log.size() > 60)
        pin_log.erase(0, pin_log.size() - 60);
}

static void fill(int x, int y, int w, int h, uintattr_t bg)
{
    for (int i=0; i<w; i++) {
        for (int j=0; j<h; j++) {
            tb_set_cell(x+i, y+j, ' ', bg, bg);
        }
    }
}

static void box(int x, int y, int w, int h, uintattr_t fg, uintattr_t bg)
{
    w--, h--;

    tb_set_cell(x  , y  , '+', fg, bg);
    tb_set_cell(x+w, y  , '+', fg, bg);
    tb_set_cell(x  , y+h, '+', fg, bg);
    tb_set_cell(x+w, y+h, '+', fg, bg);

    for (int i=1; i<w; i++) {
        tb_set_cell(x+i, y  , '-', fg, bg);
        tb_set_cell(x+i, y+h, '-', fg, bg);
    }

    for (int i=1; i<h; i++) {
        tb_set_cell(x  , y+i, '|', fg, bg);
        tb_set_cell(x+w, y+i, '|', fg, bg);
    }
}

static int listing_offset{};

// Program memory around the next instruction
static void listing()
{
    constexpr int ROWS = 16;
    int next = pic.next_address().get();

    for (int i=0; i<ROWS; i++) {
        int address = next + listing_offset + i - ROWS/4;

        fill(44, 2+i, 34, 1, TB_BLACK);
        if (address < 0 || address >= int(ProgramMemory::SIZE))
            continue;

        auto word = pic.program_memory.fetch(u9(address));
        auto text = disassemble(Instruction{word});
        uintattr_t fg = address == next ? TB_YELLOW|TB_BOLD : TB_DEFAULT;

        tb_printf(44, 2+i, fg, TB_BLACK, "%c%03x  %03x  %s",
            address == next ? '>' : ' ', address, word.get(), text.c_str());
    }
}

static void regdump()
{
    for (unsigned i=0; i<RegisterFile::SIZE/8; i++) {
        auto line_start = i * 8;
        tb_printf(2, 12+i, TB_DEFAULT, TB_BLACK, "%02x:", line_start);

        for (unsigned j=0; j<8; j++) {
            uint8_t value = pic.data_memory.registers[line_start + j];
            uintattr_t fg = value ? TB_GREEN : TB_DEFAULT|TB_DIM;
            tb_printf(2+4+3*j, 12+i, fg, TB_BLACK, "%02x", value);
        }
    }
}

static void status_line(const char* message, uintattr_t bg)
{
    fill(2, 10, 40, 1, TB_BLACK);
    tb_print(2, 10, TB_BLACK, bg, message);
}

static bool handle_event(tb_event e)
{
    switch (e.ch) {
        case 's':
            try {
                if (!pic.tick())
                    status_line(state_name(pic.state), TB_YELLOW);
            } catch (std::runtime_error& e) {
                status_line(e.what(), TB_RED);
            }
            listing_offset = 0;
            break;
        case 'q':
            return false;
        case 'r':
            pic.power_on_initialize();
            listing_offset = 0;
            fill(2, 10, 40, 1, TB_BLACK);
            break;
        case '0':
        case '1':
        case '2': {
            unsigned pin = e.ch - '0';
            input_levels[pin] = !input_levels[pin];
            pic.set_input(pin, input_levels[pin]);
            break;
        }
        case 'j':
            listing_offset++;
            break;
        case 'k':
            listing_offset--;
            break;
    }
    return true;
}

static void console_run()
{
    for (int i=0;; i++) {
        fill(1, 1, 39, 7, TB_BLUE);
        box(1, 1, 39, 7, TB_YELLOW, TB_BLUE);
        tb_printf(0, 0, TB_DEFAULT, TB_BLACK, "%i", i);
        tb_print(3, 2, TB_WHITE, TB_BLUE, pic.print_array().data());
        fill(2, 8, 70, 1, TB_BLACK);
        tb_print(2, 8, TB_GREEN, TB_BLACK, pin_log.c_str());
        regdump();
        listing();
        tb_present();

        tb_event ev;
        if (tb_poll_event(&ev) != TB_OK)
            return;

        if (not handle_event(ev))
            return;
    }
}

int main(int argc, char** argv)
{
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <file.hex>\n", argv[0]);
        return 0;
    }

    try {
        pic.load_file(argv[1]);
    } catch (std::exception& e) {
        fprintf(stderr, "Failed to load file '%s', reason: %s\n", argv[1], e.what());
        return 1;
    }

    pic.power_on_initialize();

    if (tb_init() != TB_OK) {
        fprintf(stderr, "Failed to initialise termbox\n");
        exit(1);
    }

    console_run();
    tb_shutdown();
}
