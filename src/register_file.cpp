#include "register_file.hpp"

static bool
is_implemented(uint8_t address)
{
    return address <= RegisterFile::CMCON0 || address >= RegisterFile::GPR_BASE;
}

// FSR<7:5> are unimplemented and read as 1
static constexpr uint8_t FSR_FIXED_BITS = 0xe0;

u5 RegisterFile::resolve(u5 address) const
{
    if (address == u5(INDF))
        return u5(registers[FSR]);
    return address;
}

// INDF addressed through INDF reads 0 and ignores writes
uint8_t RegisterFile::read(u5 address) const
{
    uint8_t a = resolve(address).get();

    if (a == INDF)
        return 0;

    if (!is_implemented(a))
        return 0;

    if (a == FSR)
        return registers[FSR] | FSR_FIXED_BITS;

    return registers[a];
}

void RegisterFile::write(u5 address, uint8_t value)
{
    uint8_t a = resolve(address).get();

    if (a == INDF)
        return;

    if (!is_implemented(a))
        return;

    if (a == FSR)
        value |= FSR_FIXED_BITS;

    if (a == GPIO) {
        gpio_latch = value;
        return;
    }

    registers[a] = value;
}

void RegisterFile::flash()
{
    registers.fill(0);
    registers[FSR] = FSR_FIXED_BITS;
    tris = TRIS_POR_VALUE;
    option = OPTION_POR_VALUE;
    gpio_latch = 0;
}
