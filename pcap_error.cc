// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pcap_error.hh"

#include <sstream>

static std::string bad_magic_msg(uint32_t magic)
{
    std::ostringstream o;
    o << "bad pcap magic number: 0x" << std::hex << magic;
    return o.str();
}

Bad_Magic_Error::Bad_Magic_Error(uint32_t magic)
    : Pcap_Error(bad_magic_msg(magic)),
      magic_(magic)
{
}

static std::string short_msg(const char *op, const char *what,
        size_t expected, size_t actual)
{
    std::ostringstream o;
    o << op << ' ' << what << ": got " << actual << " of " << expected << " bytes";
    return o.str();
}

Short_Read_Error::Short_Read_Error(const char *what, size_t expected, size_t actual)
    : Pcap_Error(short_msg("short read of", what, expected, actual)),
      expected_(expected),
      actual_(actual)
{
}

Short_Write_Error::Short_Write_Error(const char *what, size_t expected, size_t actual)
    : Pcap_Error(short_msg("short write of", what, expected, actual)),
      expected_(expected),
      actual_(actual)
{
}
