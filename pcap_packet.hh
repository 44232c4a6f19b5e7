// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PCAP_PACKET_HH
#define PCAP_PACKET_HH

#include <stdint.h>

#include "buffer_pool.hh"

struct Pcap_Packet {
    uint32_t sec {0};
    // always nanoseconds, usec files are scaled on read
    uint32_t nsec {0};
    // number of bytes captured, i.e. the valid prefix of buffer
    uint32_t snaplen {0};
    // original length on the wire
    uint32_t len {0};

    // sized to the snaplen of the file header
    Pooled_Buffer buffer;

    const unsigned char *data() const { return buffer.data(); }
    unsigned char *data() { return buffer.data(); }
    size_t size() const { return snaplen; }
};

#endif // PCAP_PACKET_HH
