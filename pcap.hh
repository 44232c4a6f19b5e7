#ifndef PCAP_HH
#define PCAP_HH

// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later


#include <stddef.h>
#include <stdint.h>

// classic libpcap file format, cf.
// https://wiki.wireshark.org/Development/LibpcapFileFormat

enum PCAP_Magic : uint32_t {
    PCAP_MAGIC_USEC         = 0xa1b2c3d4,
    PCAP_MAGIC_NSEC         = 0xa1b23c4d,
    PCAP_MAGIC_USEC_SWAPPED = 0xd4c3b2a1,
    PCAP_MAGIC_NSEC_SWAPPED = 0x4d3cb2a1
};

enum { PCAP_HEADER_SIZE = 24, PCAP_PKT_HEADER_SIZE = 16 };

// all fields in host byte order
struct PCAP_Header {
    uint32_t magic;
    uint16_t major;
    uint16_t minor;
    int32_t timezone;
    uint32_t sigfigs;
    uint32_t snaplen;
    uint32_t network;
};
extern const PCAP_Header default_pcap_header;

struct PCAP_Pkt_Header {
    uint32_t sec;
    uint32_t nsec; // or usec in old format
    uint32_t snaplen;
    uint32_t len;
};

namespace pcap {

    // byte order and timestamp resolution as selected by a magic number
    struct Format {
        bool swapped {false};
        bool nanosec {false};
    };

    // returns false for unknown magic values
    bool lookup_format(uint32_t magic, Format &f);

    uint32_t native_magic(const Format &f);

    // swapped means big-endian, since files are little-endian by default
    inline uint32_t decode_u32(const unsigned char *p, bool swapped)
    {
        if (swapped)
            return uint32_t(p[0]) << 24 | uint32_t(p[1]) << 16
                | uint32_t(p[2]) << 8 | uint32_t(p[3]);
        else
            return uint32_t(p[3]) << 24 | uint32_t(p[2]) << 16
                | uint32_t(p[1]) << 8 | uint32_t(p[0]);
    }
    inline uint16_t decode_u16(const unsigned char *p, bool swapped)
    {
        if (swapped)
            return uint16_t(p[0]) << 8 | uint16_t(p[1]);
        else
            return uint16_t(p[1]) << 8 | uint16_t(p[0]);
    }

    // the writer only ever emits little-endian
    inline unsigned char *encode_u32(unsigned char *p, uint32_t v)
    {
        *p++ = v;
        *p++ = v >> 8;
        *p++ = v >> 16;
        *p++ = v >> 24;
        return p;
    }
    inline unsigned char *encode_u16(unsigned char *p, uint16_t v)
    {
        *p++ = v;
        *p++ = v >> 8;
        return p;
    }

    void decode_header(const unsigned char *p, bool swapped, PCAP_Header &h);
    void decode_pkt_header(const unsigned char *p, bool swapped, PCAP_Pkt_Header &h);

    // precondition: p points to at least PCAP_HEADER_SIZE/PCAP_PKT_HEADER_SIZE bytes
    unsigned char *encode_header(unsigned char *p, const PCAP_Header &h);
    unsigned char *encode_pkt_header(unsigned char *p, const PCAP_Pkt_Header &h);

}

#endif
