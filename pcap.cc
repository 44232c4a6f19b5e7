// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pcap.hh"

const PCAP_Header default_pcap_header = {
    .magic = PCAP_MAGIC_NSEC, // i.e. ns resolution, use PCAP_MAGIC_USEC for us resolution
    .major = 2, // PCAP format version
    .minor = 4,
    .timezone = 0,
    .sigfigs = 0,
    .snaplen = 1522, // maximum captured packet size
    .network = 1 // ethernet
};

namespace pcap {

    bool lookup_format(uint32_t magic, Format &f)
    {
        switch (magic) {
            case PCAP_MAGIC_USEC:
                f = Format { false, false };
                return true;
            case PCAP_MAGIC_NSEC:
                f = Format { false, true };
                return true;
            case PCAP_MAGIC_USEC_SWAPPED:
                f = Format { true, false };
                return true;
            case PCAP_MAGIC_NSEC_SWAPPED:
                f = Format { true, true };
                return true;
        }
        return false;
    }

    uint32_t native_magic(const Format &f)
    {
        return f.nanosec ? PCAP_MAGIC_NSEC : PCAP_MAGIC_USEC;
    }

    void decode_header(const unsigned char *p, bool swapped, PCAP_Header &h)
    {
        h.magic    = decode_u32(p     , swapped);
        h.major    = decode_u16(p +  4, swapped);
        h.minor    = decode_u16(p +  6, swapped);
        h.timezone = int32_t(decode_u32(p +  8, swapped));
        h.sigfigs  = decode_u32(p + 12, swapped);
        h.snaplen  = decode_u32(p + 16, swapped);
        h.network  = decode_u32(p + 20, swapped);
    }

    void decode_pkt_header(const unsigned char *p, bool swapped, PCAP_Pkt_Header &h)
    {
        h.sec     = decode_u32(p     , swapped);
        h.nsec    = decode_u32(p +  4, swapped);
        h.snaplen = decode_u32(p +  8, swapped);
        h.len     = decode_u32(p + 12, swapped);
    }

    unsigned char *encode_header(unsigned char *p, const PCAP_Header &h)
    {
        p = encode_u32(p, h.magic);
        p = encode_u16(p, h.major);
        p = encode_u16(p, h.minor);
        p = encode_u32(p, uint32_t(h.timezone));
        p = encode_u32(p, h.sigfigs);
        p = encode_u32(p, h.snaplen);
        p = encode_u32(p, h.network);
        return p;
    }

    unsigned char *encode_pkt_header(unsigned char *p, const PCAP_Pkt_Header &h)
    {
        p = encode_u32(p, h.sec);
        p = encode_u32(p, h.nsec);
        p = encode_u32(p, h.snaplen);
        p = encode_u32(p, h.len);
        return p;
    }

}
