// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pcap_reader.hh"

#include <string>
#include <utility>

#include <stdint.h>

#include "pcap_error.hh"

Pcap_Reader::Pcap_Reader(Byte_Source &src)
    : src_(src)
{
    read_header();
    pool_ = Buffer_Pool::create(header_.snaplen);
}

void Pcap_Reader::read_header()
{
    unsigned char b[PCAP_HEADER_SIZE];

    size_t l = read_full(src_, b, 4);
    if (l != 4)
        throw Short_Read_Error("file header", sizeof b, l);

    // NB: after a bad magic the stream position is undefined,
    // there is no attempt to resynchronize
    uint32_t magic = pcap::decode_u32(b, false);
    if (!pcap::lookup_format(magic, format_))
        throw Bad_Magic_Error(magic);

    l = read_full(src_, b + 4, sizeof b - 4);
    if (l != sizeof b - 4)
        throw Short_Read_Error("file header", sizeof b, 4 + l);

    pcap::decode_header(b, format_.swapped, header_);
}

bool Pcap_Reader::next(Pcap_Packet &p)
{
    if (error_)
        std::rethrow_exception(error_);
    if (eof_)
        return false;
    try {
        return read_packet(p);
    } catch (const std::exception &) {
        error_ = std::current_exception();
        throw;
    }
}

bool Pcap_Reader::read_packet(Pcap_Packet &p)
{
    // give back the previous buffer first such that it can be reused
    p = Pcap_Packet();

    unsigned char b[PCAP_PKT_HEADER_SIZE];
    size_t l = read_full(src_, b, sizeof b);
    if (!l) {
        eof_ = true;
        return false;
    }
    if (l != sizeof b)
        throw Short_Read_Error("packet header", sizeof b, l);

    PCAP_Pkt_Header h;
    pcap::decode_pkt_header(b, format_.swapped, h);

    if (h.snaplen > header_.snaplen)
        throw Format_Error("packet " + std::to_string(count_) + ": captured length "
                + std::to_string(h.snaplen) + " exceeds snaplen "
                + std::to_string(header_.snaplen));

    Pooled_Buffer buf = pool_->acquire();
    l = read_full(src_, buf.data(), h.snaplen);
    if (l != h.snaplen)
        throw Short_Read_Error("packet data", h.snaplen, l);

    uint32_t sec = h.sec;
    uint64_t nsec = h.nsec;
    if (!format_.nanosec)
        nsec *= 1000;
    // carry an out-of-range fraction into the seconds
    sec += uint32_t(nsec / 1000000000);
    nsec %= 1000000000;

    p.sec     = sec;
    p.nsec    = uint32_t(nsec);
    p.snaplen = h.snaplen;
    p.len     = h.len;
    p.buffer  = std::move(buf);

    ++count_;
    return true;
}
