// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pcap_writer.hh"

#include <string>

#include "pcap_error.hh"

Pcap_Writer::Pcap_Writer(Byte_Sink &sink, const PCAP_Header &h)
    : sink_(sink),
      header_(h)
{
    if (!pcap::lookup_format(h.magic, format_))
        throw Bad_Magic_Error(h.magic);
    header_.magic = pcap::native_magic(format_);

    unsigned char b[PCAP_HEADER_SIZE];
    pcap::encode_header(b, header_);
    put(b, sizeof b, "file header");
}

void Pcap_Writer::write(const Pcap_Packet &p)
{
    if (p.snaplen > p.buffer.size())
        throw Format_Error("captured length " + std::to_string(p.snaplen)
                + " exceeds packet buffer of " + std::to_string(p.buffer.size())
                + " bytes");
    write(p.data(), p.snaplen, p.len, p.sec, p.nsec);
}

void Pcap_Writer::write(const unsigned char *begin, unsigned snaplen, unsigned len,
        unsigned sec, unsigned nsec)
{
    if (failed_)
        throw Pcap_Error("pcap writer already failed on a previous write");
    if (snaplen > header_.snaplen)
        throw Format_Error("captured length " + std::to_string(snaplen)
                + " exceeds snaplen " + std::to_string(header_.snaplen));

    PCAP_Pkt_Header h = {
        .sec = sec,
        .nsec = format_.nanosec ? nsec : nsec / 1000,
        .snaplen = snaplen,
        .len = len
    };
    unsigned char b[PCAP_PKT_HEADER_SIZE];
    pcap::encode_pkt_header(b, h);

    put(b, sizeof b, "packet header");
    put(begin, snaplen, "packet data");

    ++pkts_;
    bytes_ += snaplen;
}

void Pcap_Writer::put(const unsigned char *p, size_t n, const char *what)
{
    if (!n)
        return;
    size_t l = 0;
    try {
        l = sink_.write(p, n);
    } catch (const std::exception &) {
        failed_ = true;
        throw;
    }
    if (l != n) {
        failed_ = true;
        throw Short_Write_Error(what, n, l);
    }
}
