// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PCAP_WRITER_HH
#define PCAP_WRITER_HH

#include <stddef.h>

#include "byte_stream.hh"
#include "pcap.hh"
#include "pcap_packet.hh"

// Writes a little-endian classic pcap stream.
//
// The file header is written on construction. Any failed or partial
// write is fatal, i.e. the writer then refuses further packets and
// the sink is left with whatever was written up to that point.
class Pcap_Writer {
    public:
        // throws Bad_Magic_Error for unknown magic values, a swapped magic
        // is emitted as its native counterpart
        explicit Pcap_Writer(Byte_Sink &sink, const PCAP_Header &h = default_pcap_header);

        Pcap_Writer(const Pcap_Writer &) =delete;
        Pcap_Writer &operator=(const Pcap_Writer &) =delete;

        void write(const Pcap_Packet &p);
        // nsec is truncated to usec for usec files
        void write(const unsigned char *begin, unsigned snaplen, unsigned len,
                unsigned sec, unsigned nsec);

        const PCAP_Header &header() const { return header_; }

        size_t count() const { return pkts_; }
        // payload bytes
        size_t bytes() const { return bytes_; }

    private:
        Byte_Sink &sink_;
        PCAP_Header header_;
        pcap::Format format_;
        bool failed_ {false};

        size_t pkts_ {0};
        size_t bytes_ {0};

        void put(const unsigned char *p, size_t n, const char *what);
};

#endif // PCAP_WRITER_HH
