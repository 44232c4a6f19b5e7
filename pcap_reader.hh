// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PCAP_READER_HH
#define PCAP_READER_HH

#include <stddef.h>

#include <exception>
#include <memory>

#include "buffer_pool.hh"
#include "byte_stream.hh"
#include "pcap.hh"
#include "pcap_packet.hh"

// Reads a classic pcap stream in either byte order.
//
// The file header is read on construction, which throws
// Bad_Magic_Error/Short_Read_Error. Packet payloads are read into
// buffers of a pool owned by the reader, thus a caller that keeps
// reusing the same Pcap_Packet object gets by with a single allocation.
class Pcap_Reader {
    public:
        explicit Pcap_Reader(Byte_Source &src);

        Pcap_Reader(const Pcap_Reader &) =delete;
        Pcap_Reader &operator=(const Pcap_Reader &) =delete;

        // Returns false if the stream ends at a packet boundary.
        // Errors are thrown and are rethrown on any later call.
        bool next(Pcap_Packet &p);

        // magic is normalized to the native value
        const PCAP_Header &header() const { return header_; }
        bool swapped() const { return format_.swapped; }
        bool nanosec() const { return format_.nanosec; }

        // number of packets read so far
        size_t count() const { return count_; }

        Buffer_Pool &pool() { return *pool_; }
        const Buffer_Pool &pool() const { return *pool_; }

    private:
        Byte_Source &src_;
        pcap::Format format_;
        PCAP_Header header_ {};
        std::shared_ptr<Buffer_Pool> pool_;

        size_t count_ {0};
        bool eof_ {false};
        std::exception_ptr error_;

        void read_header();
        bool read_packet(Pcap_Packet &p);
};

#endif // PCAP_READER_HH
