// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <catch2/catch.hpp>

#include <string>

#include <stdlib.h>
#include <unistd.h>

#include "byte_stream.hh"
#include "pcap_reader.hh"
#include "pcap_writer.hh"

TEST_CASE("memory source", "[byte_stream]")
{
    Memory_Source src("0123456789", 4);
    unsigned char b[16] = {0};

    REQUIRE(src.read(b, sizeof b) == 4);
    REQUIRE(read_full(src, b, 5) == 5);
    REQUIRE(std::string(reinterpret_cast<char*>(b), 5) == "45678");
    REQUIRE(read_full(src, b, 5) == 1);
    REQUIRE(b[0] == '9');
    REQUIRE(src.read(b, sizeof b) == 0);
    REQUIRE(src.offset() == 10);
}

TEST_CASE("memory sink", "[byte_stream]")
{
    const unsigned char b[] = { 'a', 'b', 'c', 'd' };

    Memory_Sink unlimited;
    REQUIRE(unlimited.write(b, 4) == 4);
    REQUIRE(unlimited.str() == "abcd");

    Memory_Sink sink(6);
    REQUIRE(sink.write(b, 4) == 4);
    REQUIRE(sink.write(b, 4) == 2);
    REQUIRE(sink.write(b, 4) == 0);
    REQUIRE(sink.str() == "abcdab");
}

TEST_CASE("file round trip", "[byte_stream]")
{
    char fn[] = "/tmp/pcapio_test_XXXXXX";
    int fd = mkstemp(fn);
    REQUIRE(fd != -1);
    std::string filename(fn);

    {
        FD_Sink sink { ixxx::util::FD { fd } };
        Pcap_Writer w(sink);
        const unsigned char payload[] = { 1, 2, 3 };
        w.write(payload, sizeof payload, 3, 5, 6);
        sink.close();
    }
    {
        FD_Source src(filename);
        Pcap_Reader r(src);
        Pcap_Packet p;
        REQUIRE(r.next(p));
        CHECK(p.sec == 5);
        CHECK(p.nsec == 6);
        CHECK(p.snaplen == 3);
        CHECK(p.data()[2] == 3);
        REQUIRE(!r.next(p));
    }
    unlink(fn);
}
