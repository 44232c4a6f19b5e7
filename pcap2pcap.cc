// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>      // getopt, ...

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <ixxx/util.hh>

#include "byte_stream.hh"
#include "pcap_reader.hh"
#include "pcap_writer.hh"

struct Args {

    Args();
    Args(int argc, char **argv);

    std::string input;
    std::string output { "-" };

    size_t count { 0 };
    bool verbose { false };

    void help(std::ostream &o, const char *argv0);
};
Args::Args() =default;

void Args::help(std::ostream &o, const char *argv0)
{
    o << argv0 << " - copy a pcap file into little-endian byte order\n"
        << "Usage: " << argv0 << " [OPT..] INPUT\n"
        << "\n"
        << "INPUT and OUTPUT may be - for stdin/stdout.\n"
        << "\n"
        << "Options:\n"
        << "  -c COUNT       stop after COUNT packets (default: 0, i.e. copy all)\n"
        << "  -h             display this help\n"
        << "  -o OUTPUT      destination file (default: -)\n"
        << "  -v             print a line for each packet to stderr\n"
        << "\n"
        << "2021, Georg Sauthoff <mail@gms.tf>, GPLv3+\n";
}

Args::Args(int argc, char **argv)
{
    int c = 0;
    // '-' prefix: no reordering of arguments, non-option arguments are
    // returned as argument to the 1 option
    // ':': preceding option takes a mandatory argument
    while ((c = getopt(argc, argv, "-c:ho:v")) != -1) {
        switch (c) {
            case '?':
                {
                    std::ostringstream o;
                    o << "unexpected option : -" << char(optopt) << '\n';
                    throw std::runtime_error(o.str());
                }
                break;
            case 'c':
                count = strtoul(optarg, nullptr, 10);
                break;
            case 'h':
                help(std::cerr, argv[0]);
                exit(0);
                break;
            case 'o':
                output = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 1:
                if (input.empty())
                    input = optarg;
                else
                    throw std::runtime_error("too many positional arguments");
                break;
        }
    }
    if (input.empty())
        throw std::runtime_error("No input file specified");
}

static std::unique_ptr<FD_Source> open_source(const std::string &filename)
{
    if (filename == "-")
        return std::unique_ptr<FD_Source>(new FD_Source(
                    ixxx::util::FD { STDIN_FILENO }));
    return std::unique_ptr<FD_Source>(new FD_Source(filename));
}

static std::unique_ptr<FD_Sink> open_sink(const std::string &filename)
{
    if (filename == "-")
        return std::unique_ptr<FD_Sink>(new FD_Sink(
                    ixxx::util::FD { STDOUT_FILENO }));
    return std::unique_ptr<FD_Sink>(new FD_Sink(filename));
}

static int mainP(int argc, char **argv)
{
    Args args(argc, argv);

    auto src = open_source(args.input);
    Pcap_Reader reader(*src);

    auto dst = open_sink(args.output);
    Pcap_Writer writer(*dst, reader.header());

    Pcap_Packet p;
    while ((!args.count || writer.count() < args.count) && reader.next(p)) {
        if (args.verbose)
            std::cerr << p.sec << '.' << p.nsec << ' ' << p.snaplen << ' ' << p.len << '\n';
        writer.write(p);
    }
    dst->close();

    std::cerr << "Copied " << writer.count() << " pkts, "
        << writer.bytes() << " bytes ("
        << (reader.swapped() ? "swapped" : "native") << " input, "
        << (reader.nanosec() ? "ns" : "us") << " resolution), "
        << reader.pool().allocations() << " buffer allocations\n";

    return 0;
}

int main(int argc, char **argv)
{
    try {
        return mainP(argc, argv);
    } catch (const std::exception &e) {
        std::cerr << "pcap2pcap failed: " << e.what() << '\n';
    }
    return 1;
}
