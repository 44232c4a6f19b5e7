// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PCAP_ERROR_HH
#define PCAP_ERROR_HH

#include <stddef.h>
#include <stdint.h>

#include <stdexcept>
#include <string>

class Pcap_Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

class Bad_Magic_Error : public Pcap_Error {
    public:
        explicit Bad_Magic_Error(uint32_t magic);

        uint32_t magic() const { return magic_; }
    private:
        uint32_t magic_;
};

// i.e. the stream ended within a fixed-width structure or a payload
class Short_Read_Error : public Pcap_Error {
    public:
        Short_Read_Error(const char *what, size_t expected, size_t actual);

        size_t expected() const { return expected_; }
        size_t actual() const { return actual_; }
    private:
        size_t expected_;
        size_t actual_;
};

class Format_Error : public Pcap_Error {
    public:
        using Pcap_Error::Pcap_Error;
};

class Short_Write_Error : public Pcap_Error {
    public:
        Short_Write_Error(const char *what, size_t expected, size_t actual);

        size_t expected() const { return expected_; }
        size_t actual() const { return actual_; }
    private:
        size_t expected_;
        size_t actual_;
};

#endif // PCAP_ERROR_HH
