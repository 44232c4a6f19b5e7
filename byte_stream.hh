// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef BYTE_STREAM_HH
#define BYTE_STREAM_HH

#include <stddef.h>

#include <string>

#include <ixxx/util.hh>

// Reads up to n bytes, may return less, 0 iff the stream is exhausted.
// Errors are thrown.
class Byte_Source {
    public:
        virtual ~Byte_Source();
        virtual size_t read(unsigned char *p, size_t n) = 0;
};

// Writes up to n bytes and returns how many were actually written.
class Byte_Sink {
    public:
        virtual ~Byte_Sink();
        virtual size_t write(const unsigned char *p, size_t n) = 0;
};

// retries partial reads until n bytes are read or the source is exhausted
size_t read_full(Byte_Source &src, unsigned char *p, size_t n);


class FD_Source : public Byte_Source {
    public:
        // takes ownership
        explicit FD_Source(ixxx::util::FD fd);
        explicit FD_Source(const std::string &filename);

        size_t read(unsigned char *p, size_t n) override;

        int fd() const { return fd_.get(); }
    private:
        ixxx::util::FD fd_;
};

class FD_Sink : public Byte_Sink {
    public:
        explicit FD_Sink(ixxx::util::FD fd);
        explicit FD_Sink(const std::string &filename);

        size_t write(const unsigned char *p, size_t n) override;

        int fd() const { return fd_.get(); }
        // flushes pending data to the file system
        void close();
    private:
        ixxx::util::FD fd_;
};


class Memory_Source : public Byte_Source {
    public:
        // chunk limits the bytes returned by a single read(),
        // i.e. to simulate a stream that only supports partial reads
        explicit Memory_Source(std::string data, size_t chunk = 0);

        size_t read(unsigned char *p, size_t n) override;

        size_t offset() const { return off_; }
    private:
        std::string data_;
        size_t off_ {0};
        size_t chunk_ {0};
};

class Memory_Sink : public Byte_Sink {
    public:
        Memory_Sink();
        // a sink that accepts at most capacity bytes in total
        explicit Memory_Sink(size_t capacity);

        size_t write(const unsigned char *p, size_t n) override;

        const std::string &str() const { return data_; }
    private:
        std::string data_;
        size_t capacity_;
};

#endif // BYTE_STREAM_HH
