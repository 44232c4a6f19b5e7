// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include "byte_stream.hh"

#include <algorithm>
#include <limits>
#include <utility>

#include <fcntl.h>
#include <string.h>

#include <ixxx/posix.hh>

Byte_Source::~Byte_Source() =default;
Byte_Sink::~Byte_Sink() =default;

size_t read_full(Byte_Source &src, unsigned char *p, size_t n)
{
    size_t off = 0;
    while (off < n) {
        size_t l = src.read(p + off, n - off);
        if (!l)
            break;
        off += l;
    }
    return off;
}


FD_Source::FD_Source(ixxx::util::FD fd)
    : fd_(std::move(fd))
{
}
FD_Source::FD_Source(const std::string &filename)
    : fd_(filename, O_RDONLY)
{
}

size_t FD_Source::read(unsigned char *p, size_t n)
{
    // throws ixxx::read_error on failure
    ssize_t l = ixxx::posix::read(fd_, p, n);
    return size_t(l);
}


FD_Sink::FD_Sink(ixxx::util::FD fd)
    : fd_(std::move(fd))
{
}
FD_Sink::FD_Sink(const std::string &filename)
    : fd_(filename, O_WRONLY | O_CREAT | O_TRUNC)
{
}

size_t FD_Sink::write(const unsigned char *p, size_t n)
{
    // NB: no retry on partial writes, the caller decides
    ssize_t l = ixxx::posix::write(fd_, p, n);
    return size_t(l);
}

void FD_Sink::close()
{
    fd_.close();
}


Memory_Source::Memory_Source(std::string data, size_t chunk)
    : data_(std::move(data)),
      chunk_(chunk)
{
}

size_t Memory_Source::read(unsigned char *p, size_t n)
{
    size_t k = std::min(n, data_.size() - off_);
    if (chunk_)
        k = std::min(k, chunk_);
    memcpy(p, data_.data() + off_, k);
    off_ += k;
    return k;
}


Memory_Sink::Memory_Sink()
    : capacity_(std::numeric_limits<size_t>::max())
{
}
Memory_Sink::Memory_Sink(size_t capacity)
    : capacity_(capacity)
{
}

size_t Memory_Sink::write(const unsigned char *p, size_t n)
{
    size_t k = std::min(n, capacity_ - data_.size());
    data_.append(reinterpret_cast<const char*>(p), k);
    return k;
}
