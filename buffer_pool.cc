// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include "buffer_pool.hh"

#include <new>
#include <utility>

Pooled_Buffer::Pooled_Buffer(std::shared_ptr<Buffer_Pool> pool,
        std::vector<unsigned char> buf)
    : pool_(std::move(pool)),
      buf_(std::move(buf))
{
}

Pooled_Buffer::Pooled_Buffer(Pooled_Buffer &&o) noexcept
    : pool_(std::move(o.pool_)),
      buf_(std::move(o.buf_))
{
}

Pooled_Buffer &Pooled_Buffer::operator=(Pooled_Buffer &&o) noexcept
{
    if (this != &o) {
        release();
        pool_ = std::move(o.pool_);
        buf_ = std::move(o.buf_);
    }
    return *this;
}

Pooled_Buffer::~Pooled_Buffer()
{
    release();
}

void Pooled_Buffer::release()
{
    if (!pool_)
        return;
    std::shared_ptr<Buffer_Pool> p(std::move(pool_));
    try {
        p->put(std::move(buf_));
    } catch (const std::bad_alloc &) {
        // the buffer is just freed then instead of being reused
    }
    buf_ = std::vector<unsigned char>();
}


std::shared_ptr<Buffer_Pool> Buffer_Pool::create(size_t buffer_size)
{
    // NB: constructor is private, thus no make_shared()
    return std::shared_ptr<Buffer_Pool>(new Buffer_Pool(buffer_size));
}

Buffer_Pool::Buffer_Pool(size_t buffer_size)
    : buffer_size_(buffer_size)
{
}

Pooled_Buffer Buffer_Pool::acquire()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!free_.empty()) {
            std::vector<unsigned char> b(std::move(free_.back()));
            free_.pop_back();
            return Pooled_Buffer(shared_from_this(), std::move(b));
        }
        ++allocations_;
    }
    // allocate outside of the critical section
    return Pooled_Buffer(shared_from_this(), std::vector<unsigned char>(buffer_size_));
}

void Buffer_Pool::put(std::vector<unsigned char> buf)
{
    std::lock_guard<std::mutex> lock(mutex_);
    free_.emplace_back(std::move(buf));
}

size_t Buffer_Pool::allocations() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return allocations_;
}

size_t Buffer_Pool::idle() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
}
