// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef BUFFER_POOL_HH
#define BUFFER_POOL_HH

#include <stddef.h>

#include <memory>
#include <mutex>
#include <vector>

class Buffer_Pool;

// Scoped handle to a pool buffer, i.e. the buffer is returned to its
// pool when the handle is destroyed, reassigned or released.
// Keeps the pool alive.
class Pooled_Buffer {
    public:
        Pooled_Buffer() =default;
        Pooled_Buffer(const Pooled_Buffer &) =delete;
        Pooled_Buffer &operator=(const Pooled_Buffer &) =delete;
        Pooled_Buffer(Pooled_Buffer &&o) noexcept;
        Pooled_Buffer &operator=(Pooled_Buffer &&o) noexcept;
        ~Pooled_Buffer();

        unsigned char *data() { return buf_.data(); }
        const unsigned char *data() const { return buf_.data(); }
        size_t size() const { return buf_.size(); }

        explicit operator bool() const { return bool(pool_); }

        void release();

    private:
        friend class Buffer_Pool;
        Pooled_Buffer(std::shared_ptr<Buffer_Pool> pool, std::vector<unsigned char> buf);

        std::shared_ptr<Buffer_Pool> pool_;
        std::vector<unsigned char> buf_;
};

// Thread-safe pool of equally sized byte buffers.
class Buffer_Pool : public std::enable_shared_from_this<Buffer_Pool> {
    public:
        static std::shared_ptr<Buffer_Pool> create(size_t buffer_size);

        Buffer_Pool(const Buffer_Pool &) =delete;
        Buffer_Pool &operator=(const Buffer_Pool &) =delete;

        // reuses an idle buffer if there is one, otherwise
        // allocates a zero-filled one
        Pooled_Buffer acquire();

        size_t buffer_size() const { return buffer_size_; }
        // number of buffers ever allocated
        size_t allocations() const;
        // number of buffers ready for reuse
        size_t idle() const;

    private:
        friend class Pooled_Buffer;
        explicit Buffer_Pool(size_t buffer_size);

        void put(std::vector<unsigned char> buf);

        const size_t buffer_size_;

        mutable std::mutex mutex_;
        std::vector<std::vector<unsigned char>> free_;
        size_t allocations_ {0};
};

#endif // BUFFER_POOL_HH
