// SPDX-FileCopyrightText: © 2021 Georg Sauthoff <mail@gms.tf>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <catch2/catch.hpp>

#include <algorithm>
#include <thread>
#include <utility>
#include <vector>

#include "buffer_pool.hh"

TEST_CASE("buffer pool", "[buffer_pool]")
{
    auto pool = Buffer_Pool::create(1522);

    SECTION("fresh buffers are zero-filled and sized") {
        Pooled_Buffer b = pool->acquire();
        REQUIRE(b);
        REQUIRE(b.size() == 1522);
        REQUIRE(std::all_of(b.data(), b.data() + b.size(),
                    [](unsigned char c) { return c == 0; }));
        REQUIRE(pool->allocations() == 1);
        REQUIRE(pool->idle() == 0);
    }

    SECTION("released buffers are reused") {
        const unsigned char *p = nullptr;
        {
            Pooled_Buffer b = pool->acquire();
            p = b.data();
        }
        REQUIRE(pool->idle() == 1);

        Pooled_Buffer c = pool->acquire();
        REQUIRE(c.data() == p);
        REQUIRE(pool->allocations() == 1);
        REQUIRE(pool->idle() == 0);
    }

    SECTION("explicit release") {
        Pooled_Buffer b = pool->acquire();
        b.release();
        REQUIRE(!b);
        REQUIRE(pool->idle() == 1);
        b.release();
        REQUIRE(pool->idle() == 1);
    }

    SECTION("moving transfers the buffer") {
        Pooled_Buffer a = pool->acquire();
        Pooled_Buffer b = pool->acquire();
        REQUIRE(pool->allocations() == 2);

        Pooled_Buffer c(std::move(a));
        REQUIRE(!a);
        REQUIRE(c);
        REQUIRE(pool->idle() == 0);

        // the old buffer of c goes back to the pool
        c = std::move(b);
        REQUIRE(pool->idle() == 1);
    }

    SECTION("buffers keep the pool alive") {
        Pooled_Buffer b = pool->acquire();
        std::weak_ptr<Buffer_Pool> w(pool);
        pool.reset();
        REQUIRE(!w.expired());
        b.release();
        REQUIRE(w.expired());
    }
}

TEST_CASE("buffer pool across threads", "[buffer_pool]")
{
    auto pool = Buffer_Pool::create(64);
    const unsigned n = 4;
    const unsigned rounds = 1000;

    std::vector<std::thread> ts;
    for (unsigned i = 0; i < n; ++i) {
        ts.emplace_back([&pool, rounds] {
            for (unsigned k = 0; k < rounds; ++k) {
                Pooled_Buffer b = pool->acquire();
                b.data()[0] = k;
            }
        });
    }
    for (auto &t : ts)
        t.join();

    // each thread holds at most one buffer at a time
    REQUIRE(pool->allocations() <= n);
    REQUIRE(pool->idle() == pool->allocations());
}

TEST_CASE("buffer released on another thread", "[buffer_pool]")
{
    auto pool = Buffer_Pool::create(64);
    Pooled_Buffer b = pool->acquire();
    const unsigned char *p = b.data();

    std::thread t([b = std::move(b)]() mutable { b.release(); });
    t.join();

    Pooled_Buffer c = pool->acquire();
    REQUIRE(c.data() == p);
    REQUIRE(pool->allocations() == 1);
}
