// Tests for autowrap::Atomic<T> and the atomic constructors
#include <autowrap/atomic.hpp>
#include <autowrap/wrap.hpp>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

using namespace autowrap;

void test_atomic_same_type() {
    printf("test_atomic_same_type: ");
    {
        auto a = atomic(std::uint32_t{7});
        static_assert(std::is_same_v<decltype(a), AtomicU32>);
        assert(a.load(Ordering::SeqCst) == 7);

        a.store(9, Ordering::Release);
        assert(a.load(Ordering::Acquire) == 9);

        auto flag = wrap(true).atomic();
        assert(flag.load(Ordering::Relaxed));
        assert(flag.swap(false, Ordering::AcqRel));
        assert(!flag.load(Ordering::Relaxed));
    }
    printf("PASS\n");
}

void test_atomic_narrowing() {
    printf("test_atomic_narrowing: ");
    {
        // Narrower targets keep the low bits
        assert(atomic_u8(300).load(Ordering::Relaxed) == 44);
        assert(atomic_u8(-1).load(Ordering::Relaxed) == 0xff);
        assert(atomic_i8(200u).load(Ordering::Relaxed) == -56);
        assert(atomic_u16(0x12345).load(Ordering::Relaxed) == 0x2345);
        assert(atomic_i16(std::int32_t{40000}).load(Ordering::Relaxed) == -25536);
        assert(atomic_u32(std::uint64_t{0x100000001}).load(Ordering::Relaxed) == 1u);
        assert(atomic_i32(std::uint64_t{0xffffffff}).load(Ordering::Relaxed) == -1);
    }
    printf("PASS\n");
}

void test_atomic_widening() {
    printf("test_atomic_widening: ");
    {
        // Signed sources sign-extend, unsigned sources zero-extend
        assert(atomic_i64(std::int8_t{-2}).load(Ordering::Relaxed) == -2);
        assert(atomic_u64(std::int16_t{-2}).load(Ordering::Relaxed) ==
               std::numeric_limits<std::uint64_t>::max() - 1);
        assert(atomic_i64(std::uint32_t{0xffffffff}).load(Ordering::Relaxed) == 4294967295LL);
        assert(atomic_u64(std::uint8_t{0xff}).load(Ordering::Relaxed) == 255u);
        assert(atomic_usize(-1).load(Ordering::Relaxed) == std::numeric_limits<std::size_t>::max());
        assert(atomic_isize(std::uint8_t{200}).load(Ordering::Relaxed) == 200);
        assert(atomic_isize(std::int32_t{-3}).load(Ordering::Relaxed) == -3);
    }
    printf("PASS\n");
}

void test_atomic_as() {
    printf("test_atomic_as: ");
    {
        auto a = atomic_as<std::int16_t>(std::uint16_t{0x8000});
        static_assert(std::is_same_v<decltype(a), AtomicI16>);
        assert(a.load(Ordering::Relaxed) == std::numeric_limits<std::int16_t>::min());

        auto b = wrap(std::int64_t{-1}).atomic_as<std::uint32_t>();
        assert(b.load(Ordering::Relaxed) == 0xffffffffu);
    }
    printf("PASS\n");
}

void test_atomic_rmw() {
    printf("test_atomic_rmw: ");
    {
        auto a = atomic_i32(10);
        assert(a.fetch_add(5, Ordering::Relaxed) == 10);
        assert(a.fetch_sub(3, Ordering::Relaxed) == 15);
        assert(a.load(Ordering::Relaxed) == 12);

        assert(a.fetch_or(0x10, Ordering::Relaxed) == 12);
        assert(a.fetch_and(0x18, Ordering::Relaxed) == 0x1c);
        assert(a.fetch_xor(0x18, Ordering::Relaxed) == 0x18);
        assert(a.load(Ordering::Relaxed) == 0);

        auto wrapped = atomic_u8(255);
        assert(wrapped.fetch_add(1, Ordering::Relaxed) == 255);
        assert(wrapped.load(Ordering::Relaxed) == 0);
    }
    printf("PASS\n");
}

void test_atomic_compare_exchange() {
    printf("test_atomic_compare_exchange: ");
    {
        auto a = atomic_u64(5);

        auto hit = a.compare_exchange(5, 6, Ordering::AcqRel, Ordering::Acquire);
        assert(hit.is_ok());
        assert(hit.unwrap() == 5);

        auto miss = a.compare_exchange(5, 7, Ordering::AcqRel, Ordering::Acquire);
        assert(miss.is_err());
        assert(miss.unwrap_err() == 6);
        assert(a.load(Ordering::SeqCst) == 6);

        auto doubled = a.fetch_update(Ordering::SeqCst, Ordering::SeqCst,
                                      [](std::uint64_t v) { return Some(v * 2); });
        assert(doubled.unwrap() == 6);
        assert(a.load(Ordering::SeqCst) == 12);

        auto refused = a.fetch_update(Ordering::SeqCst, Ordering::SeqCst,
                                      [](std::uint64_t) { return Option<std::uint64_t>(None); });
        assert(refused.unwrap_err() == 12);
    }
    printf("PASS\n");
}

void test_atomic_compare_exchange_weak() {
    printf("test_atomic_compare_exchange_weak: ");
    {
        auto a = atomic_i32(10);

        auto miss = a.compare_exchange_weak(3, 4, Ordering::AcqRel, Ordering::Relaxed);
        assert(miss.is_err());
        assert(miss.unwrap_err() == 10);

        // Spurious failures report the current value; retry until it lands
        std::int32_t current = a.load(Ordering::Relaxed);
        for (;;) {
            auto r = a.compare_exchange_weak(current, current * 3,
                                             Ordering::AcqRel, Ordering::Acquire);
            if (r.is_ok()) {
                assert(r.unwrap() == 10);
                break;
            }
            current = r.unwrap_err();
        }
        assert(a.load(Ordering::SeqCst) == 30);

        bool threw = false;
        try {
            a.compare_exchange_weak(30, 31, Ordering::SeqCst, Ordering::AcqRel);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(a.load(Ordering::SeqCst) == 30);
    }
    printf("PASS\n");
}

void test_atomic_invalid_orderings() {
    printf("test_atomic_invalid_orderings: ");
    {
        auto a = atomic(1);

        int rejected = 0;
        try { a.load(Ordering::Release); } catch (const std::invalid_argument&) { rejected++; }
        try { a.load(Ordering::AcqRel); } catch (const std::invalid_argument&) { rejected++; }
        try { a.store(2, Ordering::Acquire); } catch (const std::invalid_argument&) { rejected++; }
        try { a.store(2, Ordering::AcqRel); } catch (const std::invalid_argument&) { rejected++; }
        try {
            a.compare_exchange(1, 2, Ordering::SeqCst, Ordering::Release);
        } catch (const std::invalid_argument&) {
            rejected++;
        }
        assert(rejected == 5);

        // Nothing was written by the rejected calls
        assert(a.load(Ordering::SeqCst) == 1);
    }
    printf("PASS\n");
}

void test_atomic_concurrent_fetch_add() {
    printf("test_atomic_concurrent_fetch_add: ");
    {
        constexpr int NUM_THREADS = 8;
        constexpr int ITERATIONS = 10000;

        auto counter = atomic_usize(0);
        std::vector<std::thread> threads;
        for (int i = 0; i < NUM_THREADS; ++i) {
            threads.emplace_back([&counter]() {
                for (int j = 0; j < ITERATIONS; ++j) {
                    counter.fetch_add(1, Ordering::Relaxed);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        assert(counter.into_inner() == static_cast<std::size_t>(NUM_THREADS * ITERATIONS));
    }
    printf("PASS\n");
}

int main() {
    printf("=== Atomic<T> tests ===\n");

    test_atomic_same_type();
    test_atomic_narrowing();
    test_atomic_widening();
    test_atomic_as();
    test_atomic_rmw();
    test_atomic_compare_exchange();
    test_atomic_compare_exchange_weak();
    test_atomic_invalid_orderings();
    test_atomic_concurrent_fetch_add();

    printf("\nAll Atomic tests passed!\n");
    return 0;
}
