// Demonstration of the autowrap constructors
// Showcases Cell, RefCell, Rc, OnceCell, Arc<Mutex>, Arc<RwLock> and atomics

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <autowrap/autowrap.hpp>

using namespace std::chrono_literals;

// Example 1: single-threaded interior mutability
void local_example() {
    std::cout << "\n=== Cell / RefCell / Rc Example ===" << std::endl;

    auto hits = autowrap::cell(0u);
    for (int i = 0; i < 3; ++i) {
        hits.set(hits.get() + 1);
    }
    std::cout << "Cell after 3 hits: " << hits.get() << std::endl;

    auto log = autowrap::wrap(std::vector<std::string>{}).rc_refcell();
    auto writer = log.clone();
    writer->borrow_mut()->push_back("written through a clone");
    std::cout << "Rc<RefCell> holds " << log->borrow()->size()
              << " entry, strong_count=" << log.strong_count() << std::endl;

    auto config = autowrap::once_cell(std::string("config.toml"));
    if (config.set("other.toml").is_err()) {
        std::cout << "OnceCell kept " << config.get().unwrap() << std::endl;
    }
}

// Example 2: Arc<Mutex<T>> shared between threads
void mutex_example() {
    std::cout << "\n=== Arc<Mutex> Example ===" << std::endl;

    auto counter = autowrap::arc_mutex(0);
    std::vector<std::thread> threads;

    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([counter]() {
            for (int j = 0; j < 1000; ++j) {
                auto guard = counter->lock().unwrap();
                *guard += 1;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::cout << "Final counter value: " << *counter->lock().unwrap()
              << " (expected 10000)" << std::endl;
}

// Example 3: Arc<RwLock<T>> with several readers and one writer
void rwlock_example() {
    std::cout << "\n=== Arc<RwLock> Example ===" << std::endl;

    auto greeting = autowrap::arc_rwlock(std::string("hello"));
    std::vector<std::thread> threads;

    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([greeting]() {
            auto read_guard = greeting->read().unwrap();
            std::this_thread::sleep_for(10ms);
            (void)read_guard->size();
        });
    }

    threads.emplace_back([greeting]() {
        std::this_thread::sleep_for(5ms);
        auto write_guard = greeting->write().unwrap();
        *write_guard += ", world";
    });

    for (auto& t : threads) {
        t.join();
    }

    std::cout << "After writer: " << *greeting->read().unwrap() << std::endl;
}

// Example 4: atomics with explicit width conversion
void atomic_example() {
    std::cout << "\n=== Atomic Example ===" << std::endl;

    auto low_byte = autowrap::atomic_u8(0x1ff);
    auto widened = autowrap::atomic_i64(std::int8_t{-5});

    std::cout << "atomic_u8(0x1ff) = " << static_cast<int>(low_byte.load(autowrap::Ordering::Relaxed))
              << ", atomic_i64(int8 -5) = " << widened.load(autowrap::Ordering::Relaxed) << std::endl;

    low_byte.fetch_add(1, autowrap::Ordering::AcqRel);
    std::cout << "0xff + 1 wraps to " << static_cast<int>(low_byte.load(autowrap::Ordering::Acquire))
              << std::endl;
}

int main() {
    std::cout << "autowrap demo" << std::endl;

    local_example();
    mutex_example();
    rwlock_example();
    atomic_example();

    std::cout << "\nDone." << std::endl;
    return 0;
}
