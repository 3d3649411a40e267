// The facade built with the concurrency group disabled
//
// Built with AUTOWRAP_FEATURE_STD=1 and AUTOWRAP_FEATURE_SYNC=0: the
// single-threaded constructors must still be complete on their own.

#include <autowrap/autowrap.hpp>
#include <cassert>
#include <cstdio>
#include <string>

static_assert(AUTOWRAP_FEATURE_STD, "heap ownership group must be enabled");
static_assert(!AUTOWRAP_FEATURE_SYNC, "concurrency group must be disabled");

#ifdef AUTOWRAP_ARC_HPP
#error "arc.hpp must not be pulled in without the concurrency group"
#endif
#ifdef AUTOWRAP_MUTEX_HPP
#error "mutex.hpp must not be pulled in without the concurrency group"
#endif
#ifdef AUTOWRAP_ATOMIC_HPP
#error "atomic.hpp must not be pulled in without the concurrency group"
#endif

using namespace autowrap;

void test_single_threaded_constructors() {
    printf("test_single_threaded_constructors: ");
    {
        auto c = cell(1);
        c.set(2);
        assert(c.get() == 2);

        auto r = refcell(std::string("a"));
        *r.borrow_mut() += "b";
        assert(r.get() == "ab");

        auto shared = wrap(std::string("s")).rc_refcell();
        auto other = shared.clone();
        other->borrow_mut()->append("t");
        assert(shared->get() == "st");
        assert(shared.strong_count() == 2);

        auto once = once_cell(42);
        assert(once.set(1).is_err());
        assert(once.get().unwrap() == 42);
    }
    printf("PASS\n");
}

int main() {
    printf("=== std-only build tests ===\n");

    test_single_threaded_constructors();

    printf("\nAll std-only tests passed!\n");
    return 0;
}
