// The facade built with both capability groups disabled
//
// Built with AUTOWRAP_FEATURE_STD=0 and AUTOWRAP_FEATURE_SYNC=0: only the
// allocation-free pieces (Cell, Option, Result) remain.

#include <autowrap/autowrap.hpp>
#include <cassert>
#include <cstdio>

static_assert(!AUTOWRAP_FEATURE_STD, "heap ownership group must be disabled");
static_assert(!AUTOWRAP_FEATURE_SYNC, "concurrency group must be disabled");

#ifdef AUTOWRAP_REFCELL_HPP
#error "refcell.hpp must not be pulled in without the heap ownership group"
#endif
#ifdef AUTOWRAP_RC_HPP
#error "rc.hpp must not be pulled in without the heap ownership group"
#endif
#ifdef AUTOWRAP_ONCE_CELL_HPP
#error "once_cell.hpp must not be pulled in without the heap ownership group"
#endif
#ifdef AUTOWRAP_ARC_HPP
#error "arc.hpp must not be pulled in without the concurrency group"
#endif

using namespace autowrap;

struct Point {
    int x;
    int y;
};

void test_cell_constructors() {
    printf("test_cell_constructors: ");
    {
        auto c = cell(1);
        c.set(2);
        assert(c.replace(3) == 2);
        assert(c.get() == 3);

        auto p = wrap(Point{1, 2}).cell();
        p.update([](Point v) { return Point{v.y, v.x}; });
        assert(p.get().x == 2);
        assert(p.get().y == 1);
    }
    printf("PASS\n");
}

void test_option_result_available() {
    printf("test_option_result_available: ");
    {
        Option<int> some = Some(4);
        assert(some.unwrap_or(0) == 4);

        auto err = Result<int, int>::Err(9);
        assert(err.unwrap_err() == 9);
    }
    printf("PASS\n");
}

int main() {
    printf("=== core-only build tests ===\n");

    test_cell_constructors();
    test_option_result_available();

    printf("\nAll core-only tests passed!\n");
    return 0;
}
