// Tests for autowrap::Option<T> and autowrap::Result<T, E>
#include <autowrap/option.hpp>
#include <autowrap/result.hpp>
#include <cassert>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

using namespace autowrap;

void test_option_some_none() {
    printf("test_option_some_none: ");
    {
        Option<int> some = Some(5);
        Option<int> none = None;

        assert(some.is_some());
        assert(!some.is_none());
        assert(none.is_none());
        assert(static_cast<bool>(some));
        assert(!static_cast<bool>(none));

        assert(some.unwrap() == 5);
        assert(some.is_none());  // unwrap moves the value out
        assert(none.unwrap_or(7) == 7);
    }
    printf("PASS\n");
}

void test_option_unwrap_none_throws() {
    printf("test_option_unwrap_none_throws: ");
    {
        Option<std::string> none = None;
        bool threw = false;
        try {
            none.unwrap();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            none.expect("no name configured");
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "no name configured";
        }
        assert(threw);
    }
    printf("PASS\n");
}

void test_option_move_only() {
    printf("test_option_move_only: ");
    {
        Option<std::unique_ptr<int>> opt = Some(std::make_unique<int>(3));
        Option<std::unique_ptr<int>> taken = opt.take();
        assert(opt.is_none());
        assert(taken.is_some());
        assert(*taken.peek() == 3);

        Option<std::unique_ptr<int>> moved = std::move(taken);
        assert(taken.is_none());
        assert(*moved.unwrap() == 3);
    }
    printf("PASS\n");
}

void test_option_reference() {
    printf("test_option_reference: ");
    {
        int x = 10;
        Option<const int&> ref(x);
        assert(ref.is_some());
        assert(&ref.unwrap() == &x);

        Option<int&> mut_ref(x);
        mut_ref.unwrap() = 11;
        assert(x == 11);

        Option<const int&> empty = None;
        int fallback = 1;
        assert(empty.unwrap_or(fallback) == 1);
    }
    printf("PASS\n");
}

void test_result_ok_err() {
    printf("test_result_ok_err: ");
    {
        auto ok = Result<int, std::string>::Ok(1);
        auto err = Result<int, std::string>::Err("bad");

        assert(ok.is_ok());
        assert(err.is_err());
        assert(ok.unwrap() == 1);
        assert(err.unwrap_err() == "bad");
        assert(err.unwrap_or(9) == 9);

        bool threw = false;
        try {
            auto e = Result<int, std::string>::Err("bad");
            e.unwrap();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            auto o = Result<int, std::string>::Ok(1);
            o.unwrap_err();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }
    printf("PASS\n");
}

void test_result_same_types() {
    printf("test_result_same_types: ");
    {
        // Ok and Err with the same payload type stay distinguishable
        auto ok = Result<int, int>::Ok(4);
        auto err = Result<int, int>::Err(4);
        assert(ok.is_ok());
        assert(err.is_err());

        Result<int, int> copy = err;
        assert(copy.is_err());
        assert(copy.unwrap_err() == 4);
    }
    printf("PASS\n");
}

void test_result_void() {
    printf("test_result_void: ");
    {
        auto ok = Result<void, int>::Ok();
        auto err = Result<void, int>::Err(42);

        assert(ok.is_ok());
        ok.unwrap();
        assert(err.is_err());
        assert(err.unwrap_err() == 42);
    }
    printf("PASS\n");
}

int main() {
    printf("=== Option/Result tests ===\n");

    test_option_some_none();
    test_option_unwrap_none_throws();
    test_option_move_only();
    test_option_reference();
    test_result_ok_err();
    test_result_same_types();
    test_result_void();

    printf("\nAll Option/Result tests passed!\n");
    return 0;
}
