#ifndef AUTOWRAP_HPP
#define AUTOWRAP_HPP

// autowrap - one-call construction of ownership and concurrency primitives
//
// The primitives follow Rust's std semantics:
// - Interior mutability (Cell, RefCell, OnceCell)
// - Shared ownership (Rc single-threaded, Arc thread-safe)
// - Locks that hand out RAII guards and report poisoning (Mutex, RwLock)
// - Atomics with an explicit Ordering on every access
//
// wrap.hpp turns any value into one of them with a single call. Which
// primitives exist is controlled by the capability macros in config.hpp.

#include "autowrap/config.hpp"
#include "autowrap/option.hpp"
#include "autowrap/result.hpp"
#include "autowrap/cell.hpp"

#if AUTOWRAP_FEATURE_STD
#include "autowrap/refcell.hpp"
#include "autowrap/rc.hpp"
#include "autowrap/once_cell.hpp"
#endif

// Synchronization primitives (std::sync equivalent)
#if AUTOWRAP_FEATURE_SYNC
#include "autowrap/arc.hpp"
#include "autowrap/mutex.hpp"
#include "autowrap/rwlock.hpp"
#include "autowrap/atomic.hpp"
#endif

#include "autowrap/wrap.hpp"

#endif // AUTOWRAP_HPP
