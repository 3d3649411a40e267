#ifndef AUTOWRAP_CONFIG_HPP
#define AUTOWRAP_CONFIG_HPP

// Capability groups
//
// AUTOWRAP_FEATURE_STD  - heap ownership: RefCell, Rc, OnceCell
// AUTOWRAP_FEATURE_SYNC - concurrency: Arc, Mutex, RwLock, Atomic
//
// Both default to on. The build normally sets them from the
// AUTOWRAP_ENABLE_STD / AUTOWRAP_ENABLE_SYNC CMake options.

#ifndef AUTOWRAP_FEATURE_STD
#define AUTOWRAP_FEATURE_STD 1
#endif

#ifndef AUTOWRAP_FEATURE_SYNC
#define AUTOWRAP_FEATURE_SYNC AUTOWRAP_FEATURE_STD
#endif

#if AUTOWRAP_FEATURE_SYNC && !AUTOWRAP_FEATURE_STD
#error "AUTOWRAP_FEATURE_SYNC requires AUTOWRAP_FEATURE_STD"
#endif

#endif // AUTOWRAP_CONFIG_HPP
