#pragma once

#include "thermo/log/Log.hpp"

#include <type_traits>

namespace thermo::testing {

inline int g_failures = 0;

// Byte-sized integers print as numbers, everything else as-is.
template<typename T>
decltype(auto) printable(const T& value) {
    if constexpr (std::is_integral_v<T> && sizeof(T) == 1) {
        return static_cast<int>(value);
    } else {
        return (value);
    }
}

inline int report(const char* suite) {
    if (g_failures) {
        thermo::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    thermo::logInfo(suite, " tests passed.\n");
    return 0;
}

} // namespace thermo::testing

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { thermo::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++thermo::testing::g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { thermo::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", thermo::testing::printable(_va), " != ", thermo::testing::printable(_vb), ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++thermo::testing::g_failures; } } while(0)

#define ASSERT_NEAR(a,b,tol,msg) \
    do { double _va=(a); double _vb=(b); double _d=_va-_vb; if (_d<0) _d=-_d; if (_d>(tol)) { \
        thermo::logError("ASSERT NEAR FAILED: ", (msg), "  (", _va, " vs ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++thermo::testing::g_failures; } } while(0)
