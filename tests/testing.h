#ifndef TESTING_H
#define TESTING_H

#include <iostream>

// number of failed checks in this test executable; main() returns non-zero if any
inline int & test_failures() {
    static int failures = 0;
    return failures;
}

// If macro argument is not true, test is failing
#define IS_TRUE(x) { \
    if (!(x)) { \
        std::cout << __PRETTY_FUNCTION__ << " failed on line " << __LINE__ << std::endl;\
        ++test_failures(); \
    } else { \
        std::cout << __PRETTY_FUNCTION__ << " passed on line " << __LINE__ << std::endl;\
    } \
}

// If the statement does not throw `ex_type`, test is failing
#define THROWS(stmt, ex_type) { \
    bool thrown = false; \
    try { stmt; } catch (const ex_type &) { thrown = true; } \
    IS_TRUE(thrown); \
}

inline int test_status() { return test_failures() == 0 ? 0 : 1; }

#endif
