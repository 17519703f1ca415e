#ifndef COMPLETENUMBERS_TEST_HH
#define COMPLETENUMBERS_TEST_HH
#include <cstdlib>
#include <cstdio>
#include <string>

inline unsigned& fail_counter() { static unsigned c = 0; return c; }
#define FAIL(explanation) { fprintf(stderr, "Test \"%s\" failed\n", explanation); fail_counter()++; }
#define CASE(...) if(!(__VA_ARGS__)) FAIL(#__VA_ARGS__)
// Like CASE, but also shows both printed forms when they differ.
#define CASE_STR(actual, expected) \
    { \
        std::string actual_str = (actual); \
        std::string expected_str = (expected); \
        if(actual_str != expected_str) \
        { \
            fprintf(stderr, "Test \"%s\" failed: got \"%s\", expected \"%s\"\n", \
                #actual, actual_str.c_str(), expected_str.c_str()); \
            fail_counter()++; \
        } \
    }
#define FINISH return fail_counter() > 255 ? 255 : fail_counter();

#endif
