// Only translation unit of jrand_tests that defines the doctest runner
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
