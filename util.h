#pragma once

#include <cstdint>
#include <cstdio>
#include <cmath>
#include <cinttypes>
#include <string>

#define test_assert(x) if (!(x)) { printf("Failed %s at %s:%d\n", #x, __FILE__, __LINE__); return false; }
#define test_assert_signed_eq(x, y) {auto x1 = x; auto y1 = y; if (!(x1 == y1)) { printf("Failed %" PRId64 " == %" PRId64 " at %s:%d\n", static_cast<int64_t>(x1), static_cast<int64_t>(y1), __FILE__, __LINE__); return false; }}
#define test_assert_unsigned_eq(x, y) {auto x1 = x; auto y1 = y; if (!(x1 == y1)) { printf("Failed 0x%" PRIx64 " == 0x%" PRIx64 " at %s:%d\n", static_cast<uint64_t>(x1), static_cast<uint64_t>(y1), __FILE__, __LINE__); return false; }}
#define test_assert_near(x, y, eps) {double x1 = x; double y1 = y; if (!(std::fabs(x1 - y1) <= (eps))) { printf("Failed %.17g ~= %.17g at %s:%d\n", x1, y1, __FILE__, __LINE__); return false; }}
#define test_assert_str_eq(x, y) {std::string const x1 = x; std::string const y1 = y; if (x1 != y1) { printf("Failed \"%s\" == \"%s\" at %s:%d\n", x1.c_str(), y1.c_str(), __FILE__, __LINE__); return false; }}
