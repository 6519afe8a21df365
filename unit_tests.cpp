#include "unit_tests.h"
#include "util.h"
#include "calendar.h"
#include "decimal_time.h"

bool unit_tests()
{
    test_assert(calendar_test());
    test_assert(decimal_time_test());

    return true;
}
