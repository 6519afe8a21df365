#include <cstdio>

#include "unit_tests.h"

int main()
{
    printf("Running self test...\n");
    if (!unit_tests())
    {
        printf("Failed self test.\n");
        return 1;
    }
    printf("Self test passed.\n");
    return 0;
}
