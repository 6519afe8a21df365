#pragma once

// Runs every self test. Prints the first failing assertion.
bool unit_tests();
