#pragma once

#include <gtest/gtest.h>

/*
 * Shared main() of the unit-test binaries:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 *
 * On top of the usual gtest flags, accepts the util::Logging and util::Random options, so that a
 * failing test can be rerun with --log-filename, --log-level or a different --seed.
 */
int launch_gtest(int argc, char** argv);
