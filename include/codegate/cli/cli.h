#pragma once

/**
 * @file cli.h
 * @brief Command-line entry point for the codegate binary.
 */

namespace codegate::cli
{

/**
 * @brief Run the CLI using argc/argv; returns the process exit code.
 *
 * 0 when the code passed, 1 when it failed, 2 on usage errors and 3 when
 * validation itself could not complete.
 */
int run(int argc, char** argv);

} // namespace codegate::cli
