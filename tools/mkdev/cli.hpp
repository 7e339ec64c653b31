/**
 * @file cli.hpp
 * @brief mkdev command-line front end
 *
 * Split from main.cpp so the tests can drive a whole invocation with a
 * scripted confirmation answer.
 */

#ifndef MKDEV_TOOL_CLI_HPP
#define MKDEV_TOOL_CLI_HPP

#include <mkdev/fwd.hpp>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace mkdev::cli {

struct Config {
    std::string source;
    std::string target;
    size_t buffer_size_mib = 0; // 0 = auto-detect
    bool no_direct = false;
    bool use_uring = false;
    bool no_progress = false;
    bool verbose = false;
};

/// parse_args() result
enum class ParseResult { Ok, Help, Error };

/**
 * Parse the command line
 *
 * Errors are reported on stderr.
 */
ParseResult parse_args(int argc, char **argv, Config &config);

/// Print usage to stderr
void print_usage(const char *argv0);

/// True if a confirmation line, trimmed, equals "yes" ignoring case
bool confirmation_accepted(std::string_view line);

/**
 * Pick the transfer buffer size
 *
 * Uses the manual size when one was given. Otherwise runs the benchmark
 * on the source and falls back to the default size, with a warning, if
 * the benchmark fails.
 */
size_t choose_buffer_size(const Config &config, const Options &opts, IoBackend &io,
                          const SourceFile &source);

/// One-line description of a failed copy naming the file involved
std::string describe_copy_error(const CopyError &e, const Config &config);

/**
 * Run one copy
 *
 * Prints the warning, reads the confirmation from `in`, then opens,
 * benchmarks and copies.
 *
 * @return Process exit code (0 on success or cancellation, 1 on failure)
 */
int run(const Config &config, FILE *in);

/// Same as run(config, in), with every I/O going through `io`
int run(const Config &config, FILE *in, IoBackend &io);

} // namespace mkdev::cli

#endif // MKDEV_TOOL_CLI_HPP
