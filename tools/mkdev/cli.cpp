/**
 * @file cli.cpp
 * @brief mkdev command-line front end
 */

#include "cli.hpp"

#include <mkdev.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <strings.h>
#include <memory>
#include <string>

namespace mkdev::cli {

static constexpr size_t MAX_BUFFER_SIZE_MIB = 1024;

// ============================================================================
// Argument parsing
// ============================================================================

void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s [OPTIONS] SOURCE TARGET\n"
            "\n"
            "Write SOURCE onto TARGET (a device or existing file), auto-detecting\n"
            "the optimal buffer size.\n"
            "\n"
            "Options:\n"
            "  -b, --buffer-size N  Buffer size in MiB (1-%zu); skips auto-detection\n"
            "  -d, --no-direct      Do not try direct I/O on the target\n"
            "  -u, --io-uring       Perform I/O through io_uring\n"
            "  --no-progress        Disable progress line\n"
            "  -v, --verbose        Show debug messages\n"
            "  -h, --help           Show this help\n"
            "\n"
            "Example: %s ubuntu.iso /dev/sdc\n"
            "         %s ubuntu.iso /dev/sdc --buffer-size 32\n"
            "\n"
            "Warning: This will OVERWRITE all data on the target device!\n",
            argv0, MAX_BUFFER_SIZE_MIB, argv0, argv0);
}

static bool parse_mib(const char *str, size_t &out) {
    if (*str == '\0' || !isdigit(static_cast<unsigned char>(*str))) return false;
    char *end;
    errno = 0;
    unsigned long long val = strtoull(str, &end, 10);
    if (errno != 0 || *end != '\0' || val < 1 || val > MAX_BUFFER_SIZE_MIB) return false;
    out = static_cast<size_t>(val);
    return true;
}

ParseResult parse_args(int argc, char **argv, Config &config) {
    static struct option long_opts[] = {{"buffer-size", required_argument, nullptr, 'b'},
                                        {"no-direct", no_argument, nullptr, 'd'},
                                        {"io-uring", no_argument, nullptr, 'u'},
                                        {"no-progress", no_argument, nullptr, 'P'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    optind = 0; // full rescan, parse_args may run more than once per process
    int opt;
    while ((opt = getopt_long(argc, argv, "b:duvh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'b':
            if (!parse_mib(optarg, config.buffer_size_mib)) {
                fprintf(stderr,
                        "mkdev: invalid buffer size '%s': use a number of MiB (e.g. 16)\n",
                        optarg);
                return ParseResult::Error;
            }
            break;
        case 'd':
            config.no_direct = true;
            break;
        case 'u':
            config.use_uring = true;
            break;
        case 'P':
            config.no_progress = true;
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            return ParseResult::Help;
        default:
            print_usage(argv[0]);
            return ParseResult::Error;
        }
    }

    if (argc - optind != 2) {
        fprintf(stderr, "mkdev: expected SOURCE and TARGET arguments\n");
        print_usage(argv[0]);
        return ParseResult::Error;
    }

    config.source = argv[optind];
    config.target = argv[optind + 1];
    return ParseResult::Ok;
}

// ============================================================================
// Confirmation
// ============================================================================

bool confirmation_accepted(std::string_view line) {
    size_t begin = 0;
    size_t end = line.size();
    while (begin < end && isspace(static_cast<unsigned char>(line[begin]))) begin++;
    while (end > begin && isspace(static_cast<unsigned char>(line[end - 1]))) end--;

    std::string_view word = line.substr(begin, end - begin);
    if (word.size() != 3) return false;
    return strncasecmp(word.data(), "yes", 3) == 0;
}

static bool confirm(const Config &config, FILE *in) {
    printf("Source: %s\n", config.source.c_str());
    printf("Target: %s\n", config.target.c_str());
    printf("\nWARNING: This will permanently erase all data on %s!\n", config.target.c_str());
    printf("Are you sure you want to continue? (yes/no): ");
    fflush(stdout);

    // The whole line is checked, however long
    char *raw = nullptr;
    size_t cap = 0;
    ssize_t len = ::getline(&raw, &cap, in);
    std::unique_ptr<char, decltype(&free)> line(raw, &free);
    if (len < 0) {
        printf("\n");
        return false;
    }
    return confirmation_accepted(std::string_view(line.get(), static_cast<size_t>(len)));
}

// ============================================================================
// Logging
// ============================================================================

namespace {

// Routes library messages to the terminal for the lifetime of a run.
class TerminalLog {
  public:
    explicit TerminalLog(bool verbose) {
        set_log_handler([verbose](LogLevel level, std::string_view msg) {
            int len = static_cast<int>(msg.size());
            switch (level) {
            case LogLevel::Error:
                fprintf(stderr, "mkdev: %.*s\n", len, msg.data());
                break;
            case LogLevel::Warning:
                fprintf(stderr, "mkdev: warning: %.*s\n", len, msg.data());
                break;
            case LogLevel::Debug:
                if (verbose) fprintf(stderr, "mkdev: debug: %.*s\n", len, msg.data());
                break;
            default:
                printf("%.*s\n", len, msg.data());
                break;
            }
        });
    }

    ~TerminalLog() { clear_log_handler(); }

    TerminalLog(const TerminalLog &) = delete;
    TerminalLog &operator=(const TerminalLog &) = delete;
};

} // namespace

static std::unique_ptr<IoBackend> create_backend(const Config &config) {
    if (config.use_uring) {
        try {
            return make_uring_backend();
        } catch (const Error &e) {
            log_emit(LogLevel::Warning,
                     std::string("io_uring unavailable (") + e.what() + "), using system calls");
        }
    }
    return make_syscall_backend();
}

size_t choose_buffer_size(const Config &config, const Options &opts, IoBackend &io,
                          const SourceFile &source) {
    if (config.buffer_size_mib > 0) {
        size_t size = config.buffer_size_mib * MiB;
        printf("Using manually specified buffer size: %s\n\n",
               format_bytes(static_cast<double>(size)).c_str());
        return size;
    }

    printf("Auto-detecting optimal buffer size...\n");
    BufferSizeSelector selector(io, opts);
    try {
        size_t size = selector.select(source.file.get(), source.size);
        printf("Optimal buffer size detected: %s\n\n",
               format_bytes(static_cast<double>(size)).c_str());
        return size;
    } catch (const BenchmarkError &e) {
        fprintf(stderr, "mkdev: warning: auto-detection failed (%s), using default %s\n\n",
                e.what(), format_bytes(static_cast<double>(opts.default_buffer_size())).c_str());
        return opts.default_buffer_size();
    }
}

// ============================================================================
// Run
// ============================================================================

std::string describe_copy_error(const CopyError &e, const Config &config) {
    const std::string &path = e.stage() == CopyStage::Read ? config.source : config.target;
    return std::string(copy_stage_name(e.stage())) + " of '" + path + "' failed after " +
           std::to_string(e.bytes_copied()) + " bytes: " + e.what();
}

static int transfer(const Config &config, IoBackend &io) {
    try {
        Options opts;
        opts.direct_io(!config.no_direct);

        SourceFile source = open_source(config.source, io);
        TargetDevice target = open_target(config.target, io, opts);

        printf("\nSource size: %s (%llu bytes)\n",
               format_bytes(static_cast<double>(source.size)).c_str(),
               static_cast<unsigned long long>(source.size));

        const CopyTask task{config.source, config.target, source.size,
                            choose_buffer_size(config, opts, io, source)};

        printf("Starting write operation...\n\n");
        fflush(stdout);

        CopyEngine engine(io, opts);
        if (!config.no_progress) {
            engine.on_progress([](const CopyProgress &progress, bool final) {
                printf("\r%s", format_progress(progress, final).c_str());
                if (final) printf("\n");
                fflush(stdout);
            });
        }

        CopySummary summary = engine.copy(source.file.get(), target.file.get(), task.total_size,
                                          task.buffer_size, target.mode);

        if (config.no_progress) {
            printf("Copied %s in %.1fs (avg %s)\n",
                   format_bytes(static_cast<double>(summary.bytes_copied)).c_str(),
                   summary.elapsed_s, format_rate(summary.average_bps).c_str());
        }
        printf("\nSuccessfully written to %s\n", task.target.c_str());
        return 0;

    } catch (const OpenError &e) {
        fprintf(stderr, "mkdev: %s\n", e.what());
        if (e.kind() == OpenFailure::PermissionDenied) {
            fprintf(stderr, "Make sure you have permission (try sudo) and the device exists.\n");
        }
        return 1;
    } catch (const CopyError &e) {
        fprintf(stderr, "\nmkdev: %s\n", describe_copy_error(e, config).c_str());
        fprintf(stderr, "mkdev: '%s' is only partially written and must not be trusted\n",
                config.target.c_str());
        return 1;
    } catch (const Error &e) {
        fprintf(stderr, "mkdev: error: %s\n", e.what());
        return 1;
    } catch (const std::exception &e) {
        fprintf(stderr, "mkdev: error: %s\n", e.what());
        return 1;
    }
}

int run(const Config &config, FILE *in) {
    if (!confirm(config, in)) {
        printf("Operation cancelled.\n");
        return 0;
    }

    TerminalLog log(config.verbose);
    auto io = create_backend(config);
    return transfer(config, *io);
}

int run(const Config &config, FILE *in, IoBackend &io) {
    if (!confirm(config, in)) {
        printf("Operation cancelled.\n");
        return 0;
    }

    TerminalLog log(config.verbose);
    return transfer(config, io);
}

} // namespace mkdev::cli
