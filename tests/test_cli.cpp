/**
 * @file test_cli.cpp
 * @brief Tests for the mkdev command-line front end
 */

#include "cli.hpp"
#include "test_util.h"

#include <mkdev.hpp>

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <utility>

using mkdev::cli::Config;
using mkdev::cli::ParseResult;

// Mutable argv for getopt_long, which permutes its input
class Argv {
  public:
    Argv(std::initializer_list<const char *> args) : storage_(args.begin(), args.end()) {
        for (auto &s : storage_) ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char **argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> ptrs_;
};

static ParseResult parse(Argv args, Config &config) {
    return mkdev::cli::parse_args(args.argc(), args.argv(), config);
}

// Confirmation answer fed to run() in place of stdin
class ScriptedInput {
  public:
    explicit ScriptedInput(std::string text) : text_(std::move(text)) {
        file_ = fmemopen(text_.data(), text_.size(), "r");
        if (!file_) {
            throw std::runtime_error("fmemopen failed");
        }
    }

    ~ScriptedInput() { fclose(file_); }

    ScriptedInput(const ScriptedInput &) = delete;
    ScriptedInput &operator=(const ScriptedInput &) = delete;

    FILE *get() const { return file_; }

  private:
    std::string text_;
    FILE *file_ = nullptr;
};

// System-call backend whose first `failures` reads fail with EIO
class FlakyReadBackend : public mkdev::IoBackend {
  public:
    explicit FlakyReadBackend(int failures)
        : inner_(mkdev::make_syscall_backend()), failures_(failures) {}

    int open(const char *path, int flags, mode_t mode) override {
        return inner_->open(path, flags, mode);
    }

    ssize_t read(int fd, void *buf, size_t len) override {
        if (failures_ > 0) {
            failures_--;
            return -EIO;
        }
        max_read_len = std::max(max_read_len, len);
        return inner_->read(fd, buf, len);
    }

    ssize_t write(int fd, const void *buf, size_t len) override {
        return inner_->write(fd, buf, len);
    }

    int sync(int fd) override { return inner_->sync(fd); }

    const char *name() const noexcept override { return "flaky-read"; }

    size_t max_read_len = 0;

  private:
    std::unique_ptr<mkdev::IoBackend> inner_;
    int failures_;
};

static Config make_config(const std::string &source, const std::string &target) {
    Config config;
    config.source = source;
    config.target = target;
    config.no_progress = true;
    return config;
}

// =============================================================================
// Argument Parsing Tests
// =============================================================================

TEST(parse_args_minimal) {
    Config config;
    ASSERT(parse({"mkdev", "ubuntu.iso", "/dev/sdc"}, config) == ParseResult::Ok);
    ASSERT_EQ(config.source, std::string("ubuntu.iso"));
    ASSERT_EQ(config.target, std::string("/dev/sdc"));
    ASSERT_EQ(config.buffer_size_mib, 0u);
    ASSERT(!config.no_direct);
    ASSERT(!config.use_uring);
}

TEST(parse_args_all_options) {
    Config config;
    ASSERT(parse({"mkdev", "ubuntu.iso", "/dev/sdc", "--buffer-size", "32", "--no-direct",
                  "--io-uring", "--no-progress", "-v"},
                 config) == ParseResult::Ok);
    ASSERT_EQ(config.source, std::string("ubuntu.iso"));
    ASSERT_EQ(config.target, std::string("/dev/sdc"));
    ASSERT_EQ(config.buffer_size_mib, 32u);
    ASSERT(config.no_direct);
    ASSERT(config.use_uring);
    ASSERT(config.no_progress);
    ASSERT(config.verbose);
}

TEST(parse_args_short_buffer_size) {
    Config config;
    ASSERT(parse({"mkdev", "-b", "1024", "a.img", "b.img"}, config) == ParseResult::Ok);
    ASSERT_EQ(config.buffer_size_mib, 1024u);
}

TEST(parse_args_invalid_buffer_size) {
    Config config;
    ASSERT(parse({"mkdev", "-b", "0", "a.img", "b.img"}, config) == ParseResult::Error);
    ASSERT(parse({"mkdev", "-b", "abc", "a.img", "b.img"}, config) == ParseResult::Error);
    ASSERT(parse({"mkdev", "-b", "-4", "a.img", "b.img"}, config) == ParseResult::Error);
    ASSERT(parse({"mkdev", "-b", "16M", "a.img", "b.img"}, config) == ParseResult::Error);
    ASSERT(parse({"mkdev", "-b", "1025", "a.img", "b.img"}, config) == ParseResult::Error);
}

TEST(parse_args_wrong_positional_count) {
    Config a;
    ASSERT(parse({"mkdev"}, a) == ParseResult::Error);
    Config b;
    ASSERT(parse({"mkdev", "a.img"}, b) == ParseResult::Error);
    Config c;
    ASSERT(parse({"mkdev", "a.img", "b.img", "c.img"}, c) == ParseResult::Error);
}

TEST(parse_args_help) {
    Config config;
    ASSERT(parse({"mkdev", "--help"}, config) == ParseResult::Help);
    Config other;
    ASSERT(parse({"mkdev", "-h", "a.img", "b.img"}, other) == ParseResult::Help);
}

TEST(parse_args_unknown_option) {
    Config config;
    ASSERT(parse({"mkdev", "--force", "a.img", "b.img"}, config) == ParseResult::Error);
}

// =============================================================================
// Confirmation Tests
// =============================================================================

TEST(confirmation_accepts_yes_any_case) {
    ASSERT(mkdev::cli::confirmation_accepted("yes"));
    ASSERT(mkdev::cli::confirmation_accepted("Yes \n"));
    ASSERT(mkdev::cli::confirmation_accepted("  yes"));
    ASSERT(mkdev::cli::confirmation_accepted("YES\r\n"));
    ASSERT(mkdev::cli::confirmation_accepted("\tyEs\t\n"));
}

TEST(confirmation_rejects_other_answers) {
    ASSERT(!mkdev::cli::confirmation_accepted(""));
    ASSERT(!mkdev::cli::confirmation_accepted("\n"));
    ASSERT(!mkdev::cli::confirmation_accepted("y"));
    ASSERT(!mkdev::cli::confirmation_accepted("no"));
    ASSERT(!mkdev::cli::confirmation_accepted("yess"));
    ASSERT(!mkdev::cli::confirmation_accepted("yes please"));
    ASSERT(!mkdev::cli::confirmation_accepted("y e s"));
}

// =============================================================================
// Run Tests
// =============================================================================

TEST(run_confirmed_copies_source) {
    auto data = random_bytes(3 * mkdev::MiB + 12345);
    TempFile source(data);
    TempFile target;
    ScriptedInput in("Yes  \n");

    Config config = make_config(source.path(), target.path());
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT(target.contents() == data);
}

TEST(run_manual_buffer_size) {
    auto data = random_bytes(2500000);
    TempFile source(data);
    TempFile target;
    ScriptedInput in("yes\n");

    Config config = make_config(source.path(), target.path());
    config.buffer_size_mib = 1;
    config.no_progress = false;
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT(target.contents() == data);
}

TEST(run_buffered_target) {
    auto data = random_bytes(1000001);
    TempFile source(data);
    TempFile target;
    ScriptedInput in("yes\n");

    Config config = make_config(source.path(), target.path());
    config.no_direct = true;
    config.buffer_size_mib = 1;
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT(target.contents() == data);
}

TEST(run_io_uring_or_fallback) {
    auto data = random_bytes(700000);
    TempFile source(data);
    TempFile target;
    ScriptedInput in("yes\n");

    Config config = make_config(source.path(), target.path());
    config.use_uring = true;
    config.buffer_size_mib = 1;
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT(target.contents() == data);
}

TEST(run_declined_leaves_target_untouched) {
    auto original = random_bytes(8192, 7);
    TempFile source(random_bytes(65536));
    TempFile target(original);
    ScriptedInput in("y\n");

    Config config = make_config(source.path(), target.path());
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT(target.contents() == original);
}

TEST(run_declined_does_not_create_target) {
    TempFile source(random_bytes(65536));
    std::string target = missing_path();
    ScriptedInput in("no\n");

    Config config = make_config(source.path(), target);
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT_NE(access(target.c_str(), F_OK), 0);
}

TEST(run_end_of_input_cancels) {
    auto original = random_bytes(4096, 11);
    TempFile source(random_bytes(65536));
    TempFile target(original);
    FILE *in = fopen("/dev/null", "r");
    ASSERT(in != nullptr);

    Config config = make_config(source.path(), target.path());
    int rc = mkdev::cli::run(config, in);
    fclose(in);
    ASSERT_EQ(rc, 0);
    ASSERT(target.contents() == original);
}

TEST(run_missing_source_fails) {
    TempFile target;
    ScriptedInput in("yes\n");

    Config config = make_config(missing_path(), target.path());
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 1);
    ASSERT(target.contents().empty());
}

TEST(run_missing_target_fails) {
    TempFile source(random_bytes(65536));
    std::string target = missing_path();
    ScriptedInput in("yes\n");

    Config config = make_config(source.path(), target);
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 1);
    ASSERT_NE(access(target.c_str(), F_OK), 0);
}

TEST(run_long_answer_checked_in_full) {
    auto original = random_bytes(8192, 5);
    TempFile source(random_bytes(65536));
    TempFile target(original);
    ScriptedInput in("yes" + std::string(300, ' ') + "no\n");

    Config config = make_config(source.path(), target.path());
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT(target.contents() == original);
}

TEST(run_long_padded_yes_accepted) {
    auto data = random_bytes(65536);
    TempFile source(data);
    TempFile target;
    ScriptedInput in(std::string(300, ' ') + "YES" + std::string(300, ' ') + "\n");

    Config config = make_config(source.path(), target.path());
    config.buffer_size_mib = 1;
    ASSERT_EQ(mkdev::cli::run(config, in.get()), 0);
    ASSERT(target.contents() == data);
}

// =============================================================================
// Buffer Size Choice Tests
// =============================================================================

TEST(choose_buffer_size_manual) {
    TempFile source(random_bytes(65536));
    FlakyReadBackend io(0);
    auto src = mkdev::open_source(source.path(), io);

    Config config = make_config(source.path(), "unused");
    config.buffer_size_mib = 32;
    mkdev::Options opts;
    ASSERT_EQ(mkdev::cli::choose_buffer_size(config, opts, io, src), 32u * mkdev::MiB);
    ASSERT_EQ(io.max_read_len, 0u);
}

TEST(choose_buffer_size_benchmark_failure_uses_default) {
    TempFile source(random_bytes(3 * mkdev::MiB));
    FlakyReadBackend io(1);
    auto src = mkdev::open_source(source.path(), io);

    Config config = make_config(source.path(), "unused");
    mkdev::Options opts;
    ASSERT_EQ(mkdev::cli::choose_buffer_size(config, opts, io, src), mkdev::DEFAULT_BUFFER_SIZE);
    ASSERT_EQ(lseek(src.file.get(), 0, SEEK_CUR), 0);
}

TEST(run_benchmark_failure_copies_with_default) {
    auto data = random_bytes(20 * mkdev::MiB + 4096);
    TempFile source(data);
    TempFile target;
    ScriptedInput in("yes\n");
    FlakyReadBackend io(1);

    Config config = make_config(source.path(), target.path());
    ASSERT_EQ(mkdev::cli::run(config, in.get(), io), 0);
    ASSERT_EQ(io.max_read_len, mkdev::DEFAULT_BUFFER_SIZE);
    ASSERT(target.contents() == data);
}

// =============================================================================
// Copy Failure Reporting Tests
// =============================================================================

TEST(describe_copy_error_names_file) {
    Config config = make_config("ubuntu.iso", "/dev/sdc");

    mkdev::CopyError read_err(mkdev::CopyStage::Read, EIO, "read from source", 4096);
    std::string msg = mkdev::cli::describe_copy_error(read_err, config);
    ASSERT(msg.find("'ubuntu.iso'") != std::string::npos);
    ASSERT(msg.find("4096 bytes") != std::string::npos);
    ASSERT(msg.find("read") == 0);

    mkdev::CopyError write_err(mkdev::CopyStage::Write, EIO, "write to target", 0);
    msg = mkdev::cli::describe_copy_error(write_err, config);
    ASSERT(msg.find("'/dev/sdc'") != std::string::npos);
    ASSERT(msg.find("ubuntu.iso") == std::string::npos);
}

TEST(run_source_read_failure_fails) {
    TempFile source(random_bytes(65536));
    TempFile target;
    ScriptedInput in("yes\n");
    FlakyReadBackend io(1);

    Config config = make_config(source.path(), target.path());
    config.buffer_size_mib = 1;
    ASSERT_EQ(mkdev::cli::run(config, in.get(), io), 1);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    printf("Running mkdev CLI tests...\n");

    RUN_TEST(parse_args_minimal);
    RUN_TEST(parse_args_all_options);
    RUN_TEST(parse_args_short_buffer_size);
    RUN_TEST(parse_args_invalid_buffer_size);
    RUN_TEST(parse_args_wrong_positional_count);
    RUN_TEST(parse_args_help);
    RUN_TEST(parse_args_unknown_option);
    RUN_TEST(confirmation_accepts_yes_any_case);
    RUN_TEST(confirmation_rejects_other_answers);
    RUN_TEST(run_confirmed_copies_source);
    RUN_TEST(run_manual_buffer_size);
    RUN_TEST(run_buffered_target);
    RUN_TEST(run_io_uring_or_fallback);
    RUN_TEST(run_declined_leaves_target_untouched);
    RUN_TEST(run_declined_does_not_create_target);
    RUN_TEST(run_end_of_input_cancels);
    RUN_TEST(run_missing_source_fails);
    RUN_TEST(run_missing_target_fails);
    RUN_TEST(run_long_answer_checked_in_full);
    RUN_TEST(run_long_padded_yes_accepted);
    RUN_TEST(choose_buffer_size_manual);
    RUN_TEST(choose_buffer_size_benchmark_failure_uses_default);
    RUN_TEST(run_benchmark_failure_copies_with_default);
    RUN_TEST(describe_copy_error_names_file);
    RUN_TEST(run_source_read_failure_fails);

    return report("test_cli");
}
