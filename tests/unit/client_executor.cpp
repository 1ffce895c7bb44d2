#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "cpan/client/cancellation.hpp"
#include "cpan/client/path_resolver.hpp"
#include "cpan/client/session.hpp"
#include "cpan/client/transfer_executor.hpp"
#include "cpan/client/transfer_planner.hpp"
#include "cpan/error_codes.hpp"
#include "client_fixture.hpp"

using namespace cpan;
using namespace cpan::client;
using namespace std::chrono_literals;
using cpan::testing::ClientFixture;
using cpan::testing::read_file;
using cpan::testing::write_file;

namespace
{

    RetryPolicy fast_retry(std::uint32_t attempts = 3)
    {
        return RetryPolicy{
            .max_attempts = attempts,
            .initial_backoff = 1ms,
            .multiplier = 2.0,
            .max_backoff = 4ms,
        };
    }

    TransferPlan upload_plan(ClientFixture &fixture, const std::filesystem::path &local_root,
                             const PlanOptions &options = {})
    {
        TransferPlanner planner(fixture.remote, fixture.tokens, Logger{});
        return planner.plan_upload(PathResolver::resolve_local(local_root), root_object(), options);
    }

    std::filesystem::path numbered_files(ClientFixture &fixture, const std::string &folder, int count)
    {
        const auto root = fixture.workspace / folder;
        for (int i = 0; i < count; ++i)
        {
            write_file(root / ("file" + std::to_string(i) + ".txt"), "content " + std::to_string(i));
        }
        return root;
    }

    void test_retry_policy_backoff()
    {
        const RetryPolicy policy{};
        assert(policy.max_attempts == 3);
        assert(policy.delay_for(1) == 500ms);
        assert(policy.delay_for(2) == 1000ms);
        assert(policy.delay_for(3) == 2000ms);
        assert(policy.delay_for(5) == 8000ms);
        assert(policy.delay_for(9) == 8000ms);
    }

    void test_two_file_upload()
    {
        ClientFixture fixture("exec_two_files");
        const auto local_root = fixture.workspace / "target";
        write_file(local_root / "a.txt", "alpha");
        write_file(local_root / "sub" / "b.txt", "beta");

        const auto plan = upload_plan(fixture, local_root);
        assert(plan.size() == 2);

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(plan, ExecuteOptions{.retry = fast_retry()});
        assert(result.ok());
        assert(result.succeeded.size() == 2);
        assert(result.failed.empty());
        assert(result.total() == plan.size());
        for (const auto &unit : result.succeeded)
        {
            assert(unit.status == UnitStatus::Done);
            assert(unit.attempt_count == 1);
            assert(unit.remote_object);
        }

        const auto a = fixture.remote.lookup("target/a.txt");
        const auto b = fixture.remote.lookup("target/sub/b.txt");
        assert(a && fixture.remote.content_of(*a) == "alpha");
        assert(b && fixture.remote.content_of(*b) == "beta");
    }

    void test_directory_creation_is_idempotent()
    {
        ClientFixture fixture("exec_idempotent");
        const auto local_root = fixture.workspace / "tree";
        for (int i = 0; i < 6; ++i)
        {
            write_file(local_root / "shared" / "deep" / ("f" + std::to_string(i)), std::to_string(i));
        }
        write_file(local_root / "top.txt", "top");

        const auto plan = upload_plan(fixture, local_root);
        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const ExecuteOptions options{.concurrency = 4, .retry = fast_retry()};

        assert(executor.execute(plan, options).ok());
        const auto nodes_after_first = fixture.remote.node_count();
        assert(fixture.remote.find_children("0", "tree").size() == 1);
        const auto tree = fixture.remote.find_children("0", "tree").front();
        assert(fixture.remote.find_children(tree, "shared").size() == 1);
        assert(fixture.remote.create_calls == 3);

        assert(executor.execute(plan, options).ok());
        assert(fixture.remote.node_count() == nodes_after_first);
        assert(fixture.remote.create_calls == 3);
        assert(fixture.remote.find_children("0", "tree").size() == 1);
    }

    void test_transient_failures_retry_until_success()
    {
        ClientFixture fixture("exec_transient");
        const auto local_root = numbered_files(fixture, "one", 1);
        fixture.remote.transient_upload_failures = 2;

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root), ExecuteOptions{.retry = fast_retry()});
        assert(result.ok());
        assert(result.succeeded.front().attempt_count == 3);
        assert(fixture.remote.upload_calls == 3);
    }

    void test_retry_budget_is_terminal()
    {
        ClientFixture fixture("exec_budget");
        const auto local_root = numbered_files(fixture, "one", 1);
        fixture.remote.transient_upload_failures = 100;

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root), ExecuteOptions{.retry = fast_retry()});
        assert(!result.ok());
        assert(result.failed.size() == 1);
        assert(result.failed.front().error.code() == ErrorCode::Transient);
        assert(result.failed.front().unit.status == UnitStatus::Failed);
        assert(result.failed.front().unit.attempt_count == 3);
        assert(fixture.remote.upload_calls == 3);
    }

    void test_terminal_errors_are_not_retried_and_isolated()
    {
        ClientFixture fixture("exec_isolated");
        const auto local_root = numbered_files(fixture, "batch", 4);
        const auto plan = upload_plan(fixture, local_root);
        // Vanishes after planning.
        std::filesystem::remove(local_root / "file2.txt");

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(plan, ExecuteOptions{.concurrency = 2, .retry = fast_retry()});
        assert(result.total() == 4);
        assert(result.succeeded.size() == 3);
        assert(result.failed.size() == 1);
        assert(result.failed.front().error.code() == ErrorCode::NotFound);
        assert(result.failed.front().unit.attempt_count == 1);
        assert(fixture.remote.upload_calls == 4);
    }

    void test_every_unit_terminates_under_failures()
    {
        ClientFixture fixture("exec_terminates");
        const auto local_root = numbered_files(fixture, "many", 12);
        fixture.remote.upload_error = ErrorCode::PermissionDenied;

        std::atomic<int> observed{0};
        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root),
                                             ExecuteOptions{
                                                 .concurrency = 5,
                                                 .retry = fast_retry(),
                                                 .on_unit_finished = [&](const TransferUnit &unit)
                                                 {
                                                     assert(unit.status == UnitStatus::Failed);
                                                     ++observed;
                                                 },
                                             });
        assert(result.total() == 12);
        assert(result.failed.size() == 12);
        assert(observed == 12);
        for (const auto &failure : result.failed)
        {
            assert(failure.error.code() == ErrorCode::PermissionDenied);
        }
    }

    void test_observer_runs_outside_executor_locks()
    {
        ClientFixture fixture("exec_observer_overlap");
        const auto local_root = numbered_files(fixture, "pair", 2);

        std::mutex mutex;
        std::condition_variable both_inside;
        int inside = 0;
        std::atomic<int> overlapped{0};
        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root),
                                             ExecuteOptions{
                                                 .concurrency = 2,
                                                 .retry = fast_retry(),
                                                 .on_unit_finished = [&](const TransferUnit &)
                                                 {
                                                     std::unique_lock lock(mutex);
                                                     ++inside;
                                                     both_inside.notify_all();
                                                     // Both callbacks can only meet here if neither blocks the other.
                                                     if (both_inside.wait_for(lock, 5s, [&]
                                                                              { return inside == 2; }))
                                                     {
                                                         ++overlapped;
                                                     }
                                                 },
                                             });
        assert(result.ok());
        assert(result.succeeded.size() == 2);
        assert(overlapped == 2);
    }

    void test_throwing_observer_does_not_affect_units()
    {
        ClientFixture fixture("exec_observer_throws");
        const auto local_root = numbered_files(fixture, "batch", 3);

        std::atomic<int> calls{0};
        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root),
                                             ExecuteOptions{
                                                 .concurrency = 2,
                                                 .retry = fast_retry(),
                                                 .on_unit_finished = [&](const TransferUnit &)
                                                 {
                                                     ++calls;
                                                     throw std::runtime_error("observer failure");
                                                 },
                                             });
        assert(result.ok());
        assert(result.succeeded.size() == 3);
        assert(calls == 3);
        assert(fixture.remote.upload_calls == 3);
    }

    void test_auth_expired_halts_dispatch()
    {
        ClientFixture fixture("exec_auth");
        const auto local_root = numbered_files(fixture, "batch", 5);
        fixture.remote.upload_error = ErrorCode::AuthExpired;

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root),
                                             ExecuteOptions{.concurrency = 1, .retry = fast_retry()});
        assert(result.failed.size() == 5);
        assert(fixture.remote.upload_calls == 1);
        for (const auto &failure : result.failed)
        {
            assert(failure.error.code() == ErrorCode::AuthExpired);
        }
    }

    void test_cancellation_after_first_unit()
    {
        ClientFixture fixture("exec_cancel");
        const auto local_root = numbered_files(fixture, "five", 5);
        CancellationSource cancellation;
        // Cancel while the first transfer is in flight.
        fixture.remote.before_upload = [&](int call)
        {
            if (call == 1)
            {
                cancellation.cancel();
            }
        };

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root),
                                             ExecuteOptions{.concurrency = 1,
                                                            .retry = fast_retry(),
                                                            .cancellation = &cancellation});
        assert(result.total() == 5);
        assert(result.succeeded.size() == 1);
        assert(result.failed.size() == 4);
        for (const auto &failure : result.failed)
        {
            assert(failure.error.code() == ErrorCode::Cancelled);
            assert(failure.unit.attempt_count == 0);
        }
        assert(fixture.remote.upload_calls == 1);
    }

    void test_cancellation_interrupts_backoff()
    {
        ClientFixture fixture("exec_cancel_backoff");
        const auto local_root = numbered_files(fixture, "one", 1);
        fixture.remote.transient_upload_failures = 100;
        CancellationSource cancellation;

        std::thread canceller([&]
                              {
            std::this_thread::sleep_for(100ms);
            cancellation.cancel(); });

        const auto started = std::chrono::steady_clock::now();
        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        RetryPolicy slow{.max_attempts = 5, .initial_backoff = 30s, .max_backoff = 60s};
        const auto result = executor.execute(upload_plan(fixture, local_root),
                                             ExecuteOptions{.retry = slow, .cancellation = &cancellation});
        canceller.join();

        assert(std::chrono::steady_clock::now() - started < 10s);
        assert(result.failed.size() == 1);
        assert(result.failed.front().error.code() == ErrorCode::Cancelled);
        assert(fixture.remote.upload_calls == 1);
    }

    void test_root_failure_fails_every_unit()
    {
        ClientFixture fixture("exec_root");
        const auto local_root = numbered_files(fixture, "blocked", 3);
        fixture.remote.create_error = ErrorCode::PermissionDenied;

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, local_root), ExecuteOptions{.retry = fast_retry()});
        assert(result.root_error);
        assert(result.root_error->code() == ErrorCode::PermissionDenied);
        assert(result.failed.size() == 3);
        assert(fixture.remote.upload_calls == 0);

        // The root is still attempted for an empty folder.
        std::filesystem::create_directories(fixture.workspace / "hollow");
        const auto empty = executor.execute(upload_plan(fixture, fixture.workspace / "hollow"),
                                            ExecuteOptions{.retry = fast_retry()});
        assert(empty.root_error);
        assert(!empty.ok());
        assert(empty.total() == 0);
    }

    void test_empty_folder_upload_creates_root()
    {
        ClientFixture fixture("exec_empty");
        std::filesystem::create_directories(fixture.workspace / "hollow");

        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});
        const auto result = executor.execute(upload_plan(fixture, fixture.workspace / "hollow"));
        assert(result.ok());
        assert(result.total() == 0);
        assert(fixture.remote.lookup("hollow"));
    }

    void test_download_tree_and_skip_existing()
    {
        ClientFixture fixture("exec_download");
        const auto docs = fixture.remote.add_directory("0", "docs");
        fixture.remote.add_file(docs, "x.txt", "remote x");
        const auto inner = fixture.remote.add_directory(docs, "inner");
        fixture.remote.add_file(inner, "y.txt", "remote y");

        const auto out = fixture.workspace / "out";
        write_file(out / "docs" / "x.txt", "local x");

        TransferPlanner planner(fixture.remote, fixture.tokens, Logger{});
        const auto source = fixture.remote.get_object("token", docs);
        TransferExecutor executor(fixture.remote, fixture.tokens, Logger{});

        fixture.remote.transient_download_failures = 1;
        const auto result = executor.execute(planner.plan_download(source, out), ExecuteOptions{.retry = fast_retry()});
        assert(result.ok());
        assert(result.succeeded.size() == 2);
        assert(result.skipped() == 1);
        assert(read_file(out / "docs" / "x.txt") == "local x");
        assert(read_file(out / "docs" / "inner" / "y.txt") == "remote y");

        const auto replaced = executor.execute(planner.plan_download(source, out),
                                               ExecuteOptions{.retry = fast_retry(), .overwrite = true});
        assert(replaced.ok());
        assert(replaced.skipped() == 0);
        assert(read_file(out / "docs" / "x.txt") == "remote x");
    }

    void test_summary_output()
    {
        TransferResult result;
        result.succeeded.push_back(TransferUnit{.direction = TransferDirection::Upload,
                                                .local_path = "/data/a.txt",
                                                .remote_path = "a.txt",
                                                .status = UnitStatus::Done});
        result.failed.push_back(UnitFailure{
            .unit = TransferUnit{.direction = TransferDirection::Upload,
                                 .local_path = "/data/b.txt",
                                 .remote_path = "b.txt",
                                 .status = UnitStatus::Failed},
            .error = Error(ErrorCode::PermissionDenied, "denied"),
        });

        std::ostringstream out;
        print_summary(out, TransferDirection::Upload, result);
        const auto text = out.str();
        assert(text.find("upload: 1 succeeded (0 skipped), 1 failed, 2 total") != std::string::npos);
        assert(text.find("ERROR: permission_denied /data/b.txt -> remote:b.txt: denied") != std::string::npos);
        assert(!result.ok());
    }

} // namespace

void run_client_executor_tests()
{
    test_retry_policy_backoff();
    test_two_file_upload();
    test_directory_creation_is_idempotent();
    test_transient_failures_retry_until_success();
    test_retry_budget_is_terminal();
    test_terminal_errors_are_not_retried_and_isolated();
    test_every_unit_terminates_under_failures();
    test_observer_runs_outside_executor_locks();
    test_throwing_observer_does_not_affect_units();
    test_auth_expired_halts_dispatch();
    test_cancellation_after_first_unit();
    test_cancellation_interrupts_backoff();
    test_root_failure_fails_every_unit();
    test_empty_folder_upload_creates_root();
    test_download_tree_and_skip_existing();
    test_summary_output();
}
