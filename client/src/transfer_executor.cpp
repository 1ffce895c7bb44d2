#include "cpan/client/transfer_executor.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace cpan::client
{

    std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t attempt) const
    {
        auto delay = static_cast<double>(initial_backoff.count());
        for (std::uint32_t i = 1; i < attempt; ++i)
        {
            delay *= multiplier;
        }
        delay = std::min(delay, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
    }

    std::size_t TransferResult::skipped() const noexcept
    {
        return static_cast<std::size_t>(std::count_if(succeeded.begin(), succeeded.end(), [](const TransferUnit &unit)
                                                      { return unit.skipped; }));
    }

    namespace
    {

        // State of one execute() call, shared by its workers.
        class ExecutionRun
        {
        public:
            ExecutionRun(RemoteApi &api, TokenAuthority &tokens, const Logger &logger, const TransferPlan &plan,
                         const ExecuteOptions &options)
                : api_(api), tokens_(tokens), logger_(logger), plan_(plan), options_(options) {}

            TransferResult run()
            {
                if (auto root_error = create_root())
                {
                    logger_.log("error", "could not create destination root: ", root_error->what());
                    for (const auto &unit : plan_.units())
                    {
                        record_failure(unit, *root_error);
                    }
                    result_.root_error = std::move(root_error);
                    return std::move(result_);
                }

                queue_.assign(plan_.units().begin(), plan_.units().end());
                if (queue_.empty())
                {
                    return std::move(result_);
                }

                const auto workers = std::clamp<std::size_t>(options_.concurrency, 1, queue_.size());
                logger_.log("execute", to_string(plan_.direction()), " of ", queue_.size(), " file(s) with ", workers,
                            " worker(s)");
                asio::thread_pool pool(workers);
                for (std::size_t i = 0; i < workers; ++i)
                {
                    asio::post(pool, [this]
                               { worker(); });
                }
                pool.join();

                drain_undispatched();
                return std::move(result_);
            }

        private:
            void worker()
            {
                while (auto unit = next_unit())
                {
                    process(std::move(*unit));
                }
            }

            std::optional<TransferUnit> next_unit()
            {
                std::lock_guard lock(queue_mutex_);
                if (!stop_reason_ && options_.cancellation && options_.cancellation->cancelled())
                {
                    stop_reason_ = ErrorCode::Cancelled;
                    logger_.log("warn", "cancellation requested, no further transfers will start");
                }
                if (stop_reason_ || queue_.empty())
                {
                    return std::nullopt;
                }
                auto unit = std::move(queue_.front());
                queue_.pop_front();
                return unit;
            }

            void halt(ErrorCode reason)
            {
                std::lock_guard lock(queue_mutex_);
                if (!stop_reason_)
                {
                    stop_reason_ = reason;
                    logger_.log("warn", "halting dispatch: ", to_string(reason));
                }
            }

            void drain_undispatched()
            {
                std::deque<TransferUnit> remaining;
                ErrorCode reason = ErrorCode::Cancelled;
                {
                    std::lock_guard lock(queue_mutex_);
                    remaining.swap(queue_);
                    if (stop_reason_)
                    {
                        reason = *stop_reason_;
                    }
                }
                const auto message = reason == ErrorCode::AuthExpired ? "Reauthorization required before transfer started"
                                                                      : "Transfer cancelled before it started";
                for (auto &unit : remaining)
                {
                    record_failure(std::move(unit), Error(reason, message));
                }
            }

            void process(TransferUnit unit)
            {
                unit.status = UnitStatus::InProgress;
                std::uint32_t attempts = 0;
                auto error = with_retry([&]
                                        { transfer(unit); },
                                        attempts, unit.source());
                unit.attempt_count = attempts;
                if (!error)
                {
                    record_success(std::move(unit));
                    return;
                }
                if (error->code() == ErrorCode::AuthExpired)
                {
                    halt(ErrorCode::AuthExpired);
                }
                record_failure(std::move(unit), std::move(*error));
            }

            template <typename Step>
            std::optional<Error> with_retry(Step &&step, std::uint32_t &attempts, const std::string &label)
            {
                const auto &policy = options_.retry;
                for (;;)
                {
                    ++attempts;
                    try
                    {
                        step();
                        return std::nullopt;
                    }
                    catch (const std::exception &ex)
                    {
                        auto error = classify_exception(ex);
                        if (!is_retryable(error.code()) || attempts >= policy.max_attempts)
                        {
                            return error;
                        }
                        const auto delay = policy.delay_for(attempts);
                        logger_.log("retry", label, " attempt ", attempts, " failed (", error.what(), "), retrying in ",
                                    delay.count(), " ms");
                        if (interrupted_during(delay))
                        {
                            return Error(ErrorCode::Cancelled, "Cancelled while waiting to retry " + label);
                        }
                    }
                }
            }

            bool interrupted_during(std::chrono::milliseconds delay) const
            {
                if (options_.cancellation)
                {
                    return options_.cancellation->wait_for(delay);
                }
                std::this_thread::sleep_for(delay);
                return false;
            }

            std::optional<Error> create_root()
            {
                std::uint32_t attempts = 0;
                if (plan_.direction() == TransferDirection::Upload)
                {
                    if (plan_.root_folder().empty())
                    {
                        return std::nullopt;
                    }
                    return with_retry([&]
                                      { ensure_remote_directory(plan_.root_folder()); },
                                      attempts, "remote:" + plan_.root_folder());
                }
                return with_retry([&]
                                  { std::filesystem::create_directories(plan_.local_root()); },
                                  attempts, plan_.local_root().string());
            }

            void transfer(TransferUnit &unit)
            {
                if (unit.direction == TransferDirection::Upload)
                {
                    const auto parent_id = ensure_remote_directory(unit.remote_parent());
                    unit.remote_object = api_.upload_primitive(tokens_.get_valid_token(), unit.local_path, parent_id);
                    return;
                }

                if (!options_.overwrite && std::filesystem::exists(unit.local_path))
                {
                    logger_.log("execute", "keeping existing ", unit.local_path.string());
                    unit.skipped = true;
                    return;
                }
                std::filesystem::create_directories(unit.local_path.parent_path());
                api_.download_primitive(tokens_.get_valid_token(), unit.remote_object->id, unit.local_path);
            }

            std::mutex &directory_mutex(const std::string &relative)
            {
                std::lock_guard lock(directories_mutex_);
                auto &slot = directory_locks_[relative];
                if (!slot)
                {
                    slot = std::make_unique<std::mutex>();
                }
                return *slot;
            }

            std::optional<std::string> cached_directory(const std::string &relative)
            {
                std::lock_guard lock(directories_mutex_);
                const auto it = directory_ids_.find(relative);
                if (it == directory_ids_.end())
                {
                    return std::nullopt;
                }
                return it->second;
            }

            // Remote id of the folder at `relative` below the plan's target, creating missing folders.
            std::string ensure_remote_directory(const std::string &relative)
            {
                if (relative.empty())
                {
                    return plan_.remote_root().id;
                }
                if (auto cached = cached_directory(relative))
                {
                    return *cached;
                }

                const auto slash = relative.rfind('/');
                const auto parent = slash == std::string::npos ? std::string{} : relative.substr(0, slash);
                const auto name = slash == std::string::npos ? relative : relative.substr(slash + 1);
                const auto parent_id = ensure_remote_directory(parent);

                std::lock_guard guard(directory_mutex(relative));
                if (auto cached = cached_directory(relative))
                {
                    return *cached;
                }
                auto id = find_or_create_directory(parent_id, name, relative);
                {
                    std::lock_guard lock(directories_mutex_);
                    directory_ids_[relative] = id;
                }
                return id;
            }

            std::optional<std::string> find_directory(const std::string &parent_id, const std::string &name,
                                                      const std::string &relative)
            {
                const auto children = api_.list_directory(tokens_.get_valid_token(), parent_id);
                const auto match = std::find_if(children.begin(), children.end(), [&](const RemoteObjectRef &child)
                                                { return child.name == name; });
                if (match == children.end())
                {
                    return std::nullopt;
                }
                if (!match->is_directory())
                {
                    throw Error(ErrorCode::AlreadyExists, "A remote file occupies folder path " + relative);
                }
                return match->id;
            }

            std::string find_or_create_directory(const std::string &parent_id, const std::string &name,
                                                 const std::string &relative)
            {
                if (auto existing = find_directory(parent_id, name, relative))
                {
                    return *existing;
                }
                try
                {
                    auto created = api_.create_directory(tokens_.get_valid_token(), parent_id, name);
                    logger_.log("execute", "created remote folder ", relative, " (", created.id, ")");
                    return created.id;
                }
                catch (const Error &ex)
                {
                    // Someone else created it between our listing and the create call.
                    if (ex.code() != ErrorCode::AlreadyExists)
                    {
                        throw;
                    }
                }
                if (auto existing = find_directory(parent_id, name, relative))
                {
                    return *existing;
                }
                throw Error(ErrorCode::Transient, "Remote folder vanished while creating " + relative);
            }

            void record_success(TransferUnit unit)
            {
                unit.status = UnitStatus::Done;
                {
                    std::lock_guard lock(result_mutex_);
                    result_.succeeded.push_back(unit);
                }
                notify_finished(unit);
            }

            void record_failure(TransferUnit unit, Error error)
            {
                unit.status = UnitStatus::Failed;
                logger_.log("error", unit.source(), " -> ", unit.destination(), ": ", to_string(error.code()), ": ",
                            error.what());
                {
                    std::lock_guard lock(result_mutex_);
                    result_.failed.push_back(UnitFailure{.unit = unit, .error = std::move(error)});
                }
                notify_finished(unit);
            }

            // Runs the observer without holding any executor lock.
            void notify_finished(const TransferUnit &unit) const
            {
                if (!options_.on_unit_finished)
                {
                    return;
                }
                try
                {
                    options_.on_unit_finished(unit);
                }
                catch (const std::exception &ex)
                {
                    logger_.log("warn", "unit observer failed for ", unit.source(), ": ", ex.what());
                }
            }

            RemoteApi &api_;
            TokenAuthority &tokens_;
            const Logger &logger_;
            const TransferPlan &plan_;
            const ExecuteOptions &options_;

            std::mutex queue_mutex_;
            std::deque<TransferUnit> queue_;
            std::optional<ErrorCode> stop_reason_;

            std::mutex directories_mutex_;
            std::map<std::string, std::unique_ptr<std::mutex>> directory_locks_;
            std::map<std::string, std::string> directory_ids_;

            std::mutex result_mutex_;
            TransferResult result_;
        };

    } // namespace

    TransferExecutor::TransferExecutor(RemoteApi &api, TokenAuthority &tokens, Logger logger)
        : api_(api), tokens_(tokens), logger_(std::move(logger)) {}

    TransferResult TransferExecutor::execute(const TransferPlan &plan, const ExecuteOptions &options)
    {
        ExecutionRun run(api_, tokens_, logger_, plan, options);
        return run.run();
    }

} // namespace cpan::client
