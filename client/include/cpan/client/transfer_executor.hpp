#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "cpan/client/cancellation.hpp"
#include "cpan/client/logger.hpp"
#include "cpan/client/token_authority.hpp"
#include "cpan/client/transfer_plan.hpp"
#include "cpan/error_codes.hpp"
#include "cpan/remote_api.hpp"

namespace cpan::client
{

    struct RetryPolicy
    {
        std::uint32_t max_attempts{3};
        std::chrono::milliseconds initial_backoff{500};
        double multiplier{2.0};
        std::chrono::milliseconds max_backoff{8000};

        // Wait after the given failed attempt (1-based) before the next one.
        std::chrono::milliseconds delay_for(std::uint32_t attempt) const;
    };

    struct ExecuteOptions
    {
        std::size_t concurrency{4};
        RetryPolicy retry{};
        bool overwrite{false};
        CancellationSource *cancellation{nullptr};
        // Called once per unit when it becomes Done or Failed, on any worker thread and outside the
        // executor's locks. Exceptions it throws are logged and do not affect the unit.
        std::function<void(const TransferUnit &)> on_unit_finished{};
    };

    struct UnitFailure
    {
        TransferUnit unit;
        Error error;
    };

    struct TransferResult
    {
        std::vector<TransferUnit> succeeded;
        std::vector<UnitFailure> failed;
        // Set when the destination root could not be created; every unit then failed with it.
        std::optional<Error> root_error;

        std::size_t total() const noexcept { return succeeded.size() + failed.size(); }
        std::size_t skipped() const noexcept;
        bool ok() const noexcept { return failed.empty() && !root_error; }
    };

    /**
     * Runs a TransferPlan on a bounded worker pool. Per-unit failures are
     * collected in the result; execute() itself only returns once every unit
     * is Done or Failed.
     */
    class TransferExecutor
    {
    public:
        TransferExecutor(RemoteApi &api, TokenAuthority &tokens, Logger logger);

        TransferResult execute(const TransferPlan &plan, const ExecuteOptions &options = {});

    private:
        RemoteApi &api_;
        TokenAuthority &tokens_;
        Logger logger_;
    };

} // namespace cpan::client
