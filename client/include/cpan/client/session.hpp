#pragma once

#include <ostream>
#include <string>

#include "cpan/client/cancellation.hpp"
#include "cpan/client/config.hpp"
#include "cpan/client/credential_store.hpp"
#include "cpan/client/logger.hpp"
#include "cpan/client/path_resolver.hpp"
#include "cpan/client/token_authority.hpp"
#include "cpan/client/transfer_executor.hpp"
#include "cpan/client/transfer_planner.hpp"
#include "cpan/remote_api.hpp"

namespace cpan::client
{

    // Counts plus one `ERROR: <kind>` line per failed unit.
    void print_summary(std::ostream &out, TransferDirection direction, const TransferResult &result);

    void print_object(std::ostream &out, const RemoteObjectRef &object);

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger, RemoteApi &api);

        // Authorizes, runs the configured command and prints its summary. Returns the process exit code.
        int run();

        Credential authenticate();

        TransferResult upload(const UploadCommand &command, CancellationSource *cancellation = nullptr);

        TransferResult download(const DownloadCommand &command, CancellationSource *cancellation = nullptr);

        RemoteObjectRef info(const std::string &target);

        // Throws Error(InvalidArgument) for the root folder.
        void remove(const std::string &target);

        // Throws Error(InvalidArgument) when `destination` is not a folder.
        RemoteObjectRef move(const std::string &target, const std::string &destination);

        RemoteObjectRef rename(const std::string &target, const std::string &new_name);

    private:
        int run_transfer();
        int run_manage(std::ostream &out);

        ExecuteOptions execute_options(CancellationSource *cancellation, bool overwrite) const;

        ClientConfig config_;
        Logger logger_;
        RemoteApi &api_;
        CredentialStore store_;
        TokenAuthority tokens_;
        PathResolver resolver_;
        TransferPlanner planner_;
        TransferExecutor executor_;
    };

} // namespace cpan::client
