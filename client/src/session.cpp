#include "cpan/client/session.hpp"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "cpan/error_codes.hpp"

namespace cpan::client
{

    namespace
    {

        // Turns SIGINT/SIGTERM into a cancellation request for the lifetime of one command.
        class InterruptWatcher
        {
        public:
            InterruptWatcher(CancellationSource &cancellation, const Logger &logger)
                : signals_(io_context_, SIGINT, SIGTERM)
            {
                signals_.async_wait([&cancellation, &logger](const std::error_code &ec, int signal)
                                    {
                if (!ec) {
                    logger.log("warn", "signal ", signal, " received, cancelling");
                    std::cerr << "Interrupted, waiting for running transfers to finish" << std::endl;
                    cancellation.cancel();
                } });
                thread_ = std::thread([this]
                                      { io_context_.run(); });
            }

            InterruptWatcher(const InterruptWatcher &) = delete;
            InterruptWatcher &operator=(const InterruptWatcher &) = delete;

            ~InterruptWatcher()
            {
                io_context_.stop();
                if (thread_.joinable())
                {
                    thread_.join();
                }
            }

        private:
            asio::io_context io_context_;
            asio::signal_set signals_;
            std::thread thread_;
        };

    } // namespace

    void print_summary(std::ostream &out, TransferDirection direction, const TransferResult &result)
    {
        out << to_string(direction) << ": " << result.succeeded.size() << " succeeded (" << result.skipped()
            << " skipped), " << result.failed.size() << " failed, " << result.total() << " total" << std::endl;
        if (result.root_error)
        {
            out << "ERROR: " << to_string(result.root_error->code()) << " destination root: "
                << result.root_error->what() << std::endl;
        }
        for (const auto &failure : result.failed)
        {
            out << "ERROR: " << to_string(failure.error.code()) << ' ' << failure.unit.source() << " -> "
                << failure.unit.destination() << ": " << failure.error.what() << std::endl;
        }
    }

    void print_object(std::ostream &out, const RemoteObjectRef &object)
    {
        out << "id:   " << object.id << '\n'
            << "kind: " << to_string(object.kind) << '\n'
            << "name: " << object.name << '\n';
        if (object.path)
        {
            out << "path: " << *object.path << '\n';
        }
        if (!object.is_directory())
        {
            out << "size: " << object.size << '\n';
        }
        out.flush();
    }

    ClientSession::ClientSession(ClientConfig config, Logger logger, RemoteApi &api)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          api_(api),
          store_(config_.credential_path),
          tokens_(api_, store_, logger_),
          resolver_(api_, tokens_, logger_),
          planner_(api_, tokens_, logger_),
          executor_(api_, tokens_, logger_) {}

    int ClientSession::run()
    {
        try
        {
            if (config_.command == CommandKind::None)
            {
                throw std::runtime_error("No command given\n" + usage_text());
            }
            authenticate();
            if (config_.command == CommandKind::Upload || config_.command == CommandKind::Download)
            {
                return run_transfer();
            }
            return run_manage(std::cout);
        }
        catch (const Error &ex)
        {
            std::cerr << "ERROR: " << to_string(ex.code()) << ": " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", to_string(ex.code()), ": ", ex.what());
            return 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
    }

    int ClientSession::run_transfer()
    {
        CancellationSource cancellation;
        InterruptWatcher watcher(cancellation, logger_);
        const auto direction =
            config_.command == CommandKind::Upload ? TransferDirection::Upload : TransferDirection::Download;
        const auto result = direction == TransferDirection::Upload ? upload(config_.upload, &cancellation)
                                                                   : download(config_.download, &cancellation);
        print_summary(std::cout, direction, result);
        return result.ok() ? 0 : 1;
    }

    int ClientSession::run_manage(std::ostream &out)
    {
        const auto &command = config_.manage;
        switch (config_.command)
        {
        case CommandKind::Info:
            print_object(out, info(command.target));
            break;
        case CommandKind::Delete:
            remove(command.target);
            out << "deleted " << command.target << std::endl;
            break;
        case CommandKind::Move:
            print_object(out, move(command.target, command.argument));
            break;
        case CommandKind::Rename:
            print_object(out, rename(command.target, command.argument));
            break;
        default:
            throw std::runtime_error("No command given\n" + usage_text());
        }
        return 0;
    }

    Credential ClientSession::authenticate()
    {
        auto credential = tokens_.bootstrap(config_.oauth);
        logger_.log("auth", "authorized client ", credential.client_id, " using ", store_.path().string());
        return credential;
    }

    TransferResult ClientSession::upload(const UploadCommand &command, CancellationSource *cancellation)
    {
        const auto local = PathResolver::resolve_local(command.local_path);
        const auto target = resolver_.resolve_remote(command.target);
        const auto plan = planner_.plan_upload(local, target.object, PlanOptions{.create_root_folder = command.create_folder});
        return executor_.execute(plan, execute_options(cancellation, false));
    }

    TransferResult ClientSession::download(const DownloadCommand &command, CancellationSource *cancellation)
    {
        const auto source = resolver_.resolve_remote(command.target);
        const auto plan = planner_.plan_download(source.object, command.save_path,
                                                 PlanOptions{.create_root_folder = command.create_folder,
                                                             .file_name = command.filename});
        return executor_.execute(plan, execute_options(cancellation, command.overwrite));
    }

    RemoteObjectRef ClientSession::info(const std::string &target)
    {
        return resolver_.resolve_remote(target).object;
    }

    void ClientSession::remove(const std::string &target)
    {
        const auto object = resolver_.resolve_remote(target).object;
        if (object.id == kRootObjectId)
        {
            throw Error(ErrorCode::InvalidArgument, "Refusing to delete the root folder");
        }
        api_.delete_object(tokens_.get_valid_token(), object.id);
        logger_.log("manage", "deleted ", target, " (", object.id, ")");
    }

    RemoteObjectRef ClientSession::move(const std::string &target, const std::string &destination)
    {
        const auto object = resolver_.resolve_remote(target).object;
        const auto folder = resolver_.resolve_remote(destination).object;
        if (!folder.is_directory())
        {
            throw Error(ErrorCode::InvalidArgument, "Move destination is not a folder: " + destination);
        }
        auto moved = api_.move_object(tokens_.get_valid_token(), object.id, folder.id);
        logger_.log("manage", "moved ", target, " (", object.id, ") into ", destination);
        return moved;
    }

    RemoteObjectRef ClientSession::rename(const std::string &target, const std::string &new_name)
    {
        const auto object = resolver_.resolve_remote(target).object;
        auto renamed = api_.rename_object(tokens_.get_valid_token(), object.id, new_name);
        logger_.log("manage", "renamed ", target, " (", object.id, ") to ", new_name);
        return renamed;
    }

    ExecuteOptions ClientSession::execute_options(CancellationSource *cancellation, bool overwrite) const
    {
        ExecuteOptions options{};
        options.concurrency = config_.concurrency;
        options.retry.max_attempts = config_.max_attempts;
        options.overwrite = overwrite;
        options.cancellation = cancellation;
        return options;
    }

} // namespace cpan::client
