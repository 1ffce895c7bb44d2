#include "cpan/client/config.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "cpan/client/credential_store.hpp"

namespace cpan::client
{

    namespace
    {

        constexpr std::array<std::string_view, 7> kKnownKeys{
            "CLIENT_ID",
            "CLIENT_KEY",
            "CLIENT_SECRET",
            "REDIRECT_URI",
            "BACKEND_OAUTH_URL",
            "CPAN_DRIVE_ROOT",
            "CPAN_CREDENTIAL_PATH",
        };

        std::string trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return std::string(input.substr(begin, end - begin + 1));
        }

        std::string unquote(const std::string &value)
        {
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            {
                return value.substr(1, value.size() - 2);
            }
            const auto comment = value.find(" #");
            if (comment != std::string::npos)
            {
                return trim(std::string_view(value).substr(0, comment));
            }
            return value;
        }

        std::optional<std::string> lookup(const EnvMap &env, const std::string &key)
        {
            const auto it = env.find(key);
            if (it == env.end() || it->second.empty())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::string require(const EnvMap &env, const std::string &key)
        {
            auto value = lookup(env, key);
            if (!value)
            {
                throw std::runtime_error("Missing required configuration value: " + key);
            }
            return *value;
        }

        std::size_t parse_positive(const std::string &option, const std::string &value)
        {
            std::size_t consumed = 0;
            unsigned long parsed = 0;
            try
            {
                parsed = std::stoul(value, &consumed);
            }
            catch (const std::exception &)
            {
                consumed = 0;
            }
            if (consumed != value.size() || parsed == 0)
            {
                throw std::runtime_error(option + " expects a positive integer, got '" + value + "'");
            }
            return static_cast<std::size_t>(parsed);
        }

        ManageCommand manage_arguments(const std::vector<std::string> &positionals, std::size_t expected,
                                       const std::string &usage)
        {
            if (positionals.size() != expected)
            {
                throw std::runtime_error(usage);
            }
            ManageCommand command{.target = positionals[0]};
            if (expected == 2)
            {
                command.argument = positionals[1];
            }
            return command;
        }

    } // namespace

    std::string usage_text()
    {
        std::ostringstream out;
        out << "Usage: cpan [options] <command> [arguments]\n"
            << "\n"
            << "Commands:\n"
            << "  upload (up) <path>              Upload a file or folder (auto-detected)\n"
            << "      --target <id|path>          Remote target folder, default 0 (root)\n"
            << "      --no-create-folder          Upload folder contents directly into the target\n"
            << "  download (down) <id|path> [save_path]\n"
            << "                                  Download a file or folder (auto-detected)\n"
            << "      --filename <name>           Local name for a single downloaded file\n"
            << "      --overwrite                 Replace existing local files\n"
            << "      --no-create-folder          Download folder contents directly into save_path\n"
            << "  info <id|path>                  Show a remote file or folder\n"
            << "  delete (rm) <id|path>           Delete a remote file or folder\n"
            << "  move (mv) <id|path> <folder>    Move a remote object into another folder\n"
            << "  rename <id|path> <new_name>     Rename a remote object\n"
            << "\n"
            << "Options:\n"
            << "  --env <file>                    Configuration file, default: nearest .env\n"
            << "  --log <file>                    Write a log file\n"
            << "  --verbose                       Log to stderr\n"
            << "  --concurrency <n>               Parallel transfers, default 4\n"
            << "  --retries <n>                   Attempts per file for transient errors, default 3\n"
            << "  --version                       Print the version\n"
            << "  --help                          Show this help\n";
        return out.str();
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        std::vector<std::string> positionals;
        std::string command_name;

        int index = 1;
        auto next_value = [&](const std::string &option) -> std::string
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        };

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (arg == "--version")
            {
                config.show_version = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--env")
            {
                config.env_file = std::filesystem::path(next_value(arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value(arg));
            }
            else if (arg == "--concurrency" || arg == "--max-workers")
            {
                config.concurrency = parse_positive(arg, next_value(arg));
            }
            else if (arg == "--retries")
            {
                config.max_attempts = static_cast<std::uint32_t>(parse_positive(arg, next_value(arg)));
            }
            else if (arg == "--target")
            {
                config.upload.target = next_value(arg);
            }
            else if (arg == "--filename")
            {
                config.download.filename = next_value(arg);
            }
            else if (arg == "--overwrite")
            {
                config.download.overwrite = true;
            }
            else if (arg == "--create-folder")
            {
                config.upload.create_folder = true;
                config.download.create_folder = true;
            }
            else if (arg == "--no-create-folder")
            {
                config.upload.create_folder = false;
                config.download.create_folder = false;
            }
            else if (!arg.empty() && arg.front() == '-' && arg != "-")
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (command_name.empty())
            {
                command_name = arg;
            }
            else
            {
                positionals.push_back(arg);
            }
        }

        if (config.show_help || config.show_version)
        {
            return config;
        }

        if (command_name == "upload" || command_name == "up")
        {
            if (positionals.size() != 1)
            {
                throw std::runtime_error("Usage: cpan upload <path> [--target <id|path>]");
            }
            config.command = CommandKind::Upload;
            config.upload.local_path = std::filesystem::path(positionals[0]);
        }
        else if (command_name == "download" || command_name == "down")
        {
            if (positionals.empty() || positionals.size() > 2)
            {
                throw std::runtime_error("Usage: cpan download <id|path> [save_path]");
            }
            config.command = CommandKind::Download;
            config.download.target = positionals[0];
            if (positionals.size() == 2)
            {
                config.download.save_path = std::filesystem::path(positionals[1]);
            }
        }
        else if (command_name == "info")
        {
            config.command = CommandKind::Info;
            config.manage = manage_arguments(positionals, 1, "Usage: cpan info <id|path>");
        }
        else if (command_name == "delete" || command_name == "rm")
        {
            config.command = CommandKind::Delete;
            config.manage = manage_arguments(positionals, 1, "Usage: cpan delete <id|path>");
        }
        else if (command_name == "move" || command_name == "mv")
        {
            config.command = CommandKind::Move;
            config.manage = manage_arguments(positionals, 2, "Usage: cpan move <id|path> <folder id|path>");
        }
        else if (command_name == "rename")
        {
            config.command = CommandKind::Rename;
            config.manage = manage_arguments(positionals, 2, "Usage: cpan rename <id|path> <new_name>");
        }
        else if (command_name.empty())
        {
            throw std::runtime_error("Missing command\n" + usage_text());
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command_name);
        }

        return config;
    }

    EnvMap load_env_file(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot read configuration file: " + path.string());
        }

        EnvMap env;
        std::string line;
        while (std::getline(in, line))
        {
            auto content = trim(line);
            if (content.empty() || content.front() == '#')
            {
                continue;
            }
            if (content.rfind("export ", 0) == 0)
            {
                content = trim(std::string_view(content).substr(7));
            }
            const auto equals = content.find('=');
            if (equals == std::string::npos)
            {
                continue;
            }
            auto key = trim(std::string_view(content).substr(0, equals));
            if (key.empty())
            {
                continue;
            }
            env[key] = unquote(trim(std::string_view(content).substr(equals + 1)));
        }
        return env;
    }

    std::optional<std::filesystem::path> find_env_file(const std::filesystem::path &start)
    {
        std::error_code ec;
        auto directory = std::filesystem::absolute(start, ec);
        if (ec)
        {
            return std::nullopt;
        }
        while (true)
        {
            const auto candidate = directory / ".env";
            if (std::filesystem::is_regular_file(candidate, ec))
            {
                return candidate;
            }
            const auto parent = directory.parent_path();
            if (parent.empty() || parent == directory)
            {
                return std::nullopt;
            }
            directory = parent;
        }
    }

    OAuthClientConfig oauth_from_env(const EnvMap &env)
    {
        OAuthClientConfig oauth;
        oauth.backend_oauth_url = lookup(env, "BACKEND_OAUTH_URL");
        oauth.client_id = require(env, "CLIENT_ID");
        if (oauth.mode() == OAuthMode::Direct)
        {
            oauth.client_key = require(env, "CLIENT_KEY");
            oauth.client_secret = require(env, "CLIENT_SECRET");
        }
        else
        {
            oauth.client_key = lookup(env, "CLIENT_KEY");
            oauth.client_secret = lookup(env, "CLIENT_SECRET");
        }
        oauth.redirect_uri = require(env, "REDIRECT_URI");
        return oauth;
    }

    void load_environment(ClientConfig &config)
    {
        EnvMap env;
        if (config.env_file)
        {
            env = load_env_file(*config.env_file);
        }
        else if (auto discovered = find_env_file(std::filesystem::current_path()))
        {
            config.env_file = discovered;
            env = load_env_file(*discovered);
        }

        for (const auto key : kKnownKeys)
        {
            const std::string name(key);
            if (const char *value = std::getenv(name.c_str()); value != nullptr && *value != '\0')
            {
                env[name] = value;
            }
        }

        config.oauth = oauth_from_env(env);
        config.drive_root = std::filesystem::path(require(env, "CPAN_DRIVE_ROOT"));
        if (auto credential_path = lookup(env, "CPAN_CREDENTIAL_PATH"))
        {
            config.credential_path = std::filesystem::path(*credential_path);
        }
        else
        {
            config.credential_path = CredentialStore::default_path();
        }
    }

} // namespace cpan::client
