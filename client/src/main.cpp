#include <cstdlib>
#include <exception>
#include <iostream>
#include <utility>

#include "cpan/client/config.hpp"
#include "cpan/client/logger.hpp"
#include "cpan/client/session.hpp"
#include "cpan/drive/drive_service.hpp"
#include "cpan/version.hpp"

int main(int argc, char *argv[])
{
    using namespace cpan::client;

    try
    {
        auto config = parse_arguments(argc, argv);
        if (config.show_help)
        {
            std::cout << usage_text();
            return EXIT_SUCCESS;
        }
        if (config.show_version)
        {
            std::cout << "cpan " << cpan::version() << std::endl;
            return EXIT_SUCCESS;
        }

        load_environment(config);
        Logger logger(config.log_path, config.verbose);
        logger.log("info", "cpan ", cpan::version(), " using drive ", config.drive_root.string());

        cpan::drive::DriveService drive(config.drive_root);
        ClientSession session(std::move(config), std::move(logger), drive);
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
