#include <iostream>

#include "clouddrive/client/config.hpp"
#include "clouddrive/client/logger.hpp"
#include "clouddrive/client/session.hpp"

int main(int argc, char *argv[])
{
    using namespace clouddrive::client;
    try
    {
        const auto command_line = parse_arguments(argc, argv);
        const auto config_path = command_line.config_path.value_or(default_config_path());
        auto settings = load_settings(config_path);
        Logger logger(command_line.log_path, command_line.debug || settings.debug);
        ClientSession session(command_line, std::move(settings), config_path, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return kExitFailure;
    }
}
