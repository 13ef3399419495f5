#include "DimensionsApplication.hpp"

#include <dimensions/core/ConfigLoader.hpp>
#include <dimensions/core/Logger.hpp>
#include <dimensions/core/LoggingConfig.hpp>

#include <iostream>

int main(int argc, char **argv)
{
    try
    {
        auto cfg = dimensions::core::ConfigLoader::load(argc, argv);
        dimensions::core::applyLoggingConfig(cfg.engine);

        {
            app::DimensionsApplication application(cfg);
            application.run();
        }

        dimensions::core::shutdownLogger();
        return 0;
    }
    catch (const std::exception &e)
    {
        SLOG_FATAL("Dimensions", "StartupFailed", "what='{}'", e.what());
        dimensions::core::shutdownLogger();
        std::cerr << "dimensions: " << e.what() << "\n";
        return 1;
    }
}
