#include "Config.hpp"
#include "Log.hpp"
#include "Mover.hpp"

#include <string>

int main(int argc, char* argv[]) {
    try {
        std::string config_path = argc > 1 ? argv[1] : std::string(CONFIG_FILE);

        auto config = load_config(config_path);
        logging::init_file_sink(config.log_file, logging::parse_size(config.max_log_file_size));

        MOVER_LOG_INFO("Starting torrent-mover with {} server(s), {}s between cycles", config.servers.size(), config.rate_limit_delay.count());

        Mover mover(std::move(config));
        mover.run();

        MOVER_LOG_INFO("Shutting down torrent-mover");
    }

    catch (const std::exception& ex) {
        MOVER_LOG_ERROR("{}", ex.what());
        return 1;
    }
}
