#include <ramses/gateway.hpp>

#include <iostream>

using namespace ramses;

int main(int argc, char* argv[]) {
    if (argc < 2 || (std::string(argv[1]) == "--replay" && argc < 3)) {
        std::cout << "usage: " << argv[0] << " <serial_port> [packet_log]" << std::endl;
        std::cout << "       " << argv[0] << " --replay <packet_log>" << std::endl;
        return 1;
    }
    Gateway::Config config;
    if (std::string(argv[1]) == "--replay") {
        config.input_file = argv[2];
    } else {
        config.serial_port = argv[1];
        if (argc > 2) {
            config.packet_log = argv[2];
        }
    }
    config.logger = std::make_shared<Logger>();
    config.logger->addLogHandler(Logger::INFO,
            [](msecs time, Logger::Level level, Error error, const void*, size_t) {
                std::cerr << time.count() << " " << Logger::getLevelName(level)
                          << ", type: " << error.type << ", code: " << error.code
                          << ", msg: " << error.what() << std::endl;
            });
    config.msg_handler = [](const Message& msg) {
        std::cout << msg.getTimestamp().count() << " " << msg.getFrame() << std::endl;
    };

    std::cout << "Starting ramses client..." << std::endl;
    Gateway gateway(std::move(config));
    switch (gateway.start()) {
        case Gateway::ExitReason::GRACEFUL_EXIT:
            std::cout << " - exiting via: graceful exit" << std::endl;
            break;
        case Gateway::ExitReason::INTERRUPTED:
            std::cout << " - exiting via: interrupt" << std::endl;
            break;
        case Gateway::ExitReason::END_OF_INPUT:
            std::cout << " - exiting via: end of input" << std::endl;
            break;
    }
    std::cout << "Finished ramses client." << std::endl;
}
