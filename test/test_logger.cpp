#include <catch2/catch.hpp>
#include <ramses/logger.hpp>

#include <cstring>
#include <vector>

using namespace ramses;

TEST_CASE("Logger Level Filter", "[logger]") {
    Logger logger;
    Error test_error("COMMAND_QUEUED", 315, 7);
    std::string test_frame = "RQ --- 18:000730 01:145038 --:------ 1F09 001 00";

    // a handler sees its own level and everything above it
    int log_count[Logger::N_LEVELS] = {0};
    for (int i = 0; i < Logger::N_LEVELS; ++i) {
        logger.addLogHandler(static_cast<Logger::Level>(i),
                [&](msecs, Logger::Level level, Error error, const void* data, size_t len) {
                    ++log_count[level];
                    REQUIRE(!strcmp(error.what(), test_error.msg));
                    REQUIRE(error.type == test_error.type);
                    REQUIRE(error.code == test_error.code);
                    REQUIRE(data == test_frame.data());
                    REQUIRE(len == test_frame.size());
                });
    }
    for (int i = 0; i < Logger::N_LEVELS; ++i) {
        logger.log(static_cast<Logger::Level>(i), test_error, test_frame.data(),
                test_frame.size());
    }
    for (int i = 0; i < Logger::N_LEVELS; ++i) {
        REQUIRE(log_count[i] == i + 1);
    }
}

TEST_CASE("Logger Clock Override", "[logger]") {
    Logger logger;
    logger.getClock() = []() { return msecs(1234); };

    std::vector<msecs> times;
    logger.addLogHandler(Logger::WARN,
            [&times](msecs time, Logger::Level, Error, const void*, size_t) {
                times.push_back(time);
            });
    // below the handler level
    logger.log(Logger::INFO, Error("ignored"));
    logger.log(Logger::ERROR, Error("kept"));
    REQUIRE(times.size() == 1);
    REQUIRE(times.front() == msecs(1234));

    // empty handlers are not registered
    logger.addLogHandler(Logger::TRACE, nullptr);
    logger.log(Logger::TRACE, Error("ignored"));
    REQUIRE(times.size() == 1);
}

TEST_CASE("Error Macros", "[logger]") {
    enum { SOME_ERROR = 42 };
    Error error(STRERR(SOME_ERROR), 3);
    REQUIRE(!strcmp(error.what(), "SOME_ERROR"));
    REQUIRE(error.type == SOME_ERROR);
    REQUIRE(error.code == 3);

    std::shared_ptr<Logger> logger;
    // a null logger is skipped
    IF_PTR(logger, log, Logger::FATAL, error);
    logger = std::make_shared<Logger>();
    int fired = 0;
    logger->addLogHandler(Logger::FATAL,
            [&fired](msecs, Logger::Level, Error, const void*, size_t) { ++fired; });
    IF_PTR(logger, log, Logger::FATAL, error);
    REQUIRE(fired == 1);
}

TEST_CASE("Logger Level Names", "[logger]") {
    REQUIRE(!strcmp(Logger::getLevelName(Logger::TRACE), "TRACE"));
    REQUIRE(!strcmp(Logger::getLevelName(Logger::WARN), "WARN"));
    REQUIRE(!strcmp(Logger::getLevelName(Logger::FATAL), "FATAL"));
    REQUIRE(!strcmp(Logger::getLevelName(Logger::N_LEVELS), "UNKNOWN"));

    Logger logger;
    REQUIRE(!logger.isEnabled(Logger::FATAL));
    logger.addLogHandler(Logger::WARN, [](msecs, Logger::Level, Error, const void*, size_t) {});
    REQUIRE(!logger.isEnabled(Logger::INFO));
    REQUIRE(logger.isEnabled(Logger::WARN));
    REQUIRE(logger.isEnabled(Logger::ERROR));
}
