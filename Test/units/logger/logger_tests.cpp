#include "Logger.hpp"

#include <catch2/catch_test_macros.hpp>
#include <iostream>
#include <sstream>
#include <string>

using namespace DnD;

TEST_CASE("Log levels parse from names and prefixes", "[logger]") {
  REQUIRE(Logger::parse_level("trace") == LogLevel::Trace);
  REQUIRE(Logger::parse_level("DEB") == LogLevel::Debug);
  REQUIRE(Logger::parse_level("e") == LogLevel::Error);
  REQUIRE(Logger::parse_level("none") == LogLevel::None);
  REQUIRE(Logger::parse_level("verbose") == LogLevel::Info);
}

TEST_CASE("Messages logged after stopping are printed in place",
          "[logger]") {
  auto &logger = Logger::get_instance();
  logger.set_level(LogLevel::Info);
  Logger::stop();

  std::ostringstream captured;
  auto *previous = std::cout.rdbuf(captured.rdbuf());
  info("Late message {}", 42);
  std::cout.rdbuf(previous);

  REQUIRE(captured.str().find("Late message 42") != std::string::npos);
}
