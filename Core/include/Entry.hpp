#include "App.hpp"
#ifdef DND_ENTRY

#include "Environment.hpp"
#include "Logger.hpp"

#include <array>
#include <cstdlib>
#include <exception>
#include <string>

using namespace DnD;

int main() {
  const std::array<std::string, 2> keys{"LOG_LEVEL",
                                        "ENABLE_VALIDATION_LAYERS"};
  Environment::initialize(keys);

  ApplicationProperties props{};

  try {
    auto application = make_application(props);
    application->run();
  } catch (const std::exception &exc) {
    error("Fatal: {}", exc.what());
    Logger::stop();
    return EXIT_FAILURE;
  }

  info("Exiting");
  Logger::stop();
  return EXIT_SUCCESS;
}

#else
#error You need to define 'DND_ENTRY' before including this file.
#endif
