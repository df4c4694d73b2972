#include <iostream>

#include "application.hpp"
#include "logger.hpp"
#include "options.hpp"

int main(int argc, char *argv[]) {
  CliOptions options;
  try {
    options = parseArguments(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << "treetool: " << e.what() << "\n\n" << usageText();
    return 2;
  }

  Logger::init(options.quiet, options.verbosity);

  Application app;
  return app.execute(options);
}
