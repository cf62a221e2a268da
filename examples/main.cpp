#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "ucibridge/app/cli_options.hpp"
#include "ucibridge/app/request_dispatcher.hpp"
#include "ucibridge/config/bridge_config.hpp"
#include "ucibridge/engine/uci_bridge.hpp"
#include "ucibridge/errors.hpp"
#include "ucibridge/log.hpp"

int main(int argc, char **argv)
{
  using namespace ucibridge;

  Logger log("ucibridge");

  app::CliOptions cli;
  try
  {
    cli = app::parse_args(argc, argv);
  }
  catch (const std::invalid_argument &e)
  {
    log.error(e.what());
    app::print_usage(std::cerr);
    return 2;
  }

  if (cli.help)
  {
    app::print_usage(std::cout);
    return 0;
  }

  try
  {
    if (cli.writeConfigPath)
    {
      config::writeDefaultConfig(*cli.writeConfigPath);
      log.info("Wrote default configuration to " + *cli.writeConfigPath);
      return 0;
    }

    config::BridgeConfig cfg = app::resolve_config(cli, log.child("Config"));
    log.setLevel(cfg.logLevel);

    // Logs go to stderr; stdout carries responses only.
    log.info("Engine path: " + cfg.enginePath);
    log.info("Think time: " + std::to_string(cfg.defaultThinkTimeMs) + " ms");
    for (const auto &[name, value] : cfg.options)
      log.info("UCI Option: " + name + " = " + value);

    engine::UciBridge bridge(cfg, log.child("Bridge"));
    bridge.start();

    app::RequestDispatcher dispatcher(bridge, log.child("Request"));
    const int rc = dispatcher.run(std::cin, std::cout);

    log.info("Shutting down bridge");
    bridge.stop();
    return rc;
  }
  catch (const BridgeError &e)
  {
    log.error(std::string("Error running bridge: ") + e.what());
    return 1;
  }
}
