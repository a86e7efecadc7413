#include "cli/options.hpp"
#include "logger/logger.hpp"
#include "crypto/password_keyring.hpp"
#include "network/connection_manager.hpp"
#include "network/tcp_server.hpp"
#include "protocol/protocol_engine.hpp"
#include "registry/memory_registry.hpp"
#include "registry/notification_sink.hpp"
#include "store/memory_store.hpp"
#include "store/store.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>

std::unique_ptr<gntp::store::ResourceStore> make_resource_store(const gntp::cli::ProgramOptions& options) {
  if (options.discard_resources) {
    return std::make_unique<gntp::store::DiscardStore>();
  }
  if (!options.store_path.empty()) {
    return std::make_unique<gntp::store::Store>(options.store_path);
  }
  return std::make_unique<gntp::store::MemoryStore>(options.memory_limit_mb * 1024 * 1024);
}

bool run_listener(const gntp::cli::ProgramOptions& options) {
  try {
    gntp::crypto::PasswordKeyring keyring(options.passwords);
    gntp::registry::MemoryRegistry registry(std::move(keyring));
    gntp::registry::LogNotificationSink sink;
    auto resource_store = make_resource_store(options);

    gntp::protocol::EngineOptions engine_options;
    engine_options.auth_failure_policy = options.ignore_unauthorized_notify
        ? gntp::protocol::AuthFailurePolicy::IGNORE_NOTIFY
        : gntp::protocol::AuthFailurePolicy::REJECT;
    engine_options.origin = gntp::protocol::OriginInfo::local();
    gntp::protocol::ProtocolEngine engine(registry, sink, *resource_store, engine_options);

    gntp::network::ConnectionManager connection_manager(engine, options.read_timeout);
    gntp::network::TCP_Server server(options.port, options.host, connection_manager);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to listen on " << options.host << ":" << options.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    // Stop accepting first, then drain the live connections
    server.shutdown();
    connection_manager.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run listener: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = gntp::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    gntp::cli::print_usage(argv[0], std::cout);
    return 0;
  }

  gntp::logger::init_logging(options.log_file,
                             options.verbose ? boost::log::trivial::debug : boost::log::trivial::info);

  if (options.passwords.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Main: No password configured, accepting unauthenticated requests";
  }

  return run_listener(options) ? 0 : 1;
}
