#include "network/tcp_server.hpp"
#include <boost/log/trivial.hpp>

namespace gntp {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const uint16_t port, const std::string& address, ConnectionManager& connection_manager)
  : port_(port)
  , address_(address)
  , connection_manager_(connection_manager) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    // A previous shutdown leaves the io_context stopped
    io_context_.restart();
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Starting to accept connections";
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Listening on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (error == boost::asio::error::operation_aborted) {
        return;
      }
      if (!error) {
        connection_manager_.create_connection(std::move(socket));
      } else {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete";
}

//==============================================
// GETTERS
//==============================================

uint16_t TCP_Server::get_port() const {
  return is_running_ ? bound_port_.load() : port_;
}

} // namespace network
} // namespace gntp
