#include "network/connection.hpp"
#include <mutex>
#include <thread>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace network {

namespace {

std::string describe_endpoint(const boost::asio::ip::tcp::socket& socket) {
  boost::system::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Connection::Connection(std::uint64_t id,
                       boost::asio::ip::tcp::socket socket,
                       protocol::ProtocolEngine& engine,
                       std::chrono::seconds read_timeout)
  : id_(id)
  , remote_endpoint_(describe_endpoint(socket))
  , stream_(std::move(socket))
  , engine_(engine)
  , read_timeout_(read_timeout) {
  BOOST_LOG_TRIVIAL(debug) << "Connection " << id_ << ": Created for " << remote_endpoint_;
}

Connection::~Connection() {
  shutdown_socket();
  join();
  BOOST_LOG_TRIVIAL(debug) << "Connection " << id_ << ": Destroyed";
}

//==============================================
// CONNECTION CONTROL
//==============================================

bool Connection::start(ClosedCallback on_closed) {
  if (active_) {
    BOOST_LOG_TRIVIAL(debug) << "Connection " << id_ << ": Already active";
    return false;
  }
  if (!stream_.socket().is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Connection " << id_ << ": Cannot start, socket not open";
    return false;
  }

  on_closed_ = std::move(on_closed);
  active_ = true;

  processing_thread_ = std::make_unique<std::thread>(&Connection::process, this);

  BOOST_LOG_TRIVIAL(info) << "Connection " << id_ << ": Accepted from " << remote_endpoint_;
  return true;
}

void Connection::close() {
  if (!active_) {
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "Connection " << id_ << ": Closing";
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (!stream_.socket().is_open()) {
    return;
  }
  boost::system::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(error) << "Connection " << id_ << ": Socket shutdown error: " << ec.message();
  }
}

void Connection::join() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (!processing_thread_ || !processing_thread_->joinable()) {
    return;
  }
  if (processing_thread_->get_id() == std::this_thread::get_id()) {
    BOOST_LOG_TRIVIAL(error) << "Connection " << id_ << ": Released from its own thread, detaching";
    processing_thread_->detach();
    return;
  }

  processing_thread_->join();
  processing_thread_.reset();
  BOOST_LOG_TRIVIAL(debug) << "Connection " << id_ << ": Processing thread joined";
}

//==============================================
// PROCESSING
//==============================================

void Connection::process() {
  if (read_timeout_.count() > 0) {
    stream_.expires_after(read_timeout_);
  }

  try {
    engine_.handle(stream_, stream_, id_);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection " << id_ << ": Processing error: " << e.what();
  }

  if (stream_.error()) {
    BOOST_LOG_TRIVIAL(debug) << "Connection " << id_ << ": Stream ended with: " << stream_.error().message();
  }

  shutdown_socket();
  active_ = false;
  BOOST_LOG_TRIVIAL(info) << "Connection " << id_ << ": Closed";

  if (on_closed_) {
    on_closed_(id_);
  }
}

void Connection::shutdown_socket() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  auto& socket = stream_.socket();
  if (!socket.is_open()) {
    return;
  }

  boost::system::error_code ec;
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Connection " << id_ << ": Socket close error: " << ec.message();
  }
}

} // namespace network
} // namespace gntp
