#include "network/connection_manager.hpp"
#include <vector>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace network {

ConnectionManager::ConnectionManager(protocol::ProtocolEngine& engine, std::chrono::seconds read_timeout)
  : engine_(engine)
  , read_timeout_(read_timeout) {
  BOOST_LOG_TRIVIAL(info) << "Connection manager: Initialized with read timeout " << read_timeout_.count() << "s";
}

ConnectionManager::~ConnectionManager() {
  shutdown();
}

//==============================================
// CONNECTION MANAGEMENT
//==============================================

std::uint64_t ConnectionManager::create_connection(boost::asio::ip::tcp::socket socket) {
  reap_finished();
  const std::uint64_t connection_id = next_id_++;

  try {
    auto connection = std::make_shared<Connection>(connection_id, std::move(socket), engine_, read_timeout_);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!accepting_) {
        BOOST_LOG_TRIVIAL(warning) << "Connection manager: Rejecting connection " << connection_id
                                   << " during shutdown";
        return 0;
      }
      connections_[connection_id] = connection;
    }

    if (!connection->start([this](std::uint64_t id) { remove_connection(id); })) {
      BOOST_LOG_TRIVIAL(error) << "Connection manager: Failed to start connection " << connection_id;
      remove_connection(connection_id);
      return 0;
    }
    return connection_id;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection manager: Error handling new connection: " << e.what();
    remove_connection(connection_id);
    return 0;
  }
}

void ConnectionManager::remove_connection(std::uint64_t connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = connections_.find(connection_id);
  if (it != connections_.end()) {
    // Called from the connection thread, which cannot join itself
    finished_.push_back(std::move(it->second));
    connections_.erase(it);
    BOOST_LOG_TRIVIAL(debug) << "Connection manager: Removed connection " << connection_id
                             << ", " << connections_.size() << " live";
  }
  if (connections_.empty()) {
    idle_.notify_all();
  }
}

bool ConnectionManager::has_connection(std::uint64_t connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.count(connection_id) > 0;
}

std::shared_ptr<Connection> ConnectionManager::get_connection(std::uint64_t connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = connections_.find(connection_id);
  if (it != connections_.end()) {
    return it->second;
  }
  return nullptr;
}

//==============================================
// UTILITY METHODS
//==============================================

std::size_t ConnectionManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

void ConnectionManager::shutdown(std::chrono::milliseconds grace) {
  std::vector<std::shared_ptr<Connection>> live;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_ && connections_.empty() && finished_.empty()) {
      return;
    }
    accepting_ = false;
    for (const auto& entry : connections_) {
      live.push_back(entry.second);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Connection manager: Closing " << live.size() << " live connections";
  // Close outside the lock; a closing connection calls back into remove_connection
  for (auto& connection : live) {
    connection->close();
  }
  live.clear();

  if (!wait_idle(grace)) {
    BOOST_LOG_TRIVIAL(warning) << "Connection manager: " << size()
                               << " connections still busy after grace period, waiting for them";
  }
  join_all();
  BOOST_LOG_TRIVIAL(info) << "Connection manager: Shutdown complete";
}

bool ConnectionManager::wait_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_.wait_for(lock, timeout, [this]() { return connections_.empty(); });
}

void ConnectionManager::reap_finished() {
  std::vector<std::shared_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished.swap(finished_);
  }

  for (auto& connection : finished) {
    connection->join();
  }
}

void ConnectionManager::join_all() {
  while (true) {
    std::vector<std::shared_ptr<Connection>> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending.swap(finished_);
      for (const auto& entry : connections_) {
        pending.push_back(entry.second);
      }
    }
    if (pending.empty()) {
      return;
    }

    // Join outside the lock; a running connection still calls remove_connection
    for (auto& connection : pending) {
      connection->join();
    }
  }
}

} // namespace network
} // namespace gntp
