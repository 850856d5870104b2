#include "fork/ConnectionManager.h"

SourceLease::SourceLease(ConnectionManager *manager,
                         std::unique_ptr<ISourceSession> session)
    : manager_(manager), session_(std::move(session)) {}

SourceLease::~SourceLease() {
  if (manager_ && session_)
    manager_->releaseSource(std::move(session_));
}

SourceLease::SourceLease(SourceLease &&other) noexcept
    : manager_(other.manager_), session_(std::move(other.session_)) {
  other.manager_ = nullptr;
}

SourceLease &SourceLease::operator=(SourceLease &&other) noexcept {
  if (this != &other) {
    if (manager_ && session_)
      manager_->releaseSource(std::move(session_));
    manager_ = other.manager_;
    session_ = std::move(other.session_);
    other.manager_ = nullptr;
  }
  return *this;
}

void SourceLease::invalidate() { session_.reset(); }

ConnectionManager::ConnectionManager(std::shared_ptr<IDatabaseDriver> driver,
                                     const ConnectionConfig &source,
                                     const ConnectionConfig &destination,
                                     const std::string &targetDatabase,
                                     size_t maxIdleSources, RetryPolicy &retry,
                                     std::shared_ptr<Logger> logger)
    : driver_(std::move(driver)), source_(source), destination_(destination),
      targetDatabase_(targetDatabase), maxIdleSources_(maxIdleSources),
      retry_(retry), logger_(std::move(logger)) {}

ConnectionManager::~ConnectionManager() { closeIdleSources(); }

ServerIdentity ConnectionManager::probeSource(const CancellationToken &token) {
  return retry_.execute("probe source server", token,
                        [&] { return driver_->probe(source_); });
}

// The destination is probed through its maintenance database; the target
// database usually does not exist yet.
ServerIdentity
ConnectionManager::probeDestination(const CancellationToken &token) {
  ConnectionConfig config =
      destination_.withDatabase(ForkDefaults::MAINTENANCE_DATABASE);
  return retry_.execute("probe destination server", token,
                        [&] { return driver_->probe(config); });
}

// Reuses an idle session when one is still healthy, otherwise opens a new
// read-only session. Unhealthy idle sessions are discarded.
SourceLease ConnectionManager::acquireSource(const CancellationToken &token) {
  while (true) {
    std::unique_ptr<ISourceSession> session;
    {
      std::lock_guard<std::mutex> lock(poolMutex_);
      if (idleSources_.empty())
        break;
      session = std::move(idleSources_.front());
      idleSources_.pop_front();
    }
    if (session->isHealthy())
      return SourceLease(this, std::move(session));
    logger_->debug(LogCategory::DATABASE, "acquireSource",
                   "Dropping unhealthy pooled source session");
  }

  auto session = retry_.execute("open source connection", token, [&] {
    return driver_->openSource(source_);
  });
  return SourceLease(this, std::move(session));
}

void ConnectionManager::releaseSource(std::unique_ptr<ISourceSession> session) {
  std::lock_guard<std::mutex> lock(poolMutex_);
  if (idleSources_.size() < maxIdleSources_)
    idleSources_.push_back(std::move(session));
}

std::unique_ptr<IDestinationSession>
ConnectionManager::openTarget(const CancellationToken &token) {
  ConnectionConfig config = destination_.withDatabase(targetDatabase_);
  return retry_.execute("open target connection", token,
                        [&] { return driver_->openDestination(config); });
}

std::unique_ptr<IAdminSession>
ConnectionManager::openAdmin(const CancellationToken &token) {
  ConnectionConfig config =
      destination_.withDatabase(ForkDefaults::MAINTENANCE_DATABASE);
  return retry_.execute("open admin connection", token,
                        [&] { return driver_->openAdmin(config); });
}

void ConnectionManager::closeIdleSources() {
  std::deque<std::unique_ptr<ISourceSession>> closing;
  {
    std::lock_guard<std::mutex> lock(poolMutex_);
    closing.swap(idleSources_);
  }
  if (!closing.empty()) {
    logger_->debug(LogCategory::DATABASE, "closeIdleSources",
                   "Closing " + std::to_string(closing.size()) +
                       " pooled source sessions");
  }
}
