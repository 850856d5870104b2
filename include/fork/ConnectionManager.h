#ifndef CONNECTION_MANAGER_H
#define CONNECTION_MANAGER_H

#include "core/cancellation.h"
#include "core/connection_config.h"
#include "core/logger.h"
#include "engines/database_session.h"
#include "fork/RetryPolicy.h"
#include <deque>
#include <memory>
#include <mutex>

class ConnectionManager;

// A pooled source session checked out by one caller. Returned to the pool on
// destruction unless invalidate() was called after an error.
class SourceLease {
  ConnectionManager *manager_ = nullptr;
  std::unique_ptr<ISourceSession> session_;

public:
  SourceLease() = default;
  SourceLease(ConnectionManager *manager,
              std::unique_ptr<ISourceSession> session);
  ~SourceLease();

  SourceLease(SourceLease &&other) noexcept;
  SourceLease &operator=(SourceLease &&other) noexcept;
  SourceLease(const SourceLease &) = delete;
  SourceLease &operator=(const SourceLease &) = delete;

  ISourceSession *operator->() const { return session_.get(); }
  ISourceSession &operator*() const { return *session_; }
  explicit operator bool() const { return session_ != nullptr; }

  void invalidate();
};

// Opens every connection one fork uses. Source sessions are pooled and shared
// between workers; destination and admin sessions are handed out exclusively.
// Every acquisition goes through the retry policy.
class ConnectionManager {
  std::shared_ptr<IDatabaseDriver> driver_;
  ConnectionConfig source_;
  ConnectionConfig destination_;
  std::string targetDatabase_;
  size_t maxIdleSources_;
  RetryPolicy &retry_;
  std::shared_ptr<Logger> logger_;

  std::mutex poolMutex_;
  std::deque<std::unique_ptr<ISourceSession>> idleSources_;

  friend class SourceLease;
  void releaseSource(std::unique_ptr<ISourceSession> session);

public:
  ConnectionManager(std::shared_ptr<IDatabaseDriver> driver,
                    const ConnectionConfig &source,
                    const ConnectionConfig &destination,
                    const std::string &targetDatabase, size_t maxIdleSources,
                    RetryPolicy &retry, std::shared_ptr<Logger> logger);
  ~ConnectionManager();

  ServerIdentity probeSource(const CancellationToken &token);
  ServerIdentity probeDestination(const CancellationToken &token);

  SourceLease acquireSource(const CancellationToken &token);
  std::unique_ptr<IDestinationSession>
  openTarget(const CancellationToken &token);
  std::unique_ptr<IAdminSession> openAdmin(const CancellationToken &token);

  // Closes pooled source sessions, e.g. before the source database is used as
  // a template, which requires that nobody is connected to it.
  void closeIdleSources();

  const ConnectionConfig &source() const { return source_; }
  const ConnectionConfig &destination() const { return destination_; }
  const std::string &targetDatabase() const { return targetDatabase_; }
};

#endif
