#ifndef POSTGRES_SESSION_H
#define POSTGRES_SESSION_H

#include "core/logger.h"
#include "engines/database_session.h"
#include <memory>
#include <pqxx/pqxx>

class PostgresTableCursor : public ITableCursor {
  std::unique_ptr<pqxx::read_transaction> txn_;
  std::string cursorName_;
  bool exhausted_ = false;

public:
  PostgresTableCursor(pqxx::connection &conn, const std::string &selectSql);
  ~PostgresTableCursor() override;

  bool fetch(size_t maxRows, std::vector<Row> &rows) override;
};

// Every statement runs in a read_transaction and the connection itself is
// opened with default_transaction_read_only, so a source session cannot write
// even through a code path that forgets to ask for a read-only transaction.
class PostgresSourceSession : public ISourceSession {
  std::unique_ptr<pqxx::connection> conn_;
  std::shared_ptr<Logger> logger_;

public:
  PostgresSourceSession(const ConnectionConfig &config,
                        std::shared_ptr<Logger> logger);

  std::vector<std::string> listTables() override;
  int64_t estimateRowCount(const std::string &table) override;
  TableSchema describeTable(const std::string &table) override;
  std::vector<ExtensionInfo> listExtensions() override;
  UserTypeInfo describeType(const std::string &name) override;
  std::unique_ptr<ITableCursor>
  openCursor(const std::string &table,
             const std::vector<std::string> &columns) override;
  bool isHealthy() override;
};

class PostgresDestinationSession : public IDestinationSession {
  std::unique_ptr<pqxx::connection> conn_;
  std::shared_ptr<Logger> logger_;

public:
  PostgresDestinationSession(const ConnectionConfig &config,
                             std::shared_ptr<Logger> logger);

  void execute(const std::string &sql) override;
  bool tableExists(const std::string &table) override;
  std::vector<ColumnInfo> tableColumns(const std::string &table) override;
  void truncateTable(const std::string &table) override;
  void writeChunk(const std::string &table,
                  const std::vector<std::string> &columns,
                  const std::vector<Row> &rows) override;
  int64_t countRows(const std::string &table) override;
};

class PostgresAdminSession : public IAdminSession {
  std::unique_ptr<pqxx::connection> conn_;
  std::shared_ptr<Logger> logger_;

public:
  PostgresAdminSession(const ConnectionConfig &config,
                       std::shared_ptr<Logger> logger);

  bool databaseExists(const std::string &name) override;
  void createDatabase(const std::string &name,
                      const std::string &templateName) override;
  void dropDatabase(const std::string &name) override;
  int64_t databaseSize(const std::string &name) override;
  std::vector<DatabaseInfo> listDatabases() override;
  bool canCreateDatabases() override;
};

class PostgresDriver : public IDatabaseDriver {
  std::shared_ptr<Logger> logger_;

public:
  explicit PostgresDriver(std::shared_ptr<Logger> logger);

  ServerIdentity probe(const ConnectionConfig &config) override;
  std::unique_ptr<ISourceSession>
  openSource(const ConnectionConfig &config) override;
  std::unique_ptr<IDestinationSession>
  openDestination(const ConnectionConfig &config) override;
  std::unique_ptr<IAdminSession>
  openAdmin(const ConnectionConfig &config) override;
};

#endif
