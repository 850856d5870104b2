#include "support/fake_database.h"
#include "core/fork_errors.h"
#include "utils/string_utils.h"
#include <algorithm>

namespace {

// Reads a double-quoted identifier starting at pos and advances past it.
std::string readQuoted(const std::string &text, size_t &pos) {
  std::string result;
  if (pos >= text.size() || text[pos] != '"')
    return result;
  ++pos;
  while (pos < text.size()) {
    if (text[pos] == '"') {
      if (pos + 1 < text.size() && text[pos + 1] == '"') {
        result += '"';
        pos += 2;
        continue;
      }
      ++pos;
      break;
    }
    result += text[pos++];
  }
  return result;
}

class FakeCursor : public ITableCursor {
  std::vector<Row> rows_;
  size_t offset_ = 0;

public:
  explicit FakeCursor(std::vector<Row> rows) : rows_(std::move(rows)) {}

  bool fetch(size_t maxRows, std::vector<Row> &rows) override {
    if (offset_ >= rows_.size())
      return false;
    size_t end = std::min(rows_.size(), offset_ + maxRows);
    for (; offset_ < end; ++offset_)
      rows.push_back(rows_[offset_]);
    return true;
  }
};

class FakeSourceSession : public ISourceSession {
  std::shared_ptr<FakeServer> server_;
  std::string database_;

public:
  FakeSourceSession(std::shared_ptr<FakeServer> server, std::string database)
      : server_(std::move(server)), database_(std::move(database)) {}

  std::vector<std::string> listTables() override {
    return server_->listTables(database_);
  }
  int64_t estimateRowCount(const std::string &table) override {
    return server_->estimateRowCount(database_, table);
  }
  TableSchema describeTable(const std::string &table) override {
    return server_->describeTable(database_, table);
  }
  std::vector<ExtensionInfo> listExtensions() override {
    return server_->listExtensions(database_);
  }
  UserTypeInfo describeType(const std::string &name) override {
    return server_->describeType(database_, name);
  }
  std::unique_ptr<ITableCursor>
  openCursor(const std::string &table,
             const std::vector<std::string> &columns) override {
    return std::make_unique<FakeCursor>(
        server_->selectRows(database_, table, columns));
  }
  bool isHealthy() override { return true; }
};

class FakeDestinationSession : public IDestinationSession {
  std::shared_ptr<FakeServer> server_;
  std::string database_;

public:
  FakeDestinationSession(std::shared_ptr<FakeServer> server,
                         std::string database)
      : server_(std::move(server)), database_(std::move(database)) {}

  void execute(const std::string &sql) override {
    server_->execute(database_, sql);
  }
  bool tableExists(const std::string &table) override {
    return server_->tableExists(database_, table);
  }
  std::vector<ColumnInfo> tableColumns(const std::string &table) override {
    return server_->tableColumns(database_, table);
  }
  void truncateTable(const std::string &table) override {
    server_->truncate(database_, table);
  }
  void writeChunk(const std::string &table,
                  const std::vector<std::string> &columns,
                  const std::vector<Row> &rows) override {
    server_->writeChunk(database_, table, columns, rows);
  }
  int64_t countRows(const std::string &table) override {
    return server_->countRows(database_, table);
  }
};

class FakeAdminSession : public IAdminSession {
  std::shared_ptr<FakeServer> server_;

public:
  explicit FakeAdminSession(std::shared_ptr<FakeServer> server)
      : server_(std::move(server)) {}

  bool databaseExists(const std::string &name) override {
    return server_->hasDatabase(name);
  }
  void createDatabase(const std::string &name,
                      const std::string &templateName) override {
    server_->createDatabaseFrom(name, templateName);
  }
  void dropDatabase(const std::string &name) override {
    server_->dropDatabase(name);
  }
  int64_t databaseSize(const std::string &name) override {
    return server_->databaseSize(name);
  }
  std::vector<DatabaseInfo> listDatabases() override {
    return server_->listDatabases();
  }
  bool canCreateDatabases() override { return server_->canCreateDatabases(); }
};

} // namespace

FakeTable &FakeDatabase::addTable(const TableSchema &schema) {
  if (tables.find(schema.name) == tables.end())
    tableOrder.push_back(schema.name);
  FakeTable &table = tables[schema.name];
  table.schema = schema;
  return table;
}

FakeServer::FakeServer(const std::string &address, int port,
                       const std::string &role) {
  identity_.address = address;
  identity_.port = port;
  identity_.role = role;
  identity_.version = "PostgreSQL 16.2 (fake)";
  databases_[ForkDefaults::MAINTENANCE_DATABASE];
  databases_[ForkDefaults::TEMPLATE_DATABASE];
}

FakeDatabase &FakeServer::createDatabase(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return databases_[name];
}

bool FakeServer::hasDatabase(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return databases_.count(name) > 0;
}

FakeDatabase &FakeServer::database(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = databases_.find(name);
  if (it == databases_.end())
    throw std::runtime_error("fake database " + name + " does not exist");
  return it->second;
}

void FakeServer::failWrites(const FakeWriteFailure &failure) {
  std::lock_guard<std::mutex> lock(mutex_);
  writeFailures_.push_back(failure);
}

void FakeServer::clearFailures() {
  std::lock_guard<std::mutex> lock(mutex_);
  writeFailures_.clear();
  openFailures_ = 0;
}

void FakeServer::failNextOpens(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  openFailures_ = count;
}

void FakeServer::setAfterChunk(
    std::function<void(const std::string &, size_t)> hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  afterChunk_ = std::move(hook);
}

void FakeServer::setCanCreateDatabases(bool allowed) {
  std::lock_guard<std::mutex> lock(mutex_);
  canCreateDatabases_ = allowed;
}

void FakeServer::failDrop(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  undroppable_.insert(name);
}

std::vector<std::string> FakeServer::executedStatements() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return executed_;
}

size_t FakeServer::rowCount(const std::string &database,
                            const std::string &table) const {
  return static_cast<size_t>(countRows(database, table));
}

size_t FakeServer::writeCalls(const std::string &database,
                              const std::string &table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto db = databases_.find(database);
  if (db == databases_.end())
    return 0;
  auto it = db->second.tables.find(table);
  return it == db->second.tables.end() ? 0 : it->second.writeCalls;
}

void FakeServer::checkOpen(const ConnectionConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (openFailures_ > 0) {
    --openFailures_;
    throw ConnectionError("could not connect to server: Connection refused");
  }
  if (databases_.count(config.database) == 0) {
    throw PlanningError("database \"" + config.database + "\" does not exist");
  }
}

std::vector<std::string>
FakeServer::listTables(const std::string &database) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return databases_.at(database).tableOrder;
}

int64_t FakeServer::estimateRowCount(const std::string &database,
                                     const std::string &table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const FakeTable &fake = databases_.at(database).tables.at(table);
  return fake.estimate >= 0 ? fake.estimate
                            : static_cast<int64_t>(fake.rows.size());
}

TableSchema FakeServer::describeTable(const std::string &database,
                                      const std::string &table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const FakeDatabase &db = databases_.at(database);
  auto it = db.tables.find(table);
  if (it == db.tables.end())
    throw SchemaMismatchError("relation \"" + table + "\" does not exist",
                              table);
  return it->second.schema;
}

std::vector<ExtensionInfo>
FakeServer::listExtensions(const std::string &database) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return databases_.at(database).extensions;
}

UserTypeInfo FakeServer::describeType(const std::string &database,
                                      const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const FakeDatabase &db = databases_.at(database);
  auto it = db.types.find(name);
  if (it == db.types.end())
    throw SchemaMismatchError("type \"" + name + "\" does not exist", "",
                              "42704");
  return it->second;
}

std::vector<Row>
FakeServer::selectRows(const std::string &database, const std::string &table,
                       const std::vector<std::string> &columns) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const FakeTable &fake = databases_.at(database).tables.at(table);

  std::vector<size_t> positions;
  for (const auto &name : columns) {
    for (size_t i = 0; i < fake.schema.columns.size(); ++i) {
      if (fake.schema.columns[i].name == name)
        positions.push_back(i);
    }
  }

  std::vector<Row> result;
  result.reserve(fake.rows.size());
  for (const auto &row : fake.rows) {
    Row projected;
    for (size_t position : positions)
      projected.push_back(position < row.size() ? row[position]
                                                : std::nullopt);
    result.push_back(std::move(projected));
  }
  return result;
}

// Only CREATE TABLE changes the fake catalog; everything else is recorded.
void FakeServer::execute(const std::string &database, const std::string &sql) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto db = databases_.find(database);
  if (db == databases_.end())
    throw PlanningError("database \"" + database + "\" does not exist");
  executed_.push_back(sql);

  const std::string prefix = "CREATE TABLE IF NOT EXISTS ";
  if (!StringUtils::startsWith(sql, prefix))
    return;

  size_t pos = prefix.size();
  readQuoted(sql, pos);
  if (pos < sql.size() && sql[pos] == '.')
    ++pos;
  std::string tableName = readQuoted(sql, pos);
  if (db->second.tables.count(tableName) > 0)
    return;

  TableSchema schema;
  schema.name = tableName;
  size_t lineStart = sql.find('\n');
  while (lineStart != std::string::npos) {
    size_t columnPos = lineStart + 3;
    if (columnPos < sql.size() && sql.compare(lineStart, 4, "\n  \"") == 0) {
      ColumnInfo column;
      column.name = readQuoted(sql, columnPos);
      column.ordinalPosition = static_cast<int>(schema.columns.size()) + 1;
      schema.columns.push_back(column);
    }
    lineStart = sql.find('\n', lineStart + 1);
  }
  db->second.addTable(schema);
}

bool FakeServer::tableExists(const std::string &database,
                             const std::string &table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return databases_.at(database).tables.count(table) > 0;
}

std::vector<ColumnInfo>
FakeServer::tableColumns(const std::string &database,
                         const std::string &table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const FakeDatabase &db = databases_.at(database);
  auto it = db.tables.find(table);
  if (it == db.tables.end())
    return {};
  return it->second.schema.columns;
}

void FakeServer::truncate(const std::string &database,
                          const std::string &table) {
  std::lock_guard<std::mutex> lock(mutex_);
  FakeDatabase &db = databases_.at(database);
  auto it = db.tables.find(table);
  if (it == db.tables.end())
    throw SchemaMismatchError("relation \"" + table + "\" does not exist",
                              table);
  it->second.rows.clear();
  it->second.chunksWritten = 0;
}

void FakeServer::writeChunk(const std::string &database,
                            const std::string &table,
                            const std::vector<std::string> &columns,
                            const std::vector<Row> &rows) {
  std::function<void(const std::string &, size_t)> hook;
  size_t chunk = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    FakeDatabase &db = databases_.at(database);
    auto it = db.tables.find(table);
    if (it == db.tables.end())
      throw SchemaMismatchError("relation \"" + table + "\" does not exist",
                                table, "42P01");
    FakeTable &fake = it->second;
    ++fake.writeCalls;
    chunk = fake.chunksWritten + 1;

    for (auto &failure : writeFailures_) {
      if (failure.table != table || failure.chunk != chunk ||
          failure.times == 0)
        continue;
      if (failure.times > 0)
        --failure.times;
      switch (failure.failure) {
      case FakeFailure::TRANSIENT:
        throw ConnectionError("server closed the connection unexpectedly",
                              table, "08006");
      case FakeFailure::PERMISSION:
        throw PermissionError("permission denied for table " + table, table,
                              "42501");
      case FakeFailure::INTEGRITY:
        throw DataIntegrityError("duplicate key value violates unique "
                                 "constraint",
                                 table, "23505");
      }
    }

    if (!rows.empty() && rows.front().size() != columns.size())
      throw DataIntegrityError("row width does not match column list", table);
    fake.rows.insert(fake.rows.end(), rows.begin(), rows.end());
    fake.chunksWritten = chunk;
    hook = afterChunk_;
  }
  if (hook)
    hook(table, chunk);
}

int64_t FakeServer::countRows(const std::string &database,
                              const std::string &table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto db = databases_.find(database);
  if (db == databases_.end())
    return 0;
  auto it = db->second.tables.find(table);
  if (it == db->second.tables.end())
    return 0;
  return static_cast<int64_t>(it->second.rows.size());
}

void FakeServer::createDatabaseFrom(const std::string &name,
                                    const std::string &templateName) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (databases_.count(name) > 0) {
    throw ForkError(ErrorKind::INTERNAL,
                    "database \"" + name + "\" already exists", false, "",
                    "42P04");
  }
  auto source = databases_.find(templateName);
  if (source == databases_.end()) {
    throw PlanningError("template database \"" + templateName +
                        "\" does not exist");
  }
  FakeDatabase copy = source->second;
  for (auto &entry : copy.tables) {
    entry.second.writeCalls = 0;
    entry.second.chunksWritten = 0;
  }
  copy.age = std::chrono::seconds(0);
  databases_[name] = copy;
}

void FakeServer::dropDatabase(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (undroppable_.count(name) > 0) {
    throw PermissionError("must be owner of database " + name, "", "42501");
  }
  databases_.erase(name);
}

int64_t FakeServer::databaseSize(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  int64_t size = 8 * 1024 * 1024;
  for (const auto &entry : databases_.at(name).tables)
    size += static_cast<int64_t>(entry.second.rows.size()) * 64;
  return size;
}

std::vector<DatabaseInfo> FakeServer::listDatabases() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DatabaseInfo> databases;
  for (const auto &entry : databases_) {
    if (entry.first == ForkDefaults::MAINTENANCE_DATABASE ||
        entry.first == ForkDefaults::TEMPLATE_DATABASE)
      continue;
    databases.push_back({entry.first, entry.second.age});
  }
  return databases;
}

bool FakeServer::canCreateDatabases() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return canCreateDatabases_;
}

void FakeDriver::addServer(const std::string &host, int port,
                           std::shared_ptr<FakeServer> server) {
  servers_[host + ":" + std::to_string(port)] = std::move(server);
}

std::shared_ptr<FakeServer>
FakeDriver::serverFor(const ConnectionConfig &config) {
  auto it = servers_.find(config.host + ":" + std::to_string(config.port));
  if (it == servers_.end()) {
    throw ConnectionError("could not connect to server " + config.host + ":" +
                          std::to_string(config.port));
  }
  return it->second;
}

ServerIdentity FakeDriver::probe(const ConnectionConfig &config) {
  auto server = serverFor(config);
  server->checkOpen(config);
  ServerIdentity identity = server->identity();
  identity.role = config.username;
  return identity;
}

std::unique_ptr<ISourceSession>
FakeDriver::openSource(const ConnectionConfig &config) {
  auto server = serverFor(config);
  server->checkOpen(config);
  return std::make_unique<FakeSourceSession>(server, config.database);
}

std::unique_ptr<IDestinationSession>
FakeDriver::openDestination(const ConnectionConfig &config) {
  auto server = serverFor(config);
  server->checkOpen(config);
  return std::make_unique<FakeDestinationSession>(server, config.database);
}

std::unique_ptr<IAdminSession>
FakeDriver::openAdmin(const ConnectionConfig &config) {
  auto server = serverFor(config);
  server->checkOpen(config);
  return std::make_unique<FakeAdminSession>(server);
}

ColumnInfo makeColumn(const std::string &name, const std::string &type,
                      bool nullable) {
  ColumnInfo column;
  column.name = name;
  column.dataType = type;
  column.isNullable = nullable;
  return column;
}

TableSchema makeTableSchema(const std::string &name,
                            const std::vector<ColumnInfo> &columns) {
  TableSchema schema;
  schema.name = name;
  schema.columns = columns;
  for (size_t i = 0; i < schema.columns.size(); ++i)
    schema.columns[i].ordinalPosition = static_cast<int>(i) + 1;
  ConstraintInfo primaryKey;
  primaryKey.name = name + "_pkey";
  primaryKey.type = 'p';
  primaryKey.definition = "PRIMARY KEY (" +
                          quoteIdentifier(schema.columns.front().name) + ")";
  schema.constraints.push_back(primaryKey);
  return schema;
}

std::vector<Row> makeRows(size_t count, const std::string &prefix) {
  std::vector<Row> rows;
  rows.reserve(count);
  for (size_t i = 1; i <= count; ++i)
    rows.push_back({std::to_string(i), prefix + "_" + std::to_string(i)});
  return rows;
}
