#include "engines/postgres_session.h"
#include "core/fork_defaults.h"
#include "core/fork_errors.h"
#include <algorithm>
#include <sstream>

namespace {
constexpr const char *CURSOR_NAME = "pgfork_cursor";

std::string connectionStringFor(const ConnectionConfig &config,
                                 bool readOnly) {
  std::string connStr = config.toConnectionString() +
                        " application_name=" +
                        ConnectionConfig::escapeConnectionParam("pgfork");
  if (readOnly) {
    connStr += " options=" + ConnectionConfig::escapeConnectionParam(
                                 "-c default_transaction_read_only=on");
  }
  return connStr;
}

std::unique_ptr<pqxx::connection> openConnection(const ConnectionConfig &config,
                                                 bool readOnly,
                                                 Logger &logger,
                                                 const std::string &role) {
  logger.debug(LogCategory::DATABASE, "openConnection",
               "Opening " + role + " connection: " +
                   config.toConnectionStringForLogging());
  auto conn = std::make_unique<pqxx::connection>(
      connectionStringFor(config, readOnly));
  if (!conn->is_open()) {
    throw pqxx::broken_connection("connection to " + config.describe() +
                                  " is not open");
  }
  return conn;
}

// SQL expression naming the user-defined type behind the type oid typeOid,
// looking through arrays, or NULL. Only enums, domains and stand-alone
// composite types outside the system schemas count; types owned by an
// extension come with CREATE EXTENSION.
std::string userTypeSql(const std::string &typeOid) {
  return "(SELECT format_type(bt.oid, NULL) FROM pg_type t "
         "JOIN pg_type bt ON bt.oid = CASE WHEN t.typtype = 'b' AND "
         "t.typcategory = 'A' AND t.typelem <> 0 THEN t.typelem ELSE t.oid END "
         "LEFT JOIN pg_class rc ON rc.oid = bt.typrelid "
         "WHERE t.oid = " +
         typeOid +
         " AND (bt.typtype IN ('e', 'd') OR "
         "(bt.typtype = 'c' AND rc.relkind = 'c')) "
         "AND bt.typnamespace NOT IN ('pg_catalog'::regnamespace, "
         "'information_schema'::regnamespace) "
         "AND NOT EXISTS (SELECT 1 FROM pg_depend dep "
         "WHERE dep.classid = 'pg_type'::regclass AND dep.objid = bt.oid "
         "AND dep.deptype = 'e'))";
}

// Column metadata straight from pg_catalog so that format_type() keeps type
// modifiers (varchar(255), numeric(10,2), arrays) and pg_get_expr() yields
// defaults exactly as the server would print them.
std::vector<ColumnInfo> queryColumns(pqxx::transaction_base &txn,
                                     const std::string &table) {
  auto results = txn.exec_params(
      "SELECT a.attname, format_type(a.atttypid, a.atttypmod), "
      "a.attnotnull, pg_get_expr(d.adbin, d.adrelid), a.attnum, "
      "a.attidentity <> '', a.attgenerated = 's', "
      "pg_get_serial_sequence($1::text, a.attname::text), "
      "a.attidentity = 'a', " +
          userTypeSql("a.atttypid") +
          " FROM pg_attribute a "
      "LEFT JOIN pg_attrdef d ON d.adrelid = a.attrelid AND d.adnum = a.attnum "
      "WHERE a.attrelid = $1::text::regclass AND a.attnum > 0 "
      "AND NOT a.attisdropped ORDER BY a.attnum",
      qualifiedTableName(table));

  std::vector<ColumnInfo> columns;
  for (const auto &row : results) {
    ColumnInfo column;
    column.name = row[0].as<std::string>();
    column.dataType = row[1].as<std::string>();
    column.isNullable = !row[2].as<bool>();
    bool generated = row[6].as<bool>();
    std::string expression = row[3].is_null() ? "" : row[3].as<std::string>();
    if (generated) {
      column.generatedExpression = expression;
    } else {
      column.defaultValue = expression;
    }
    column.ordinalPosition = row[4].as<int>();
    column.isIdentity = row[5].as<bool>();
    column.ownedSequence = row[7].is_null() ? "" : row[7].as<std::string>();
    column.identityAlways = row[8].as<bool>();
    column.userType = row[9].is_null() ? "" : row[9].as<std::string>();
    columns.push_back(column);
  }
  return columns;
}

// Extracts the sequence name from a default such as
// nextval('orders_id_seq'::regclass).
std::string sequenceFromDefault(const std::string &defaultValue) {
  size_t start = defaultValue.find("nextval('");
  if (start == std::string::npos)
    return "";
  start += 9;
  size_t end = defaultValue.find("'", start);
  if (end == std::string::npos)
    return "";
  return defaultValue.substr(start, end - start);
}
} // namespace

PostgresTableCursor::PostgresTableCursor(pqxx::connection &conn,
                                         const std::string &selectSql)
    : txn_(std::make_unique<pqxx::read_transaction>(conn)),
      cursorName_(CURSOR_NAME) {
  txn_->exec("DECLARE " + cursorName_ + " NO SCROLL CURSOR FOR " + selectSql);
}

// The read transaction only ever read; letting it abort on destruction
// releases the cursor and the snapshot.
PostgresTableCursor::~PostgresTableCursor() = default;

bool PostgresTableCursor::fetch(size_t maxRows, std::vector<Row> &rows) {
  if (exhausted_)
    return false;

  auto results = txn_->exec("FETCH FORWARD " + std::to_string(maxRows) +
                            " FROM " + cursorName_);
  if (results.empty()) {
    exhausted_ = true;
    return false;
  }

  for (const auto &resultRow : results) {
    Row row;
    row.reserve(resultRow.size());
    for (const auto &field : resultRow) {
      if (field.is_null()) {
        row.emplace_back(std::nullopt);
      } else {
        row.emplace_back(std::string(field.c_str(), field.size()));
      }
    }
    rows.push_back(std::move(row));
  }

  if (results.size() < maxRows)
    exhausted_ = true;
  return true;
}

PostgresSourceSession::PostgresSourceSession(const ConnectionConfig &config,
                                             std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {
  conn_ = openConnection(config, true, *logger_, "source");
}

std::vector<std::string> PostgresSourceSession::listTables() {
  pqxx::read_transaction txn(*conn_);
  auto results = txn.exec_params(
      "SELECT c.relname FROM pg_class c "
      "JOIN pg_namespace n ON n.oid = c.relnamespace "
      "WHERE n.nspname = $1 AND c.relkind IN ('r', 'p') "
      "AND NOT c.relispartition ORDER BY c.relname",
      std::string(ForkDefaults::PUBLIC_SCHEMA));

  std::vector<std::string> tables;
  for (const auto &row : results)
    tables.push_back(row[0].as<std::string>());
  return tables;
}

// Planner statistics, not a count: reltuples is -1 for tables that were
// never vacuumed or analyzed, which is reported as unknown.
int64_t PostgresSourceSession::estimateRowCount(const std::string &table) {
  pqxx::read_transaction txn(*conn_);
  auto results = txn.exec_params(
      "SELECT c.reltuples::bigint FROM pg_class c "
      "WHERE c.oid = $1::regclass",
      qualifiedTableName(table));
  if (results.empty() || results[0][0].is_null())
    return -1;
  int64_t estimate = results[0][0].as<int64_t>();
  return estimate < 0 ? -1 : estimate;
}

TableSchema PostgresSourceSession::describeTable(const std::string &table) {
  pqxx::read_transaction txn(*conn_);
  TableSchema schema;
  schema.name = table;
  schema.columns = queryColumns(txn, table);

  auto constraints = txn.exec_params(
      "SELECT conname, contype, pg_get_constraintdef(oid) "
      "FROM pg_constraint WHERE conrelid = $1::regclass "
      "AND contype IN ('p', 'u', 'c', 'f', 'x') ORDER BY contype, conname",
      qualifiedTableName(table));
  for (const auto &row : constraints) {
    ConstraintInfo constraint;
    constraint.name = row[0].as<std::string>();
    constraint.type = row[1].as<std::string>().at(0);
    constraint.definition = row[2].as<std::string>();
    schema.constraints.push_back(constraint);
  }

  auto indexes = txn.exec_params(
      "SELECT ic.relname, pg_get_indexdef(i.indexrelid) FROM pg_index i "
      "JOIN pg_class ic ON ic.oid = i.indexrelid "
      "WHERE i.indrelid = $1::regclass AND NOT i.indisprimary "
      "AND NOT EXISTS (SELECT 1 FROM pg_constraint con "
      "WHERE con.conindid = i.indexrelid AND con.contype IN ('u', 'x')) "
      "ORDER BY ic.relname",
      qualifiedTableName(table));
  for (const auto &row : indexes) {
    schema.indexes.push_back(
        {row[0].as<std::string>(), row[1].as<std::string>()});
  }

  for (const auto &column : schema.columns) {
    if (column.isIdentity)
      continue;
    if (column.defaultValue.find("nextval(") == std::string::npos)
      continue;
    if (!column.ownedSequence.empty()) {
      schema.sequences.push_back({column.ownedSequence, column.name, true});
    } else {
      std::string name = sequenceFromDefault(column.defaultValue);
      if (!name.empty())
        schema.sequences.push_back({name, column.name, false});
    }
  }

  return schema;
}

// plpgsql ships with every database and is left to the target's template.
std::vector<ExtensionInfo> PostgresSourceSession::listExtensions() {
  pqxx::read_transaction txn(*conn_);
  auto results = txn.exec(
      "SELECT e.extname, n.nspname FROM pg_extension e "
      "JOIN pg_namespace n ON n.oid = e.extnamespace "
      "WHERE e.extname <> 'plpgsql' ORDER BY e.extname");

  std::vector<ExtensionInfo> extensions;
  for (const auto &row : results)
    extensions.push_back({row[0].as<std::string>(), row[1].as<std::string>()});
  return extensions;
}

UserTypeInfo PostgresSourceSession::describeType(const std::string &name) {
  pqxx::read_transaction txn(*conn_);
  auto header = txn.exec_params(
      "SELECT format_type(t.oid, NULL), n.nspname, t.typtype, "
      "format_type(t.typbasetype, t.typtypmod), t.typnotnull, t.typdefault, " +
          userTypeSql("t.typbasetype") +
          ", t.typrelid FROM pg_type t "
          "JOIN pg_namespace n ON n.oid = t.typnamespace "
          "WHERE t.oid = $1::text::regtype",
      name);
  if (header.empty()) {
    throw SchemaMismatchError("type " + name + " does not exist in the source",
                              "", "42704");
  }

  UserTypeInfo type;
  type.name = header[0][0].as<std::string>();
  type.schema = header[0][1].as<std::string>();
  type.kind = header[0][2].as<std::string>().at(0);

  if (type.kind == 'e') {
    auto labels = txn.exec_params(
        "SELECT enumlabel FROM pg_enum WHERE enumtypid = $1::text::regtype "
        "ORDER BY enumsortorder",
        name);
    for (const auto &row : labels)
      type.enumLabels.push_back(row[0].as<std::string>());
  } else if (type.kind == 'd') {
    type.baseType = header[0][3].as<std::string>();
    type.notNull = header[0][4].as<bool>();
    type.defaultValue =
        header[0][5].is_null() ? "" : header[0][5].as<std::string>();
    if (!header[0][6].is_null())
      type.dependencies.push_back(header[0][6].as<std::string>());

    auto checks = txn.exec_params(
        "SELECT conname, pg_get_constraintdef(oid) FROM pg_constraint "
        "WHERE contypid = $1::text::regtype AND contype = 'c' "
        "ORDER BY conname",
        name);
    for (const auto &row : checks) {
      ConstraintInfo check;
      check.name = row[0].as<std::string>();
      check.type = 'c';
      check.definition = row[1].as<std::string>();
      type.checks.push_back(check);
    }
  } else if (type.kind == 'c') {
    auto attributes = txn.exec_params(
        "SELECT a.attname, format_type(a.atttypid, a.atttypmod), " +
            userTypeSql("a.atttypid") +
            " FROM pg_attribute a WHERE a.attrelid = $1::text::oid "
            "AND a.attnum > 0 AND NOT a.attisdropped ORDER BY a.attnum",
        header[0][7].as<std::string>());
    for (const auto &row : attributes) {
      ColumnInfo attribute;
      attribute.name = row[0].as<std::string>();
      attribute.dataType = row[1].as<std::string>();
      attribute.ordinalPosition =
          static_cast<int>(type.attributes.size()) + 1;
      if (!row[2].is_null()) {
        attribute.userType = row[2].as<std::string>();
        type.dependencies.push_back(attribute.userType);
      }
      type.attributes.push_back(attribute);
    }
  }
  return type;
}

std::unique_ptr<ITableCursor>
PostgresSourceSession::openCursor(const std::string &table,
                                  const std::vector<std::string> &columns) {
  std::ostringstream query;
  query << "SELECT ";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0)
      query << ", ";
    query << conn_->quote_name(columns[i]);
  }
  query << " FROM " << qualifiedTableName(table);
  return std::make_unique<PostgresTableCursor>(*conn_, query.str());
}

bool PostgresSourceSession::isHealthy() {
  if (!conn_ || !conn_->is_open())
    return false;
  try {
    pqxx::read_transaction txn(*conn_);
    txn.exec("SELECT 1");
    return true;
  } catch (const std::exception &e) {
    logger_->debug(LogCategory::DATABASE, "isHealthy",
                   "Discarding unusable source connection: " +
                       std::string(e.what()));
    return false;
  }
}

PostgresDestinationSession::PostgresDestinationSession(
    const ConnectionConfig &config, std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {
  conn_ = openConnection(config, false, *logger_, "destination");
  pqxx::nontransaction txn(*conn_);
  txn.exec("SET synchronous_commit = off");
}

void PostgresDestinationSession::execute(const std::string &sql) {
  pqxx::work txn(*conn_);
  txn.exec(sql);
  txn.commit();
}

bool PostgresDestinationSession::tableExists(const std::string &table) {
  pqxx::read_transaction txn(*conn_);
  auto results = txn.exec_params("SELECT to_regclass($1::text) IS NOT NULL",
                                 qualifiedTableName(table));
  return !results.empty() && results[0][0].as<bool>();
}

std::vector<ColumnInfo>
PostgresDestinationSession::tableColumns(const std::string &table) {
  pqxx::read_transaction txn(*conn_);
  return queryColumns(txn, table);
}

void PostgresDestinationSession::truncateTable(const std::string &table) {
  pqxx::work txn(*conn_);
  txn.exec("TRUNCATE TABLE " + qualifiedTableName(table));
  txn.commit();
}

// One transaction per chunk, split into multi-row INSERT statements. Values
// travel as text literals and are coerced by the destination column types,
// which accept the text output of the identical source types.
void PostgresDestinationSession::writeChunk(
    const std::string &table, const std::vector<std::string> &columns,
    const std::vector<Row> &rows) {
  if (rows.empty())
    return;

  pqxx::work txn(*conn_);
  std::string fullTableName = qualifiedTableName(table);

  std::string columnList;
  for (size_t j = 0; j < columns.size(); ++j) {
    if (j > 0)
      columnList += ", ";
    columnList += txn.quote_name(columns[j]);
  }

  const size_t batchSize = ForkDefaults::INSERT_BATCH_ROWS;
  for (size_t i = 0; i < rows.size(); i += batchSize) {
    std::ostringstream insertQuery;
    insertQuery << "INSERT INTO " << fullTableName << " (" << columnList
                << ") VALUES ";

    size_t endIdx = std::min(i + batchSize, rows.size());
    for (size_t j = i; j < endIdx; ++j) {
      if (j > i)
        insertQuery << ", ";
      insertQuery << "(";
      const Row &row = rows[j];
      for (size_t k = 0; k < columns.size(); ++k) {
        if (k > 0)
          insertQuery << ", ";
        if (k >= row.size() || !row[k]) {
          insertQuery << "NULL";
        } else {
          insertQuery << txn.quote(*row[k]);
        }
      }
      insertQuery << ")";
    }

    txn.exec(insertQuery.str());
  }

  txn.commit();
}

int64_t PostgresDestinationSession::countRows(const std::string &table) {
  pqxx::read_transaction txn(*conn_);
  auto results =
      txn.exec("SELECT COUNT(*) FROM " + qualifiedTableName(table));
  return results[0][0].as<int64_t>();
}

PostgresAdminSession::PostgresAdminSession(const ConnectionConfig &config,
                                           std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {
  conn_ = openConnection(config, false, *logger_, "admin");
}

bool PostgresAdminSession::databaseExists(const std::string &name) {
  pqxx::read_transaction txn(*conn_);
  auto results =
      txn.exec_params("SELECT 1 FROM pg_database WHERE datname = $1", name);
  return !results.empty();
}

// CREATE DATABASE cannot run inside a transaction block.
void PostgresAdminSession::createDatabase(const std::string &name,
                                          const std::string &templateName) {
  pqxx::nontransaction txn(*conn_);
  txn.exec("CREATE DATABASE " + txn.quote_name(name) + " WITH TEMPLATE " +
           txn.quote_name(templateName));
  logger_->info(LogCategory::DATABASE, "createDatabase",
                "Created database " + name + " from template " + templateName);
}

// Other sessions connected to the database would make DROP DATABASE fail, so
// they are terminated first.
void PostgresAdminSession::dropDatabase(const std::string &name) {
  pqxx::nontransaction txn(*conn_);
  auto terminated = txn.exec_params(
      "SELECT pg_terminate_backend(pid) FROM pg_stat_activity "
      "WHERE datname = $1 AND pid <> pg_backend_pid()",
      name);
  if (!terminated.empty()) {
    logger_->warning(LogCategory::DATABASE, "dropDatabase",
                     "Terminated " + std::to_string(terminated.size()) +
                         " sessions connected to " + name);
  }
  txn.exec("DROP DATABASE IF EXISTS " + txn.quote_name(name));
  logger_->info(LogCategory::DATABASE, "dropDatabase",
                "Dropped database " + name);
}

int64_t PostgresAdminSession::databaseSize(const std::string &name) {
  pqxx::read_transaction txn(*conn_);
  auto results = txn.exec_params("SELECT pg_database_size($1)", name);
  return results.empty() ? 0 : results[0][0].as<int64_t>();
}

// The creation time of a database is the modification time of its
// PG_VERSION file, which only privileged roles may read. Otherwise the last
// statistics reset is the best available age.
std::vector<DatabaseInfo> PostgresAdminSession::listDatabases() {
  const std::string userDatabases =
      "FROM pg_database d WHERE NOT d.datistemplate AND d.datname <> " +
      conn_->quote(std::string(ForkDefaults::MAINTENANCE_DATABASE));

  pqxx::result results;
  try {
    pqxx::read_transaction txn(*conn_);
    results = txn.exec(
        "SELECT d.datname, EXTRACT(EPOCH FROM now() - (pg_stat_file('base/' "
        "|| d.oid || '/PG_VERSION')).modification)::bigint " +
        userDatabases + " ORDER BY d.datname");
  } catch (const pqxx::sql_error &e) {
    logger_->debug(LogCategory::DATABASE, "listDatabases",
                   "Database creation times are not readable, using "
                   "statistics reset times: " +
                       std::string(e.what()));
    pqxx::read_transaction txn(*conn_);
    results = txn.exec(
        "SELECT d.datname, EXTRACT(EPOCH FROM now() - s.stats_reset)::bigint "
        "FROM pg_database d LEFT JOIN pg_stat_database s ON s.datid = d.oid "
        "WHERE NOT d.datistemplate AND d.datname <> " +
        conn_->quote(std::string(ForkDefaults::MAINTENANCE_DATABASE)) +
        " ORDER BY d.datname");
  }

  std::vector<DatabaseInfo> databases;
  for (const auto &row : results) {
    DatabaseInfo info;
    info.name = row[0].as<std::string>();
    if (!row[1].is_null())
      info.age = std::chrono::seconds(row[1].as<int64_t>());
    databases.push_back(info);
  }
  return databases;
}

bool PostgresAdminSession::canCreateDatabases() {
  pqxx::read_transaction txn(*conn_);
  auto results = txn.exec("SELECT rolcreatedb OR rolsuper FROM pg_roles "
                          "WHERE rolname = current_user");
  return !results.empty() && results[0][0].as<bool>();
}

PostgresDriver::PostgresDriver(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

// inet_server_addr() is NULL over Unix sockets; the address is then left
// empty and callers fall back to comparing configured hosts.
ServerIdentity PostgresDriver::probe(const ConnectionConfig &config) {
  auto conn = openConnection(config, true, *logger_, "probe");
  pqxx::read_transaction txn(*conn);
  auto results = txn.exec(
      "SELECT COALESCE(host(inet_server_addr()), ''), "
      "COALESCE(inet_server_port(), 0), current_user, "
      "current_setting('server_version')");

  ServerIdentity identity;
  identity.address = results[0][0].as<std::string>();
  identity.port = results[0][1].as<int>();
  identity.role = results[0][2].as<std::string>();
  identity.version = results[0][3].as<std::string>();
  return identity;
}

std::unique_ptr<ISourceSession>
PostgresDriver::openSource(const ConnectionConfig &config) {
  return std::make_unique<PostgresSourceSession>(config, logger_);
}

std::unique_ptr<IDestinationSession>
PostgresDriver::openDestination(const ConnectionConfig &config) {
  return std::make_unique<PostgresDestinationSession>(config, logger_);
}

std::unique_ptr<IAdminSession>
PostgresDriver::openAdmin(const ConnectionConfig &config) {
  return std::make_unique<PostgresAdminSession>(config, logger_);
}
