#ifndef DATABASE_SESSION_H
#define DATABASE_SESSION_H

#include "core/connection_config.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ColumnInfo {
  std::string name;
  std::string dataType;
  bool isNullable = true;
  std::string defaultValue;
  int ordinalPosition = 0;
  bool isIdentity = false;
  // GENERATED ALWAYS rather than BY DEFAULT.
  bool identityAlways = false;
  std::string generatedExpression;
  std::string ownedSequence;
  // Name of the enum, domain or composite type behind the column (looking
  // through arrays) when it is defined in the database itself.
  std::string userType;

  bool isGenerated() const { return !generatedExpression.empty(); }
};

struct IndexInfo {
  std::string name;
  std::string definition;
};

// contype from pg_constraint: 'p' primary key, 'u' unique, 'c' check,
// 'f' foreign key, 'x' exclusion.
struct ConstraintInfo {
  std::string name;
  char type = 'c';
  std::string definition;
};

// A sequence feeding a column default. name is schema-qualified and already
// quoted where needed, as pg_get_serial_sequence() returns it.
struct SequenceInfo {
  std::string name;
  std::string column;
  bool owned = true;
};

struct TableSchema {
  std::string name;
  std::vector<ColumnInfo> columns;
  std::vector<ConstraintInfo> constraints;
  std::vector<IndexInfo> indexes;
  std::vector<SequenceInfo> sequences;

  std::vector<std::string> copyableColumns() const;
};

struct ExtensionInfo {
  std::string name;
  std::string schema;
};

// A type created with CREATE TYPE or CREATE DOMAIN. kind is typtype from
// pg_type: 'e' enum, 'd' domain, 'c' composite. name is what format_type()
// prints, schema-qualified outside the search path. dependencies lists the
// user types this one is built on.
struct UserTypeInfo {
  std::string name;
  std::string schema;
  char kind = 'e';
  std::vector<std::string> enumLabels;
  std::string baseType;
  bool notNull = false;
  std::string defaultValue;
  std::vector<ConstraintInfo> checks;
  std::vector<ColumnInfo> attributes;
  std::vector<std::string> dependencies;
};

// A database on a server, as listed for cleanup. age is unknown when the
// server cannot tell when the database was created.
struct DatabaseInfo {
  std::string name;
  std::optional<std::chrono::seconds> age;
};

struct ServerIdentity {
  std::string address;
  int port = 0;
  std::string role;
  std::string version;
};

using Row = std::vector<std::optional<std::string>>;

inline std::string quoteIdentifier(const std::string &identifier) {
  std::string quoted = "\"";
  for (char c : identifier) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += "\"";
  return quoted;
}

inline std::string quoteLiteral(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'')
      quoted += '\'';
    quoted += c;
  }
  quoted += "'";
  return quoted;
}

// "public"."table" for tables of the forked schema.
inline std::string qualifiedTableName(const std::string &table) {
  return quoteIdentifier(ForkDefaults::PUBLIC_SCHEMA) + "." +
         quoteIdentifier(table);
}

class ITableCursor {
public:
  virtual ~ITableCursor() = default;

  // Appends up to maxRows rows in source order. Returns false once the
  // cursor is exhausted and nothing was appended.
  virtual bool fetch(size_t maxRows, std::vector<Row> &rows) = 0;
};

// Read-only access to the source database.
class ISourceSession {
public:
  virtual ~ISourceSession() = default;

  virtual std::vector<std::string> listTables() = 0;
  virtual int64_t estimateRowCount(const std::string &table) = 0;
  virtual TableSchema describeTable(const std::string &table) = 0;
  virtual std::vector<ExtensionInfo> listExtensions() = 0;
  virtual UserTypeInfo describeType(const std::string &name) = 0;
  virtual std::unique_ptr<ITableCursor>
  openCursor(const std::string &table,
             const std::vector<std::string> &columns) = 0;
  virtual bool isHealthy() = 0;
};

// Write path into the target database. Exclusive to one worker at a time.
class IDestinationSession {
public:
  virtual ~IDestinationSession() = default;

  virtual void execute(const std::string &sql) = 0;
  virtual bool tableExists(const std::string &table) = 0;
  virtual std::vector<ColumnInfo> tableColumns(const std::string &table) = 0;
  virtual void truncateTable(const std::string &table) = 0;
  // Writes rows and commits them as one transaction.
  virtual void writeChunk(const std::string &table,
                          const std::vector<std::string> &columns,
                          const std::vector<Row> &rows) = 0;
  virtual int64_t countRows(const std::string &table) = 0;
};

// Server-level operations, run against the maintenance database.
class IAdminSession {
public:
  virtual ~IAdminSession() = default;

  virtual bool databaseExists(const std::string &name) = 0;
  virtual void createDatabase(const std::string &name,
                              const std::string &templateName) = 0;
  virtual void dropDatabase(const std::string &name) = 0;
  virtual int64_t databaseSize(const std::string &name) = 0;
  // User databases, without templates and the maintenance database.
  virtual std::vector<DatabaseInfo> listDatabases() = 0;
  // True when the connected role may run CREATE DATABASE.
  virtual bool canCreateDatabases() = 0;
};

class IDatabaseDriver {
public:
  virtual ~IDatabaseDriver() = default;

  virtual ServerIdentity probe(const ConnectionConfig &config) = 0;
  virtual std::unique_ptr<ISourceSession>
  openSource(const ConnectionConfig &config) = 0;
  virtual std::unique_ptr<IDestinationSession>
  openDestination(const ConnectionConfig &config) = 0;
  virtual std::unique_ptr<IAdminSession>
  openAdmin(const ConnectionConfig &config) = 0;
};

#endif
