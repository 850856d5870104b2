#include "fork/SchemaExtractor.h"
#include "utils/string_utils.h"
#include <functional>
#include <unordered_set>

namespace {
bool usesSequenceDefault(const ColumnInfo &col,
                         const std::vector<SequenceInfo> &sequences) {
  for (const auto &sequence : sequences) {
    if (sequence.column == col.name)
      return true;
  }
  return false;
}

// pg_get_indexdef() output made safe to replay on a partially forked target.
std::string makeIndexIdempotent(const std::string &definition) {
  if (StringUtils::startsWith(definition, "CREATE UNIQUE INDEX ") &&
      definition.find(" IF NOT EXISTS ") == std::string::npos) {
    return "CREATE UNIQUE INDEX IF NOT EXISTS " + definition.substr(20);
  }
  if (StringUtils::startsWith(definition, "CREATE INDEX ") &&
      definition.find(" IF NOT EXISTS ") == std::string::npos) {
    return "CREATE INDEX IF NOT EXISTS " + definition.substr(13);
  }
  return definition;
}

std::string createSchemaPrefix(const std::string &schema) {
  if (schema.empty() || schema == ForkDefaults::PUBLIC_SCHEMA)
    return "";
  return "CREATE SCHEMA IF NOT EXISTS " + quoteIdentifier(schema) + ";\n";
}

// CREATE TYPE and CREATE DOMAIN have no IF NOT EXISTS; a type that a
// previous run already created is skipped inside the server.
std::string ignoreDuplicate(const std::string &sql) {
  return "DO $pgfork$ BEGIN " + sql +
         "; EXCEPTION WHEN duplicate_object THEN NULL; END $pgfork$";
}

std::string unquoteIdentifier(const std::string &identifier) {
  if (identifier.size() >= 2 && identifier.front() == '"' &&
      identifier.back() == '"') {
    std::string inner = identifier.substr(1, identifier.size() - 2);
    std::string result;
    for (size_t i = 0; i < inner.size(); ++i) {
      result += inner[i];
      if (inner[i] == '"' && i + 1 < inner.size() && inner[i + 1] == '"')
        ++i;
    }
    return result;
  }
  return identifier;
}
} // namespace

SchemaExtractor::SchemaExtractor(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

std::vector<TableSchema>
SchemaExtractor::describeTables(ISourceSession &source,
                                const std::vector<std::string> &tables,
                                const CancellationToken &token) {
  std::vector<TableSchema> schemas;
  schemas.reserve(tables.size());
  for (const auto &table : tables) {
    token.throwIfStopped("schema extraction", table);
    TableSchema schema = source.describeTable(table);
    logger_->debug(LogCategory::SCHEMA, "describeTables",
                   "Extracted " + table + ": " +
                       std::to_string(schema.columns.size()) + " columns, " +
                       std::to_string(schema.indexes.size()) + " indexes, " +
                       std::to_string(schema.constraints.size()) +
                       " constraints, " +
                       std::to_string(schema.sequences.size()) + " sequences");
    schemas.push_back(std::move(schema));
  }
  return schemas;
}

std::vector<UserTypeInfo>
SchemaExtractor::describeTypes(ISourceSession &source,
                               const std::vector<TableSchema> &schemas,
                               const CancellationToken &token) {
  std::vector<UserTypeInfo> types;
  std::set<std::string> visited;

  std::function<void(const std::string &)> visit =
      [&](const std::string &name) {
        if (!visited.insert(name).second)
          return;
        token.throwIfStopped("type extraction");
        UserTypeInfo type = source.describeType(name);
        for (const auto &dependency : type.dependencies)
          visit(dependency);
        types.push_back(std::move(type));
      };

  for (const auto &schema : schemas) {
    for (const auto &column : schema.columns) {
      if (!column.userType.empty())
        visit(column.userType);
    }
  }

  if (!types.empty()) {
    logger_->debug(LogCategory::SCHEMA, "describeTypes",
                   "Extracted " + std::to_string(types.size()) +
                       " user-defined types");
  }
  return types;
}

// Builds the replayable statement list for the selected tables. Foreign keys
// that point at a table outside the selection cannot be satisfied on the
// target and are left out with a warning.
std::vector<DdlStatement>
SchemaExtractor::buildStatements(const std::vector<TableSchema> &schemas,
                                 const std::vector<ExtensionInfo> &extensions,
                                 const std::vector<UserTypeInfo> &types) const {
  std::set<std::string> selected;
  for (const auto &schema : schemas)
    selected.insert(schema.name);

  std::vector<DdlStatement> prerequisites = buildExtensionStatements(extensions);
  for (const auto &type : types)
    prerequisites.push_back(buildTypeStatement(type));

  std::vector<DdlStatement> tables;
  std::vector<DdlStatement> sequences;
  std::vector<DdlStatement> indexes;
  std::vector<DdlStatement> foreignKeys;
  std::vector<DdlStatement> sequenceSync;

  for (const auto &schema : schemas) {
    tables.push_back(buildCreateTable(schema));

    auto seq = buildSequenceStatements(schema);
    sequences.insert(sequences.end(), seq.begin(), seq.end());

    auto idx = buildIndexStatements(schema);
    indexes.insert(indexes.end(), idx.begin(), idx.end());

    std::vector<std::string> skipped;
    auto fks = buildForeignKeyStatements(schema, selected, skipped);
    foreignKeys.insert(foreignKeys.end(), fks.begin(), fks.end());
    for (const auto &name : skipped) {
      logger_->warning(LogCategory::SCHEMA, "buildStatements",
                       "Skipping foreign key " + name + " on " + schema.name +
                           ": referenced table is not part of the fork");
    }

    auto sync = buildSequenceSyncStatements(schema);
    sequenceSync.insert(sequenceSync.end(), sync.begin(), sync.end());
  }

  std::vector<DdlStatement> statements;
  for (auto *group : {&prerequisites, &tables, &sequences, &indexes,
                      &foreignKeys, &sequenceSync}) {
    statements.insert(statements.end(), group->begin(), group->end());
  }

  logger_->info(LogCategory::SCHEMA, "buildStatements",
                "Prepared " + std::to_string(statements.size()) +
                    " DDL statements for " + std::to_string(schemas.size()) +
                    " tables (" + std::to_string(foreignKeys.size()) +
                    " foreign keys deferred until after data load)");
  return statements;
}

std::vector<DdlStatement> SchemaExtractor::buildExtensionStatements(
    const std::vector<ExtensionInfo> &extensions) {
  std::vector<DdlStatement> statements;
  for (const auto &extension : extensions) {
    DdlStatement statement;
    statement.id = "extension:" + extension.name;
    statement.kind = DdlKind::EXTENSION;
    statement.sql = createSchemaPrefix(extension.schema) +
                    "CREATE EXTENSION IF NOT EXISTS " +
                    quoteIdentifier(extension.name);
    if (!extension.schema.empty())
      statement.sql += " WITH SCHEMA " + quoteIdentifier(extension.schema);
    statements.push_back(statement);
  }
  return statements;
}

DdlStatement SchemaExtractor::buildTypeStatement(const UserTypeInfo &type) {
  DdlStatement statement;
  statement.id = "type:" + type.name;
  statement.kind = DdlKind::CREATE_TYPE;

  std::string create;
  if (type.kind == 'e') {
    create = "CREATE TYPE " + type.name + " AS ENUM (";
    for (size_t i = 0; i < type.enumLabels.size(); ++i) {
      if (i > 0)
        create += ", ";
      create += quoteLiteral(type.enumLabels[i]);
    }
    create += ")";
  } else if (type.kind == 'd') {
    create = "CREATE DOMAIN " + type.name + " AS " + type.baseType;
    if (!type.defaultValue.empty())
      create += " DEFAULT " + type.defaultValue;
    if (type.notNull)
      create += " NOT NULL";
    for (const auto &check : type.checks) {
      create += " CONSTRAINT " + quoteIdentifier(check.name) + " " +
                check.definition;
    }
  } else {
    create = "CREATE TYPE " + type.name + " AS (";
    for (size_t i = 0; i < type.attributes.size(); ++i) {
      if (i > 0)
        create += ", ";
      create += quoteIdentifier(type.attributes[i].name) + " " +
                type.attributes[i].dataType;
    }
    create += ")";
  }

  statement.sql = createSchemaPrefix(type.schema) + ignoreDuplicate(create);
  return statement;
}

// Defaults that call nextval() on a sequence are held back: the sequence is
// created after the table and the default is attached together with it.
std::string SchemaExtractor::buildColumnDefinition(const ColumnInfo &col,
                                                   bool keepDefault) {
  std::string def = quoteIdentifier(col.name) + " " + col.dataType;

  if (col.isGenerated()) {
    def += " GENERATED ALWAYS AS (" + col.generatedExpression + ") STORED";
  } else if (col.isIdentity) {
    def += " GENERATED BY DEFAULT AS IDENTITY";
  } else if (keepDefault && !col.defaultValue.empty()) {
    def += " DEFAULT " + col.defaultValue;
  }

  if (!col.isNullable) {
    def += " NOT NULL";
  }

  return def;
}

DdlStatement SchemaExtractor::buildCreateTable(const TableSchema &schema) {
  DdlStatement statement;
  statement.id = "table:" + schema.name;
  statement.kind = DdlKind::CREATE_TABLE;
  statement.table = schema.name;

  std::string sql =
      "CREATE TABLE IF NOT EXISTS " + qualifiedTableName(schema.name) + " (";
  bool first = true;
  for (const auto &col : schema.columns) {
    sql += first ? "\n  " : ",\n  ";
    first = false;
    sql += buildColumnDefinition(col,
                                 !usesSequenceDefault(col, schema.sequences));
    statement.columns.push_back(col.name);
  }
  for (const auto &constraint : schema.constraints) {
    if (constraint.type != 'p')
      continue;
    sql += first ? "\n  " : ",\n  ";
    first = false;
    sql += "CONSTRAINT " + quoteIdentifier(constraint.name) + " " +
           constraint.definition;
  }
  sql += "\n)";

  statement.sql = sql;
  return statement;
}

std::vector<DdlStatement>
SchemaExtractor::buildSequenceStatements(const TableSchema &schema) {
  std::vector<DdlStatement> statements;
  for (const auto &sequence : schema.sequences) {
    const ColumnInfo *column = nullptr;
    for (const auto &col : schema.columns) {
      if (col.name == sequence.column)
        column = &col;
    }

    DdlStatement statement;
    statement.id = "sequence:" + schema.name + "." + sequence.column;
    statement.kind = DdlKind::CREATE_SEQUENCE;
    statement.table = schema.name;

    std::string sql = "CREATE SEQUENCE IF NOT EXISTS " + sequence.name;
    if (sequence.owned) {
      sql += ";\nALTER SEQUENCE " + sequence.name + " OWNED BY " +
             qualifiedTableName(schema.name) + "." +
             quoteIdentifier(sequence.column);
    }
    if (column && !column->defaultValue.empty()) {
      sql += ";\nALTER TABLE " + qualifiedTableName(schema.name) +
             " ALTER COLUMN " + quoteIdentifier(sequence.column) +
             " SET DEFAULT " + column->defaultValue;
    }
    statement.sql = sql;
    statements.push_back(statement);
  }
  return statements;
}

std::vector<DdlStatement>
SchemaExtractor::buildIndexStatements(const TableSchema &schema) {
  std::vector<DdlStatement> statements;
  for (const auto &index : schema.indexes) {
    DdlStatement statement;
    statement.id = "index:" + schema.name + "." + index.name;
    statement.kind = DdlKind::INDEX;
    statement.table = schema.name;
    statement.sql = makeIndexIdempotent(index.definition);
    statements.push_back(statement);
  }
  for (const auto &constraint : schema.constraints) {
    if (constraint.type == 'p' || constraint.type == 'f')
      continue;
    DdlStatement statement;
    statement.id = "constraint:" + schema.name + "." + constraint.name;
    statement.kind = DdlKind::CONSTRAINT;
    statement.table = schema.name;
    statement.sql = "ALTER TABLE " + qualifiedTableName(schema.name) +
                    " ADD CONSTRAINT " + quoteIdentifier(constraint.name) +
                    " " + constraint.definition;
    statements.push_back(statement);
  }
  return statements;
}

std::vector<DdlStatement> SchemaExtractor::buildForeignKeyStatements(
    const TableSchema &schema, const std::set<std::string> &selectedTables,
    std::vector<std::string> &skipped) {
  std::vector<DdlStatement> statements;
  for (const auto &constraint : schema.constraints) {
    if (constraint.type != 'f')
      continue;
    std::string target = referencedTable(constraint.definition);
    if (!target.empty() && selectedTables.count(target) == 0) {
      skipped.push_back(constraint.name);
      continue;
    }
    DdlStatement statement;
    statement.id = "fk:" + schema.name + "." + constraint.name;
    statement.kind = DdlKind::FOREIGN_KEY;
    statement.table = schema.name;
    statement.sql = "ALTER TABLE " + qualifiedTableName(schema.name) +
                    " ADD CONSTRAINT " + quoteIdentifier(constraint.name) +
                    " " + constraint.definition;
    statements.push_back(statement);
  }
  return statements;
}

// Moves each sequence past the highest copied value so that inserts on the
// fork do not collide with copied rows. Identity columns are handled through
// pg_get_serial_sequence(), which resolves their implicit sequence. Columns
// declared GENERATED ALWAYS were created BY DEFAULT to accept the copied
// values and get their declaration back here.
std::vector<DdlStatement>
SchemaExtractor::buildSequenceSyncStatements(const TableSchema &schema) {
  std::vector<DdlStatement> statements;
  std::string table = qualifiedTableName(schema.name);

  auto makeSync = [&](const std::string &column,
                      const std::string &sequenceExpr) {
    std::string col = quoteIdentifier(column);
    DdlStatement statement;
    statement.id = "seqsync:" + schema.name + "." + column;
    statement.kind = DdlKind::SEQUENCE_SYNC;
    statement.table = schema.name;
    statement.sql = "SELECT setval(" + sequenceExpr + ", COALESCE(MAX(" + col +
                    "), 1), MAX(" + col + ") IS NOT NULL) FROM " + table;
    return statement;
  };

  for (const auto &sequence : schema.sequences) {
    statements.push_back(
        makeSync(sequence.column, quoteLiteral(sequence.name)));
  }
  for (const auto &col : schema.columns) {
    if (!col.isIdentity)
      continue;
    statements.push_back(
        makeSync(col.name, "pg_get_serial_sequence(" + quoteLiteral(table) +
                               ", " + quoteLiteral(col.name) + ")"));
    if (col.identityAlways) {
      DdlStatement restore;
      restore.id = "identity:" + schema.name + "." + col.name;
      restore.kind = DdlKind::SEQUENCE_SYNC;
      restore.table = schema.name;
      restore.sql = "ALTER TABLE " + table + " ALTER COLUMN " +
                    quoteIdentifier(col.name) + " SET GENERATED ALWAYS";
      statements.push_back(restore);
    }
  }
  return statements;
}

void SchemaExtractor::verifyDestinationSchema(
    IDestinationSession &destination, const std::vector<TableTask> &tasks,
    const CancellationToken &token) {
  for (const auto &task : tasks) {
    token.throwIfStopped("schema verification", task.name);

    if (!destination.tableExists(task.name)) {
      throw SchemaMismatchError("target table " + task.name +
                                    " does not exist (data-only mode "
                                    "requires an existing schema)",
                                task.name);
    }

    SchemaDiff diff = detectSchemaChanges(
        task.columns, destination.tableColumns(task.name));
    if (diff.hasMissingColumns()) {
      throw SchemaMismatchError(
          "target table " + task.name + " is missing columns: " +
              StringUtils::join(diff.missingColumns, ", "),
          task.name);
    }
    if (!diff.extraColumns.empty()) {
      logger_->warning(LogCategory::SCHEMA, "verifyDestinationSchema",
                       "Target table " + task.name +
                           " has columns not present in the source: " +
                           StringUtils::join(diff.extraColumns, ", "));
    }
  }
  logger_->info(LogCategory::SCHEMA, "verifyDestinationSchema",
                "Target schema verified for " + std::to_string(tasks.size()) +
                    " tables");
}

SchemaDiff SchemaExtractor::detectSchemaChanges(
    const std::vector<std::string> &requiredColumns,
    const std::vector<ColumnInfo> &targetColumns) {
  SchemaDiff diff;

  std::unordered_set<std::string> targetNames;
  for (const auto &col : targetColumns)
    targetNames.insert(col.name);

  std::unordered_set<std::string> requiredNames(requiredColumns.begin(),
                                                requiredColumns.end());

  for (const auto &name : requiredColumns) {
    if (targetNames.find(name) == targetNames.end())
      diff.missingColumns.push_back(name);
  }
  for (const auto &col : targetColumns) {
    if (requiredNames.find(col.name) == requiredNames.end())
      diff.extraColumns.push_back(col.name);
  }
  return diff;
}

// Returns the unqualified table named after REFERENCES in a foreign key
// definition produced by pg_get_constraintdef(), or "" if it cannot be read.
std::string
SchemaExtractor::referencedTable(const std::string &foreignKeyDefinition) {
  const std::string marker = "REFERENCES ";
  size_t pos = foreignKeyDefinition.find(marker);
  if (pos == std::string::npos)
    return "";
  pos += marker.size();

  std::vector<std::string> parts;
  std::string current;
  bool inQuotes = false;
  for (; pos < foreignKeyDefinition.size(); ++pos) {
    char c = foreignKeyDefinition[pos];
    if (c == '"') {
      if (inQuotes && pos + 1 < foreignKeyDefinition.size() &&
          foreignKeyDefinition[pos + 1] == '"') {
        current += "\"\"";
        ++pos;
        continue;
      }
      inQuotes = !inQuotes;
      current += c;
    } else if (!inQuotes && c == '.') {
      parts.push_back(current);
      current.clear();
    } else if (!inQuotes && (c == '(' || c == ' ')) {
      break;
    } else {
      current += c;
    }
  }
  parts.push_back(current);

  return unquoteIdentifier(parts.back());
}
