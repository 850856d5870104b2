#ifndef SCHEMA_EXTRACTOR_H
#define SCHEMA_EXTRACTOR_H

#include "core/cancellation.h"
#include "core/logger.h"
#include "engines/database_session.h"
#include "fork/ForkTypes.h"
#include <memory>
#include <set>
#include <string>
#include <vector>

struct SchemaDiff {
  std::vector<std::string> missingColumns;
  std::vector<std::string> extraColumns;

  bool hasMissingColumns() const { return !missingColumns.empty(); }
};

class SchemaExtractor {
  std::shared_ptr<Logger> logger_;

public:
  explicit SchemaExtractor(std::shared_ptr<Logger> logger);

  std::vector<TableSchema> describeTables(ISourceSession &source,
                                          const std::vector<std::string> &tables,
                                          const CancellationToken &token);

  // Every user-defined type the columns use, together with the types those
  // are built on. Each type comes after the types it depends on.
  std::vector<UserTypeInfo>
  describeTypes(ISourceSession &source, const std::vector<TableSchema> &schemas,
                const CancellationToken &token);

  // Statements in application order: extensions, types, tables, sequences,
  // indexes and non-FK constraints, foreign keys, sequence value sync.
  std::vector<DdlStatement>
  buildStatements(const std::vector<TableSchema> &schemas,
                  const std::vector<ExtensionInfo> &extensions = {},
                  const std::vector<UserTypeInfo> &types = {}) const;

  // Data-only mode: every table must exist with every column that will be
  // copied. Throws SchemaMismatchError naming the first offending table.
  void verifyDestinationSchema(IDestinationSession &destination,
                               const std::vector<TableTask> &tasks,
                               const CancellationToken &token);

  static std::vector<DdlStatement>
  buildExtensionStatements(const std::vector<ExtensionInfo> &extensions);
  static DdlStatement buildTypeStatement(const UserTypeInfo &type);
  static DdlStatement buildCreateTable(const TableSchema &schema);
  static std::string buildColumnDefinition(const ColumnInfo &col,
                                           bool keepDefault);
  static std::vector<DdlStatement>
  buildSequenceStatements(const TableSchema &schema);
  static std::vector<DdlStatement>
  buildIndexStatements(const TableSchema &schema);
  static std::vector<DdlStatement>
  buildForeignKeyStatements(const TableSchema &schema,
                            const std::set<std::string> &selectedTables,
                            std::vector<std::string> &skipped);
  static std::vector<DdlStatement>
  buildSequenceSyncStatements(const TableSchema &schema);

  static SchemaDiff
  detectSchemaChanges(const std::vector<std::string> &requiredColumns,
                      const std::vector<ColumnInfo> &targetColumns);
  static std::string referencedTable(const std::string &foreignKeyDefinition);
};

#endif
