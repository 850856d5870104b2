#include "fork/ForkOrchestrator.h"
#include "fork/JobStateStore.h"
#include "support/capture_log_writer.h"
#include "support/fake_database.h"
#include "support/test_runner.h"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace {

TableSchema usersTable() {
  return makeTableSchema("users", {makeColumn("id", "integer", false),
                                   makeColumn("name", "text")});
}

TableSchema ordersTable() {
  TableSchema schema =
      makeTableSchema("orders", {makeColumn("id", "bigint", false),
                                 makeColumn("user_id", "text")});
  schema.columns[0].defaultValue = "nextval('orders_id_seq'::regclass)";

  SequenceInfo sequence;
  sequence.name = "public.orders_id_seq";
  sequence.column = "id";
  schema.sequences.push_back(sequence);

  IndexInfo index;
  index.name = "orders_user_id_idx";
  index.definition =
      "CREATE INDEX orders_user_id_idx ON public.orders USING btree (user_id)";
  schema.indexes.push_back(index);

  ConstraintInfo fk;
  fk.name = "orders_user_id_fkey";
  fk.type = 'f';
  fk.definition = "FOREIGN KEY (user_id) REFERENCES users(id)";
  schema.constraints.push_back(fk);
  return schema;
}

TableSchema auditTable() {
  return makeTableSchema("audit_logs", {makeColumn("id", "integer", false),
                                        makeColumn("entry", "text")});
}

// Source server with shop (users 250, orders 1000, audit_logs 300 rows) and
// an empty destination server.
struct OrchestratorFixture {
  std::shared_ptr<CaptureLogWriter> capture;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<FakeServer> sourceServer;
  std::shared_ptr<FakeServer> destServer;
  std::shared_ptr<FakeDriver> driver;
  TemporaryDirectory dir{"pgfork-orchestrator"};

  OrchestratorFixture() {
    logger = makeCaptureLogger(capture);
    sourceServer = std::make_shared<FakeServer>("10.0.0.1", 5432, "forker");
    destServer = std::make_shared<FakeServer>("10.0.0.2", 5432, "forker");

    FakeDatabase &shop = sourceServer->createDatabase("shop");
    shop.addTable(usersTable()).rows = makeRows(250, "user");
    shop.addTable(ordersTable()).rows = makeRows(1000, "order");
    shop.addTable(auditTable()).rows = makeRows(300, "audit");

    driver = std::make_shared<FakeDriver>();
    driver->addServer("src.db", 5432, sourceServer);
    driver->addServer("dst.db", 5432, destServer);
  }

  ForkSpec spec() const {
    ForkSpec forkSpec;
    forkSpec.source.host = "src.db";
    forkSpec.source.username = "forker";
    forkSpec.source.database = "shop";
    forkSpec.destination = forkSpec.source;
    forkSpec.destination.host = "dst.db";
    forkSpec.destination.database = "postgres";
    forkSpec.targetDatabase = "shop_fork";
    forkSpec.excludeTables = {"audit_logs"};
    forkSpec.maxConnections = 1;
    forkSpec.chunkSize = 100;
    forkSpec.stateDir = dir.path();
    forkSpec.retry.maxAttempts = 3;
    forkSpec.retry.initialDelay = std::chrono::milliseconds(1);
    forkSpec.retry.maxDelay = std::chrono::milliseconds(2);
    return forkSpec;
  }

  ForkResult fork(const ForkSpec &forkSpec) {
    CancellationToken token;
    return fork(forkSpec, token);
  }

  ForkResult fork(const ForkSpec &forkSpec, CancellationToken &token) {
    ForkOrchestrator orchestrator(driver, logger);
    return orchestrator.fork(token, forkSpec);
  }
};

long indexOfStatement(const std::vector<std::string> &statements,
                      const std::string &needle) {
  for (size_t i = 0; i < statements.size(); ++i) {
    if (statements[i].find(needle) != std::string::npos)
      return static_cast<long>(i);
  }
  return -1;
}

} // namespace

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "FORK ORCHESTRATOR TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Cross-server fork with an excluded table", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.maxConnections = 2;
    spec.progressFile = fixture.dir.file("progress.json");

    ForkResult result = fixture.fork(spec);
    runner.assertTrue(result.success, "Fork succeeded: " + result.errorMessage);
    runner.assertTrue(result.strategy == TransferStrategy::CROSS_SERVER,
                      "Streaming strategy");
    runner.assertEquals(2, result.tablesCompleted, "Two tables completed");
    runner.assertEquals(2, result.tablesTotal, "Two tables planned");
    runner.assertEquals(1250, result.rowsTransferred, "All rows transferred");

    runner.assertTrue(fixture.destServer->hasDatabase("shop_fork"),
                      "Target created");
    runner.assertEquals(250, fixture.destServer->rowCount("shop_fork", "users"),
                        "users copied");
    runner.assertEquals(1000,
                        fixture.destServer->rowCount("shop_fork", "orders"),
                        "orders copied");
    runner.assertFalse(
        fixture.destServer->database("shop_fork").tables.count("audit_logs") >
            0,
        "Excluded table not created");

    auto executed = fixture.destServer->executedStatements();
    long createOrders = indexOfStatement(executed, "\"public\".\"orders\" (");
    long fk = indexOfStatement(executed, "orders_user_id_fkey");
    long setval = indexOfStatement(executed, "setval");
    runner.assertTrue(createOrders >= 0 && fk > createOrders,
                      "Foreign key after the tables");
    runner.assertTrue(setval > fk, "Sequence values synced last");
    runner.assertEquals(0, fixture.capture->countContaining("mismatch for"),
                        "Row counts verified");

    std::ifstream file(spec.progressFile);
    nlohmann::json progress = nlohmann::json::parse(file);
    runner.assertEquals("done", progress["phase"].get<std::string>(),
                        "Progress file shows done");
    runner.assertNear(100.0, progress["overall"]["percent_complete"].get<double>(),
                      0.001, "100 percent");

    JobStateStore store(spec.stateDir, fixture.logger);
    std::optional<ForkJob> job = store.load(result.jobId);
    runner.assertTrue(job && job->phase == ForkPhase::DONE,
                      "Job recorded as done");
  });

  runner.runTest("Extensions and user types are created before tables",
                 [&]() {
    OrchestratorFixture fixture;
    FakeDatabase &shop = fixture.sourceServer->database("shop");
    ExtensionInfo citext;
    citext.name = "citext";
    citext.schema = "public";
    shop.extensions.push_back(citext);

    UserTypeInfo mood;
    mood.name = "mood";
    mood.schema = "public";
    mood.kind = 'e';
    mood.enumLabels = {"sad", "ok", "happy"};
    shop.types["mood"] = mood;

    FakeTable &users = shop.tables.at("users");
    ColumnInfo moodColumn = makeColumn("mood", "mood");
    moodColumn.userType = "mood";
    moodColumn.ordinalPosition = 3;
    users.schema.columns.push_back(moodColumn);
    for (auto &row : users.rows)
      row.push_back(std::string("ok"));

    ForkResult result = fixture.fork(fixture.spec());
    runner.assertTrue(result.success, "Fork succeeded: " + result.errorMessage);

    auto executed = fixture.destServer->executedStatements();
    long extension =
        indexOfStatement(executed, "CREATE EXTENSION IF NOT EXISTS \"citext\"");
    long type = indexOfStatement(executed, "CREATE TYPE mood AS ENUM");
    long createUsers = indexOfStatement(executed, "\"public\".\"users\" (");
    runner.assertTrue(extension >= 0, "Extension installed");
    runner.assertTrue(type > extension, "Type after the extension");
    runner.assertTrue(createUsers > type, "Table after its column type");
    runner.assertEquals(250, fixture.destServer->rowCount("shop_fork", "users"),
                        "users copied");
  });

  runner.runTest("Dry run writes nothing", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.dryRun = true;

    ForkResult result = fixture.fork(spec);
    runner.assertTrue(result.success, "Dry run succeeds");
    runner.assertTrue(result.dryRun, "Flagged as dry run");
    runner.assertEquals(2, result.plan.tables.size(), "Plan returned");
    runner.assertFalse(result.plan.statements.empty(), "Statements returned");
    runner.assertFalse(fixture.destServer->hasDatabase("shop_fork"),
                       "No target database");
    runner.assertEquals(0, fixture.destServer->executedStatements().size(),
                        "No statements executed");
    JobStateStore store(spec.stateDir, fixture.logger);
    runner.assertFalse(store.exists(result.jobId), "No job state written");
    runner.assertTrue(result.toJson().contains("plan"),
                      "Plan included in the result document");
  });

  runner.runTest("A transient write failure is retried", [&]() {
    OrchestratorFixture fixture;
    FakeWriteFailure failure;
    failure.table = "orders";
    failure.chunk = 2;
    fixture.destServer->failWrites(failure);

    ForkResult result = fixture.fork(fixture.spec());
    runner.assertTrue(result.success, "Fork succeeded: " + result.errorMessage);
    runner.assertEquals(1000,
                        fixture.destServer->rowCount("shop_fork", "orders"),
                        "No rows lost");
    runner.assertEquals(11,
                        fixture.destServer->writeCalls("shop_fork", "orders"),
                        "One extra write");
  });

  runner.runTest("A permission failure is reported with its table", [&]() {
    OrchestratorFixture fixture;
    FakeWriteFailure failure;
    failure.table = "orders";
    failure.times = -1;
    failure.failure = FakeFailure::PERMISSION;
    fixture.destServer->failWrites(failure);

    ForkResult result = fixture.fork(fixture.spec());
    runner.assertFalse(result.success, "Fork failed");
    runner.assertTrue(result.errorKind == ErrorKind::PERMISSION,
                      "Permission kind");
    runner.assertEquals("orders", result.failedTable, "Table reported");
    runner.assertEquals(1,
                        fixture.destServer->writeCalls("shop_fork", "orders"),
                        "Not retried");

    nlohmann::json document = result.toJson();
    runner.assertEquals("permission", document["error_kind"].get<std::string>(),
                        "error_kind in the document");
    runner.assertEquals("orders", document["table"].get<std::string>(),
                        "table in the document");
    runner.assertFalse(document["success"].get<bool>(), "success is false");

    JobStateStore store(fixture.spec().stateDir, fixture.logger);
    std::optional<ForkJob> job = store.load(result.jobId);
    runner.assertTrue(job && job->phase == ForkPhase::FAILED,
                      "Job recorded as failed");
    runner.assertEquals("orders", job->failedTable, "Failed table recorded");
  });

  runner.runTest("Resume skips completed tables", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.jobId = "fork-resume-test";

    FakeWriteFailure failure;
    failure.table = "orders";
    failure.failure = FakeFailure::PERMISSION;
    fixture.destServer->failWrites(failure);

    ForkResult first = fixture.fork(spec);
    runner.assertFalse(first.success, "First run fails");
    runner.assertEquals(1, first.tablesCompleted, "users completed");
    size_t usersWrites = fixture.destServer->writeCalls("shop_fork", "users");
    runner.assertEquals(3, usersWrites, "users written once");

    fixture.destServer->clearFailures();
    spec.resume = true;
    ForkResult second = fixture.fork(spec);
    runner.assertTrue(second.success,
                      "Resumed run succeeds: " + second.errorMessage);
    runner.assertEquals("fork-resume-test", second.jobId, "Same job");
    runner.assertEquals(usersWrites,
                        fixture.destServer->writeCalls("shop_fork", "users"),
                        "users not copied again");
    runner.assertEquals(1000,
                        fixture.destServer->rowCount("shop_fork", "orders"),
                        "orders completed");
    runner.assertEquals(2, second.tablesCompleted, "Both tables completed");
    runner.assertTrue(fixture.capture->countContaining("Resuming job "
                                                       "fork-resume-test") == 1,
                      "Resume is logged");

    auto executed = fixture.destServer->executedStatements();
    size_t createUsers = std::count_if(
        executed.begin(), executed.end(), [](const std::string &sql) {
          return sql.find("\"public\".\"users\" (") != std::string::npos;
        });
    runner.assertEquals(1, createUsers, "Applied statements are not repeated");

    ForkResult third = fixture.fork(spec);
    runner.assertTrue(third.success, "Finished job resumes as success");
    runner.assertEquals(1000,
                        fixture.destServer->rowCount("shop_fork", "orders"),
                        "Nothing rewritten");
  });

  runner.runTest("Resume with an unknown job id starts over", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.jobId = "fork-never-ran";
    spec.resume = true;
    ForkResult result = fixture.fork(spec);
    runner.assertTrue(result.success, "Fresh fork succeeds");
    runner.assertEquals(1, fixture.capture->countContaining(
                               "No saved state for job fork-never-ran"),
                        "Fresh start is logged");
  });

  runner.runTest("Resume with a different configuration is refused", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.jobId = "fork-changed";
    ForkResult first = fixture.fork(spec);
    runner.assertTrue(first.success, "First run succeeds");

    spec.resume = true;
    spec.excludeTables.clear();
    ForkResult second = fixture.fork(spec);
    runner.assertFalse(second.success, "Refused");
    runner.assertTrue(second.errorKind == ErrorKind::RESUME_MISMATCH,
                      "Resume mismatch kind");
  });

  runner.runTest("Schema-only fork creates empty tables", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.schemaOnly = true;

    ForkResult result = fixture.fork(spec);
    runner.assertTrue(result.success, "Fork succeeded: " + result.errorMessage);
    runner.assertEquals(2, result.tablesCompleted, "Tables completed");
    runner.assertEquals(0, result.rowsTransferred, "No rows");
    runner.assertEquals(0, fixture.destServer->rowCount("shop_fork", "users"),
                        "users empty");
    runner.assertTrue(indexOfStatement(fixture.destServer->executedStatements(),
                                       "orders_user_id_fkey") >= 0,
                      "Foreign keys still applied");
  });

  runner.runTest("Data-only fork checks the target schema", [&]() {
    OrchestratorFixture fixture;
    FakeDatabase &target = fixture.destServer->createDatabase("shop_fork");
    target.addTable(usersTable());
    target.addTable(makeTableSchema("orders", {makeColumn("id", "bigint")}));

    ForkSpec spec = fixture.spec();
    spec.dataOnly = true;
    ForkResult result = fixture.fork(spec);
    runner.assertFalse(result.success, "Fork failed");
    runner.assertTrue(result.errorKind == ErrorKind::SCHEMA_MISMATCH,
                      "Schema mismatch kind");
    runner.assertEquals("orders", result.failedTable, "Offending table");
    runner.assertEquals(0, fixture.destServer->rowCount("shop_fork", "users"),
                        "Nothing copied");
  });

  runner.runTest("Data-only fork fills an existing schema", [&]() {
    OrchestratorFixture fixture;
    FakeDatabase &target = fixture.destServer->createDatabase("shop_fork");
    target.addTable(usersTable());
    target.addTable(ordersTable());

    ForkSpec spec = fixture.spec();
    spec.dataOnly = true;
    ForkResult result = fixture.fork(spec);
    runner.assertTrue(result.success, "Fork succeeded: " + result.errorMessage);
    runner.assertEquals(1250, result.rowsTransferred, "Rows copied");
    runner.assertEquals(-1, indexOfStatement(
                                fixture.destServer->executedStatements(),
                                "CREATE"),
                        "No DDL executed");
  });

  runner.runTest("Cancellation stops the fork", [&]() {
    OrchestratorFixture fixture;
    CancellationToken token;
    fixture.destServer->setAfterChunk(
        [&token](const std::string &table, size_t chunk) {
          if (table == "users" && chunk == 1)
            token.cancel();
        });

    ForkResult result = fixture.fork(fixture.spec(), token);
    runner.assertFalse(result.success, "Fork stopped");
    runner.assertTrue(result.errorKind == ErrorKind::CANCELLED,
                      "Cancelled kind");
    runner.assertEquals(100, fixture.destServer->rowCount("shop_fork", "users"),
                        "Committed chunk kept");
    runner.assertEquals(0, fixture.destServer->writeCalls("shop_fork", "orders"),
                        "No new table started");
  });

  runner.runTest("Resume after a failure mid-table rewrites only that table",
                 [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.jobId = "fork-mid-table";

    FakeWriteFailure failure;
    failure.table = "orders";
    failure.chunk = 5;
    failure.times = -1;
    failure.failure = FakeFailure::PERMISSION;
    fixture.destServer->failWrites(failure);

    ForkResult first = fixture.fork(spec);
    runner.assertFalse(first.success, "First run fails");
    runner.assertEquals("orders", first.failedTable, "orders reported");
    runner.assertEquals(400,
                        fixture.destServer->rowCount("shop_fork", "orders"),
                        "Four chunks committed before the failure");
    size_t usersWrites = fixture.destServer->writeCalls("shop_fork", "users");

    fixture.destServer->clearFailures();
    spec.resume = true;
    ForkResult second = fixture.fork(spec);
    runner.assertTrue(second.success,
                      "Resumed run succeeds: " + second.errorMessage);
    runner.assertEquals(1000,
                        fixture.destServer->rowCount("shop_fork", "orders"),
                        "Exactly the source rows, no duplicates");
    runner.assertEquals(250, fixture.destServer->rowCount("shop_fork", "users"),
                        "users unchanged");
    runner.assertEquals(usersWrites,
                        fixture.destServer->writeCalls("shop_fork", "users"),
                        "users not rewritten");
    runner.assertEquals(15,
                        fixture.destServer->writeCalls("shop_fork", "orders"),
                        "orders restarted from its first chunk");
  });

  runner.runTest("Parallel resume after exhausted retries", [&]() {
    OrchestratorFixture fixture;
    FakeDatabase &warehouse =
        fixture.sourceServer->createDatabase("warehouse");
    for (size_t i = 1; i <= 7; ++i) {
      std::string name = "t" + std::to_string(i);
      warehouse
          .addTable(makeTableSchema(name, {makeColumn("id", "integer", false),
                                           makeColumn("label", "text")}))
          .rows = makeRows(150 * i + 30, name);
    }

    ForkSpec spec = fixture.spec();
    spec.source.database = "warehouse";
    spec.targetDatabase = "warehouse_fork";
    spec.excludeTables.clear();
    spec.maxConnections = 4;
    spec.jobId = "fork-parallel-resume";

    FakeWriteFailure failure;
    failure.table = "t3";
    failure.chunk = 3;
    failure.times = -1;
    fixture.destServer->failWrites(failure);

    ForkResult first = fixture.fork(spec);
    runner.assertFalse(first.success, "First run fails");
    runner.assertTrue(first.errorKind == ErrorKind::EXHAUSTED_RETRIES,
                      "Retries exhausted");
    runner.assertEquals("t3", first.failedTable, "t3 reported");
    runner.assertEquals(200,
                        fixture.destServer->rowCount("warehouse_fork", "t3"),
                        "Two chunks of t3 committed");

    fixture.destServer->clearFailures();
    spec.resume = true;
    ForkResult second = fixture.fork(spec);
    runner.assertTrue(second.success,
                      "Resumed run succeeds: " + second.errorMessage);
    runner.assertEquals(7, second.tablesCompleted, "All tables completed");
    for (size_t i = 1; i <= 7; ++i) {
      std::string name = "t" + std::to_string(i);
      runner.assertEquals(150 * i + 30,
                          fixture.destServer->rowCount("warehouse_fork", name),
                          "Exact row count for " + name);
    }

    auto executed = fixture.destServer->executedStatements();
    size_t createT1 = std::count_if(
        executed.begin(), executed.end(), [](const std::string &sql) {
          return sql.find("\"public\".\"t1\" (") != std::string::npos;
        });
    runner.assertEquals(1, createT1, "Tables are created once");
  });

  runner.runTest("Same-server fork clones the database", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.destination.host = "src.db";
    spec.excludeTables.clear();

    ForkResult result = fixture.fork(spec);
    runner.assertTrue(result.success, "Fork succeeded: " + result.errorMessage);
    runner.assertTrue(result.strategy == TransferStrategy::SAME_SERVER,
                      "Template clone");
    runner.assertTrue(fixture.sourceServer->hasDatabase("shop_fork"),
                      "Clone on the source server");
    runner.assertEquals(300,
                        fixture.sourceServer->rowCount("shop_fork",
                                                       "audit_logs"),
                        "All tables cloned");
    runner.assertEquals(1550, result.rowsTransferred,
                        "Rows counted on the clone");
    runner.assertEquals(0,
                        fixture.sourceServer->writeCalls("shop_fork", "users"),
                        "No rows streamed");
  });

  runner.runTest("Existing target is replaced with drop_if_exists", [&]() {
    OrchestratorFixture fixture;
    fixture.destServer->createDatabase("shop_fork").addTable(
        makeTableSchema("leftover", {makeColumn("id", "integer")}));

    ForkSpec spec = fixture.spec();
    runner.assertTrue(fixture.fork(spec).errorKind == ErrorKind::PLANNING,
                      "Refused without drop_if_exists");

    spec.dropIfExists = true;
    ForkResult result = fixture.fork(spec);
    runner.assertTrue(result.success, "Fork succeeded: " + result.errorMessage);
    runner.assertEquals(0, fixture.destServer->database("shop_fork")
                               .tables.count("leftover"),
                        "Old target dropped");
  });

  runner.runTest("Invalid configuration fails before connecting", [&]() {
    OrchestratorFixture fixture;
    ForkSpec spec = fixture.spec();
    spec.chunkSize = 10;
    fixture.sourceServer->failNextOpens(100);

    ForkResult result = fixture.fork(spec);
    runner.assertFalse(result.success, "Fork failed");
    runner.assertTrue(result.errorKind == ErrorKind::VALIDATION,
                      "Validation kind");
    runner.assertContains(result.errorMessage, "chunk_size", "Field named");
    runner.assertEquals("validation",
                        result.toJson()["error_kind"].get<std::string>(),
                        "Reported as validation");
  });

  runner.runTest("Result document keys", [&]() {
    OrchestratorFixture fixture;
    nlohmann::json document = fixture.fork(fixture.spec()).toJson();
    for (const char *key : {"success", "database", "strategy", "job_id",
                            "dry_run", "tables_completed", "tables_total",
                            "rows_transferred", "duration"}) {
      runner.assertTrue(document.contains(key),
                        std::string("Key present: ") + key);
    }
    runner.assertFalse(document.contains("error"), "No error on success");
    runner.assertEquals("shop_fork", document["database"].get<std::string>(),
                        "Target database");
  });

  return runner.printSummary();
}
