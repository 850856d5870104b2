#ifndef JOB_STATE_STORE_H
#define JOB_STATE_STORE_H

#include "core/logger.h"
#include "fork/ForkTypes.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Persists fork jobs as one JSON document per job id under the state
// directory. The job currently being run is held in memory and every status
// transition of it goes through this class, which writes the document before
// returning, so a crash never loses a recorded transition.
class JobStateStore {
private:
  std::string stateDir_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  ForkJob job_;
  bool active_ = false;
  bool persist_ = true;

  void persistLocked();
  TableTask &findTaskLocked(const std::string &table);

public:
  JobStateStore(const std::string &stateDir, std::shared_ptr<Logger> logger);

  static std::string defaultStateDir();
  static std::string generateJobId();

  const std::string &stateDir() const { return stateDir_; }
  std::string pathFor(const std::string &jobId) const;

  // Record access by id. load() returns nothing when no record exists and
  // throws StateError when the record cannot be parsed.
  bool exists(const std::string &jobId) const;
  std::optional<ForkJob> load(const std::string &jobId) const;
  void save(const ForkJob &job) const;
  bool remove(const std::string &jobId) const;
  std::vector<ForkJob> listJobs() const;
  size_t cleanupOldJobs(std::chrono::hours maxAge) const;

  // Starts tracking job as the running job. With persist == false (dry run)
  // nothing is written to disk.
  void beginJob(const ForkJob &job, bool persist);
  ForkJob snapshot() const;
  bool hasJob() const;

  void setPhase(ForkPhase phase);
  void setPlan(const TransferPlan &plan);

  // Applies a status change to one table and persists the job. Entering
  // IN_PROGRESS counts an attempt and resets the row counter. Returns the
  // task as it is after the change. Throws StateError on an illegal change.
  TableTask transitionTask(const std::string &table, TableTaskStatus status,
                           const std::string &error = "");
  // In-memory only; rows are persisted with the next transition.
  void recordRows(const std::string &table, int64_t rowsTransferred);

  void markStatementApplied(const std::string &statementId);
  bool isStatementApplied(const std::string &statementId) const;

  void markFailed(const ClassifiedError &error);

  static bool isValidTransition(TableTaskStatus from, TableTaskStatus to);

  // Tasks that did not complete go back to PENDING and restart their stream
  // from the first row. Completed tasks and applied statements are kept.
  static void prepareForResume(ForkJob &job);

  // Throws ResumeMismatchError when spec does not describe the same fork as
  // the stored job: source, destination, target and table selection.
  static void verifyResumable(const ForkJob &stored, const ForkSpec &spec);
};

#endif
