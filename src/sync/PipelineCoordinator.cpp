#include "sync/PipelineCoordinator.h"
#include "core/logger.h"
#include "sync/TypeMapper.h"
#include "sync/UnitProvisioner.h"
#include <algorithm>

std::string pipelineOutcomeToString(PipelineOutcome outcome) {
  switch (outcome) {
  case PipelineOutcome::NotStarted:
    return "not_started";
  case PipelineOutcome::Completed:
    return "completed";
  case PipelineOutcome::Paused:
    return "paused";
  case PipelineOutcome::Stopped:
    return "stopped";
  case PipelineOutcome::Failed:
    return "failed";
  }
  return "failed";
}

PipelineCoordinator::PipelineCoordinator(const PipelineContext &ctx,
                                         size_t unitIndex)
    : ctx_(ctx), unitIndex_(unitIndex),
      unit_(ctx.runtimes->snapshot(unitIndex).unit) {}

bool PipelineCoordinator::holdRequested() const {
  return ctx_.signals->pauseRequested() || ctx_.errors->haltRequested();
}

void PipelineCoordinator::publishStatus(UnitStatus status,
                                        const std::string &message) {
  if (!ctx_.events)
    return;
  SyncEvent event;
  event.kind = SyncEventKind::StatusChange;
  event.taskId = ctx_.taskId;
  event.unit = unit_.target;
  event.payload = {{"scope", "unit"},
                   {"source", unit_.source},
                   {"target", unit_.target},
                   {"status", unitStatusToString(status)}};
  if (!message.empty())
    event.payload["message"] = message;
  ctx_.events->publish(std::move(event));
}

void PipelineCoordinator::setStatus(UnitStatus status,
                                    const std::string &message) {
  ctx_.runtimes->update(unitIndex_, [&](UnitRuntime &runtime) {
    runtime.status = status;
    if (status == UnitStatus::Running)
      runtime.errorMessage.clear();
    else if (!message.empty())
      runtime.errorMessage = message;
    if (status == UnitStatus::Completed)
      runtime.totalRecords = runtime.processedRecords;
  });
  Logger::info(LogCategory::TRANSFER, "PipelineCoordinator",
               unit_.source + " -> " + unit_.target + ": " +
                   unitStatusToString(status) +
                   (message.empty() ? "" : " (" + message + ")"));
  publishStatus(status, message);
  if (ctx_.onProgress)
    ctx_.onProgress();
}

PipelineOutcome PipelineCoordinator::run() {
  UnitRuntime state = ctx_.runtimes->snapshot(unitIndex_);
  if (state.status == UnitStatus::Completed)
    return PipelineOutcome::Completed;
  if (state.status == UnitStatus::Failed)
    return PipelineOutcome::Failed;
  if (ctx_.signals->stopRequested() || holdRequested())
    return PipelineOutcome::NotStarted;

  setStatus(UnitStatus::Running);
  try {
    if (!state.provisioned)
      prepare();
    return transfer();
  } catch (const SyncError &e) {
    return handleFailure(e);
  } catch (const std::exception &) {
    return handleFailure(
        classifyException(std::current_exception(), unit_.source, "transfer"));
  }
}

void PipelineCoordinator::prepare() {
  UnitProvisioner provisioner(*ctx_.source, *ctx_.destination, *ctx_.errors,
                              ctx_.config.unitExistsStrategy());
  UnitSchemas schemas = provisioner.describe(unit_);
  provisioner.provision(unit_, *schemas.destination);

  ctx_.runtimes->update(unitIndex_, [&](UnitRuntime &runtime) {
    runtime.provisioned = true;
    runtime.sourceSchema = schemas.source;
    runtime.destinationSchema = schemas.destination;
    runtime.checkpoint = UnitCheckpoint{};
    runtime.processedRecords = 0;
    runtime.failedRecords = 0;
  });
}

/*
 * Batch loop. The reader hands out pages of readPageSize records; batches
 * are cut from those pages at the effective batch size, so one batch may
 * span pages and one page may feed several batches.
 *
 * After each write the checkpoint becomes (start of the page being consumed,
 * records of that page already consumed). Resuming reopens the reader at the
 * page start and skips the consumed prefix, which works for offset, keyset
 * and search_after readers alike. Records that fail conversion never reach
 * the writer but still count as processed, as do records the writer
 * rejected.
 */
PipelineOutcome PipelineCoordinator::transfer() {
  UnitRuntime state = ctx_.runtimes->snapshot(unitIndex_);
  const Schema &sourceSchema = *state.sourceSchema;
  const Schema &destinationSchema = *state.destinationSchema;
  const EndpointKind sourceKind = ctx_.source->kind();
  const size_t batchSize =
      ctx_.config.effectiveBatchSize(ctx_.destination->defaultBatchSize());

  std::unique_ptr<IBatchWriter> writer =
      ctx_.destination->openWriter(unit_.target, destinationSchema);
  std::unique_ptr<IBatchReader> reader = ctx_.source->openReader(
      unit_.source, sourceSchema, state.checkpoint.pageStart,
      ctx_.config.readPageSize());

  // The reader may attach a cursor to its start position (a fresh point in
  // time), so the first page start comes from the reader.
  ReadCheckpoint pageStart = reader->checkpoint();
  std::vector<Record> page = reader->readPage();
  size_t position = std::min(state.checkpoint.consumedInPage, page.size());

  Logger::info(LogCategory::TRANSFER, "PipelineCoordinator::transfer",
               unit_.source + ": starting at offset " +
                   std::to_string(pageStart.offset + position) +
                   ", batch size " + std::to_string(batchSize));

  while (true) {
    if (ctx_.signals->stopRequested()) {
      reader->close();
      return PipelineOutcome::Stopped;
    }
    if (holdRequested()) {
      setStatus(UnitStatus::Paused, "paused at batch boundary");
      return PipelineOutcome::Paused;
    }

    PendingBatch batch;
    while (batch.consumed < batchSize) {
      if (position >= page.size()) {
        if (page.empty() || reader->exhausted())
          break;
        pageStart = reader->checkpoint();
        page = reader->readPage();
        position = 0;
        continue;
      }
      const uint64_t offset = pageStart.offset + position;
      const Record &record = page[position];
      position++;
      batch.consumed++;
      try {
        batch.records.push_back(TypeMapper::mapRecord(
            record, sourceSchema, destinationSchema, sourceKind));
        batch.offsets.push_back(offset);
      } catch (const DataError &e) {
        batch.conversionFailures.emplace_back(offset, e.what());
      }
    }

    if (batch.consumed == 0)
      break;

    WriteResult result;
    auto started = std::chrono::steady_clock::now();
    if (!batch.records.empty()) {
      try {
        result = writer->write(batch.records);
      } catch (const DataError &e) {
        result = failWholeBatch(batch, e);
      }
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    bool rejected = false;
    bool halt = applyFailures(batch, result, rejected);
    const uint64_t failed =
        result.failures.size() + batch.conversionFailures.size();
    const UnitCheckpoint next{pageStart, position};

    ctx_.runtimes->update(unitIndex_, [&](UnitRuntime &runtime) {
      runtime.processedRecords += batch.consumed;
      runtime.failedRecords += failed;
      if (runtime.processedRecords > runtime.totalRecords)
        runtime.totalRecords = runtime.processedRecords;
      runtime.checkpoint = next;
    });

    Logger::debug(LogCategory::TRANSFER, "PipelineCoordinator::transfer",
                  unit_.source + ": wrote " +
                      std::to_string(batch.records.size()) + " records in " +
                      std::to_string(latency.count()) + "ms, " +
                      std::to_string(failed) + " failed");

    if (ctx_.onBatchWritten)
      ctx_.onBatchWritten(latency, rejected);
    if (ctx_.onProgress)
      ctx_.onProgress();

    if (halt) {
      setStatus(UnitStatus::Paused, "paused after record failure");
      return PipelineOutcome::Paused;
    }
  }

  reader->close();
  setStatus(UnitStatus::Completed);
  return PipelineOutcome::Completed;
}

// The destination refused the batch as a whole (a 4xx bulk response, an
// unclassified SQL error). Every record of the batch is reported as failed
// so the error strategy decides, exactly as for per-record rejections.
WriteResult PipelineCoordinator::failWholeBatch(const PendingBatch &batch,
                                                const DataError &error) {
  Logger::error(LogCategory::TRANSFER, "PipelineCoordinator::transfer",
                unit_.source + ": batch of " +
                    std::to_string(batch.records.size()) +
                    " records refused: " + error.what());
  WriteResult result;
  result.attempted = batch.records.size();
  for (size_t i = 0; i < batch.records.size(); i++) {
    RecordFailure failure;
    failure.index = i;
    failure.kind = RecordFailureKind::Unknown;
    failure.message = error.what();
    result.failures.push_back(std::move(failure));
  }
  return result;
}

bool PipelineCoordinator::applyFailures(const PendingBatch &batch,
                                        const WriteResult &result,
                                        bool &rejected) {
  bool halt = false;

  for (const auto &failure : batch.conversionFailures) {
    RecordFailure recordFailure;
    recordFailure.index = static_cast<size_t>(failure.first);
    recordFailure.kind = RecordFailureKind::TypeMismatch;
    recordFailure.message = failure.second;
    nlohmann::json context = {{"phase", "convert"},
                              {"sourceOffset", failure.first}};
    if (ctx_.errors->recordFailure(unit_.source, recordFailure,
                                   std::move(context)) == ErrorVerdict::Halt)
      halt = true;
  }

  for (const auto &failure : result.failures) {
    if (failure.kind == RecordFailureKind::Rejected)
      rejected = true;
    nlohmann::json context = {{"phase", "write"},
                              {"target", unit_.target},
                              {"batchSize", batch.records.size()}};
    if (failure.index < batch.records.size()) {
      context["sourceOffset"] = batch.offsets[failure.index];
      const std::string &id = batch.records[failure.index].documentId;
      if (!id.empty())
        context["documentId"] = id;
    }
    if (ctx_.errors->recordFailure(unit_.source, failure,
                                   std::move(context)) == ErrorVerdict::Halt)
      halt = true;
  }
  return halt;
}

PipelineOutcome PipelineCoordinator::handleFailure(const SyncError &error) {
  SyncError contextual(error.kind(), error.what(),
                       error.unit().empty() ? unit_.source : error.unit(),
                       error.operation());
  ErrorVerdict verdict = ctx_.errors->recordFatal(contextual);

  if (error.kind() == ErrorKind::Schema ||
      error.kind() == ErrorKind::Provision) {
    setStatus(UnitStatus::Failed, contextual.describe());
    return PipelineOutcome::Failed;
  }
  if (verdict == ErrorVerdict::Halt) {
    setStatus(UnitStatus::Paused, contextual.describe());
    return PipelineOutcome::Paused;
  }
  setStatus(UnitStatus::Failed, contextual.describe());
  return PipelineOutcome::Failed;
}
