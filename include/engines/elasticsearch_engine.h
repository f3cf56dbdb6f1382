#ifndef ELASTICSEARCH_ENGINE_H
#define ELASTICSEARCH_ENGINE_H

#include "core/Config.h"
#include "engines/database_engine.h"
#include "engines/elasticsearch_client.h"
#include "engines/elasticsearch_codec.h"
#include <memory>

class ElasticsearchEndpoint {
protected:
  EndpointConfig endpoint_;

  explicit ElasticsearchEndpoint(EndpointConfig endpoint);

  std::unique_ptr<ElasticsearchClient> createClient(int maxRetries) const;
  // GET / with the configured credentials. Throws ConnectionError.
  void pingCluster() const;
};

// Reads one index through a point in time sorted by _shard_doc. The cursor
// in the checkpoint is a PitCursor; close() deletes the point in time and is
// only called once the index has been read completely.
class ElasticsearchBatchReader : public IBatchReader {
  std::unique_ptr<ElasticsearchClient> client_;
  std::string index_;
  size_t pageSize_;
  ReadCheckpoint next_;
  PitCursor cursor_;
  bool exhausted_ = false;

  void openPointInTime();

public:
  ElasticsearchBatchReader(std::unique_ptr<ElasticsearchClient> client,
                           std::string index, const ReadCheckpoint &from,
                           size_t pageSize);

  std::vector<Record> readPage() override;
  bool exhausted() const override { return exhausted_; }
  ReadCheckpoint checkpoint() const override { return next_; }
  void close() override;
};

class ElasticsearchSource : public IUnitSource, private ElasticsearchEndpoint {
public:
  explicit ElasticsearchSource(EndpointConfig endpoint);

  EndpointKind kind() const override { return EndpointKind::Elasticsearch; }
  void ping() override;
  std::vector<std::string> listUnits(const std::string &scope) override;
  Schema introspect(const std::string &unit) override;
  uint64_t countRecords(const std::string &unit) override;
  std::unique_ptr<IBatchReader> openReader(const std::string &unit,
                                           const Schema &schema,
                                           const ReadCheckpoint &from,
                                           size_t pageSize) override;
};

class ElasticsearchBatchWriter : public IBatchWriter {
  std::unique_ptr<ElasticsearchClient> client_;
  std::string index_;

public:
  ElasticsearchBatchWriter(std::unique_ptr<ElasticsearchClient> client,
                           std::string index);

  WriteResult write(const std::vector<Record> &records) override;
};

class ElasticsearchDestination : public IUnitDestination,
                                 private ElasticsearchEndpoint {
  void createIndex(ElasticsearchClient &client, const std::string &index,
                   const Schema &schema);
  bool indexExists(ElasticsearchClient &client, const std::string &index);

public:
  explicit ElasticsearchDestination(EndpointConfig endpoint);

  EndpointKind kind() const override { return EndpointKind::Elasticsearch; }
  void ping() override;
  size_t defaultBatchSize() const override {
    return DatabaseDefaults::ELASTICSEARCH_DEFAULT_BATCH_SIZE;
  }
  void provision(const std::string &unit, const Schema &schema,
                 UnitExistsStrategy strategy) override;
  std::unique_ptr<IBatchWriter> openWriter(const std::string &unit,
                                           const Schema &schema) override;
};

#endif
