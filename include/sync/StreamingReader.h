#ifndef STREAMINGREADER_H
#define STREAMINGREADER_H

#include "core/migration_config.h"
#include "engines/source_engine.h"
#include "sync/MigrationErrors.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Pulls a source table through a forward-only cursor in chunks of at most
// fetchSize rows. A new open() always starts a new cursor; there is no way to
// resume from the middle of a table.
class StreamingReader {
  ISourceEngine &source_;
  const PerformanceConfig &performance_;

  std::unique_ptr<ISourceCursor> cursor_;
  std::string table_;
  std::vector<std::string> expectedColumns_;
  size_t fetchSize_ = 0;
  uint64_t rowsRead_ = 0;
  bool finished_ = false;

public:
  StreamingReader(ISourceEngine &source, const PerformanceConfig &performance);
  ~StreamingReader();

  StreamingReader(const StreamingReader &) = delete;
  StreamingReader &operator=(const StreamingReader &) = delete;

  void open(const std::string &table,
            const std::vector<std::string> &expectedColumns, size_t fetchSize);

  // Next chunk of rows, or std::nullopt at end of stream.
  std::optional<std::vector<SourceRow>> nextBatch();

  void close();

  uint64_t rowsRead() const { return rowsRead_; }
  bool isOpen() const { return cursor_ != nullptr; }
};

#endif
