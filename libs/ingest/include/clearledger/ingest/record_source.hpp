#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "clearledger/common/types.hpp"

namespace clearledger {
namespace ingest {

// Lazy, one-shot sequence of transaction records. next() returns false once
// the source is exhausted and throws common::ProcessingError when the
// underlying input cannot be read or interpreted.
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual bool next(common::TransactionRecord& out_record) = 0;
};

class VectorSource : public RecordSource {
 public:
  explicit VectorSource(std::vector<common::TransactionRecord> records)
      : records_(std::move(records)) {}

  bool next(common::TransactionRecord& out_record) override {
    if (cursor_ >= records_.size()) {
      return false;
    }
    out_record = records_[cursor_++];
    return true;
  }

 private:
  std::vector<common::TransactionRecord> records_;
  std::size_t cursor_{0};
};

}  // namespace ingest
}  // namespace clearledger
