#ifndef PROTOLAYOUT_MERGE_DATASET_H
#define PROTOLAYOUT_MERGE_DATASET_H

#include "protolayout/core/errors.h"
#include "protolayout/model/component_element.h"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace protolayout {

struct DataRow {
    std::size_t line = 0;               // 1-based line in the source file
    std::vector<std::string> values;
    bool valid = true;                  // field count matched the header
};

// Immutable table parsed from CSV. Shared between the merge manager and the
// policies' cursors through shared_ptr<const Dataset>.
class Dataset {
public:
    Dataset(std::string name, std::vector<std::string> headers, std::vector<DataRow> rows);

    const std::string& name() const noexcept { return name_; }
    const std::vector<std::string>& headers() const noexcept { return headers_; }
    const std::vector<DataRow>& rows() const noexcept { return rows_; }
    std::size_t rowCount() const noexcept { return rows_.size(); }
    std::size_t validRowCount() const noexcept { return validFrom_.front(); }
    // Valid rows at or after `index`.
    std::size_t validRowsFrom(std::size_t index) const noexcept;

    std::optional<std::size_t> columnIndex(std::string_view header) const;
    // Headers beginning with '@'.
    std::vector<std::string> bindingHeaders() const;
    // '@' columns of one row keyed by header.
    DataRecord record(const DataRow& row) const;

private:
    std::string name_;
    std::vector<std::string> headers_;
    std::vector<DataRow> rows_;
    std::vector<std::size_t> validFrom_;
};

// Parses RFC 4180 style CSV: comma separated, double-quote quoting with ""
// escapes, quoted fields may span lines. The first record is the header.
// Files without any '@' header yield no rows. Rows whose field count differs
// from the header are kept but marked invalid and reported to `onWarning`.
std::shared_ptr<const Dataset> parseCsv(std::istream& in, std::string name, const WarningHandler& onWarning = {});
// Throws Error if the file cannot be opened.
std::shared_ptr<const Dataset> loadCsvFile(const std::string& path, const WarningHandler& onWarning = {});

// Forward-only read position over one dataset. Owned by exactly one policy.
class DatasetCursor {
public:
    explicit DatasetCursor(std::shared_ptr<const Dataset> dataset);

    const Dataset& dataset() const noexcept { return *dataset_; }
    const std::shared_ptr<const Dataset>& datasetPtr() const noexcept { return dataset_; }
    std::size_t position() const noexcept { return next_; }

    // Valid rows not yet consumed.
    std::size_t remaining() const noexcept;
    bool exhausted() const noexcept { return remaining() == 0; }

    // Next valid row; invalid rows on the way are skipped and reported.
    const DataRow* next(const WarningHandler& onWarning = {});
    void rewind() noexcept { next_ = 0; }

private:
    std::shared_ptr<const Dataset> dataset_;
    std::size_t next_ = 0;
};

} // namespace protolayout

#endif // PROTOLAYOUT_MERGE_DATASET_H
