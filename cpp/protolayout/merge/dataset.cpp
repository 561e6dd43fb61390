#include "protolayout/merge/dataset.h"

#include "protolayout/core/logging.h"
#include "protolayout/core/string_utils.h"
#include "protolayout/core/types.h"

#include <fstream>
#include <istream>
#include <iterator>
#include <sstream>
#include <utility>

namespace protolayout {

namespace {

struct CsvRecord {
    std::size_t line = 0;
    std::vector<std::string> fields;
    bool unterminated = false;
};

std::vector<CsvRecord> splitRecords(const std::string& text) {
    std::vector<CsvRecord> records;
    CsvRecord current;
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;
    std::size_t line = 1;
    current.line = line;

    auto endField = [&]() {
        current.fields.push_back(std::move(field));
        field.clear();
        fieldStarted = false;
    };
    auto endRecord = [&]() {
        endField();
        const bool blank = current.fields.size() == 1 && current.fields.front().empty();
        if (!blank) records.push_back(std::move(current));
        current = CsvRecord{};
        current.line = line;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field.push_back(c);
            }
            continue;
        }
        switch (c) {
            case '"':
                if (!fieldStarted) {
                    inQuotes = true;
                    fieldStarted = true;
                } else {
                    field.push_back(c);
                }
                break;
            case ',':
                endField();
                break;
            case '\r':
                break;
            case '\n':
                ++line;
                endRecord();
                break;
            default:
                field.push_back(c);
                fieldStarted = true;
                break;
        }
    }
    if (inQuotes) current.unterminated = true;
    if (fieldStarted || !field.empty() || !current.fields.empty() || current.unterminated) endRecord();
    return records;
}

} // namespace

// =============================================================================
// Dataset
// =============================================================================

Dataset::Dataset(std::string name, std::vector<std::string> headers, std::vector<DataRow> rows)
    : name_(std::move(name)), headers_(std::move(headers)), rows_(std::move(rows)), validFrom_(rows_.size() + 1, 0) {
    for (std::size_t i = rows_.size(); i > 0; --i) {
        validFrom_[i - 1] = validFrom_[i] + (rows_[i - 1].valid ? 1 : 0);
    }
}

std::size_t Dataset::validRowsFrom(std::size_t index) const noexcept {
    return index < validFrom_.size() ? validFrom_[index] : 0;
}

std::optional<std::size_t> Dataset::columnIndex(std::string_view header) const {
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        if (headers_[i] == header) return i;
    }
    return std::nullopt;
}

std::vector<std::string> Dataset::bindingHeaders() const {
    std::vector<std::string> out;
    for (const auto& h : headers_) {
        if (!h.empty() && h.front() == kBindingPrefix) out.push_back(h);
    }
    return out;
}

DataRecord Dataset::record(const DataRow& row) const {
    DataRecord out;
    for (std::size_t i = 0; i < headers_.size() && i < row.values.size(); ++i) {
        if (!headers_[i].empty() && headers_[i].front() == kBindingPrefix) out[headers_[i]] = row.values[i];
    }
    return out;
}

// =============================================================================
// CSV loading
// =============================================================================

std::shared_ptr<const Dataset> parseCsv(std::istream& in, std::string name, const WarningHandler& onWarning) {
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<CsvRecord> records = splitRecords(text);

    std::vector<std::string> headers;
    std::vector<DataRow> rows;
    if (records.empty()) return std::make_shared<const Dataset>(std::move(name), std::move(headers), std::move(rows));

    for (auto& h : records.front().fields) headers.emplace_back(trimView(h));

    bool hasBinding = false;
    for (const auto& h : headers) hasBinding = hasBinding || (!h.empty() && h.front() == kBindingPrefix);
    if (!hasBinding) {
        PROTOLAYOUT_LOG_DEBUG("dataset %s has no '@' columns; no rows merged", name.c_str());
        return std::make_shared<const Dataset>(std::move(name), std::move(headers), std::move(rows));
    }

    rows.reserve(records.size() - 1);
    for (std::size_t i = 1; i < records.size(); ++i) {
        CsvRecord& rec = records[i];
        DataRow row;
        row.line = rec.line;
        row.valid = !rec.unterminated && rec.fields.size() == headers.size();
        row.values = std::move(rec.fields);
        if (!row.valid) {
            std::ostringstream msg;
            msg << name << ":" << row.line << ": malformed row (" << row.values.size() << " fields, expected "
                << headers.size() << ")";
            PROTOLAYOUT_LOG_WARN("%s", msg.str().c_str());
            if (onWarning) onWarning(msg.str());
        }
        rows.push_back(std::move(row));
    }
    return std::make_shared<const Dataset>(std::move(name), std::move(headers), std::move(rows));
}

std::shared_ptr<const Dataset> loadCsvFile(const std::string& path, const WarningHandler& onWarning) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Error("cannot open CSV file '" + path + "'");
    return parseCsv(in, path, onWarning);
}

// =============================================================================
// DatasetCursor
// =============================================================================

DatasetCursor::DatasetCursor(std::shared_ptr<const Dataset> dataset) : dataset_(std::move(dataset)) {}

std::size_t DatasetCursor::remaining() const noexcept {
    return dataset_->validRowsFrom(next_);
}

const DataRow* DatasetCursor::next(const WarningHandler& onWarning) {
    const auto& rows = dataset_->rows();
    while (next_ < rows.size()) {
        const DataRow& row = rows[next_++];
        if (row.valid) return &row;
        const std::string msg = dataset_->name() + ":" + std::to_string(row.line) + ": skipping malformed row";
        PROTOLAYOUT_LOG_WARN("%s", msg.c_str());
        if (onWarning) onWarning(msg);
    }
    return nullptr;
}

} // namespace protolayout
