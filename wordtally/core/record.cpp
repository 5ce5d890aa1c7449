/*******************************************************************************
 * wordtally/core/record.cpp
 *
 * Part of Project Wordtally
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <wordtally/core/record.hpp>

#include <wordtally/common/logger.hpp>

#include <tlx/string/split.hpp>

#include <string>
#include <utility>
#include <vector>

namespace wordtally {
namespace core {

static constexpr bool debug = false;

const char * RecordStatusName(RecordStatus s) {
    switch (s) {
    case RecordStatus::Ok:
        return "ok";
    case RecordStatus::Header:
        return "header";
    case RecordStatus::TooFewFields:
        return "too_few_fields";
    case RecordStatus::BadDate:
        return "bad_date";
    case RecordStatus::Excluded:
        return "excluded";
    }
    return "unknown";
}

std::ostream& operator << (std::ostream& os, const RecordStatus& s) {
    return os << RecordStatusName(s);
}

bool IsHeaderLine(const std::string& line) {
    return line.find("post_theme") != std::string::npos &&
           line.find("date") != std::string::npos;
}

std::vector<std::string> SplitFields(const std::string& line) {
    std::vector<std::string> fields;
    tlx::split(&fields, '\t', line);

    while (fields.size() > 1 && fields.back().empty())
        fields.pop_back();

    return fields;
}

RecordStatus ParseRecord(const std::string& line, Record* out, Date* date) {
    if (IsHeaderLine(line)) {
        LOG << "ParseRecord: skipping header line";
        return RecordStatus::Header;
    }

    std::vector<std::string> fields;
    if (!line.empty() && line.back() == '\r')
        fields = SplitFields(line.substr(0, line.size() - 1));
    else
        fields = SplitFields(line);

    if (fields.size() < kRecordFields) {
        sLOG << "ParseRecord: skipping record with" << fields.size()
             << "fields";
        return RecordStatus::TooFewFields;
    }

    if (!ParseDate(fields[2], date)) {
        sLOG << "ParseRecord: skipping record with bad date" << fields[2];
        return RecordStatus::BadDate;
    }

    out->title = std::move(fields[0]);
    out->reply_flag = std::move(fields[1]);
    out->date_raw = std::move(fields[2]);
    out->comment = std::move(fields[3]);
    return RecordStatus::Ok;
}

} // namespace core
} // namespace wordtally

/******************************************************************************/
