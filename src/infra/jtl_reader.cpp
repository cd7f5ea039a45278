#include "qg/jtl.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <string_view>

namespace qg {

namespace {

void trim_inplace(std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    s = s.substr(start, end - start);
}

std::string short_line_preview(const std::string& line)
{
    const size_t max_len = 160;
    if (line.size() <= max_len) return line;
    return line.substr(0, max_len) + "...";
}

// Read one logical CSV record. A quoted field may span physical lines, so keep
// appending while the quote count is odd. Returns false at EOF.
bool read_record(std::istream& in, std::string& record, size_t& line_no, size_t& first_line)
{
    record.clear();
    std::string line;
    bool in_quotes = false;
    bool got_any   = false;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!got_any) {
            first_line = line_no;
            got_any    = true;
        } else {
            record.push_back('\n');
        }
        record += line;
        if (std::ranges::count(line, '"') % 2 != 0) in_quotes = !in_quotes;
        if (!in_quotes) return true;
    }
    return got_any;
}

// CSV splitter with support for:
// - quoted fields: "a,b"
// - escaped quotes inside quoted fields: "" -> "
bool split_csv_record(const std::string& record, std::vector<std::string>& out, std::string* err)
{
    out.clear();

    std::string field;
    field.reserve(record.size());

    bool in_quotes = false;

    for (size_t i = 0; i < record.size(); ++i) {
        char c = record[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < record.size() && record[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            continue;
        }

        if (c == ',') {
            trim_inplace(field);
            out.push_back(field);
            field.clear();
            continue;
        }

        field.push_back(c);
    }

    if (in_quotes) {
        if (err) *err = "Unterminated quoted field.";
        return false;
    }

    trim_inplace(field);
    out.push_back(field);
    return true;
}

bool to_int64(std::string_view s, std::int64_t& out)
{
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return false;
    std::int64_t v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return false;
    out = v;
    return true;
}

bool to_success(std::string_view s, bool& out)
{
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "true" || lower == "1" || lower == "yes") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        out = false;
        return true;
    }
    return false;
}

std::optional<size_t> column_index(const std::vector<std::string>& header, std::string_view name)
{
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) return std::nullopt;
    return static_cast<size_t>(it - header.begin());
}

// Empty cell, short row or missing column all count as "absent".
const std::string* cell(const std::vector<std::string>& cols, std::optional<size_t> idx)
{
    if (!idx || *idx >= cols.size() || cols[*idx].empty()) return nullptr;
    return &cols[*idx];
}

LoadResult format_error(size_t line_no, const std::string& what)
{
    LoadResult r{};
    r.kind  = LoadErrorKind::Format;
    r.line  = line_no;
    r.error = what;
    return r;
}

} // namespace

LoadResult parse_jtl(std::istream& in)
{
    LoadResult result{};

    std::string record;
    std::vector<std::string> cols;
    std::string err;
    size_t line_no    = 0;
    size_t first_line = 0;

    // Header: first non-blank record. No header at all means zero samples.
    bool have_header = false;
    while (read_record(in, record, line_no, first_line)) {
        if (first_line == 1 && record.starts_with("\xEF\xBB\xBF")) record.erase(0, 3);
        std::string probe = record;
        trim_inplace(probe);
        if (!probe.empty()) {
            have_header = true;
            break;
        }
    }
    if (!have_header) return result;

    if (!split_csv_record(record, cols, &err)) {
        return format_error(first_line, "Header parse error at line " + std::to_string(first_line) +
                                            ": " + err + " Line: " + short_line_preview(record));
    }

    const auto ts_col      = column_index(cols, "timeStamp");
    const auto elapsed_col = column_index(cols, "elapsed");
    const auto success_col = column_index(cols, "success");

    while (read_record(in, record, line_no, first_line)) {
        std::string probe = record;
        trim_inplace(probe);
        if (probe.empty()) continue;

        if (!split_csv_record(record, cols, &err)) {
            return format_error(first_line, "CSV parse error at line " + std::to_string(first_line) +
                                                ": " + err + " Line: " + short_line_preview(record));
        }

        Sample s{};

        if (const std::string* v = cell(cols, ts_col)) {
            if (!to_int64(*v, s.timestamp)) {
                return format_error(first_line, "Invalid timeStamp at line " + std::to_string(first_line) +
                                                    ". Value: " + *v + ". Line: " + short_line_preview(record));
            }
        } else {
            s.has_timestamp = false;
        }

        if (const std::string* v = cell(cols, elapsed_col)) {
            if (!to_int64(*v, s.elapsed)) {
                return format_error(first_line, "Invalid elapsed at line " + std::to_string(first_line) +
                                                    ". Value: " + *v + ". Line: " + short_line_preview(record));
            }
            if (s.elapsed < 0) {
                return format_error(first_line, "Negative elapsed at line " + std::to_string(first_line) +
                                                    ". Value: " + *v + ". Line: " + short_line_preview(record));
            }
        }

        if (const std::string* v = cell(cols, success_col)) {
            if (!to_success(*v, s.success)) {
                return format_error(first_line, "Invalid success at line " + std::to_string(first_line) +
                                                    ". Value: " + *v + ". Line: " + short_line_preview(record));
            }
        }

        result.samples.push_back(s);
    }

    return result;
}

LoadResult load_jtl_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        LoadResult r{};
        r.kind  = LoadErrorKind::NotFound;
        r.error = "JTL file not found: " + path;
        return r;
    }
    return parse_jtl(in);
}

} // namespace qg
