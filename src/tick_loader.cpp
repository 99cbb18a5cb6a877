#include "../include/renko/tick_loader.hpp"
#include "../include/renko/errors.hpp"
#include "../include/renko/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace renko {
namespace {

const char* kTimestamp = "timestamp";
const char* kPrice = "price";
const char* kSize = "size";

std::vector<std::string> parse_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (ch == ',' && !in_quotes) {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    fields.push_back(trim(current));
    return fields;
}

RenkoError invalid_row(std::size_t line, const std::string& message) {
    return RenkoError(ErrorKind::InvalidRecord,
                      "Line " + std::to_string(line) + ": " + message);
}

double parse_number(const std::string& text, const char* what, std::size_t line) {
    char* end_ptr = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end_ptr);
    if (errno != 0 || end_ptr == text.c_str() || *end_ptr != '\0') {
        throw invalid_row(line, std::string("unparseable ") + what + " '" + text + "'");
    }
    return value;
}

long long parse_size(double value, std::size_t line) {
    if (!std::isfinite(value) || value < 0.0 || std::floor(value) != value) {
        throw invalid_row(line, "size must be a non-negative integer");
    }
    return static_cast<long long>(value);
}

// Both formats must declare timestamp and price; size is optional.
void require_fields(const std::set<std::string>& declared) {
    std::string missing;
    for (const char* name : {kTimestamp, kPrice}) {
        if (declared.count(name) == 0) {
            if (!missing.empty()) missing += ", ";
            missing += name;
        }
    }
    if (!missing.empty()) {
        throw RenkoError(ErrorKind::MissingRequiredField,
                         "Missing required field(s): " + missing + " (expected timestamp, price, optional size)");
    }
}

} // namespace

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> exts = {".csv", ".json", ".parquet", ".h5"};
    return exts;
}

std::vector<Tick> parse_tick_csv(std::istream& in, std::vector<std::string>* fields) {
    std::string header_line;
    if (!std::getline(in, header_line)) {
        throw RenkoError(ErrorKind::MissingRequiredField, "CSV is empty");
    }
    if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();

    std::map<std::string, std::size_t> header_index;
    std::vector<std::string> names;
    for (const auto& raw : parse_csv_line(header_line)) {
        std::string name = lowercase(trim(raw));
        if (header_index.count(name) != 0) {
            throw RenkoError(ErrorKind::InvalidRecord, "Ambiguous header: column '" + name + "' appears twice");
        }
        header_index[name] = names.size();
        names.push_back(name);
    }
    require_fields(std::set<std::string>(names.begin(), names.end()));
    if (fields) *fields = names;

    const std::size_t ts_col = header_index[kTimestamp];
    const std::size_t price_col = header_index[kPrice];
    const bool has_size = header_index.count(kSize) != 0;
    const std::size_t size_col = has_size ? header_index[kSize] : 0;

    std::vector<Tick> ticks;
    std::string line;
    std::size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        auto cells = parse_csv_line(line);
        if (cells.size() < names.size()) {
            throw invalid_row(line_no, "expected " + std::to_string(names.size()) +
                                       " columns, got " + std::to_string(cells.size()));
        }

        Tick t;
        try {
            t.time = parse_timestamp_ms(cells[ts_col]);
        } catch (const std::invalid_argument& e) {
            throw invalid_row(line_no, e.what());
        }
        if (!cells[price_col].empty()) t.price = parse_number(cells[price_col], kPrice, line_no);
        if (has_size && !cells[size_col].empty()) {
            t.size = parse_size(parse_number(cells[size_col], kSize, line_no), line_no);
        }
        ticks.push_back(t);
    }
    return ticks;
}

std::vector<Tick> parse_tick_json(const std::string& text, std::vector<std::string>* fields) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw RenkoError(ErrorKind::InvalidRecord, std::string("JSON parse error: ") + e.what());
    }
    if (!doc.is_array()) {
        throw RenkoError(ErrorKind::UnsupportedFormat, "Expected a top-level JSON array of tick objects");
    }

    std::set<std::string> declared;
    for (const auto& item : doc) {
        if (!item.is_object()) {
            throw RenkoError(ErrorKind::UnsupportedFormat, "Expected a top-level JSON array of tick objects");
        }
        for (auto it = item.begin(); it != item.end(); ++it) declared.insert(lowercase(it.key()));
    }
    if (!doc.empty()) require_fields(declared);
    if (fields) fields->assign(declared.begin(), declared.end());

    std::vector<Tick> ticks;
    ticks.reserve(doc.size());
    std::size_t index = 0;
    for (const auto& item : doc) {
        ++index;
        std::map<std::string, const json*> by_name;
        for (auto it = item.begin(); it != item.end(); ++it) by_name[lowercase(it.key())] = &it.value();

        Tick t;
        auto ts = by_name.find(kTimestamp);
        if (ts == by_name.end() || ts->second->is_null()) {
            throw invalid_row(index, "missing timestamp");
        }
        try {
            if (ts->second->is_number()) {
                t.time = epoch_seconds_to_ms(ts->second->get<double>());
            } else if (ts->second->is_string()) {
                t.time = parse_timestamp_ms(ts->second->get<std::string>());
            } else {
                throw std::invalid_argument("timestamp must be a number or string");
            }
        } catch (const std::invalid_argument& e) {
            throw invalid_row(index, e.what());
        }

        auto price = by_name.find(kPrice);
        if (price != by_name.end() && !price->second->is_null()) {
            if (!price->second->is_number()) throw invalid_row(index, "price must be a number");
            t.price = price->second->get<double>();
        }

        auto size = by_name.find(kSize);
        if (size != by_name.end() && !size->second->is_null()) {
            if (!size->second->is_number()) throw invalid_row(index, "size must be a number");
            t.size = parse_size(size->second->get<double>(), index);
        }
        ticks.push_back(t);
    }
    return ticks;
}

FileTickLoader::FileTickLoader(std::string data_dir) : data_dir_(std::move(data_dir)) {}

std::string FileTickLoader::resolve(const std::string& source) const {
    std::string name = trim(source);
    if (name.empty() || name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
        name.find("..") != std::string::npos) {
        throw RenkoError(ErrorKind::SourceNotFound, "Invalid source name: '" + source + "'");
    }

    const auto& exts = supported_extensions();
    fs::path dir(data_dir_);
    std::string ext = lowercase(fs::path(name).extension().string());
    if (std::find(exts.begin(), exts.end(), ext) != exts.end()) {
        fs::path p = dir / name;
        if (fs::is_regular_file(p)) return p.string();
    } else {
        for (const auto& e : exts) {
            fs::path p = dir / (name + e);
            if (fs::is_regular_file(p)) return p.string();
        }
        if (fs::is_regular_file(dir / name)) {
            throw RenkoError(ErrorKind::UnsupportedFormat, "Unsupported file format: " + name);
        }
    }
    throw RenkoError(ErrorKind::SourceNotFound, "File " + name + " not found in " + data_dir_);
}

LoadedTicks FileTickLoader::load(const std::string& source) const {
    LoadedTicks out;
    out.source = trim(source);
    out.path = resolve(source);
    std::string ext = lowercase(fs::path(out.path).extension().string());

    if (ext == ".csv") {
        std::ifstream in(out.path);
        if (!in.is_open()) {
            throw RenkoError(ErrorKind::SourceNotFound, "Unable to open " + out.path);
        }
        out.format = "csv";
        out.ticks = parse_tick_csv(in, &out.fields);
    } else if (ext == ".json") {
        std::ifstream in(out.path);
        if (!in.is_open()) {
            throw RenkoError(ErrorKind::SourceNotFound, "Unable to open " + out.path);
        }
        std::stringstream ss;
        ss << in.rdbuf();
        out.format = "json";
        out.ticks = parse_tick_json(ss.str(), &out.fields);
    } else {
        throw RenkoError(ErrorKind::UnsupportedFormat,
                         "No reader for " + ext + " files (" + out.path + ")");
    }
    return out;
}

std::vector<std::string> FileTickLoader::scan_available_files() const {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(data_dir_, ec)) return files;

    const auto& exts = supported_extensions();
    for (const auto& entry : fs::directory_iterator(data_dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string ext = lowercase(entry.path().extension().string());
        if (std::find(exts.begin(), exts.end(), ext) != exts.end()) {
            files.push_back(entry.path().filename().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace renko
