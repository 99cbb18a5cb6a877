#pragma once
#include <istream>
#include <string>
#include <vector>
#include "types.hpp"

namespace renko {

struct LoadedTicks {
    std::string source;
    std::string path;
    std::string format;
    std::vector<std::string> fields; // columns the file declared, normalized
    std::vector<Tick> ticks;
};

// Source of tick data for the aggregation pipeline.
//
// Implementations must deliver the fixed field contract
// {timestamp, price, size?} and fail with RenkoError of kind
// SourceNotFound, UnsupportedFormat, MissingRequiredField or InvalidRecord.
class TickLoader {
public:
    virtual ~TickLoader() = default;
    virtual LoadedTicks load(const std::string& source) const = 0;
};

// Loads "<data_dir>/<source>[.csv|.json|.parquet|.h5]".
class FileTickLoader : public TickLoader {
public:
    explicit FileTickLoader(std::string data_dir);

    LoadedTicks load(const std::string& source) const override;

    std::string resolve(const std::string& source) const;
    std::vector<std::string> scan_available_files() const;
    const std::string& data_dir() const { return data_dir_; }

private:
    std::string data_dir_;
};

const std::vector<std::string>& supported_extensions();

std::vector<Tick> parse_tick_csv(std::istream& in, std::vector<std::string>* fields);
std::vector<Tick> parse_tick_json(const std::string& text, std::vector<std::string>* fields);

} // namespace renko
