#include "csv_file_sink.hpp"
#include <algorithm>
#include <fstream>
#include "../core/logger/logger.hpp"

namespace Spoor {
namespace Storage {

using namespace Spoor::Core;

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos)
        return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

}  // namespace

CsvFileSink::CsvFileSink(std::string path) : path_(std::move(path)) {
}

bool CsvFileSink::write(const std::vector<CanonicalEntity>& entities) {
    std::vector<CanonicalEntity> rows = entities;
    std::sort(rows.begin(), rows.end());

    if (!prepare_output_path(path_))
        return false;

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        Logger::error("Write Error: " + path_);
        return false;
    }

    file << "key,url\n";
    for (const auto& row : rows)
        file << csv_field(row.key) << ',' << csv_field(row.uri) << '\n';

    if (!file) {
        Logger::error("Write Error: " + path_);
        return false;
    }
    Logger::success("Saved " + std::to_string(rows.size()) + " sites: " + path_);
    return true;
}

}  // namespace Storage
}  // namespace Spoor
