#include "osm2mbtiles.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace osm2mbtiles {

namespace {

const std::vector<std::string> kRequiredMetadata = {"name", "type", "version", "description"};

std::string trim(std::string value) {
    auto is_not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), is_not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), is_not_space).base(), value.end());
    return value;
}

std::vector<double> parse_number_list(const std::string &name, const std::string &value, std::size_t expected) {
    std::vector<double> numbers;
    std::stringstream stream(value);
    std::string token;
    while (std::getline(stream, token, ',')) {
        token = trim(token);
        std::size_t consumed = 0;
        double number = 0.0;
        try {
            number = std::stod(token, &consumed);
        } catch (const std::logic_error &) {
            consumed = 0;
        }
        if (token.empty() || consumed != token.size()) {
            throw osm2mbtiles_error("Metadata '" + name + "' has a non-numeric component '" + token + "'");
        }
        // stod accepts "nan" and "inf", which slip past every range check.
        if (!std::isfinite(number)) {
            throw osm2mbtiles_error("Metadata '" + name + "' has a non-finite component '" + token + "'");
        }
        numbers.push_back(number);
    }
    if (numbers.size() != expected) {
        throw osm2mbtiles_error("Metadata '" + name + "' must have " + std::to_string(expected) +
                                " comma-separated values, got '" + value + "'");
    }
    return numbers;
}

void check_longitude(const std::string &name, double lon) {
    if (lon < -180.0 || lon > 180.0) {
        throw osm2mbtiles_error("Metadata '" + name + "' has longitude " + std::to_string(lon) + " outside [-180, 180]");
    }
}

void check_latitude(const std::string &name, double lat) {
    if (lat < -90.0 || lat > 90.0) {
        throw osm2mbtiles_error("Metadata '" + name + "' has latitude " + std::to_string(lat) + " outside [-90, 90]");
    }
}

}  // namespace

std::pair<std::string, std::string> parse_metadata_assignment(const std::string &assignment) {
    const std::size_t separator = assignment.find('=');
    if (separator == std::string::npos) {
        throw osm2mbtiles_error("Metadata entry '" + assignment + "' must be written as name=value");
    }
    std::string name = trim(assignment.substr(0, separator));
    if (name.empty()) {
        throw osm2mbtiles_error("Metadata entry '" + assignment + "' has an empty name");
    }
    return {std::move(name), trim(assignment.substr(separator + 1))};
}

std::map<std::string, std::string> load_metadata_file(const fs::path &path) {
    std::ifstream file(path);
    if (!file) {
        throw osm2mbtiles_error("Failed to open metadata file '" + path.string() + "'");
    }

    std::map<std::string, std::string> entries;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }
        try {
            auto entry = parse_metadata_assignment(content);
            entries[entry.first] = entry.second;
        } catch (const osm2mbtiles_error &ex) {
            throw osm2mbtiles_error(path.string() + ":" + std::to_string(line_number) + ": " + ex.what());
        }
    }
    if (file.bad()) {
        throw osm2mbtiles_error("Failed to read metadata file '" + path.string() + "'");
    }
    return entries;
}

std::vector<std::string> validate_metadata(const std::map<std::string, std::string> &metadata) {
    auto type = metadata.find("type");
    if (type != metadata.end() && type->second != "overlay" && type->second != "baselayer") {
        throw osm2mbtiles_error("Metadata 'type' must be 'overlay' or 'baselayer', got '" + type->second + "'");
    }

    // left,bottom,right,top
    auto bounds = metadata.find("bounds");
    if (bounds != metadata.end()) {
        const auto values = parse_number_list("bounds", bounds->second, 4);
        check_longitude("bounds", values[0]);
        check_latitude("bounds", values[1]);
        check_longitude("bounds", values[2]);
        check_latitude("bounds", values[3]);
        if (values[0] > values[2] || values[1] > values[3]) {
            throw osm2mbtiles_error("Metadata 'bounds' must be ordered left,bottom,right,top, got '" +
                                    bounds->second + "'");
        }
    }

    auto center = metadata.find("center");
    if (center != metadata.end()) {
        const auto values = parse_number_list("center", center->second, 3);
        check_longitude("center", values[0]);
        check_latitude("center", values[1]);
        if (values[2] < 0.0 || values[2] > kMaxZoom || values[2] != static_cast<int>(values[2])) {
            throw osm2mbtiles_error("Metadata 'center' zoom must be an integer in [0, " + std::to_string(kMaxZoom) +
                                    "], got '" + center->second + "'");
        }
    }

    std::vector<std::string> missing;
    for (const auto &name : kRequiredMetadata) {
        if (metadata.find(name) == metadata.end()) {
            missing.push_back(name);
        }
    }
    return missing;
}

}  // namespace osm2mbtiles
