// shell/src/file_io.cpp
#include "../include/file_io.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {
    std::string trim(const std::string& str) {
        const char* whitespace = " \t\n\r\f\v";
        size_t first = str.find_first_not_of(whitespace);
        if (std::string::npos == first) {
            return "";
        }
        size_t last = str.find_last_not_of(whitespace);
        return str.substr(first, (last - first + 1));
    }

    std::string stripComment(const std::string& line) {
        size_t hash = line.find('#');
        return hash == std::string::npos ? line : line.substr(0, hash);
    }

    void flushPolyline(Orthoplan::Engine::Polyline& current, std::vector<Orthoplan::Engine::Polyline>& polylines) {
        if (!current.empty()) {
            polylines.push_back(current);
            current.clear();
        }
    }
}

namespace Orthoplan::FileIO {

bool ParsePolylines(std::istream& in, std::vector<Engine::Polyline>& polylines) {
    Engine::Polyline current;
    std::string raw;
    size_t lineNumber = 0;

    while (std::getline(in, raw)) {
        ++lineNumber;
        const bool commentOnly = trim(raw).rfind('#', 0) == 0;
        std::string line = trim(stripComment(raw));
        if (line.empty()) {
            // Comment lines do not break a polyline, blank ones do.
            if (!commentOnly) flushPolyline(current, polylines);
            continue;
        }

        std::istringstream fields(line);
        double x = 0.0, y = 0.0;
        std::string extra;
        if (!(fields >> x >> y) || (fields >> extra)) {
            std::cerr << "FileIO Error: Expected 'x y' on line " << lineNumber << ": " << line << std::endl;
            return false;
        }
        current.emplace_back(x, y);
    }
    flushPolyline(current, polylines);
    return true;
}

bool LoadPolylinesFromFile(const std::string& filepath, std::vector<Engine::Polyline>& polylines) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "FileIO Error: Could not open " << filepath << " for reading." << std::endl;
        return false;
    }
    if (!ParsePolylines(file, polylines)) {
        std::cerr << "FileIO Error: Failed to parse " << filepath << std::endl;
        return false;
    }
    std::cout << "FileIO: Loaded " << polylines.size() << " polylines from " << filepath << std::endl;
    return true;
}

bool WriteTextFile(const std::string& filepath, const std::string& contents) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "FileIO Error: Could not open " << filepath << " for writing." << std::endl;
        return false;
    }
    file << contents;
    return static_cast<bool>(file);
}

}
