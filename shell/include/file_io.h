// shell/include/file_io.h
#pragma once

#include <istream>
#include <string>
#include <vector>
#include <orthoplan/line.h>

namespace Orthoplan::FileIO {

// Text polyline format: one "x y" pair per line, blank lines separate polylines,
// '#' starts a comment. Returns false on the first malformed line.
bool ParsePolylines(std::istream& in, std::vector<Engine::Polyline>& polylines);

bool LoadPolylinesFromFile(const std::string& filepath, std::vector<Engine::Polyline>& polylines);

bool WriteTextFile(const std::string& filepath, const std::string& contents);

}
