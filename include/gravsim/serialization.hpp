#pragma once

#include "gravsim/types.hpp"
#include "gravsim/body.hpp"
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace gravsim {

// Text save format: one comma separated record per body,
//   x,y,xVel,yVel,mass,radius,red,green,blue
// Lines starting with '#' are comments and blank lines are skipped.
// Records of five to eight fields derive the radius and pick a random color.

constexpr char SAVE_COMMENT = '#';
constexpr char SAVE_DELIMITER = ',';
constexpr const char* SAVE_HEADER = "#x, y, xVel, yVel, mass, radius, red, green, blue";

class Serializer {
public:
    // Save live bodies to file through a sibling "<filename>.tmp" that replaces
    // the target on success. Throws IOException if either step fails; the
    // previous file is then left as it was.
    static void save(const std::string& filename, const BodyBuffer& bodies);

    // Load bodies from file. Throws IOException if the file cannot be read and
    // ParseException on a malformed record.
    static std::vector<Body> load(const std::string& filename, std::mt19937& rng);

    // Save to stream
    static void save(std::ostream& out, const BodyBuffer& bodies);

    // Load from stream
    static std::vector<Body> load(std::istream& in, std::mt19937& rng);

    // Split one record into trimmed fields
    static std::vector<std::string> splitRecord(const std::string& line);

    // Shortest decimal text that reads back to the same double
    static std::string formatReal(double value);

private:
    static void writeBody(std::ostream& out, const Body& body);
};

} // namespace gravsim
