#include "gravsim/serialization.hpp"
#include "gravsim/error_handling.hpp"
#include <charconv>
#include <cstdio>
#include <fstream>

namespace gravsim {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

void Serializer::save(const std::string& filename, const BodyBuffer& bodies) {
    // Write beside the target and replace it only once the write succeeded,
    // so a failed save leaves the previous file intact
    const std::string temp = filename + ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            throw IOException("open for writing", temp);
        }
        save(file, bodies);
        file.flush();
        if (!file) {
            file.close();
            std::remove(temp.c_str());
            throw IOException("write", temp);
        }
    }

    if (std::rename(temp.c_str(), filename.c_str()) != 0) {
        std::remove(temp.c_str());
        throw IOException("replace", filename);
    }
}

std::vector<Body> Serializer::load(const std::string& filename, std::mt19937& rng) {
    std::ifstream file(filename);
    if (!file) {
        throw IOException("open for reading", filename);
    }
    return load(file, rng);
}

void Serializer::save(std::ostream& out, const BodyBuffer& bodies) {
    out << SAVE_HEADER << "\n";
    for (const auto& slot : bodies) {
        if (slot) {
            writeBody(out, *slot);
        }
    }
    out << "\n";
}

std::vector<Body> Serializer::load(std::istream& in, std::mt19937& rng) {
    std::vector<Body> bodies;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        std::string content = trim(line);
        if (content.empty() || content[0] == SAVE_COMMENT) {
            continue;
        }

        try {
            bodies.push_back(BodyFactory::fromStrings(splitRecord(content), rng));
        } catch (const ParseException& e) {
            throw ParseException(e.getDetail(), line_number);
        }
    }

    return bodies;
}

std::vector<std::string> Serializer::splitRecord(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(SAVE_DELIMITER, start);
        if (comma == std::string::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

std::string Serializer::formatReal(double value) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, result.ptr);
}

void Serializer::writeBody(std::ostream& out, const Body& body) {
    out << formatReal(body.position.x) << SAVE_DELIMITER
        << formatReal(body.position.y) << SAVE_DELIMITER
        << formatReal(body.velocity.x) << SAVE_DELIMITER
        << formatReal(body.velocity.y) << SAVE_DELIMITER
        << formatReal(body.mass) << SAVE_DELIMITER
        << formatReal(body.radius) << SAVE_DELIMITER
        << static_cast<int>(body.color.r) << SAVE_DELIMITER
        << static_cast<int>(body.color.g) << SAVE_DELIMITER
        << static_cast<int>(body.color.b) << "\n";
}

} // namespace gravsim
