#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace gravsim {

struct SimulationConfig;

// Parse Exception class (malformed body record, unrecoverable at load time)
class ParseException : public std::runtime_error {
public:
    ParseException(const std::string& msg, size_t line)
        : std::runtime_error(formatMessage(msg, line)), detail_(msg), line_(line) {}

    explicit ParseException(const std::string& msg)
        : std::runtime_error("Parse Error: " + msg), detail_(msg), line_(0) {}

    const std::string& getDetail() const { return detail_; }

    // 1-based line number in the source file, 0 when unknown
    size_t getLine() const { return line_; }

private:
    static std::string formatMessage(const std::string& msg, size_t line) {
        std::ostringstream oss;
        oss << "Parse Error: " << msg << " on line " << line;
        return oss.str();
    }

    std::string detail_;
    size_t line_;
};

// I/O Exception class
class IOException : public std::runtime_error {
public:
    IOException(const std::string& operation, const std::string& path)
        : std::runtime_error(formatMessage(operation, path)),
          operation_(operation), path_(path) {}

    const std::string& getOperation() const { return operation_; }
    const std::string& getPath() const { return path_; }

private:
    static std::string formatMessage(const std::string& operation, const std::string& path) {
        std::ostringstream oss;
        oss << "I/O Error: cannot " << operation << " " << path;
        return oss.str();
    }

    std::string operation_;
    std::string path_;
};

// OpenGL Exception class
class OpenGLException : public std::runtime_error {
public:
    OpenGLException(const char* operation, unsigned int error_code)
        : std::runtime_error(formatMessage(operation, error_code)),
          operation_(operation), error_code_(error_code) {}

    const std::string& getOperation() const { return operation_; }
    unsigned int getErrorCode() const { return error_code_; }

private:
    static std::string formatMessage(const char* operation, unsigned int error_code) {
        std::ostringstream oss;
        oss << "OpenGL Error in " << operation << ": code " << error_code;
        return oss.str();
    }

    std::string operation_;
    unsigned int error_code_;
};

// Validation Exception class
class ValidationException : public std::runtime_error {
public:
    explicit ValidationException(const std::string& msg)
        : std::runtime_error("Validation Error: " + msg) {}
};

// Input validation
void validateSimulationConfig(const SimulationConfig& config);
void validateBodyCount(size_t count);
void validateTimescale(double timescale);
void validateGravitationalConstant(double G);
void validateWorldExtent(double half_width, double half_height);

} // namespace gravsim
