#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace satr {

// Base of every failure raised by the reader. what() always starts with a
// bracketed category tag, e.g. "[TYPE ERROR] ...".
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

class ExpressionError : public Error {
public:
    ExpressionError(const std::string& expr, const std::string& cause)
        : Error("[EXPR ERROR] Error evaluating expr '" + expr + "': " + cause),
          expr_(expr), cause_(cause) {}

    const std::string& expression() const { return expr_; }
    const std::string& cause() const { return cause_; }

private:
    std::string expr_;
    std::string cause_;
};

class TypeError : public Error {
public:
    explicit TypeError(const std::string& msg) : Error("[TYPE ERROR] " + msg) {}
};

class BoundsError : public Error {
public:
    BoundsError(const std::string& subsystem, const std::string& field,
                size_t offset, size_t size, size_t frame_size)
        : Error("[READ ERROR] Field '" + subsystem + "." + field + "' (offset " +
                std::to_string(offset) + ", size " + std::to_string(size) +
                ") overflows frame boundary of " + std::to_string(frame_size) + " bytes."),
          subsystem_(subsystem), field_(field),
          offset_(offset), size_(size), frame_size_(frame_size) {}

    const std::string& subsystem() const { return subsystem_; }
    const std::string& field() const { return field_; }
    size_t offset() const { return offset_; }
    size_t size() const { return size_; }
    size_t frame_size() const { return frame_size_; }

private:
    std::string subsystem_;
    std::string field_;
    size_t offset_;
    size_t size_;
    size_t frame_size_;
};

class PluginError : public Error {
public:
    PluginError(const std::string& function, const std::string& msg)
        : Error("[PLUGIN ERROR] " + msg), function_(function) {}

    const std::string& function() const { return function_; }

private:
    std::string function_;
};

class FrameSizeError : public Error {
public:
    explicit FrameSizeError(const std::string& msg) : Error(msg) {}
};

class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& msg) : Error("[XML ERROR] " + msg) {}
};

} // namespace satr
