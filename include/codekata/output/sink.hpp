#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace codekata {

/// Destination for program and report output
class Sink
{
public:
    virtual void write(std::string_view str) = 0;
    virtual void flush() = 0;

    virtual ~Sink() = default;
};

/// Collects everything written into a string
class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }

    void flush() override {}

    const std::string& str() const { return buffer_; }

    std::string take() { return std::move(buffer_); }

private:
    std::string buffer_;
};

/// Discards everything written
class NullSink : public Sink
{
public:
    void write(std::string_view /*str*/) override {}

    void flush() override {}
};

} // namespace codekata
