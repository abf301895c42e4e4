#pragma once

#include <codekata/output/sink.hpp>

#include <string_view>

namespace codekata {

class StdoutSink : public Sink
{
public:
    void write(std::string_view str) override;
    void flush() override;

    ~StdoutSink() override = default;
};

} // namespace codekata
