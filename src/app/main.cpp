#include <codekata/logging.hpp>

#include "app/kata_app.hpp"
#include "app/trace_exception.hpp"
#include "output/stdout_sink.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <span>

int main(int argc, const char* argv[]) {
    using namespace codekata;

    init_loggers();

    try {
        std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

        const ProgramOptions options = parse_args_or_exit(args);

        StdoutSink output_sink;
        KataApp app{options, output_sink};

        return app.run();
    } catch (const std::exception& ex) {
        trace_exception(ex.what());
    } catch (...) {
        trace_exception("(unknown - not derived from std::exception)");
    }

    return EXIT_FAILURE;
}
