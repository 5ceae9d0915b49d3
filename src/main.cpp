#include "app/exam_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <examforge/logging.hpp>

#include <cstddef>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace examforge;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    ProgramOptions options = parse_args_or_exit(args);

    ExamApp app{std::move(options)};

    return app.run();
}
