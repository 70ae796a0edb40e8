#include "app/execbox_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <execbox/logging.hpp>

#include <cstddef>
#include <span>

int main(int argc, const char* argv[]) {
    execbox::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    execbox::ExecboxApp app{execbox::parse_args_or_exit(args)};

    return app.run();
}
