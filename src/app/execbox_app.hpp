#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "output/serializer.hpp"

#include <execbox/engine.hpp>
#include <execbox/execution/language.hpp>

#include <string>

namespace execbox {

/// Command line front end: one engine, one command
class ExecboxApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;

    int run_command(CodeExecutionEngine& engine, Serializer& serializer, const std::string& code,
                    Language language) const;
    int validate_command(CodeExecutionEngine& engine, Serializer& serializer, const std::string& code,
                         Language language) const;
    int test_command(CodeExecutionEngine& engine, Serializer& serializer, const std::string& code,
                     Language language) const;
};

} // namespace execbox
