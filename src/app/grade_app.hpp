#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace nexusexec {

/// ``nexusexec grade``: run a submission against a fixture file's test cases
class GradeApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace nexusexec
