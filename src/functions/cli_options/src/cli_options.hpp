#pragma once
#include "functions/run_aggregator/src/run_aggregator.hpp"

#include <iosfwd>

enum class CliAction {
    Run,
    Help
};

// argv → opts (opts 에는 미리 .env/환경 변수 기본값이 들어 있음)
// 잘못된 인자는 std::invalid_argument
CliAction parse_args(int argc, char** argv, RunOptions& opts);

void print_usage(std::ostream& os);
