#pragma once

#include <ostream>

namespace Rektor::Cli {

// 退出码
inline constexpr int EXIT_VERIFIED = 0;
inline constexpr int EXIT_REJECTED = 1; // root 不一致
inline constexpr int EXIT_BAD_INPUT = 2; // 用法、解码或形状错误

void print_usage(std::ostream& err);

// rektor [--config FILE] [--debug] <command> [flags]
// 结果写到 out，诊断写到 err，返回退出码
int run(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

} // namespace Rektor::Cli
