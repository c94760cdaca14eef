#include "ds/console.hpp"

#include <cstdio>
#include <mutex>
#include <print>

namespace ds {

static std::mutex g_print_mtx;

void out_line(std::string_view line)
{
    std::lock_guard<std::mutex> lk(g_print_mtx);
    std::println("{}", line);
    std::fflush(stdout);
}

void err_line(std::string_view line)
{
    std::lock_guard<std::mutex> lk(g_print_mtx);
    std::println(stderr, "{}", line);
}

void out_block(std::string_view text)
{
    std::lock_guard<std::mutex> lk(g_print_mtx);
    std::print("{}", text);
    std::fflush(stdout);
}

} // namespace ds
