#pragma once

#include <iostream>
#include <mailfence/detail/result.hpp>
#include <mailfence/response/content.hpp>

inline void print_error(const mailfence::error_info& err)
{
    std::cout << "Error: " << mailfence::to_string(err.code) << " - " << err.message << "\n";
    std::cout << "Detail: " << err.detail << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}

inline void print_result(const mailfence::response::tool_result& res)
{
    nlohmann::ordered_json j = res;
    std::cout << j.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << "\n";
}
