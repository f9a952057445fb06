#pragma once

#include <iostream>
#include <mailstage/detail/result.hpp>

inline void print_error(const mailstage::error& err)
{
    std::cout << "Error: " << static_cast<int>(err.code()) << " - " << err.message() << "\n";
    if (!err.detail().empty())
        std::cout << "Detail: " << err.detail() << "\n";
}
