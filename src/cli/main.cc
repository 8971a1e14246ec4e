//
// Created by igor on 17/08/2025.
//

#include <pngme/commands.hh>
#include <iostream>

int main(int argc, char* argv[]) {
    return pngme::commands::run(argc, argv, std::cout, std::cerr);
}
