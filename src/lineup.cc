#include "driver.h"
#include <iostream>
#include <string>
#include <vector>

/**
 * Entry point: stdin -> items -> stdout.
 */
int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    return runLineup(std::vector<std::string>(argv, argv + argc), std::cin, std::cout, std::cerr);
}
